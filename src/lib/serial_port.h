/*
 * POSIX serial port, raw 8N1, for talking to USB-serial synth boards.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <string>
#include "ardutouch.h"


class SerialPort : public SynthPort
{
public:
    SerialPort();
    virtual ~SerialPort();

    bool open(const char *path, unsigned baud);
    void close();

    virtual bool isOpen() const;
    virtual bool write(const std::string &bytes);
    virtual bool setRTS(bool level);

    const char *path() const { return devicePath.c_str(); }

    // termios speed constant for a baud rate, or B0 if unsupported
    static speed_t baudConstant(unsigned baud);

private:
    int fd;
    std::string devicePath;

    SerialPort(const SerialPort &);
    SerialPort &operator=(const SerialPort &);
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline SerialPort::SerialPort()
    : fd(-1)
{}

inline SerialPort::~SerialPort()
{
    close();
}

inline speed_t SerialPort::baudConstant(unsigned baud)
{
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        default:     return B0;
    }
}

inline bool SerialPort::open(const char *path, unsigned baud)
{
    close();
    devicePath = path;

    speed_t speed = baudConstant(baud);
    if (speed == B0) {
        fprintf(stderr, "serial: %s: unsupported baud rate %u\n", path, baud);
        return false;
    }

    fd = ::open(path, O_RDWR | O_NOCTTY);
    if (fd < 0) {
        fprintf(stderr, "serial: can't open %s: %s\n", path, strerror(errno));
        return false;
    }

    struct termios tio;
    if (tcgetattr(fd, &tio) < 0) {
        fprintf(stderr, "serial: %s: tcgetattr: %s\n", path, strerror(errno));
        close();
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
    tio.c_cflag |= CS8 | CLOCAL | CREAD;

    // Reads time out after 2 seconds
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 20;

    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    if (tcsetattr(fd, TCSANOW, &tio) < 0) {
        fprintf(stderr, "serial: %s: tcsetattr: %s\n", path, strerror(errno));
        close();
        return false;
    }

    return true;
}

inline void SerialPort::close()
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

inline bool SerialPort::isOpen() const
{
    return fd >= 0;
}

inline bool SerialPort::write(const std::string &bytes)
{
    if (fd < 0) {
        return false;
    }

    const char *p = bytes.data();
    size_t remaining = bytes.size();

    while (remaining) {
        ssize_t n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            fprintf(stderr, "serial: %s: write: %s\n", devicePath.c_str(), strerror(errno));
            return false;
        }
        p += n;
        remaining -= n;
    }

    return tcdrain(fd) == 0;
}

inline bool SerialPort::setRTS(bool level)
{
    if (fd < 0) {
        return false;
    }

    int bits = TIOCM_RTS;
    return ioctl(fd, level ? TIOCMBIS : TIOCMBIC, &bits) == 0;
}
