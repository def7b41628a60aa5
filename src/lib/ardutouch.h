/*
 * Remote control for ArduTouch synthesizer boards, through the
 * keyboard and volume menus of their serial console.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include <unistd.h>
#include <string>


/*
 * Byte pipe to one synth board. The RTS line is wired to the board's reset.
 */
class SynthPort
{
public:
    virtual ~SynthPort() {}

    virtual bool isOpen() const = 0;

    // Write and flush one command string
    virtual bool write(const std::string &bytes) = 0;

    virtual bool setRTS(bool level) = 0;
};


class ArduTouch
{
public:
    ArduTouch(const char *name, SynthPort *port);

    const char *name() const { return boardName.c_str(); }
    SynthPort *port() const { return synthPort; }
    void setPort(SynthPort *port) { synthPort = port; }

    // Volume 0-255, applies to the following notes
    void setVolume(unsigned level);

    // Semitone 0-11 (C through B) on octave 0-7
    void playNote(int key, unsigned octave);

    void stopNote();

    // Leave the remote-control mode the board boots into
    void exitRemote();

    // Quick stepped fade to silence
    void fadeOut();

    // Pulse the reset line
    void reset();

    // Keyboard-menu letter for a semitone, or 0 if out of range
    static char keyLetter(int key);

    // Set to skip real sleeps (tests)
    bool skipDelays;

private:
    std::string boardName;
    SynthPort *synthPort;

    void send(const std::string &s);
    void pause(unsigned usec);
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline ArduTouch::ArduTouch(const char *name, SynthPort *port)
    : skipDelays(false),
      boardName(name),
      synthPort(port)
{}

inline char ArduTouch::keyLetter(int key)
{
    // The bottom row of the computer keyboard is the board's piano keyboard
    static const char letters[] = "zsxdcvgbhnjm";

    if (key < 0 || key > 11) {
        return 0;
    }
    return letters[key];
}

inline void ArduTouch::send(const std::string &s)
{
    if (!synthPort->write(s)) {
        fprintf(stderr, "ardutouch: %s: write failed\n", boardName.c_str());
    }
}

inline void ArduTouch::pause(unsigned usec)
{
    if (!skipDelays) {
        usleep(usec);
    }
}

inline void ArduTouch::setVolume(unsigned level)
{
    char digits[16];
    snprintf(digits, sizeof digits, "%u", level);

    send("v");          // Volume menu
    send(digits);
    send("\\");         // Set volume and leave the menu
}

inline void ArduTouch::playNote(int key, unsigned octave)
{
    char letter = keyLetter(key);
    if (!letter || octave > 7) {
        fprintf(stderr, "ardutouch: %s: ignoring note %d on octave %u\n", boardName.c_str(), key, octave);
        return;
    }

    send("k");          // Keyboard menu
    send(std::string(1, char('0' + octave)));
    send(std::string(1, letter));
    send("`");          // Leave the menu
}

inline void ArduTouch::stopNote()
{
    send("k");
    send(" ");
    send("`");
}

inline void ArduTouch::exitRemote()
{
    send("`");
}

inline void ArduTouch::fadeOut()
{
    static const unsigned levels[] = { 200, 180, 150, 100, 80, 60, 40, 20 };

    for (unsigned i = 0; i < sizeof levels / sizeof levels[0]; i++) {
        setVolume(levels[i]);
        pause(1000);
    }
    setVolume(0);
}

inline void ArduTouch::reset()
{
    if (!synthPort->setRTS(true)) {
        fprintf(stderr, "ardutouch: %s: can't raise RTS\n", boardName.c_str());
    }
    pause(100000);
    if (!synthPort->setRTS(false)) {
        fprintf(stderr, "ardutouch: %s: can't lower RTS\n", boardName.c_str());
    }
    pause(100000);
}
