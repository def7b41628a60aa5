/*
 * Stand-ins for the serial ports and speech engine, for testing.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <string>
#include <vector>
#include "lib/ardutouch.h"
#include "lib/singer.h"


class RecordingPort : public SynthPort
{
public:
    RecordingPort() : open(true), writes(0) {}

    virtual bool isOpen() const { return open; }

    virtual bool write(const std::string &bytes)
    {
        writes++;
        if (!open) {
            return false;
        }
        output += bytes;
        return true;
    }

    virtual bool setRTS(bool level)
    {
        rts.push_back(level);
        return open;
    }

    // Everything written since the last call
    std::string take()
    {
        std::string s = output;
        output.clear();
        return s;
    }

    bool open;
    unsigned writes;
    std::string output;
    std::vector<bool> rts;
};


class RecordingSinger : public Singer
{
public:
    virtual bool sing(const std::string &words)
    {
        sung.push_back(words);
        return true;
    }

    std::vector<std::string> sung;
};
