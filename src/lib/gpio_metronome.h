/*
 * Metronome driven by an external square wave on a Raspberry Pi GPIO pin.
 *
 * An ESP32 generates a 20 Hz square wave (25 ms high, 25 ms low). Each
 * falling edge is one tick.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <wiringPi.h>
#include "metronome.h"


class GpioMetronome : public EdgeMetronome
{
public:
    // BCM pin numbering
    explicit GpioMetronome(int pin = 23);

    // Configure the pin and install the interrupt handler. Once only.
    bool setup();

    virtual void start();

private:
    int pin;
    bool installed;

    // wiringPi interrupt handlers take no arguments
    static GpioMetronome *instance;
    static void fallingEdge();
};
