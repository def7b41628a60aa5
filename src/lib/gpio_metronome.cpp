/*
 * Metronome driven by an external square wave on a Raspberry Pi GPIO pin.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#include <stdio.h>
#include "gpio_metronome.h"


GpioMetronome *GpioMetronome::instance = 0;

static std::string gpioName(int pin)
{
    char name[16];
    snprintf(name, sizeof name, "GPIO%d", pin);
    return name;
}

GpioMetronome::GpioMetronome(int pin)
    : EdgeMetronome(gpioName(pin)),
      pin(pin),
      installed(false)
{}

bool GpioMetronome::setup()
{
    if (installed) {
        return true;
    }
    if (instance) {
        fprintf(stderr, "gpio: only one GPIO metronome is supported\n");
        return false;
    }

    if (wiringPiSetupGpio() < 0) {
        fprintf(stderr, "gpio: wiringPi setup failed\n");
        return false;
    }

    pinMode(pin, INPUT);
    pullUpDnControl(pin, PUD_UP);

    instance = this;
    if (wiringPiISR(pin, INT_EDGE_FALLING, &GpioMetronome::fallingEdge) < 0) {
        fprintf(stderr, "gpio: can't install interrupt handler on GPIO%d\n", pin);
        instance = 0;
        return false;
    }

    installed = true;
    return true;
}

void GpioMetronome::fallingEdge()
{
    if (instance) {
        instance->pulse();
    }
}

void GpioMetronome::start()
{
    if (!installed) {
        fprintf(stderr, "gpio: metronome started before setup()\n");
    }
    EdgeMetronome::start();
}
