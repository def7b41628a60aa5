/*
 * Lounge Looker
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#include <signal.h>
#include <string.h>
#include "kiosk.h"

static Kiosk kiosk;

static void shutdownHandler(int)
{
    Kiosk::requestShutdown();
}

int main(int argc, char **argv)
{
    struct sigaction action;
    memset(&action, 0, sizeof action);
    action.sa_handler = shutdownHandler;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, NULL);
    sigaction(SIGTERM, &action, NULL);

    if (!kiosk.runner.parseArguments(argc, argv)) {
        return 1;
    }
    if (!kiosk.setup()) {
        return 1;
    }

    return kiosk.run() ? 0 : 1;
}
