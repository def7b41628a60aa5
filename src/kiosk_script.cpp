/*
 * The visit, step by step.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#include <stdio.h>
#include "kiosk.h"


int Kiosk::script(int st)
{
    switch (st) {

        //////////////////////////////////////////////////////////////////////////////////////////////
        // Defaults

        default: {
            return 0;
        }

        //////////////////////////////////////////////////////////////////////////////////////////////
        // Debug states

        case 1: {
            // Jukebox: every song in turn, no camera
            if (!initSynths(cold)) {
                fail("synth initialization failed");
                return 1;
            }
            cold = false;

            printf("\n\n     Now playing song %u: %s\n\n\n", songChoice, songs[songChoice].title.c_str());
            fflush(stdout);
            playSong(songChoice);
            shutDownSynths(false);

            songChoice = (songChoice + 1) % songs.size();
            sleep(1);
            return 1;
        }

        case 2: {
            // Debugging the computer vision; look and choose forever
            lookAndChoose();
            sleep(2);
            return 2;
        }

        //////////////////////////////////////////////////////////////////////////////////////////////
        // Normal states

        case 0: {
            // Credits
            showCredits();
            return 10;
        }

        case 10: {
            // Ready the synths. Only the very first time opens ports and starts the metronome.
            if (!initSynths(cold)) {
                fail("synth initialization failed");
                return 0;
            }
            cold = false;
            return 20;
        }

        case 20: {
            showGreeting();
            return 30;
        }

        case 30: {
            // Wait for a face, and choose a song for it
            songChoice = lookAndChoose();
            return 40;
        }

        case 40: {
            playSong(songChoice);
            return 50;
        }

        case 50: {
            shutDownSynths(false);
            sleep(2);
            showThanks();
            return 60;
        }

        case 60: {
            showNextConsumer();
            return 0;
        }
    }
}
