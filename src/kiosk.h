/*
 * Infrastructure to serve one consumer after another: look at them,
 * choose their song, play it.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <signal.h>
#include <map>
#include <string>
#include <vector>
#include "lib/ardutouch.h"
#include "lib/metronome.h"
#include "lib/prng.h"
#include "lib/runner.h"
#include "lib/sequencer.h"
#include "lib/serial_port.h"
#include "lib/singer.h"
#include "lib/song.h"
#include "lib/song_table.h"
#include "face_chooser.h"
#include "title_card.h"


class Kiosk
{
public:

    class KRunner : public Runner
    {
    public:
        KRunner();
        int initialState;
        int forcedSong;         // -1 to let the camera choose
        std::string tickSource; // "clock" or "gpio"
        bool loadConfig(const char *filename);
    protected:
        virtual bool parseArgument(int &i, int &argc, char **argv);
        virtual void argumentUsage();
        virtual bool validateArguments();
    };

    Kiosk();
    ~Kiosk();

    // Read the configuration and load songs and faces. Must succeed before run().
    bool setup();

    // Serve consumers until a shutdown is requested. False if the synths
    // couldn't be brought up.
    bool run();

    // Run the current state once and move on to the next. Returns the new state.
    int step();

    int state() const { return currentState; }
    bool failed() const { return failure; }

    // Drive a synth through another port instead of its serial device.
    // The port must already be open; delays on that board are skipped.
    void attachPort(unsigned voice, SynthPort *port);

    // Multiplier on the pauses between stages; 0 skips them
    void setTimeScale(float scale) { timeScale = scale; }

    // Safe to call from a signal handler
    static void requestShutdown();
    static bool shutdownRequested();
    static void cancelShutdown();

    KRunner runner;

private:
    struct Synth {
        std::string device;
        SerialPort serial;
        SynthPort *port;        // &serial unless attached elsewhere
        ArduTouch *board;
        bool muteRests;
        bool fadeAtEnd;
        int warmupKey;
        unsigned warmupOctave;
        unsigned warmupVolume;
    };

    int script(int st);

    // Stages of one consumer's visit
    void showCredits();
    bool initSynths(bool cold);
    void showGreeting();
    unsigned lookAndChoose();
    void playSong(unsigned number);
    void shutDownSynths(bool final);
    void showThanks();
    void showNextConsumer();

    void fail(const char *why);
    void showCard(const TitleCard &card);
    void clearScreen();
    void sleep(float seconds);

    void formatTime(double s);
    void logSummary();

    std::vector<Synth*> synths;
    std::vector<Song> songs;
    SongTable songTable;
    FaceChooser chooser;
    ESpeakSinger singer;
    Sequencer sequencer;
    Metronome *metronome;
    TitleCardWindow cards;
    PRNG prng;

    bool cold;
    bool camera;
    bool failure;
    float timeScale;
    unsigned songChoice;
    unsigned baudRate;
    float cardSeconds;

    unsigned totalLoops;
    double totalTime;
    std::map<int, double> singleStateTime;
    int currentState;

    static volatile sig_atomic_t stopRequested;
};
