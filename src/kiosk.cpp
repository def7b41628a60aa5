/*
 * Infrastructure to serve one consumer after another: look at them,
 * choose their song, play it.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include "kiosk.h"

#ifdef LOUNGE_HAVE_WIRINGPI
#include "lib/gpio_metronome.h"
#endif


volatile sig_atomic_t Kiosk::stopRequested = 0;

static bool hasMembers(const rapidjson::Value &obj, const char *section, const char *const names[])
{
    if (!obj.IsObject()) {
        fprintf(stderr, "kiosk: config: \"%s\" must be an object\n", section);
        return false;
    }
    for (unsigned i = 0; names[i]; i++) {
        if (!obj.HasMember(names[i])) {
            fprintf(stderr, "kiosk: config: \"%s\" is missing \"%s\"\n", section, names[i]);
            return false;
        }
    }
    return true;
}


Kiosk::Kiosk()
    : metronome(0),
      cold(true),
      camera(true),
      failure(false),
      timeScale(1),
      songChoice(0),
      baudRate(115200),
      cardSeconds(5),
      totalLoops(0),
      totalTime(0),
      currentState(0)
{}

Kiosk::~Kiosk()
{
    for (unsigned i = 0; i < synths.size(); i++) {
        delete synths[i]->board;
        delete synths[i];
    }
    delete metronome;
}

void Kiosk::requestShutdown()
{
    stopRequested = 1;
}

bool Kiosk::shutdownRequested()
{
    return stopRequested != 0;
}

void Kiosk::cancelShutdown()
{
    stopRequested = 0;
}

void Kiosk::fail(const char *why)
{
    fprintf(stderr, "kiosk: %s\n", why);
    failure = true;
    requestShutdown();
}

void Kiosk::attachPort(unsigned voice, SynthPort *port)
{
    if (voice >= synths.size()) {
        return;
    }
    Synth *s = synths[voice];
    s->port = port ? port : &s->serial;
    s->board->setPort(s->port);
    s->board->skipDelays = s->port != &s->serial;
}

bool Kiosk::setup()
{
    static const char *const topLevel[] = {
        "cardSeconds", "baudRate", "tickPeriod", "gpioPin", "catchUp", "camera",
        "synths", "singer", "songs", "faces", "faceSongs", 0 };
    static const char *const synthKeys[] = { "name", "port", "muteRests", "fadeAtEnd", "warmup", 0 };
    static const char *const singerKeys[] = { "enabled", "command", 0 };
    static const char *const faceKeys[] = {
        "camera", "cascade", "model", "encodings", "scaleFactor", "minNeighbors", "minSize",
        "tolerance", "frameWait", "frameWidth", "warmupSeconds", "holdSeconds", "timeoutSeconds", 0 };

    const rapidjson::Value &config = runner.config;

    if (!hasMembers(config, "top level", topLevel) ||
        !hasMembers(config["singer"], "singer", singerKeys) ||
        !hasMembers(config["faces"], "faces", faceKeys)) {
        return false;
    }

    cardSeconds = config["cardSeconds"].GetDouble();
    baudRate = config["baudRate"].GetUint();
    camera = config["camera"].GetBool();
    cards.setHeadless(runner.isHeadless());
    cards.setStopFlag(&stopRequested);

    // Synth boards

    const rapidjson::Value &synthList = config["synths"];
    if (!synthList.IsArray() || synthList.Size() != Song::kVoices) {
        fprintf(stderr, "kiosk: config: \"synths\" must list %u boards\n", Song::kVoices);
        return false;
    }

    for (rapidjson::SizeType i = 0; i < synthList.Size(); i++) {
        const rapidjson::Value &sc = synthList[i];
        if (!hasMembers(sc, "synths[]", synthKeys)) {
            return false;
        }

        const rapidjson::Value &warmup = sc["warmup"];
        if (!warmup.IsArray() || warmup.Size() != 3 || !warmup[0].IsString() ||
            !warmup[1].IsUint() || !warmup[2].IsUint() || Song::noteKey(warmup[0].GetString()) < 0) {
            fprintf(stderr, "kiosk: config: warmup for %s must be [note, octave, volume]\n", sc["name"].GetString());
            return false;
        }

        Synth *s = new Synth;
        s->device = sc["port"].GetString();
        s->port = &s->serial;
        s->board = new ArduTouch(sc["name"].GetString(), s->port);
        s->muteRests = sc["muteRests"].GetBool();
        s->fadeAtEnd = sc["fadeAtEnd"].GetBool();
        s->warmupKey = Song::noteKey(warmup[0].GetString());
        s->warmupOctave = warmup[1].GetUint();
        s->warmupVolume = warmup[2].GetUint();
        synths.push_back(s);

        sequencer.setSynth(i, s->board, s->muteRests, s->fadeAtEnd);
    }

    sequencer.setCatchUp(config["catchUp"].GetBool());
    sequencer.setVerbose(runner.isVerbose());

    singer.setConfig(config["singer"]);
    sequencer.setSinger(&singer);

    // Songs, numbered in the order they're listed

    const rapidjson::Value &songList = config["songs"];
    if (!songList.IsArray() || songList.Size() == 0) {
        fprintf(stderr, "kiosk: config: \"songs\" must list at least one song file\n");
        return false;
    }

    songs.resize(songList.Size());
    for (rapidjson::SizeType i = 0; i < songList.Size(); i++) {
        if (!songList[i].IsString() || !songs[i].load(songList[i].GetString())) {
            fprintf(stderr, "kiosk: can't load song %d\n", (int)i);
            return false;
        }
        if (runner.isVerbose()) {
            fprintf(stderr, "kiosk: song %d \"%s\", %u ticks\n", (int)i, songs[i].title.c_str(), songs[i].lengthInTicks());
        }
    }

    if (runner.forcedSong >= int(songs.size())) {
        fprintf(stderr, "kiosk: there is no song %d\n", runner.forcedSong);
        return false;
    }

    songTable.setSongCount(songs.size());
    if (!songTable.setConfig(config["faceSongs"])) {
        return false;
    }

    // Faces

    if (camera && runner.forcedSong < 0) {
        chooser.setConfig(config["faces"]);
        chooser.setHeadless(runner.isHeadless());
        chooser.setVerbose(runner.isVerbose());
        chooser.setStopFlag(&stopRequested);
        if (!chooser.setup()) {
            return false;
        }
    }

    prng.seed(time(0));
    currentState = runner.initialState;
    return true;
}

bool Kiosk::run()
{
    totalTime = 0;
    totalLoops = 0;

    while (!shutdownRequested()) {
        step();
    }

    fprintf(stderr, "kiosk: shutting down\n");
    shutDownSynths(true);
    return !failure;
}

int Kiosk::step()
{
    typedef std::chrono::steady_clock clock;

    if (runner.isVerbose()) {
        fprintf(stderr, "kiosk: state %d\n", currentState);
    }

    clock::time_point start = clock::now();
    int nextState = script(currentState);
    double elapsed = std::chrono::duration<double>(clock::now() - start).count();

    totalTime += elapsed;
    singleStateTime[currentState] += elapsed;

    if (nextState == runner.initialState && !failure) {
        totalLoops++;
        logSummary();
    }

    currentState = nextState;
    return currentState;
}

void Kiosk::logSummary()
{
    fprintf(stderr, "kiosk: ------------------- Summary ------------------\n");
    fprintf(stderr, "kiosk: Total loops: %d\n", totalLoops);
    fprintf(stderr, "kiosk:       loop total "); formatTime(totalTime);
    fprintf(stderr, "  average ");
    formatTime(totalTime / totalLoops);
    fprintf(stderr, "\n");

    for (std::map<int, double>::iterator it = singleStateTime.begin(); it != singleStateTime.end(); it++) {
        fprintf(stderr, "kiosk: state %-3d  total ", it->first);
        formatTime(it->second);
        fprintf(stderr, "  average ");
        formatTime(it->second / totalLoops);
        fprintf(stderr, "\n");
    }

    fprintf(stderr, "kiosk: ----------------------------------------------\n");
}

void Kiosk::formatTime(double s)
{
    fprintf(stderr, "%02d:%02d:%05.2f", (int)s / (60*60), ((int)s / 60) % 60, fmod(s, 60));
}

void Kiosk::sleep(float seconds)
{
    seconds *= timeScale;

    // Short naps, so a shutdown request isn't kept waiting
    while (seconds > 0 && !shutdownRequested()) {
        float nap = std::min(seconds, 0.05f);
        usleep(unsigned(nap * 1e6));
        seconds -= nap;
    }
}

void Kiosk::clearScreen()
{
    printf("\033[2J\033[H");
    fflush(stdout);
}

void Kiosk::showCard(const TitleCard &card)
{
    if (!shutdownRequested()) {
        cards.show(card);
    }
}

bool Kiosk::initSynths(bool cold)
{
    printf("\n\nResetting everything for the next consumer with unique desires...\n");
    fflush(stdout);
    sleep(0.6f);
    printf("    Please enjoy waiting patiently...\n\n\n");
    fflush(stdout);

    TitleCard card(1400, 500, 210, 60, cardSeconds * 0.8f);
    card.lines[0] = "Resetting everything for the";
    card.lines[1] = "          next consumer with unique desires...";
    card.lines[4] = "               Please enjoy waiting patiently...";
    showCard(card);

    if (cold) {
        printf("Opening serial ports...\n");
        for (unsigned i = 0; i < synths.size(); i++) {
            Synth *s = synths[i];
            if (s->port != &s->serial) {
                continue;
            }
            if (!s->serial.open(s->device.c_str(), baudRate)) {
                fprintf(stderr, "kiosk: can't reach %s on %s\n", s->board->name(), s->device.c_str());
                return false;
            }
        }
        // Opening the port resets the boards
        sleep(2);
        printf(".......................done\n");
    }

    printf("Resetting synths...\n");
    for (unsigned i = 0; i < synths.size(); i++) {
        synths[i]->board->reset();
    }
    sleep(3);
    printf("....................done\n");

    if (cold) {
        printf("Exit remote mode...\n");
        for (unsigned i = 0; i < synths.size(); i++) {
            synths[i]->board->exitRemote();
        }
        printf("...................done\n");
    }

    // The first note after a reset is an anomaly on some boards; get it out of the way quietly
    printf("Playing initial note on each synth...\n");
    for (unsigned i = 0; i < synths.size(); i++) {
        Synth *s = synths[i];
        s->board->setVolume(s->warmupVolume);
        s->board->playNote(s->warmupKey, s->warmupOctave);
    }
    sleep(3);
    for (unsigned i = 0; i < synths.size(); i++) {
        synths[i]->board->stopNote();
    }
    for (unsigned i = 0; i < synths.size(); i++) {
        if (synths[i]->muteRests) {
            synths[i]->board->setVolume(0);
        }
    }
    sleep(1);
    printf(".....................................done\n");
    fflush(stdout);

    if (cold && !metronome) {
        const std::string &source = runner.tickSource;

        if (source == "clock") {
            metronome = new ClockMetronome(runner.config["tickPeriod"].GetDouble());
            metronome->setStopFlag(&stopRequested);

        } else if (source == "gpio") {
#ifdef LOUNGE_HAVE_WIRINGPI
            printf("Starting interrupts...\n");
            GpioMetronome *gpio = new GpioMetronome(runner.config["gpioPin"].GetInt());
            gpio->setStopFlag(&stopRequested);
            metronome = gpio;
            if (!gpio->setup()) {
                return false;
            }
            printf("......................done\n");
#else
            fprintf(stderr, "kiosk: built without GPIO support; use -tick clock\n");
            return false;
#endif
        } else {
            fprintf(stderr, "kiosk: unknown tick source \"%s\"\n", source.c_str());
            return false;
        }
    }

    return true;
}

void Kiosk::shutDownSynths(bool final)
{
    if (final && metronome) {
        metronome->stop();
    }

    printf("stop notes on synths...\n");
    for (unsigned i = 0; i < synths.size(); i++) {
        if (synths[i]->port->isOpen()) {
            synths[i]->board->stopNote();
        }
    }
    printf(".......................done\n");

    if (final) {
        printf("Close serial ports...\n");
        for (unsigned i = 0; i < synths.size(); i++) {
            synths[i]->serial.close();
        }
        printf(".....................done\n");
    }
    fflush(stdout);
}

void Kiosk::showCredits()
{
    sleep(1);
    clearScreen();

    printf("\n\n\n\n\n");
    printf("                       LOUNGE LOOKER\n");
    fflush(stdout);
    sleep(0.25f);
    printf("                            by\n");
    printf("                       Mitch Altman\n");
    printf("\n\n\n\n\n");
    fflush(stdout);

    TitleCard card(1000, 500, 275, 60, cardSeconds, true);
    card.lines[1] = "LOUNGE LOOKER";
    card.lines[2] = "     by";
    card.lines[3] = "Mitch Altman";
    showCard(card);
}

void Kiosk::showGreeting()
{
    sleep(1);
    clearScreen();

    printf("\n\n\n\n\n");
    printf("                       WE ARE ABOUT TO CALCULATE YOUR DESIRES\n");
    fflush(stdout);
    sleep(0.6f);
    printf("                 AND CHOOSE THE PERFECT SONG TO FULFILL THEM!\n");
    printf("\n\n\n\n\n");
    fflush(stdout);

    TitleCard card(1500, 500, 125, 60, cardSeconds);
    card.lines[3] = "           We Are About to Calculate Your Desires";
    card.lines[5] = "     and Choose the PERFECT LOUNGE SONG to Fulfill Them!";
    showCard(card);
}

unsigned Kiosk::lookAndChoose()
{
    if (runner.forcedSong >= 0) {
        return runner.forcedSong;
    }

    std::string name = FaceDatabase::unknownName();

    if (camera && !chooser.look(name)) {
        fprintf(stderr, "kiosk: looking failed, choosing a random song\n");
        name = FaceDatabase::unknownName();
    }

    unsigned number = songTable.choose(name, prng);

    if (runner.isVerbose()) {
        fprintf(stderr, "kiosk: face \"%s\" chose song %u\n", name.c_str(), number);
    }

    printf("\n\n     The song number to play is: %u (%s)\n\n\n", number, songs[number].title.c_str());
    fflush(stdout);
    return number;
}

void Kiosk::playSong(unsigned number)
{
    if (number >= songs.size() || !metronome) {
        return;
    }

    sequencer.reset(&songs[number]);
    metronome->start();

    while (!sequencer.done() && !shutdownRequested()) {
        if (!metronome->wait()) {
            break;
        }
        sequencer.tick();
    }

    metronome->stop();

    if (runner.isVerbose()) {
        fprintf(stderr, "kiosk: \"%s\" finished after %u ticks\n",
            songs[number].title.c_str(), sequencer.elapsedTicks());
    }
    printf("\n\n");
    fflush(stdout);
}

void Kiosk::showThanks()
{
    printf("\n\n\n\n\n");
    printf("               Thank you for letting us care about your desires!\n");
    printf("\n\n\n\n\n");
    fflush(stdout);

    TitleCard card(1400, 500, 125, 60, cardSeconds);
    card.lines[5] = "     Thank you for letting us care about your desires!";
    showCard(card);
}

void Kiosk::showNextConsumer()
{
    printf("\n\n\n\n\n");
    printf("                            Next Consumer, Please!\n");
    printf("\n");
    fflush(stdout);

    TitleCard card(1400, 500, 60, 60, cardSeconds);
    card.lines[2] = "               Next Consumer, Please!";
    showCard(card);

    // Scroll the console clear
    for (int i = 0; i < 15; i++) {
        printf("\n");
        fflush(stdout);
        sleep(0.1f);
    }
    sleep(0.5f);
}


Kiosk::KRunner::KRunner()
    : initialState(0),
      forcedSong(-1),
      tickSource("clock")
{
    if (!loadConfig("data/config.json")) {
        fprintf(stderr, "Can't load default configuration file\n");
    }
}

bool Kiosk::KRunner::loadConfig(const char *filename)
{
    if (!setConfig(filename)) {
        return false;
    }

    if (config.HasMember("initialState") && config["initialState"].IsInt()) {
        initialState = config["initialState"].GetInt();
    }
    if (config.HasMember("tickSource") && config["tickSource"].IsString()) {
        tickSource = config["tickSource"].GetString();
    }
    if (config.HasMember("verbose") && config["verbose"].IsBool() && config["verbose"].GetBool()) {
        setVerbose(true);
    }

    return true;
}

bool Kiosk::KRunner::parseArgument(int &i, int &argc, char **argv)
{
    if (!strcmp(argv[i], "-state") && (i+1 < argc)) {
        initialState = atoi(argv[++i]);
        return true;
    }

    if (!strcmp(argv[i], "-song") && (i+1 < argc)) {
        forcedSong = atoi(argv[++i]);
        return true;
    }

    if (!strcmp(argv[i], "-tick") && (i+1 < argc)) {
        tickSource = argv[++i];
        return true;
    }

    if (!strcmp(argv[i], "-config") && (i+1 < argc)) {
        if (!loadConfig(argv[++i])) {
            fprintf(stderr, "Can't load config from %s\n", argv[i]);
            return false;
        }
        return true;
    }

    return Runner::parseArgument(i, argc, argv);
}

void Kiosk::KRunner::argumentUsage()
{
    Runner::argumentUsage();
    fprintf(stderr, " [-state ST] [-song N] [-tick clock|gpio] [-config FILE.json]");
}

bool Kiosk::KRunner::validateArguments()
{
    if (tickSource != "clock" && tickSource != "gpio") {
        fprintf(stderr, "Tick source must be \"clock\" or \"gpio\"\n");
        return false;
    }
    return config.IsObject() && config.MemberCount() > 0 && Runner::validateArguments();
}
