/*
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#include <stdio.h>
#include <string>
#include <gtest/gtest.h>
#include "kiosk.h"
#include "fakes.h"


static const char *kSong =
    "{ \"title\": \"Short Song\","
    "  \"voices\": ["
    "    [ [\"C\", 4, 100, \"q\"] ],"
    "    [ [\"E\", 4, 60, \"e\"] ],"
    "    [ [\"G\", 2, 90, \"q\"] ] ],"
    "  \"lyrics\": [ \"la\" ] }";


class KioskTest : public testing::Test
{
protected:
    virtual void SetUp()
    {
        Kiosk::cancelShutdown();

        songPath = testing::TempDir() + "/kiosk_short_song.json";
        FILE *f = fopen(songPath.c_str(), "w");
        ASSERT_TRUE(f != 0);
        fputs(kSong, f);
        fclose(f);
    }

    virtual void TearDown()
    {
        Kiosk::cancelShutdown();
        remove(songPath.c_str());
    }

    std::string config(const char *lastPort = "/dev/ttyUSB2")
    {
        return std::string(
            "{ \"cardSeconds\": 0, \"baudRate\": 115200, \"tickPeriod\": 0.001,"
            "  \"gpioPin\": 23, \"catchUp\": true, \"camera\": false,"
            "  \"synths\": ["
            "    { \"name\": \"Thick\", \"port\": \"/dev/ttyUSB0\", \"muteRests\": false, \"fadeAtEnd\": false, \"warmup\": [\"D\", 3, 20] },"
            "    { \"name\": \"Hocus\", \"port\": \"/dev/ttyUSB1\", \"muteRests\": false, \"fadeAtEnd\": false, \"warmup\": [\"G\", 3, 5] },"
            "    { \"name\": \"Dronetic\", \"port\": \"") + lastPort + "\", \"muteRests\": true, \"fadeAtEnd\": true, \"warmup\": [\"G\", 2, 10] } ],"
            "  \"singer\": { \"enabled\": false, \"command\": \"espeak\" },"
            "  \"songs\": [ \"" + songPath + "\" ],"
            "  \"faces\": { \"camera\": 0, \"cascade\": \"\", \"model\": \"\", \"encodings\": \"\","
            "    \"scaleFactor\": 1.1, \"minNeighbors\": 5, \"minSize\": 30, \"tolerance\": 1.128,"
            "    \"frameWait\": 20, \"frameWidth\": 500, \"warmupSeconds\": 0, \"holdSeconds\": 0,"
            "    \"timeoutSeconds\": 0 },"
            "  \"faceSongs\": {} }";
    }

    void setUpKiosk(const char *lastPort = "/dev/ttyUSB2", unsigned attached = 3)
    {
        ASSERT_TRUE(kiosk.runner.setConfigString(config(lastPort).c_str()));
        kiosk.runner.setHeadless(true);
        ASSERT_TRUE(kiosk.setup());
        for (unsigned i = 0; i < attached; i++) {
            kiosk.attachPort(i, &ports[i]);
        }
        kiosk.setTimeScale(0);
    }

    std::string songPath;
    RecordingPort ports[3];
    Kiosk kiosk;
};


TEST_F(KioskTest, OneVisit)
{
    setUpKiosk();
    EXPECT_EQ(0, kiosk.state());

    EXPECT_EQ(10, kiosk.step());
    for (unsigned i = 0; i < 3; i++) {
        EXPECT_EQ("", ports[i].take());
    }

    // Cold start: reset, leave remote mode, one quiet note, mute the droning board
    EXPECT_EQ(20, kiosk.step());
    EXPECT_EQ("`v20\\k3x`k `", ports[0].take());
    EXPECT_EQ("`v5\\k3b`k `", ports[1].take());
    EXPECT_EQ("`v10\\k2b`k `v0\\", ports[2].take());
    for (unsigned i = 0; i < 3; i++) {
        ASSERT_EQ(2u, ports[i].rts.size());
        EXPECT_TRUE(ports[i].rts[0]);
        EXPECT_FALSE(ports[i].rts[1]);
    }

    EXPECT_EQ(30, kiosk.step());
    EXPECT_EQ(40, kiosk.step());

    // No camera and nobody in the table; the only song gets chosen
    EXPECT_EQ(50, kiosk.step());
    std::string thick = ports[0].take();
    std::string dronetic = ports[2].take();
    EXPECT_NE(std::string::npos, thick.find("v100\\k4z`"));
    EXPECT_NE(std::string::npos, ports[1].take().find("v60\\k4c`"));
    EXPECT_NE(std::string::npos, dronetic.find("v90\\k2b`"));
    EXPECT_NE(std::string::npos, dronetic.find("v200\\v180\\v150\\v100\\v80\\v60\\v40\\v20\\v0\\"));

    EXPECT_EQ(60, kiosk.step());
    for (unsigned i = 0; i < 3; i++) {
        EXPECT_EQ("k `", ports[i].take());
    }

    EXPECT_EQ(0, kiosk.step());
    EXPECT_FALSE(kiosk.failed());
}

TEST_F(KioskTest, WarmRestartStaysInRemoteMode)
{
    setUpKiosk();
    for (unsigned i = 0; i < 7; i++) {
        kiosk.step();
    }
    ASSERT_EQ(0, kiosk.state());
    for (unsigned i = 0; i < 3; i++) {
        ports[i].take();
    }

    EXPECT_EQ(10, kiosk.step());
    EXPECT_EQ(20, kiosk.step());
    EXPECT_EQ("v20\\k3x`k `", ports[0].take());
    EXPECT_EQ("v10\\k2b`k `v0\\", ports[2].take());
    EXPECT_EQ(4u, ports[1].rts.size());
}

TEST_F(KioskTest, ShutdownStopsNotes)
{
    setUpKiosk();
    kiosk.step();
    kiosk.step();
    for (unsigned i = 0; i < 3; i++) {
        ports[i].take();
    }

    Kiosk::requestShutdown();
    EXPECT_TRUE(kiosk.run());
    EXPECT_FALSE(kiosk.failed());
    for (unsigned i = 0; i < 3; i++) {
        EXPECT_EQ("k `", ports[i].take());
    }
}

TEST_F(KioskTest, UnreachableSynthEndsTheRun)
{
    setUpKiosk("/nonexistent/ttyUSB9", 2);

    EXPECT_FALSE(kiosk.run());
    EXPECT_TRUE(kiosk.failed());
    EXPECT_TRUE(Kiosk::shutdownRequested());

    // Nothing was reset or played; the reachable boards are only told to stop
    for (unsigned i = 0; i < 2; i++) {
        EXPECT_TRUE(ports[i].rts.empty());
        EXPECT_EQ("k `", ports[i].take());
    }
}
