/*
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#include <string>
#include <gtest/gtest.h>
#include "lib/song.h"


static bool parseSong(Song &song, const char *json)
{
    rapidjson::Document doc;
    doc.Parse<0>(json);
    if (doc.HasParseError()) {
        return false;
    }
    return song.parse(doc, "test");
}

TEST(SongTest, NoteNames)
{
    EXPECT_EQ(0, Song::noteKey("C"));
    EXPECT_EQ(1, Song::noteKey("C#"));
    EXPECT_EQ(3, Song::noteKey("D#"));
    EXPECT_EQ(11, Song::noteKey("B"));
    EXPECT_EQ(-1, Song::noteKey("H"));
    EXPECT_EQ(-1, Song::noteKey("c"));
    EXPECT_EQ(-1, Song::noteKey(""));
}

TEST(SongTest, Durations)
{
    EXPECT_EQ(16u, Song::durationTicks("w"));
    EXPECT_EQ(8u, Song::durationTicks("h"));
    EXPECT_EQ(4u, Song::durationTicks("q"));
    EXPECT_EQ(2u, Song::durationTicks("e"));
    EXPECT_EQ(1u, Song::durationTicks("s"));
    EXPECT_EQ(16u, Song::durationTicks("W"));
    EXPECT_EQ(4u, Song::durationTicks("Q"));
    EXPECT_EQ(0u, Song::durationTicks("x"));
    EXPECT_EQ(0u, Song::durationTicks("qq"));
    EXPECT_EQ(0u, Song::durationTicks(""));
}

TEST(SongTest, ParsesVoicesAndLyrics)
{
    Song song;
    ASSERT_TRUE(parseSong(song,
        "{ \"title\": \"Test Song\","
        "  \"voices\": ["
        "    [ [\"C\", 2, 255, \"w\"], [\"R\", \"q\"], [\"G#\", 3, 10, \"s\"] ],"
        "    [ [\"A\", 4, 0, \"h\"] ],"
        "    [ ]"
        "  ],"
        "  \"lyrics\": [ \"I_did\", [\"R\", \"e\"], \"it\" ] }"));

    EXPECT_EQ("Test Song", song.title);

    ASSERT_EQ(3u, song.voices[0].size());
    EXPECT_EQ(0, song.voices[0][0].key);
    EXPECT_EQ(2u, song.voices[0][0].octave);
    EXPECT_EQ(255u, song.voices[0][0].volume);
    EXPECT_EQ(16u, song.voices[0][0].ticks);
    EXPECT_TRUE(song.voices[0][1].isRest());
    EXPECT_EQ(4u, song.voices[0][1].ticks);
    EXPECT_EQ(8, song.voices[0][2].key);
    EXPECT_EQ(1u, song.voices[0][2].ticks);

    ASSERT_EQ(1u, song.voices[1].size());
    EXPECT_EQ(9, song.voices[1][0].key);
    EXPECT_TRUE(song.voices[2].empty());

    ASSERT_EQ(3u, song.lyrics.size());
    EXPECT_FALSE(song.lyrics[0].isRest());
    EXPECT_EQ("I did", song.lyrics[0].spoken());
    EXPECT_TRUE(song.lyrics[1].isRest());
    EXPECT_EQ(2u, song.lyrics[1].ticks);
    EXPECT_EQ("it", song.lyrics[2].words);

    EXPECT_EQ(21u, song.lengthInTicks());
}

TEST(SongTest, LyricsAreOptional)
{
    Song song;
    ASSERT_TRUE(parseSong(song, "{ \"voices\": [ [], [], [] ] }"));
    EXPECT_TRUE(song.lyrics.empty());
    EXPECT_EQ("test", song.title);
    EXPECT_EQ(0u, song.lengthInTicks());
}

TEST(SongTest, RejectsBadSongs)
{
    Song song;

    // Wrong number of voices
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [], [] ] }"));
    EXPECT_FALSE(parseSong(song, "{ \"voices\": {} }"));
    EXPECT_FALSE(parseSong(song, "[ 1, 2, 3 ]"));

    // Unknown note
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [ [\"H\", 2, 255, \"q\"] ], [], [] ] }"));

    // Octave and volume ranges
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [ [\"C\", 8, 255, \"q\"] ], [], [] ] }"));
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [ [\"C\", 2, 256, \"q\"] ], [], [] ] }"));
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [ [\"C\", -1, 20, \"q\"] ], [], [] ] }"));

    // Durations
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [ [\"C\", 2, 255, \"t\"] ], [], [] ] }"));
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [ [\"R\", \"t\"] ], [], [] ] }"));

    // Malformed records
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [ [\"C\", 2, 255] ], [], [] ] }"));
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [ [\"X\", \"q\"] ], [], [] ] }"));
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [ \"C\" ], [], [] ] }"));

    // Lyrics
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [], [], [] ], \"lyrics\": \"la\" }"));
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [], [], [] ], \"lyrics\": [ \"\" ] }"));
    EXPECT_FALSE(parseSong(song, "{ \"voices\": [ [], [], [] ], \"lyrics\": [ 5 ] }"));
}

TEST(SongTest, MissingFile)
{
    Song song;
    EXPECT_FALSE(song.load("/nonexistent/song.json"));
}

TEST(SongTest, InstalledSongsLoad)
{
    static const char *files[] = {
        "my_way.json", "moon_river.json", "strangers_in_the_night.json",
        "love_story.json", "this_guys_in_love.json" };
    static const char *titles[] = {
        "My Way", "Moon River", "Strangers in the Night",
        "Theme from Love Story", "This Guy's in Love" };

    for (unsigned i = 0; i < 5; i++) {
        std::string path = std::string(LOUNGE_SOURCE_DIR) + "/data/songs/" + files[i];
        Song song;
        ASSERT_TRUE(song.load(path.c_str())) << path;
        EXPECT_EQ(titles[i], song.title);
        EXPECT_GT(song.lengthInTicks(), 0u);
        EXPECT_FALSE(song.lyrics.empty());
        for (unsigned v = 0; v < Song::kVoices; v++) {
            EXPECT_FALSE(song.voices[v].empty()) << path << " voice " << v;
        }
    }
}
