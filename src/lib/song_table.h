/*
 * Which song goes with which face.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include <string.h>
#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "prng.h"


class SongTable
{
public:
    static const int kRandom = -1;

    SongTable() : songCount(0) {}

    // Number of songs available; random choices are drawn from [0, count)
    void setSongCount(unsigned count) { songCount = count; }
    unsigned getSongCount() const { return songCount; }

    void set(const std::string &name, int song);
    void clear() { entries.clear(); }

    /*
     * JSON object of face name to song number, or to "R" for a random song:
     * { "frank_sinatra": 3, "mitch": "R" }
     */
    bool setConfig(const rapidjson::Value &config);

    // Song number for a face name. kRandom if unmapped or random.
    int lookup(const std::string &name) const;

    // Song to play for a face name; falls back to a random song
    unsigned choose(const std::string &name, PRNG &prng) const;

private:
    struct Entry {
        std::string name;
        int song;
    };

    std::vector<Entry> entries;
    unsigned songCount;
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline void SongTable::set(const std::string &name, int song)
{
    for (unsigned i = 0; i < entries.size(); i++) {
        if (entries[i].name == name) {
            entries[i].song = song;
            return;
        }
    }

    Entry e;
    e.name = name;
    e.song = song;
    entries.push_back(e);
}

inline bool SongTable::setConfig(const rapidjson::Value &config)
{
    if (!config.IsObject()) {
        fprintf(stderr, "songtable: face to song map must be a JSON object\n");
        return false;
    }

    clear();
    for (rapidjson::Value::ConstMemberIterator it = config.MemberBegin(); it != config.MemberEnd(); ++it) {
        const char *name = it->name.GetString();
        const rapidjson::Value &v = it->value;

        if (v.IsString() && !strcmp(v.GetString(), "R")) {
            set(name, kRandom);
        } else if (v.IsInt() && v.GetInt() >= 0) {
            set(name, v.GetInt());
        } else {
            fprintf(stderr, "songtable: \"%s\" must map to a song number or \"R\"\n", name);
            return false;
        }
    }

    return true;
}

inline int SongTable::lookup(const std::string &name) const
{
    for (unsigned i = 0; i < entries.size(); i++) {
        if (entries[i].name == name) {
            return entries[i].song;
        }
    }
    return kRandom;
}

inline unsigned SongTable::choose(const std::string &name, PRNG &prng) const
{
    int song = lookup(name);

    if (song != kRandom && unsigned(song) >= songCount) {
        fprintf(stderr, "songtable: \"%s\" maps to song %d, but there are only %u songs\n",
            name.c_str(), song, songCount);
        song = kRandom;
    }

    if (song == kRandom) {
        return prng.index(songCount);
    }
    return song;
}
