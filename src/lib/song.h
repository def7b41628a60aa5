/*
 * Songs for three ArduTouch voices plus a sung lyric voice.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include <string.h>
#include <ctype.h>
#include <string>
#include <vector>
#include <algorithm>
#include <rapidjson/document.h>
#include <rapidjson/filereadstream.h>
#include <rapidjson/error/en.h>


/*
 * One note or rest on a synth voice. Timing is in metronome ticks,
 * where a tick is a sixteenth note.
 */
struct SynthEvent
{
    static const int kRest = -1;

    int key;            // Semitone, 0 = C ... 11 = B, or kRest
    unsigned octave;    // 0 through 7
    unsigned volume;    // 0 through 255
    unsigned ticks;     // 1, 2, 4, 8 or 16

    SynthEvent() : key(kRest), octave(0), volume(0), ticks(1) {}

    bool isRest() const { return key == kRest; }
};

/*
 * One lyric entry. Words are sung instantly and take no ticks;
 * rests hold the lyric voice for their duration.
 */
struct LyricEvent
{
    std::string words;  // Words separated by '_', empty for a rest
    unsigned ticks;

    LyricEvent() : ticks(0) {}

    bool isRest() const { return words.empty(); }

    // Words with '_' replaced by spaces, ready to speak
    std::string spoken() const;
};


class Song
{
public:
    static const unsigned kVoices = 3;
    static const unsigned kMaxOctave = 7;
    static const unsigned kMaxVolume = 255;

    typedef std::vector<SynthEvent> Voice;
    typedef std::vector<LyricEvent> Lyrics;

    std::string title;
    Voice voices[kVoices];
    Lyrics lyrics;

    // Load a JSON song file. Reports problems on stderr.
    bool load(const char *filename);

    // Parse an already-decoded JSON song. 'origin' names the source in error messages.
    bool parse(const rapidjson::Value &doc, const char *origin);

    // Total length of the longest synth voice, in ticks
    unsigned lengthInTicks() const;

    // Note name ("C", "C#", ... "B") to semitone, or -1 if unknown
    static int noteKey(const char *name);

    // Duration letter (w, h, q, e, s) to ticks, or 0 if unknown
    static unsigned durationTicks(const char *code);

private:
    bool parseVoice(const rapidjson::Value &v, Voice &out, unsigned voice, const char *origin);
    bool parseLyrics(const rapidjson::Value &v, const char *origin);
    bool parseRest(const rapidjson::Value &rec, unsigned &ticks);
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline std::string LyricEvent::spoken() const
{
    std::string s = words;
    for (unsigned i = 0; i < s.size(); ++i) {
        if (s[i] == '_') {
            s[i] = ' ';
        }
    }
    return s;
}

inline int Song::noteKey(const char *name)
{
    static const char *names[] = { "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B" };

    for (int i = 0; i < 12; i++) {
        if (!strcmp(name, names[i])) {
            return i;
        }
    }
    return -1;
}

inline unsigned Song::durationTicks(const char *code)
{
    if (!code[0] || code[1]) {
        return 0;
    }

    switch (tolower((unsigned char) code[0])) {
        case 'w': return 16;
        case 'h': return 8;
        case 'q': return 4;
        case 'e': return 2;
        case 's': return 1;
        default:  return 0;
    }
}

inline bool Song::load(const char *filename)
{
    FILE *f = fopen(filename, "r");
    if (!f) {
        fprintf(stderr, "song: Can't open %s\n", filename);
        return false;
    }

    char buffer[4096];
    rapidjson::FileReadStream istr(f, buffer, sizeof buffer);
    rapidjson::Document doc;
    doc.ParseStream<0>(istr);
    fclose(f);

    if (doc.HasParseError()) {
        fprintf(stderr, "song: %s: JSON error at offset %u: %s\n", filename,
            (unsigned) doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError()));
        return false;
    }

    return parse(doc, filename);
}

inline bool Song::parse(const rapidjson::Value &doc, const char *origin)
{
    if (!doc.IsObject()) {
        fprintf(stderr, "song: %s: top level must be an object\n", origin);
        return false;
    }

    if (doc.HasMember("title") && doc["title"].IsString()) {
        title = doc["title"].GetString();
    } else {
        title = origin;
    }

    if (!doc.HasMember("voices") || !doc["voices"].IsArray() || doc["voices"].Size() != kVoices) {
        fprintf(stderr, "song: %s: \"voices\" must be an array of %u voices\n", origin, kVoices);
        return false;
    }

    const rapidjson::Value &voiceArray = doc["voices"];
    for (unsigned i = 0; i < kVoices; i++) {
        if (!parseVoice(voiceArray[i], voices[i], i, origin)) {
            return false;
        }
    }

    lyrics.clear();
    if (doc.HasMember("lyrics")) {
        return parseLyrics(doc["lyrics"], origin);
    }
    return true;
}

inline bool Song::parseRest(const rapidjson::Value &rec, unsigned &ticks)
{
    // ["R", duration]
    if (!rec.IsArray() || rec.Size() != 2 || !rec[0].IsString() || !rec[1].IsString()) {
        return false;
    }
    if (strcmp(rec[0].GetString(), "R")) {
        return false;
    }
    ticks = durationTicks(rec[1].GetString());
    return ticks != 0;
}

inline bool Song::parseVoice(const rapidjson::Value &v, Voice &out, unsigned voice, const char *origin)
{
    out.clear();

    if (!v.IsArray()) {
        fprintf(stderr, "song: %s: voice %u is not an array\n", origin, voice);
        return false;
    }

    for (rapidjson::SizeType i = 0; i < v.Size(); i++) {
        const rapidjson::Value &rec = v[i];
        SynthEvent e;

        if (rec.IsArray() && rec.Size() == 2) {
            if (!parseRest(rec, e.ticks)) {
                fprintf(stderr, "song: %s: voice %u event %d: bad rest\n", origin, voice, (int)i);
                return false;
            }
            out.push_back(e);
            continue;
        }

        // [note, octave, volume, duration]
        if (!rec.IsArray() || rec.Size() != 4 || !rec[0].IsString() ||
            !rec[1].IsUint() || !rec[2].IsUint() || !rec[3].IsString()) {
            fprintf(stderr, "song: %s: voice %u event %d: expected [note, octave, volume, duration]\n",
                origin, voice, (int)i);
            return false;
        }

        e.key = noteKey(rec[0].GetString());
        e.octave = rec[1].GetUint();
        e.volume = rec[2].GetUint();
        e.ticks = durationTicks(rec[3].GetString());

        if (e.key < 0) {
            fprintf(stderr, "song: %s: voice %u event %d: unknown note \"%s\"\n",
                origin, voice, (int)i, rec[0].GetString());
            return false;
        }
        if (e.octave > kMaxOctave) {
            fprintf(stderr, "song: %s: voice %u event %d: octave %u out of range\n",
                origin, voice, (int)i, e.octave);
            return false;
        }
        if (e.volume > kMaxVolume) {
            fprintf(stderr, "song: %s: voice %u event %d: volume %u out of range\n",
                origin, voice, (int)i, e.volume);
            return false;
        }
        if (!e.ticks) {
            fprintf(stderr, "song: %s: voice %u event %d: unknown duration \"%s\"\n",
                origin, voice, (int)i, rec[3].GetString());
            return false;
        }

        out.push_back(e);
    }

    return true;
}

inline bool Song::parseLyrics(const rapidjson::Value &v, const char *origin)
{
    if (!v.IsArray()) {
        fprintf(stderr, "song: %s: \"lyrics\" is not an array\n", origin);
        return false;
    }

    for (rapidjson::SizeType i = 0; i < v.Size(); i++) {
        const rapidjson::Value &rec = v[i];
        LyricEvent e;

        if (rec.IsString() && rec.GetStringLength() > 0) {
            e.words = rec.GetString();
        } else if (!parseRest(rec, e.ticks)) {
            fprintf(stderr, "song: %s: lyric %d: expected a word or [\"R\", duration]\n", origin, (int)i);
            return false;
        }

        lyrics.push_back(e);
    }

    return true;
}

inline unsigned Song::lengthInTicks() const
{
    unsigned longest = 0;
    for (unsigned v = 0; v < kVoices; v++) {
        unsigned total = 0;
        for (unsigned i = 0; i < voices[v].size(); i++) {
            total += voices[v][i].ticks;
        }
        longest = std::max(longest, total);
    }
    return longest;
}
