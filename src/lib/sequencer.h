/*
 * Sequencer: plays a Song on three ArduTouch boards and a Singer,
 * one metronome tick at a time.
 *
 * Each synth voice holds its current note for the note's duration, counting
 * ticks down to zero before starting the next one. A voice ends one full
 * duration after its last note starts. The lyric voice sings words
 * immediately and only spends ticks on rests.
 *
 * Singing blocks the tick loop. To keep the synths from droning on through
 * every spoken word, singing can cut all currently held notes short
 * ("catch-up").
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include "ardutouch.h"
#include "singer.h"
#include "song.h"


class Sequencer
{
public:
    Sequencer();

    // Attach a board to a voice. Rests on 'muteRests' voices also zero the volume,
    // for boards that keep droning after a stop. 'fadeAtEnd' voices fade out when they finish.
    void setSynth(unsigned voice, ArduTouch *synth, bool muteRests = false, bool fadeAtEnd = false);

    void setSinger(Singer *s) { singer = s; }

    // Shorten held notes after each sung word
    void setCatchUp(bool enable) { catchUp = enable; }

    void setVerbose(bool enable) { verbose = enable; }

    // Rewind to the beginning of a song. The song must outlive playback.
    void reset(const Song *song);

    // Advance by one metronome tick
    void tick();

    // True once every voice, including lyrics, has finished
    bool done() const;

    bool voiceEnded(unsigned voice) const { return voices[voice].ended; }
    bool lyricsEnded() const { return lyricVoice.ended; }

    // Ticks remaining on the note a voice is holding
    unsigned heldTicks(unsigned voice) const { return voices[voice].tickCount; }

    unsigned elapsedTicks() const { return tickNumber; }

private:
    struct VoiceState {
        ArduTouch *synth;
        bool muteRests;
        bool fadeAtEnd;

        unsigned tickCount;
        unsigned next;
        bool lastNotePlaying;
        bool ended;

        VoiceState()
            : synth(0), muteRests(false), fadeAtEnd(false),
              tickCount(0), next(0), lastNotePlaying(false), ended(true) {}
    };

    struct LyricState {
        unsigned tickCount;
        unsigned next;
        bool ended;

        LyricState() : tickCount(0), next(0), ended(true) {}
    };

    const Song *song;
    Singer *singer;
    bool catchUp;
    bool verbose;
    unsigned tickNumber;

    VoiceState voices[Song::kVoices];
    LyricState lyricVoice;

    void tickVoice(unsigned v);
    void tickLyrics();
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline Sequencer::Sequencer()
    : song(0),
      singer(0),
      catchUp(true),
      verbose(false),
      tickNumber(0)
{}

inline void Sequencer::setSynth(unsigned voice, ArduTouch *synth, bool muteRests, bool fadeAtEnd)
{
    if (voice >= Song::kVoices) {
        return;
    }
    voices[voice].synth = synth;
    voices[voice].muteRests = muteRests;
    voices[voice].fadeAtEnd = fadeAtEnd;
}

inline void Sequencer::reset(const Song *s)
{
    song = s;
    tickNumber = 0;

    for (unsigned v = 0; v < Song::kVoices; v++) {
        VoiceState &vs = voices[v];
        vs.tickCount = 0;
        vs.next = 0;
        vs.lastNotePlaying = false;

        // Voices with nothing to play (or nowhere to play it) are finished before they start
        vs.ended = !song || song->voices[v].empty() || !vs.synth;
    }

    lyricVoice.tickCount = 0;
    lyricVoice.next = 0;
    lyricVoice.ended = !song || song->lyrics.empty();
}

inline bool Sequencer::done() const
{
    for (unsigned v = 0; v < Song::kVoices; v++) {
        if (!voices[v].ended) {
            return false;
        }
    }
    return lyricVoice.ended;
}

inline void Sequencer::tick()
{
    if (!song) {
        return;
    }

    for (unsigned v = 0; v < Song::kVoices; v++) {
        tickVoice(v);
    }
    tickLyrics();

    tickNumber++;
}

inline void Sequencer::tickVoice(unsigned v)
{
    VoiceState &vs = voices[v];
    const Song::Voice &notes = song->voices[v];

    if (vs.ended) {
        return;
    }

    if (vs.tickCount != 0) {
        // Keep holding the current note
        vs.tickCount--;
        return;
    }

    if (!vs.lastNotePlaying) {
        const SynthEvent &e = notes[vs.next];

        // Counting down to zero, so a one-tick note holds for no extra ticks
        vs.tickCount = e.ticks - 1;

        if (e.isRest()) {
            vs.synth->stopNote();
            if (vs.muteRests) {
                vs.synth->setVolume(0);
            }
        } else {
            vs.synth->setVolume(e.volume);
            vs.synth->playNote(e.key, e.octave);
        }

        if (verbose) {
            fprintf(stderr, "\t[sequencer] tick %u %s: event %u key %d octave %u volume %u ticks %u\n",
                tickNumber, vs.synth->name(), vs.next, e.key, e.octave, e.volume, e.ticks);
        }

        if (++vs.next == notes.size()) {
            vs.lastNotePlaying = true;
        }
        return;
    }

    // The last note has played for its full duration
    vs.ended = true;
    if (vs.fadeAtEnd) {
        vs.synth->fadeOut();
    }
    vs.synth->stopNote();

    if (verbose) {
        fprintf(stderr, "\t[sequencer] tick %u %s: end of voice\n", tickNumber, vs.synth->name());
    }
}

inline void Sequencer::tickLyrics()
{
    LyricState &ls = lyricVoice;

    if (ls.tickCount != 0) {
        ls.tickCount--;
        return;
    }

    if (ls.ended) {
        return;
    }

    const LyricEvent &e = song->lyrics[ls.next];

    if (e.isRest()) {
        ls.tickCount = e.ticks - 1;
    } else {
        std::string words = e.spoken();
        ls.tickCount = 0;

        printf("    %s\n", words.c_str());
        fflush(stdout);

        if (singer && !singer->sing(words)) {
            fprintf(stderr, "sequencer: couldn't sing \"%s\"\n", words.c_str());
        }

        if (catchUp) {
            for (unsigned v = 0; v < Song::kVoices; v++) {
                voices[v].tickCount = 0;
            }
        }
    }

    if (++ls.next == song->lyrics.size()) {
        ls.ended = true;
    }
}
