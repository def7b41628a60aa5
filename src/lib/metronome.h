/*
 * Metronome: the sixteenth-note tick that drives song playback.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include <signal.h>
#include <chrono>
#include <thread>
#include <mutex>
#include <string>
#include <condition_variable>


class Metronome
{
public:
    Metronome() : stopFlag(0) {}
    virtual ~Metronome() {}

    virtual void start() = 0;
    virtual void stop() = 0;

    // Block until the next tick. Returns false if the metronome is stopped,
    // or if the stop flag has been raised.
    virtual bool wait() = 0;

    // Waiting gives up when this becomes nonzero
    void setStopFlag(const volatile sig_atomic_t *flag) { stopFlag = flag; }

protected:
    bool stopping() const { return stopFlag && *stopFlag; }

private:
    const volatile sig_atomic_t *stopFlag;
};


/*
 * Ticks from the steady clock. If the caller falls behind by a whole
 * period or more (a blocking speech call, for example) the missed ticks are
 * dropped and the schedule restarts from the current time.
 */
class ClockMetronome : public Metronome
{
public:
    typedef std::chrono::steady_clock clock;

    explicit ClockMetronome(double periodSeconds = 0.05);

    void setPeriod(double periodSeconds);
    double getPeriod() const;

    virtual void start();
    virtual void stop();
    virtual bool wait();

    // Number of ticks dropped since start()
    unsigned droppedTicks() const { return dropped; }

private:
    clock::duration period;
    clock::time_point next;
    bool running;
    unsigned dropped;
};


/*
 * Ticks from edges signalled by another thread or an interrupt handler.
 * Edges that pile up while the caller is busy count as one tick. The wait
 * is sliced so that a raised stop flag is noticed within 'poll', and a
 * warning is logged each 'quiet' without any edge.
 */
class EdgeMetronome : public Metronome
{
public:
    explicit EdgeMetronome(const std::string &name = "edge");

    virtual void start();
    virtual void stop();
    virtual bool wait();

    // One edge of the tick signal. Safe to call from any thread.
    void pulse();

    void setTimeouts(double pollSeconds, double quietSeconds);

    // Ticks delivered since start() that merged more than one edge
    unsigned coalescedTicks() const { return coalesced; }

private:
    std::string sourceName;
    bool running;
    unsigned pendingEdges;
    unsigned coalesced;
    std::chrono::milliseconds poll;
    std::chrono::milliseconds quiet;
    std::mutex lock;
    std::condition_variable edge;
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline ClockMetronome::ClockMetronome(double periodSeconds)
    : running(false),
      dropped(0)
{
    setPeriod(periodSeconds);
}

inline void ClockMetronome::setPeriod(double periodSeconds)
{
    period = std::chrono::duration_cast<clock::duration>(std::chrono::duration<double>(periodSeconds));
}

inline double ClockMetronome::getPeriod() const
{
    return std::chrono::duration_cast<std::chrono::duration<double> >(period).count();
}

inline void ClockMetronome::start()
{
    running = true;
    dropped = 0;
    next = clock::now() + period;
}

inline void ClockMetronome::stop()
{
    running = false;
}

inline bool ClockMetronome::wait()
{
    if (!running || stopping()) {
        return false;
    }

    clock::time_point now = clock::now();

    if (now >= next + period) {
        // Fell behind; tick once now and re-anchor
        dropped += unsigned((now - next) / period);
        next = now + period;
        return true;
    }

    std::this_thread::sleep_until(next);
    next += period;
    return running && !stopping();
}

inline EdgeMetronome::EdgeMetronome(const std::string &name)
    : sourceName(name),
      running(false),
      pendingEdges(0),
      coalesced(0),
      poll(50),
      quiet(2000)
{}

inline void EdgeMetronome::setTimeouts(double pollSeconds, double quietSeconds)
{
    poll = std::chrono::milliseconds(long(pollSeconds * 1000));
    quiet = std::chrono::milliseconds(long(quietSeconds * 1000));
}

inline void EdgeMetronome::start()
{
    std::lock_guard<std::mutex> guard(lock);
    pendingEdges = 0;
    coalesced = 0;
    running = true;
}

inline void EdgeMetronome::stop()
{
    std::lock_guard<std::mutex> guard(lock);
    running = false;
    edge.notify_all();
}

inline void EdgeMetronome::pulse()
{
    std::lock_guard<std::mutex> guard(lock);
    if (running) {
        pendingEdges++;
        edge.notify_one();
    }
}

inline bool EdgeMetronome::wait()
{
    std::unique_lock<std::mutex> guard(lock);
    std::chrono::milliseconds silent(0);

    while (running && pendingEdges == 0) {
        if (stopping()) {
            return false;
        }
        if (edge.wait_for(guard, poll) == std::cv_status::timeout && pendingEdges == 0) {
            silent += poll;
            if (silent >= quiet) {
                fprintf(stderr, "metronome: no ticks from %s for %.1f seconds\n",
                    sourceName.c_str(), silent.count() / 1000.0);
                silent = std::chrono::milliseconds(0);
            }
        }
    }

    if (pendingEdges > 1) {
        coalesced++;
    }
    pendingEdges = 0;
    return running && !stopping();
}
