/*
 * Look at the consumer through the webcam and choose the perfect song
 * for their desires.
 *
 * Faces in each frame are matched against the known faces database. Once
 * enough frames have contained a recognized face, the first face in the
 * latest frame decides the song.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include <signal.h>
#include <unistd.h>
#include <chrono>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/highgui.hpp>
#include <opencv2/videoio.hpp>
#include <rapidjson/document.h>
#include "lib/face_database.h"
#include "lib/face_encoder.h"


/*
 * Counts frames in which at least one face was recognized, and remembers
 * the first face of the most recent frame that had any faces.
 */
class MatchCounter
{
public:
    explicit MatchCounter(unsigned frameWait = 20);

    void reset();

    // Names of the faces in one frame, in detection order. Returns true
    // if the frame had a recognized face.
    bool addFrame(const std::vector<std::string> &names);

    unsigned matchedFrames() const { return framesWithMatch; }
    const std::string &firstFace() const { return firstFaceName; }

    // Frames left to count, for the on-screen countdown
    int remaining() const { return int(frameWait) - int(framesWithMatch); }

    // Still counting down, with the "Calculating" message on screen
    bool counting() const { return framesWithMatch > 0 && framesWithMatch + 1 < frameWait; }

    bool finished() const { return framesWithMatch > frameWait; }

private:
    unsigned frameWait;
    unsigned framesWithMatch;
    std::string firstFaceName;
};


class FaceChooser
{
public:
    FaceChooser();

    void setConfig(const rapidjson::Value &config);

    // Load the detector, recognizer and known faces
    bool setup();

    void setHeadless(bool h) { headless = h; }
    void setVerbose(bool v) { verbose = v; }

    // Looking stops early when this becomes nonzero
    void setStopFlag(const volatile sig_atomic_t *flag) { stopFlag = flag; }

    /*
     * Watch the camera until a face has been recognized for long enough.
     * Stores the name of the first face seen in the final frame, or
     * FaceDatabase::unknownName() if no face was ever seen. Returns false
     * if the camera couldn't be used.
     */
    bool look(std::string &name);

    const FaceDatabase &database() const { return faces; }

private:
    int cameraIndex;
    std::string encodingsPath;
    double tolerance;
    unsigned frameWait;
    int frameWidth;
    float warmupSeconds;
    float holdSeconds;
    float timeoutSeconds;

    bool headless;
    bool verbose;
    const volatile sig_atomic_t *stopFlag;

    FaceEncoder encoder;
    FaceDatabase faces;

    bool stopping() const { return stopFlag && *stopFlag; }
    void nap(float seconds);
    void display(const cv::Mat &frame, int waitMs, int &key);
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline MatchCounter::MatchCounter(unsigned frameWait)
    : frameWait(frameWait),
      framesWithMatch(0),
      firstFaceName(FaceDatabase::unknownName())
{}

inline void MatchCounter::reset()
{
    framesWithMatch = 0;
    firstFaceName = FaceDatabase::unknownName();
}

inline bool MatchCounter::addFrame(const std::vector<std::string> &names)
{
    bool matched = false;
    for (unsigned i = 0; i < names.size(); i++) {
        if (names[i] != FaceDatabase::unknownName()) {
            matched = true;
        }
    }

    if (matched) {
        framesWithMatch++;
    }
    if (!names.empty()) {
        firstFaceName = names[0];
    }
    return matched;
}

inline FaceChooser::FaceChooser()
    : cameraIndex(0),
      tolerance(1.128),
      frameWait(20),
      frameWidth(500),
      warmupSeconds(2),
      holdSeconds(6),
      timeoutSeconds(0),
      headless(false),
      verbose(false),
      stopFlag(0)
{}

inline void FaceChooser::setConfig(const rapidjson::Value &config)
{
    encoder.setConfig(config);

    cameraIndex = config["camera"].GetInt();
    encodingsPath = config["encodings"].GetString();
    tolerance = config["tolerance"].GetDouble();
    frameWait = config["frameWait"].GetUint();
    frameWidth = config["frameWidth"].GetInt();
    warmupSeconds = config["warmupSeconds"].GetDouble();
    holdSeconds = config["holdSeconds"].GetDouble();
    timeoutSeconds = config["timeoutSeconds"].GetDouble();
}

inline bool FaceChooser::setup()
{
    if (!encoder.setup()) {
        return false;
    }
    if (!faces.load(encodingsPath.c_str())) {
        return false;
    }

    if (verbose) {
        fprintf(stderr, "faces: %u encodings of %u people loaded from %s\n",
            faces.size(), faces.numPeople(), encodingsPath.c_str());
    }
    return true;
}

inline void FaceChooser::nap(float seconds)
{
    while (seconds > 0 && !stopping()) {
        float slice = seconds < 0.05f ? seconds : 0.05f;
        usleep(unsigned(slice * 1e6));
        seconds -= slice;
    }
}

inline void FaceChooser::display(const cv::Mat &frame, int waitMs, int &key)
{
    if (headless) {
        key = -1;
        if (waitMs > 1) {
            nap(waitMs / 1000.0f);
        }
        return;
    }

    cv::imshow("Calculating your desires...", frame);
    key = cv::waitKey(waitMs) & 0xFF;
}

inline bool FaceChooser::look(std::string &name)
{
    typedef std::chrono::steady_clock clock;

    cv::VideoCapture camera(cameraIndex);
    if (!camera.isOpened()) {
        fprintf(stderr, "faces: can't open camera %d\n", cameraIndex);
        return false;
    }

    // Let the sensor settle its exposure
    nap(warmupSeconds);

    const cv::Scalar yellow(0, 255, 255);
    const cv::Scalar green(0, 255, 0);

    MatchCounter matches(frameWait);
    unsigned frameCount = 0;
    unsigned emptyFrames = 0;
    int key = -1;
    cv::Mat frame;

    clock::time_point startTime = clock::now();

    while (!stopping()) {
        cv::Mat raw;
        if (!camera.read(raw) || raw.empty()) {
            if (++emptyFrames > 100) {
                fprintf(stderr, "faces: camera %d stopped delivering frames\n", cameraIndex);
                return false;
            }
            continue;
        }
        emptyFrames = 0;

        // Smaller frames are much faster to search
        double scale = double(frameWidth) / raw.cols;
        cv::resize(raw, frame, cv::Size(frameWidth, int(raw.rows * scale + 0.5)));

        std::vector<cv::Rect> rects = encoder.detect(frame);
        std::vector<std::string> names;

        for (unsigned i = 0; i < rects.size(); i++) {
            names.push_back(faces.identify(encoder.encode(frame, rects[i]), tolerance));
        }

        if (matches.addFrame(names) && matches.counting()) {
            char countdown[16];
            snprintf(countdown, sizeof countdown, "%d", matches.remaining());

            cv::putText(frame, "Calculating", cv::Point(10, 30), cv::FONT_HERSHEY_COMPLEX, 1.25, yellow, 3);
            cv::putText(frame, "      Your Desires...", cv::Point(10, 70), cv::FONT_HERSHEY_COMPLEX, 1.25, yellow, 3);
            cv::putText(frame, countdown, cv::Point(frame.cols - 40, frame.rows - 20),
                cv::FONT_HERSHEY_SIMPLEX, 0.75, yellow, 2);
        }

        // Everyone is a consumer
        for (unsigned i = 0; i < rects.size(); i++) {
            const cv::Rect &r = rects[i];
            int y = r.y - 15 > 15 ? r.y - 15 : r.y + 15;
            cv::rectangle(frame, r, green, 2);
            cv::putText(frame, "consumer", cv::Point(r.x, y), cv::FONT_HERSHEY_SIMPLEX, 0.75, green, 2);
        }

        if (verbose) {
            fprintf(stderr, "\t[faces] frame %u: %d faces, first \"%s\", %u frames with a match\n",
                frameCount, (int)rects.size(), matches.firstFace().c_str(), matches.matchedFrames());
        }

        frameCount++;
        bool finished = matches.finished();

        if (finished) {
            cv::putText(frame, "  Desires", cv::Point(60, 80), cv::FONT_HERSHEY_COMPLEX, 1.25, yellow, 3);
            cv::putText(frame, "Calculated!", cv::Point(60, 118), cv::FONT_HERSHEY_COMPLEX, 1.25, yellow, 3);
        }

        display(frame, 1, key);
        if (key == 'q' || finished) {
            break;
        }

        double elapsed = std::chrono::duration<double>(clock::now() - startTime).count();
        if (timeoutSeconds > 0 && elapsed > timeoutSeconds) {
            fprintf(stderr, "faces: no match after %.0f seconds\n", elapsed);
            break;
        }
    }

    double elapsed = std::chrono::duration<double>(clock::now() - startTime).count();

    // Keep the verdict on screen for a while
    if (!frame.empty() && !stopping()) {
        display(frame, int(holdSeconds * 1000), key);
    }
    if (!headless) {
        cv::destroyAllWindows();
    }

    fprintf(stderr, "faces: elapsed time: %.2f\n", elapsed);
    fprintf(stderr, "faces: approx. FPS: %.2f\n", elapsed > 0 ? frameCount / elapsed : 0.0);

    name = matches.firstFace();
    return true;
}
