/*
 * Face detection and face feature extraction.
 *
 * Faces are found with a Haar cascade on a grayscale image, then each face
 * crop is turned into a feature vector by the SFace recognition network.
 * Features of the same person lie close together in L2 distance.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>
#include <rapidjson/document.h>


class FaceEncoder
{
public:
    FaceEncoder();

    void setConfig(const rapidjson::Value &config);

    // Load the cascade and the recognition model named in the config
    bool setup();

    // Face rectangles in a BGR image
    std::vector<cv::Rect> detect(const cv::Mat &bgr);

    // Feature vector for one face rectangle of a BGR image
    cv::Mat encode(const cv::Mat &bgr, const cv::Rect &face);

    static const int kInputSize = 112;

private:
    std::string cascadePath;
    std::string modelPath;
    double scaleFactor;
    int minNeighbors;
    int minSize;

    cv::CascadeClassifier cascade;
    cv::Ptr<cv::FaceRecognizerSF> recognizer;
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline FaceEncoder::FaceEncoder()
    : scaleFactor(1.1),
      minNeighbors(5),
      minSize(30)
{}

inline void FaceEncoder::setConfig(const rapidjson::Value &config)
{
    cascadePath = config["cascade"].GetString();
    modelPath = config["model"].GetString();
    scaleFactor = config["scaleFactor"].GetDouble();
    minNeighbors = config["minNeighbors"].GetInt();
    minSize = config["minSize"].GetInt();
}

inline bool FaceEncoder::setup()
{
    if (!cascade.load(cascadePath)) {
        fprintf(stderr, "faces: can't load cascade %s\n", cascadePath.c_str());
        return false;
    }

    try {
        recognizer = cv::FaceRecognizerSF::create(modelPath, "");
    } catch (const cv::Exception &e) {
        fprintf(stderr, "faces: can't load recognition model %s: %s\n", modelPath.c_str(), e.what());
        return false;
    }

    if (recognizer.empty()) {
        fprintf(stderr, "faces: can't load recognition model %s\n", modelPath.c_str());
        return false;
    }

    return true;
}

inline std::vector<cv::Rect> FaceEncoder::detect(const cv::Mat &bgr)
{
    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

    std::vector<cv::Rect> faces;
    cascade.detectMultiScale(gray, faces, scaleFactor, minNeighbors,
        cv::CASCADE_SCALE_IMAGE, cv::Size(minSize, minSize));
    return faces;
}

inline cv::Mat FaceEncoder::encode(const cv::Mat &bgr, const cv::Rect &face)
{
    cv::Mat crop;
    cv::resize(bgr(face & cv::Rect(0, 0, bgr.cols, bgr.rows)), crop, cv::Size(kInputSize, kInputSize));

    cv::Mat feature;
    recognizer->feature(crop, feature);
    return feature.clone();
}
