/*
 * Known faces: a labelled set of face feature vectors, and nearest-match
 * voting to put a name to a new face.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include <string>
#include <vector>
#include <opencv2/core.hpp>


class FaceDatabase
{
public:
    struct Entry {
        std::string name;
        cv::Mat feature;    // 1xN CV_32F row
    };

    static const char *unknownName() { return "Unknown"; }

    void add(const std::string &name, const cv::Mat &feature);
    void clear() { entries.clear(); }

    unsigned size() const { return entries.size(); }
    const Entry &entry(unsigned i) const { return entries[i]; }

    // Number of distinct names
    unsigned numPeople() const;

    bool load(const char *filename);
    bool save(const char *filename) const;

    /*
     * Every known feature within 'tolerance' (L2 distance) votes for its
     * name. The name with the most votes wins; ties go to the name that
     * appears first in the database. Returns unknownName() if nothing
     * is close enough.
     */
    std::string identify(const cv::Mat &feature, double tolerance) const;

private:
    std::vector<Entry> entries;
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline void FaceDatabase::add(const std::string &name, const cv::Mat &feature)
{
    Entry e;
    e.name = name;
    feature.reshape(1, 1).convertTo(e.feature, CV_32F);
    entries.push_back(e);
}

inline unsigned FaceDatabase::numPeople() const
{
    std::vector<std::string> names;
    for (unsigned i = 0; i < entries.size(); i++) {
        bool seen = false;
        for (unsigned j = 0; j < names.size() && !seen; j++) {
            seen = names[j] == entries[i].name;
        }
        if (!seen) {
            names.push_back(entries[i].name);
        }
    }
    return names.size();
}

inline bool FaceDatabase::load(const char *filename)
{
    cv::FileStorage fs;
    try {
        if (!fs.open(filename, cv::FileStorage::READ)) {
            fprintf(stderr, "faces: can't open encodings file %s\n", filename);
            return false;
        }
    } catch (const cv::Exception &e) {
        fprintf(stderr, "faces: %s: %s\n", filename, e.what());
        return false;
    }

    cv::FileNode faces = fs["faces"];
    if (faces.type() != cv::FileNode::SEQ) {
        fprintf(stderr, "faces: %s has no \"faces\" sequence\n", filename);
        return false;
    }

    entries.clear();
    for (cv::FileNodeIterator it = faces.begin(); it != faces.end(); ++it) {
        std::string name;
        cv::Mat feature;
        (*it)["name"] >> name;
        (*it)["feature"] >> feature;

        if (name.empty() || feature.empty()) {
            fprintf(stderr, "faces: %s: skipping incomplete entry %d\n", filename, (int)entries.size());
            continue;
        }
        add(name, feature);
    }

    return true;
}

inline bool FaceDatabase::save(const char *filename) const
{
    cv::FileStorage fs;
    try {
        if (!fs.open(filename, cv::FileStorage::WRITE)) {
            fprintf(stderr, "faces: can't write encodings file %s\n", filename);
            return false;
        }
    } catch (const cv::Exception &e) {
        fprintf(stderr, "faces: %s: %s\n", filename, e.what());
        return false;
    }

    fs << "faces" << "[";
    for (unsigned i = 0; i < entries.size(); i++) {
        fs << "{" << "name" << entries[i].name << "feature" << entries[i].feature << "}";
    }
    fs << "]";
    return true;
}

inline std::string FaceDatabase::identify(const cv::Mat &feature, double tolerance) const
{
    cv::Mat query;
    feature.reshape(1, 1).convertTo(query, CV_32F);

    // Tally in order of first appearance, so ties resolve to the earliest name
    std::vector<std::string> names;
    std::vector<unsigned> votes;

    for (unsigned i = 0; i < entries.size(); i++) {
        const Entry &e = entries[i];
        if (e.feature.cols != query.cols) {
            continue;
        }
        if (cv::norm(e.feature, query, cv::NORM_L2) > tolerance) {
            continue;
        }

        unsigned j = 0;
        while (j < names.size() && names[j] != e.name) {
            j++;
        }
        if (j == names.size()) {
            names.push_back(e.name);
            votes.push_back(0);
        }
        votes[j]++;
    }

    std::string best = unknownName();
    unsigned bestVotes = 0;
    for (unsigned j = 0; j < names.size(); j++) {
        if (votes[j] > bestVotes) {
            bestVotes = votes[j];
            best = names[j];
        }
    }
    return best;
}
