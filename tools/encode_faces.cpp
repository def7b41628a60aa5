/*
 * Build the known faces database from a directory of photos,
 * one subdirectory per person:
 *
 *   dataset/frank_sinatra/001.jpg
 *   dataset/frank_sinatra/002.jpg
 *   dataset/sandra_dee/001.png
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#include <stdio.h>
#include <string.h>
#include <dirent.h>
#include <sys/stat.h>
#include <algorithm>
#include <string>
#include <vector>
#include <opencv2/imgcodecs.hpp>
#include "lib/face_database.h"
#include "lib/face_encoder.h"
#include "lib/runner.h"


class EncodeRunner : public Runner
{
public:
    EncodeRunner()
        : datasetPath("dataset"),
          outputPath("data/encodings.yml")
    {
        setConfig("data/config.json");
    }

    std::string datasetPath;
    std::string outputPath;

protected:
    virtual bool parseArgument(int &i, int &argc, char **argv)
    {
        if (!strcmp(argv[i], "-dataset") && (i+1 < argc)) {
            datasetPath = argv[++i];
            return true;
        }
        if (!strcmp(argv[i], "-output") && (i+1 < argc)) {
            outputPath = argv[++i];
            return true;
        }
        if (!strcmp(argv[i], "-config") && (i+1 < argc)) {
            if (!setConfig(argv[++i])) {
                fprintf(stderr, "Can't load config from %s\n", argv[i]);
                return false;
            }
            return true;
        }
        return Runner::parseArgument(i, argc, argv);
    }

    virtual void argumentUsage()
    {
        Runner::argumentUsage();
        fprintf(stderr, " [-config FILE.json] [-dataset DIR] [-output FILE.yml]");
    }

    virtual bool validateArguments()
    {
        if (!config.HasMember("faces") || !config["faces"].IsObject()) {
            fprintf(stderr, "Configuration has no \"faces\" section\n");
            return false;
        }
        return Runner::validateArguments();
    }
};


static bool isDirectory(const std::string &path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

static bool listDirectory(const std::string &path, std::vector<std::string> &names)
{
    DIR *dir = opendir(path.c_str());
    if (!dir) {
        return false;
    }

    struct dirent *ent;
    while ((ent = readdir(dir)) != NULL) {
        if (ent->d_name[0] != '.') {
            names.push_back(ent->d_name);
        }
    }
    closedir(dir);

    std::sort(names.begin(), names.end());
    return true;
}

int main(int argc, char **argv)
{
    EncodeRunner runner;
    if (!runner.parseArguments(argc, argv)) {
        return 1;
    }

    FaceEncoder encoder;
    encoder.setConfig(runner.config["faces"]);
    if (!encoder.setup()) {
        return 1;
    }

    std::vector<std::string> people;
    if (!listDirectory(runner.datasetPath, people)) {
        fprintf(stderr, "encode: can't read dataset directory %s\n", runner.datasetPath.c_str());
        return 1;
    }

    FaceDatabase db;
    unsigned imageCount = 0;

    for (unsigned p = 0; p < people.size(); p++) {
        std::string personDir = runner.datasetPath + "/" + people[p];
        std::vector<std::string> images;
        if (!isDirectory(personDir) || !listDirectory(personDir, images)) {
            continue;
        }

        for (unsigned i = 0; i < images.size(); i++) {
            std::string imagePath = personDir + "/" + images[i];
            cv::Mat image = cv::imread(imagePath);
            if (image.empty()) {
                fprintf(stderr, "encode: skipping %s, not an image\n", imagePath.c_str());
                continue;
            }

            std::vector<cv::Rect> faces = encoder.detect(image);
            if (faces.empty()) {
                fprintf(stderr, "encode: no face found in %s\n", imagePath.c_str());
                continue;
            }

            for (unsigned f = 0; f < faces.size(); f++) {
                db.add(people[p], encoder.encode(image, faces[f]));
            }
            imageCount++;

            if (runner.isVerbose()) {
                fprintf(stderr, "encode: %s: %d faces\n", imagePath.c_str(), (int)faces.size());
            }
        }
    }

    if (!db.save(runner.outputPath.c_str())) {
        return 1;
    }

    fprintf(stderr, "encode: %u encodings of %u people from %u images written to %s\n",
        db.size(), db.numPeople(), imageCount, runner.outputPath.c_str());
    return 0;
}
