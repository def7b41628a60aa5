/*
 * Command line and JSON configuration handling for a long-running
 * installation program. Subclasses add their own arguments.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <rapidjson/document.h>
#include <rapidjson/filereadstream.h>
#include <rapidjson/error/en.h>


class Runner
{
public:
    Runner();
    virtual ~Runner() {}

    // Parse argv. On failure, prints usage and returns false.
    bool parseArguments(int argc, char **argv);

    // Load a JSON object as the configuration
    bool setConfig(const char *filename);
    bool setConfigString(const char *json);

    const char *getConfigPath() const { return configPath.c_str(); }

    bool isVerbose() const { return verbose; }
    void setVerbose(bool v) { verbose = v; }

    bool isHeadless() const { return headless; }
    void setHeadless(bool h) { headless = h; }

    rapidjson::Document config;

protected:
    virtual bool parseArgument(int &i, int &argc, char **argv);
    virtual void argumentUsage();
    virtual bool validateArguments();

private:
    bool verbose;
    bool headless;
    std::string configPath;
    const char *programName;

    void usage();
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline Runner::Runner()
    : verbose(false),
      headless(false),
      programName("lounge_looker")
{
    config.SetObject();
}

inline bool Runner::setConfig(const char *filename)
{
    FILE *f = fopen(filename, "r");
    if (!f) {
        return false;
    }

    char buffer[4096];
    rapidjson::FileReadStream istr(f, buffer, sizeof buffer);
    rapidjson::Document doc;
    doc.ParseStream<0>(istr);
    fclose(f);

    if (doc.HasParseError()) {
        fprintf(stderr, "%s: JSON error at offset %u: %s\n", filename,
            (unsigned) doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError()));
        return false;
    }
    if (!doc.IsObject()) {
        return false;
    }

    config.Swap(doc);
    configPath = filename;
    return true;
}

inline bool Runner::setConfigString(const char *json)
{
    rapidjson::Document doc;
    doc.Parse<0>(json);

    if (doc.HasParseError() || !doc.IsObject()) {
        return false;
    }

    config.Swap(doc);
    configPath = "<string>";
    return true;
}

inline bool Runner::parseArguments(int argc, char **argv)
{
    if (argc > 0) {
        programName = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        if (!parseArgument(i, argc, argv)) {
            usage();
            return false;
        }
    }

    if (!validateArguments()) {
        usage();
        return false;
    }

    return true;
}

inline bool Runner::parseArgument(int &i, int &argc, char **argv)
{
    if (!strcmp(argv[i], "-verbose")) {
        verbose = true;
        return true;
    }

    if (!strcmp(argv[i], "-headless")) {
        headless = true;
        return true;
    }

    return false;
}

inline bool Runner::validateArguments()
{
    return config.IsObject();
}

inline void Runner::argumentUsage()
{
    fprintf(stderr, "[-verbose] [-headless]");
}

inline void Runner::usage()
{
    fprintf(stderr, "usage: %s ", programName);
    argumentUsage();
    fprintf(stderr, "\n");
}
