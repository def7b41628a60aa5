/*
 * "Singing" lyric words through a text-to-speech engine.
 *
 * (c) 2021 Mitch Altman, 2014 Micah Elizabeth Scott
 * http://creativecommons.org/licenses/by-sa/4.0/
 */

#pragma once

#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <string>
#include <vector>
#include <rapidjson/document.h>

extern char **environ;


class Singer
{
public:
    virtual ~Singer() {}

    // Speak the words, returning once they have been spoken
    virtual bool sing(const std::string &words) = 0;
};


/*
 * Runs the eSpeak command line tool once per lyric entry. This blocks
 * for roughly a second per word on the installation's hardware.
 */
class ESpeakSinger : public Singer
{
public:
    ESpeakSinger();

    void setConfig(const rapidjson::Value &config);

    virtual bool sing(const std::string &words);

private:
    bool enabled;
    std::string command;
    std::vector<std::string> options;
};


/*****************************************************************************************
 *                                   Implementation
 *****************************************************************************************/


inline ESpeakSinger::ESpeakSinger()
    : enabled(true),
      command("espeak")
{}

inline void ESpeakSinger::setConfig(const rapidjson::Value &config)
{
    enabled = config["enabled"].GetBool();
    command = config["command"].GetString();

    options.clear();
    if (config.HasMember("options")) {
        const rapidjson::Value &opts = config["options"];
        for (rapidjson::SizeType i = 0; i < opts.Size(); i++) {
            options.push_back(opts[i].GetString());
        }
    }
}

inline bool ESpeakSinger::sing(const std::string &words)
{
    if (!enabled || words.empty()) {
        return true;
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(command.c_str()));
    for (unsigned i = 0; i < options.size(); i++) {
        argv.push_back(const_cast<char*>(options[i].c_str()));
    }
    argv.push_back(const_cast<char*>(words.c_str()));
    argv.push_back(0);

    // eSpeak complains about audio devices on stderr; keep the console clean
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, 2, "/dev/null", O_WRONLY, 0);

    pid_t pid;
    int err = posix_spawnp(&pid, command.c_str(), &actions, 0, &argv[0], environ);
    posix_spawn_file_actions_destroy(&actions);

    if (err) {
        fprintf(stderr, "singer: can't run %s: %s\n", command.c_str(), strerror(err));
        return false;
    }

    int status;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            fprintf(stderr, "singer: waitpid: %s\n", strerror(errno));
            return false;
        }
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        fprintf(stderr, "singer: %s failed on \"%s\"\n", command.c_str(), words.c_str());
        return false;
    }

    return true;
}
