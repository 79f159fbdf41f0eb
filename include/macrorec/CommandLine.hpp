#pragma once

#include "macrorec/Settings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace macrorec {

enum class Command {
    HELP,
    RECORD,
    PLAY,
    LIST
};

struct CommandLine {
    Command command = Command::HELP;
    std::string settingsPath = "macrorec.json";

    // record
    int durationMin = 0;
    std::optional<int> rateHz;
    std::optional<int> startDelaySec;
    std::optional<std::string> outputPath;

    // play
    std::string recordFile;
    std::optional<double> speed;
    std::optional<int> loopCount;
};

// args excludes the program name. Throws ValueError on unknown options,
// missing values and out of range numbers.
CommandLine parseCommandLine(const std::vector<std::string>& args);

// Copies the options given on the command line over the loaded settings.
void applyOverrides(const CommandLine& cmd, Settings& settings);

std::string usage();

} // namespace macrorec
