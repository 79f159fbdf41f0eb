#include "macrorec/CommandLine.hpp"

#include "macrorec/Errors.hpp"

#include <cctype>
#include <sstream>

namespace macrorec {

namespace {

int parseInt(const std::string& option, const std::string& text) {
    size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::logic_error&) {
        throw ValueError(option + " expects an integer, got '" + text + "'");
    }
    if (pos != text.size()) {
        throw ValueError(option + " expects an integer, got '" + text + "'");
    }
    return value;
}

double parseDouble(const std::string& option, const std::string& text) {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::logic_error&) {
        throw ValueError(option + " expects a number, got '" + text + "'");
    }
    if (pos != text.size()) {
        throw ValueError(option + " expects a number, got '" + text + "'");
    }
    return value;
}

bool isOption(const std::string& arg, const char* longName, const char* shortName) {
    return arg == longName || (shortName != nullptr && arg == shortName);
}

} // namespace

CommandLine parseCommandLine(const std::vector<std::string>& args) {
    CommandLine cmd;
    if (args.empty()) return cmd;

    const std::string& name = args[0];
    if (name == "record") {
        cmd.command = Command::RECORD;
    } else if (name == "play") {
        cmd.command = Command::PLAY;
    } else if (name == "list") {
        cmd.command = Command::LIST;
    } else if (name == "help" || name == "--help" || name == "-h") {
        return cmd;
    } else {
        throw ValueError("unknown command '" + name + "'");
    }

    std::vector<std::string> positional;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw ValueError("option " + arg + " requires a value");
            return args[++i];
        };

        if (isOption(arg, "--settings", nullptr)) {
            cmd.settingsPath = next();
        } else if (cmd.command == Command::RECORD && isOption(arg, "--rate-hz", "-r")) {
            cmd.rateHz = parseInt(arg, next());
        } else if (cmd.command == Command::RECORD && isOption(arg, "--start-delay-sec", "-d")) {
            cmd.startDelaySec = parseInt(arg, next());
        } else if (cmd.command == Command::RECORD && isOption(arg, "--output", "-o")) {
            cmd.outputPath = next();
        } else if (cmd.command == Command::PLAY && isOption(arg, "--speed", "-s")) {
            cmd.speed = parseDouble(arg, next());
        } else if (cmd.command == Command::PLAY && isOption(arg, "--loop", "-l")) {
            cmd.loopCount = parseInt(arg, next());
        } else if (arg.size() > 1 && arg[0] == '-' && !std::isdigit(static_cast<unsigned char>(arg[1]))) {
            throw ValueError("unknown option '" + arg + "' for command " + name);
        } else {
            positional.push_back(arg);
        }
    }

    if (cmd.command == Command::RECORD) {
        if (positional.size() != 1) throw ValueError("record expects exactly one duration in minutes");
        cmd.durationMin = parseInt("duration", positional[0]);
        if (cmd.durationMin <= 0) throw ValueError("duration must be a positive integer");
        if (cmd.rateHz && *cmd.rateHz <= 0) throw ValueError("rate_hz must be a positive integer");
        if (cmd.startDelaySec && *cmd.startDelaySec < 0) throw ValueError("start_delay_sec must be >= 0");
    } else if (cmd.command == Command::PLAY) {
        if (positional.size() != 1) throw ValueError("play expects exactly one recording file");
        cmd.recordFile = positional[0];
        if (cmd.speed && !(*cmd.speed > 0.0)) throw ValueError("speed must be a positive value");
        if (cmd.loopCount && *cmd.loopCount <= 0) throw ValueError("loop count must be a positive integer");
    } else if (!positional.empty()) {
        throw ValueError("list takes no arguments");
    }

    return cmd;
}

void applyOverrides(const CommandLine& cmd, Settings& settings) {
    if (cmd.rateHz) settings.recordRateHz = *cmd.rateHz;
    if (cmd.startDelaySec) settings.startDelaySec = *cmd.startDelaySec;
    if (cmd.speed) settings.playbackSpeed = *cmd.speed;
    if (cmd.loopCount) settings.loopCount = *cmd.loopCount;
}

std::string usage() {
    std::ostringstream ss;
    ss << "usage: macrorec <command> [options]\n"
       << "\n"
       << "commands:\n"
       << "  record <duration-min> [-r|--rate-hz N] [-d|--start-delay-sec N] [-o|--output PATH]\n"
       << "      record the mouse and keyboard for the given number of minutes\n"
       << "  play <file> [-s|--speed X] [-l|--loop N]\n"
       << "      play back a recording, fractional speeds such as 0.5 slow it down\n"
       << "  list\n"
       << "      list recordings in the recordings directory\n"
       << "\n"
       << "options:\n"
       << "  --settings PATH   settings file (default macrorec.json)\n";
    return ss.str();
}

} // namespace macrorec
