#include "macrorec/CommandLine.hpp"
#include "macrorec/Errors.hpp"
#include "macrorec/Player.hpp"
#include "macrorec/Recorder.hpp"
#include "macrorec/RecordingCodec.hpp"
#include "macrorec/Settings.hpp"
#include "macrorec/StopSignal.hpp"
#include "platform/Win32InputDevice.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <vector>

using namespace macrorec;

namespace {

StopSignal& interrupted() {
    static StopSignal signal;
    return signal;
}

// Console control events are delivered on a thread of their own, so the
// handler only flags the interrupt and lets the command wind down.
BOOL WINAPI consoleHandler(DWORD event) {
    if (event == CTRL_C_EVENT || event == CTRL_BREAK_EVENT) {
        interrupted().requestStop();
        return TRUE;
    }
    return FALSE;
}

bool askYesNo(const std::string& question) {
    std::cout << question << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

int runRecord(const CommandLine& cmd, const Settings& settings) {
    Win32InputDevice device;
    Recorder recorder(device);

    if (settings.startDelaySec > 0) {
        std::cout << "Recording starts in " << settings.startDelaySec << " seconds..." << std::endl;
        if (interrupted().waitFor(std::chrono::seconds(settings.startDelaySec))) {
            std::cout << "Recording cancelled." << std::endl;
            return 1;
        }
    }

    recorder.start(settings.recordRateHz);
    std::cout << "Recording started for " << cmd.durationMin << " minute(s) at "
              << settings.recordRateHz << " Hz. Press Ctrl+C to stop early." << std::endl;

    bool cut = interrupted().waitFor(std::chrono::minutes(cmd.durationMin));
    recorder.stop();
    std::cout << "Recording stopped!" << std::endl;

    std::vector<Snapshot> records = recorder.getRecords();
    std::cout << "Captured " << records.size() << " snapshots." << std::endl;

    if (cut && !askYesNo("recording interrupted, would you like to save all events [y/n]? ")) {
        std::cout << "Recording discarded." << std::endl;
        return 1;
    }

    std::string path = cmd.outputPath ? *cmd.outputPath : defaultRecordingPath(settings.recordingsDir);
    recorder.save(path);
    std::cout << "Recording saved to: " << path << std::endl;
    return 0;
}

int runPlay(const CommandLine& cmd, const Settings& settings) {
    std::vector<Snapshot> records = loadRecords(cmd.recordFile);
    std::cout << "Loaded recording from: " << cmd.recordFile << " (" << records.size()
              << " snapshots)" << std::endl;

    Win32InputDevice device;
    Player player(device);

    for (int run = 1; run <= settings.loopCount; ++run) {
        if (interrupted().stopRequested()) break;
        if (settings.loopCount > 1) {
            std::cout << "Playback " << run << "/" << settings.loopCount << "..." << std::endl;
        }

        std::promise<void> done;
        std::future<void> finished = done.get_future();
        player.start(records, [&done]() { done.set_value(); }, settings.playbackSpeed);

        while (finished.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (interrupted().stopRequested()) {
                try {
                    player.stop();
                } catch (const StateError&) {
                    // finished between the poll and the stop request
                }
                break;
            }
        }
        finished.wait();

        std::string error = player.lastError();
        if (!error.empty()) {
            std::cerr << "Playback failed: " << error << std::endl;
            return 1;
        }
    }

    if (interrupted().stopRequested()) {
        std::cout << "Playback stopped!" << std::endl;
        return 1;
    }
    std::cout << "Playback completed!" << std::endl;
    return 0;
}

int runList(const Settings& settings) {
    std::vector<std::string> recordings = listRecordings(settings.recordingsDir);
    if (recordings.empty()) {
        std::cout << "No recordings found." << std::endl;
        return 0;
    }
    std::cout << "Available recordings:" << std::endl;
    for (size_t i = 0; i < recordings.size(); i++) {
        std::cout << "  " << (i + 1) << ". " << recordings[i] << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCtrlHandler(consoleHandler, TRUE);

    try {
        CommandLine cmd = parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
        if (cmd.command == Command::HELP) {
            std::cout << usage();
            return 0;
        }

        Settings settings = loadSettings(cmd.settingsPath);
        applyOverrides(cmd, settings);
        settings.validate();

        switch (cmd.command) {
            case Command::RECORD: return runRecord(cmd, settings);
            case Command::PLAY: return runPlay(cmd, settings);
            case Command::LIST: return runList(settings);
            case Command::HELP: break;
        }
    } catch (const ValueError& e) {
        std::cerr << "error: " << e.what() << "\n\n" << usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
