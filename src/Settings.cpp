#include "macrorec/Settings.hpp"

#include "macrorec/Errors.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

namespace macrorec {

using json = nlohmann::json;
namespace fs = std::filesystem;

void Settings::validate() const {
    if (!(playbackSpeed > 0.0)) {
        throw ValueError("playback speed multiplier must be a positive floating point value");
    }
    if (recordRateHz <= 0) {
        throw ValueError("recording rate must be a positive integer");
    }
    if (startDelaySec < 0) {
        throw ValueError("start delay must be >= 0");
    }
    if (loopCount <= 0) {
        throw ValueError("loop count must be a positive integer");
    }
    if (recordingsDir.empty()) {
        throw ValueError("recordings directory must not be empty");
    }
}

Settings loadSettings(const std::string& path) {
    Settings settings;
    if (!fs::exists(path)) return settings;

    std::ifstream file(path);
    if (!file) throw std::runtime_error("cannot open: " + path);

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw DecodeError("invalid settings file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw DecodeError("invalid settings file " + path + ": not an object");
    }

    try {
        settings.playbackSpeed = j.value("playbackSpeed", settings.playbackSpeed);
        settings.recordRateHz = j.value("recordRateHz", settings.recordRateHz);
        settings.startDelaySec = j.value("startDelaySec", settings.startDelaySec);
        settings.loopCount = j.value("loopCount", settings.loopCount);
        settings.recordingsDir = j.value("recordingsDir", settings.recordingsDir);
    } catch (const json::type_error& e) {
        throw ValueError("invalid settings file " + path + ": " + e.what());
    }

    settings.validate();
    return settings;
}

void saveSettings(const std::string& path, const Settings& settings) {
    settings.validate();

    json j;
    j["playbackSpeed"] = settings.playbackSpeed;
    j["recordRateHz"] = settings.recordRateHz;
    j["startDelaySec"] = settings.startDelaySec;
    j["loopCount"] = settings.loopCount;
    j["recordingsDir"] = settings.recordingsDir;

    std::ofstream file(path, std::ios::trunc);
    if (!file) throw std::runtime_error("cannot open for writing: " + path);
    file << j.dump(2) << '\n';
    file.close();
    if (!file) throw std::runtime_error("failed writing: " + path);
}

} // namespace macrorec
