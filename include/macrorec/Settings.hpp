#pragma once

#include <string>

namespace macrorec {

struct Settings {
    double playbackSpeed = 1.0;
    int recordRateHz = 100;
    int startDelaySec = 0;
    int loopCount = 1;
    std::string recordingsDir = "recordings";

    // Throws ValueError naming the first invalid field.
    void validate() const;
};

// Missing file or missing keys keep the defaults. Throws DecodeError for a
// file that is not a JSON object and ValueError for a value of the wrong type
// or range.
Settings loadSettings(const std::string& path);
void saveSettings(const std::string& path, const Settings& settings);

} // namespace macrorec
