#pragma once

#include <stdexcept>
#include <string>

namespace macrorec {

// A Recorder or Player method was called in a state that does not allow it.
class StateError : public std::logic_error {
public:
    explicit StateError(const std::string& what) : std::logic_error(what) {}
};

// A recording file is not valid JSON or does not have the expected layout.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// A value is well formed but not acceptable: a bad field in a recording, an
// unrecognized key or button at playback, an invalid setting.
class ValueError : public std::invalid_argument {
public:
    explicit ValueError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace macrorec
