#pragma once

#include "macrorec/InputDevice.hpp"
#include "macrorec/Snapshot.hpp"

#include <map>

namespace macrorec {

// Applies snapshots to an InputDevice. Holds the keypress cache used to avoid
// replaying a key whose press was already executed, so one instance is used
// per playback session.
class ActionExecutor {
public:
    explicit ActionExecutor(InputDevice& device);

    // Moves the pointer, then applies the button, scroll and key fields in that
    // order. Throws std::out_of_range when the position is off screen (the
    // pointer is left where it was) and ValueError for an unrecognized button
    // or key.
    void execute(const Snapshot& snapshot);

    void resetKeyCache();

private:
    void moveCursor(const Point& pos);
    void applyButton(const ButtonEvent& ev);
    void pressAndReleaseKeys(const std::vector<KeyPress>& keys);

    InputDevice& device;
    std::map<Key, double> keypressCache;
};

} // namespace macrorec
