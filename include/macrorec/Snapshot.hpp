#pragma once

#include "macrorec/InputTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace macrorec {

struct Point {
    int x = 0;
    int y = 0;
};

// A key that went down at pressTime and has since been released.
struct KeyPress {
    Key key;
    double pressTime = 0.0;
};

struct ButtonEvent {
    MouseButton button = MouseButton::LEFT;
    bool pressed = false;
    // Identifier text of an UNKNOWN button, kept so it survives a save/load cycle.
    std::string raw;

    std::string identifier() const;
};

struct ScrollDelta {
    int dx = 0;
    int dy = 0;
};

// One sample of device state. timestamp is seconds since the Unix epoch,
// keys/button/scroll hold what happened since the previous sample.
struct Snapshot {
    double timestamp = 0.0;
    Point mousePos;
    std::vector<KeyPress> keys;
    std::optional<ButtonEvent> button;
    std::optional<ScrollDelta> scroll;

    // Resets the per-interval fields, keeping timestamp and position.
    void clearTransient();
};

bool operator==(const Point& a, const Point& b);
bool operator!=(const Point& a, const Point& b);
bool operator==(const KeyPress& a, const KeyPress& b);
bool operator==(const ButtonEvent& a, const ButtonEvent& b);
bool operator==(const ScrollDelta& a, const ScrollDelta& b);
bool operator==(const Snapshot& a, const Snapshot& b);
bool operator!=(const Snapshot& a, const Snapshot& b);

} // namespace macrorec
