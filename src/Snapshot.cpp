#include "macrorec/Snapshot.hpp"

namespace macrorec {

std::string ButtonEvent::identifier() const {
    if (button == MouseButton::UNKNOWN && !raw.empty()) return raw;
    return buttonToString(button);
}

void Snapshot::clearTransient() {
    keys.clear();
    button.reset();
    scroll.reset();
}

bool operator==(const Point& a, const Point& b) {
    return a.x == b.x && a.y == b.y;
}

bool operator!=(const Point& a, const Point& b) {
    return !(a == b);
}

bool operator==(const KeyPress& a, const KeyPress& b) {
    return a.key == b.key && a.pressTime == b.pressTime;
}

bool operator==(const ButtonEvent& a, const ButtonEvent& b) {
    return a.button == b.button && a.pressed == b.pressed &&
           (a.button != MouseButton::UNKNOWN || a.raw == b.raw);
}

bool operator==(const ScrollDelta& a, const ScrollDelta& b) {
    return a.dx == b.dx && a.dy == b.dy;
}

bool operator==(const Snapshot& a, const Snapshot& b) {
    return a.timestamp == b.timestamp &&
           a.mousePos == b.mousePos &&
           a.keys == b.keys &&
           a.button == b.button &&
           a.scroll == b.scroll;
}

bool operator!=(const Snapshot& a, const Snapshot& b) {
    return !(a == b);
}

} // namespace macrorec
