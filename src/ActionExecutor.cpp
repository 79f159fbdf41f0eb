#include "macrorec/ActionExecutor.hpp"

#include "macrorec/Errors.hpp"

#include <stdexcept>
#include <string>

namespace macrorec {

ActionExecutor::ActionExecutor(InputDevice& device)
    : device(device) {
}

void ActionExecutor::execute(const Snapshot& snapshot) {
    moveCursor(snapshot.mousePos);
    if (snapshot.button) applyButton(*snapshot.button);
    if (snapshot.scroll && (snapshot.scroll->dx != 0 || snapshot.scroll->dy != 0)) {
        device.scroll(snapshot.scroll->dx, snapshot.scroll->dy);
    }
    pressAndReleaseKeys(snapshot.keys);
}

void ActionExecutor::resetKeyCache() {
    keypressCache.clear();
}

void ActionExecutor::moveCursor(const Point& pos) {
    Point screen = device.screenSize();
    if (pos.x < 0 || pos.x >= screen.x) {
        throw std::out_of_range("mouse x coordinate " + std::to_string(pos.x) +
                                " out of range [0," + std::to_string(screen.x) + ")");
    }
    if (pos.y < 0 || pos.y >= screen.y) {
        throw std::out_of_range("mouse y coordinate " + std::to_string(pos.y) +
                                " out of range [0," + std::to_string(screen.y) + ")");
    }
    device.moveCursor(pos);
}

void ActionExecutor::applyButton(const ButtonEvent& ev) {
    if (ev.button == MouseButton::UNKNOWN) {
        throw ValueError("unknown button type '" + ev.identifier() + "'");
    }
    if (ev.pressed) {
        device.pressButton(ev.button);
    } else {
        device.releaseButton(ev.button);
    }
}

void ActionExecutor::pressAndReleaseKeys(const std::vector<KeyPress>& keys) {
    if (keys.empty()) return;

    // Reject the whole combo before anything is pressed so no key is left down.
    for (const auto& kp : keys) {
        if (kp.key.type == KeyType::UNKNOWN) {
            throw ValueError("unknown key '" + kp.key.raw + "'");
        }
    }

    std::vector<Key> combo;
    for (const auto& kp : keys) {
        if (kp.key.isModifier()) {
            combo.push_back(kp.key);
            continue;
        }
        auto it = keypressCache.find(kp.key);
        if (it == keypressCache.end() || kp.pressTime > it->second) {
            keypressCache[kp.key] = kp.pressTime;
            combo.push_back(kp.key);
        }
    }

    for (const auto& key : combo) device.pressKey(key);
    for (const auto& key : combo) device.releaseKey(key);
}

} // namespace macrorec
