#include "macrorec/InputTypes.hpp"

namespace macrorec {

namespace {

struct SpecialKeyName {
    SpecialKey key;
    const char* name;
};

const SpecialKeyName SPECIAL_KEY_NAMES[] = {
    {SpecialKey::ALT, "alt"},
    {SpecialKey::ALT_L, "alt_l"},
    {SpecialKey::ALT_R, "alt_r"},
    {SpecialKey::ALT_GR, "alt_gr"},
    {SpecialKey::BACKSPACE, "backspace"},
    {SpecialKey::CAPS_LOCK, "caps_lock"},
    {SpecialKey::CMD, "cmd"},
    {SpecialKey::CMD_L, "cmd_l"},
    {SpecialKey::CMD_R, "cmd_r"},
    {SpecialKey::CTRL, "ctrl"},
    {SpecialKey::CTRL_L, "ctrl_l"},
    {SpecialKey::CTRL_R, "ctrl_r"},
    {SpecialKey::DELETE_KEY, "delete"},
    {SpecialKey::DOWN, "down"},
    {SpecialKey::END, "end"},
    {SpecialKey::ENTER, "enter"},
    {SpecialKey::ESC, "esc"},
    {SpecialKey::F1, "f1"},
    {SpecialKey::F2, "f2"},
    {SpecialKey::F3, "f3"},
    {SpecialKey::F4, "f4"},
    {SpecialKey::F5, "f5"},
    {SpecialKey::F6, "f6"},
    {SpecialKey::F7, "f7"},
    {SpecialKey::F8, "f8"},
    {SpecialKey::F9, "f9"},
    {SpecialKey::F10, "f10"},
    {SpecialKey::F11, "f11"},
    {SpecialKey::F12, "f12"},
    {SpecialKey::F13, "f13"},
    {SpecialKey::F14, "f14"},
    {SpecialKey::F15, "f15"},
    {SpecialKey::F16, "f16"},
    {SpecialKey::F17, "f17"},
    {SpecialKey::F18, "f18"},
    {SpecialKey::F19, "f19"},
    {SpecialKey::F20, "f20"},
    {SpecialKey::HOME, "home"},
    {SpecialKey::INSERT, "insert"},
    {SpecialKey::LEFT, "left"},
    {SpecialKey::MENU, "menu"},
    {SpecialKey::NUM_LOCK, "num_lock"},
    {SpecialKey::PAGE_DOWN, "page_down"},
    {SpecialKey::PAGE_UP, "page_up"},
    {SpecialKey::PAUSE, "pause"},
    {SpecialKey::PRINT_SCREEN, "print_screen"},
    {SpecialKey::RIGHT, "right"},
    {SpecialKey::SCROLL_LOCK, "scroll_lock"},
    {SpecialKey::SHIFT, "shift"},
    {SpecialKey::SHIFT_L, "shift_l"},
    {SpecialKey::SHIFT_R, "shift_r"},
    {SpecialKey::SPACE, "space"},
    {SpecialKey::TAB, "tab"},
    {SpecialKey::UP, "up"},
    {SpecialKey::MEDIA_PLAY_PAUSE, "media_play_pause"},
    {SpecialKey::MEDIA_VOLUME_MUTE, "media_volume_mute"},
    {SpecialKey::MEDIA_VOLUME_DOWN, "media_volume_down"},
    {SpecialKey::MEDIA_VOLUME_UP, "media_volume_up"},
    {SpecialKey::MEDIA_PREVIOUS, "media_previous"},
    {SpecialKey::MEDIA_NEXT, "media_next"},
};

const std::string KEY_PREFIX = "Key.";
const std::string BUTTON_PREFIX = "Button.";

} // namespace

Key Key::fromChar(char c) {
    Key k;
    k.type = KeyType::CHARACTER;
    k.character = c;
    return k;
}

Key Key::fromSpecial(SpecialKey s) {
    Key k;
    k.type = KeyType::SPECIAL;
    k.special = s;
    return k;
}

Key Key::unknown(const std::string& identifier) {
    Key k;
    k.type = KeyType::UNKNOWN;
    k.raw = identifier;
    return k;
}

bool Key::isModifier() const {
    if (type != KeyType::SPECIAL) return false;
    return special == SpecialKey::CTRL || special == SpecialKey::ALT ||
           special == SpecialKey::SHIFT || special == SpecialKey::CMD;
}

bool operator==(const Key& a, const Key& b) {
    if (a.type != b.type) return false;
    switch (a.type) {
        case KeyType::CHARACTER: return a.character == b.character;
        case KeyType::SPECIAL: return a.special == b.special;
        case KeyType::UNKNOWN: return a.raw == b.raw;
    }
    return false;
}

bool operator!=(const Key& a, const Key& b) {
    return !(a == b);
}

bool operator<(const Key& a, const Key& b) {
    if (a.type != b.type) return a.type < b.type;
    switch (a.type) {
        case KeyType::CHARACTER: return a.character < b.character;
        case KeyType::SPECIAL: return a.special < b.special;
        case KeyType::UNKNOWN: return a.raw < b.raw;
    }
    return false;
}

std::string specialKeyName(SpecialKey key) {
    for (const auto& entry : SPECIAL_KEY_NAMES) {
        if (entry.key == key) return entry.name;
    }
    return "unknown";
}

bool specialKeyFromName(const std::string& name, SpecialKey& out) {
    for (const auto& entry : SPECIAL_KEY_NAMES) {
        if (name == entry.name) {
            out = entry.key;
            return true;
        }
    }
    return false;
}

std::string keyToString(const Key& key) {
    switch (key.type) {
        case KeyType::CHARACTER: return std::string(1, key.character);
        case KeyType::SPECIAL: return KEY_PREFIX + specialKeyName(key.special);
        case KeyType::UNKNOWN: return key.raw;
    }
    return key.raw;
}

Key keyFromString(const std::string& identifier) {
    if (identifier.size() == 1) {
        return Key::fromChar(identifier[0]);
    }
    if (identifier.compare(0, KEY_PREFIX.size(), KEY_PREFIX) == 0) {
        SpecialKey special;
        if (specialKeyFromName(identifier.substr(KEY_PREFIX.size()), special)) {
            return Key::fromSpecial(special);
        }
    }
    return Key::unknown(identifier);
}

std::string buttonToString(MouseButton button) {
    switch (button) {
        case MouseButton::LEFT: return BUTTON_PREFIX + "left";
        case MouseButton::RIGHT: return BUTTON_PREFIX + "right";
        case MouseButton::MIDDLE: return BUTTON_PREFIX + "middle";
        case MouseButton::X1: return BUTTON_PREFIX + "x1";
        case MouseButton::X2: return BUTTON_PREFIX + "x2";
        case MouseButton::UNKNOWN: break;
    }
    return BUTTON_PREFIX + "unknown";
}

MouseButton buttonFromString(const std::string& identifier) {
    if (identifier == "Button.left") return MouseButton::LEFT;
    if (identifier == "Button.right") return MouseButton::RIGHT;
    if (identifier == "Button.middle") return MouseButton::MIDDLE;
    if (identifier == "Button.x1") return MouseButton::X1;
    if (identifier == "Button.x2") return MouseButton::X2;
    return MouseButton::UNKNOWN;
}

} // namespace macrorec
