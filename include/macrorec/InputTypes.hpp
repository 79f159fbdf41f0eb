#pragma once

#include <string>

namespace macrorec {

enum class SpecialKey {
    ALT, ALT_L, ALT_R, ALT_GR,
    BACKSPACE, CAPS_LOCK,
    CMD, CMD_L, CMD_R,
    CTRL, CTRL_L, CTRL_R,
    DELETE_KEY, DOWN, END, ENTER, ESC,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10,
    F11, F12, F13, F14, F15, F16, F17, F18, F19, F20,
    HOME, INSERT, LEFT, MENU, NUM_LOCK,
    PAGE_DOWN, PAGE_UP, PAUSE, PRINT_SCREEN,
    RIGHT, SCROLL_LOCK,
    SHIFT, SHIFT_L, SHIFT_R,
    SPACE, TAB, UP,
    MEDIA_PLAY_PAUSE, MEDIA_VOLUME_MUTE, MEDIA_VOLUME_DOWN, MEDIA_VOLUME_UP,
    MEDIA_PREVIOUS, MEDIA_NEXT
};

enum class KeyType {
    CHARACTER,
    SPECIAL,
    UNKNOWN
};

// A keyboard key decoded once at the device boundary. UNKNOWN keeps the raw
// identifier so it survives a save/load cycle untouched.
struct Key {
    KeyType type = KeyType::UNKNOWN;
    char character = 0;
    SpecialKey special = SpecialKey::ESC;
    std::string raw;

    static Key fromChar(char c);
    static Key fromSpecial(SpecialKey k);
    static Key unknown(const std::string& identifier);

    // True for the generic ctrl, alt, shift and cmd keys. Left/right variants
    // are not included.
    bool isModifier() const;
};

bool operator==(const Key& a, const Key& b);
bool operator!=(const Key& a, const Key& b);
bool operator<(const Key& a, const Key& b);

enum class MouseButton {
    LEFT,
    RIGHT,
    MIDDLE,
    X1,
    X2,
    UNKNOWN
};

// Identifier text used in recording files: "a", "Key.shift", "Button.left".
std::string keyToString(const Key& key);
Key keyFromString(const std::string& identifier);

std::string specialKeyName(SpecialKey key);
bool specialKeyFromName(const std::string& name, SpecialKey& out);

std::string buttonToString(MouseButton button);
MouseButton buttonFromString(const std::string& identifier);

} // namespace macrorec
