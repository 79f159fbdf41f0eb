#include "platform/Win32InputDevice.hpp"

#include "macrorec/Errors.hpp"
#include "macrorec/WheelAccumulator.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

#include <cctype>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace macrorec {

namespace {

struct VkEntry {
    SpecialKey key;
    WORD vk;
};

const VkEntry VK_TABLE[] = {
    {SpecialKey::ALT, VK_MENU},
    {SpecialKey::ALT_L, VK_LMENU},
    {SpecialKey::ALT_R, VK_RMENU},
    {SpecialKey::ALT_GR, VK_RMENU},
    {SpecialKey::BACKSPACE, VK_BACK},
    {SpecialKey::CAPS_LOCK, VK_CAPITAL},
    {SpecialKey::CMD, VK_LWIN},
    {SpecialKey::CMD_L, VK_LWIN},
    {SpecialKey::CMD_R, VK_RWIN},
    {SpecialKey::CTRL, VK_CONTROL},
    {SpecialKey::CTRL_L, VK_LCONTROL},
    {SpecialKey::CTRL_R, VK_RCONTROL},
    {SpecialKey::DELETE_KEY, VK_DELETE},
    {SpecialKey::DOWN, VK_DOWN},
    {SpecialKey::END, VK_END},
    {SpecialKey::ENTER, VK_RETURN},
    {SpecialKey::ESC, VK_ESCAPE},
    {SpecialKey::F1, VK_F1},
    {SpecialKey::F2, VK_F2},
    {SpecialKey::F3, VK_F3},
    {SpecialKey::F4, VK_F4},
    {SpecialKey::F5, VK_F5},
    {SpecialKey::F6, VK_F6},
    {SpecialKey::F7, VK_F7},
    {SpecialKey::F8, VK_F8},
    {SpecialKey::F9, VK_F9},
    {SpecialKey::F10, VK_F10},
    {SpecialKey::F11, VK_F11},
    {SpecialKey::F12, VK_F12},
    {SpecialKey::F13, VK_F13},
    {SpecialKey::F14, VK_F14},
    {SpecialKey::F15, VK_F15},
    {SpecialKey::F16, VK_F16},
    {SpecialKey::F17, VK_F17},
    {SpecialKey::F18, VK_F18},
    {SpecialKey::F19, VK_F19},
    {SpecialKey::F20, VK_F20},
    {SpecialKey::HOME, VK_HOME},
    {SpecialKey::INSERT, VK_INSERT},
    {SpecialKey::LEFT, VK_LEFT},
    {SpecialKey::MENU, VK_APPS},
    {SpecialKey::NUM_LOCK, VK_NUMLOCK},
    {SpecialKey::PAGE_DOWN, VK_NEXT},
    {SpecialKey::PAGE_UP, VK_PRIOR},
    {SpecialKey::PAUSE, VK_PAUSE},
    {SpecialKey::PRINT_SCREEN, VK_SNAPSHOT},
    {SpecialKey::RIGHT, VK_RIGHT},
    {SpecialKey::SCROLL_LOCK, VK_SCROLL},
    {SpecialKey::SHIFT, VK_SHIFT},
    {SpecialKey::SHIFT_L, VK_LSHIFT},
    {SpecialKey::SHIFT_R, VK_RSHIFT},
    {SpecialKey::SPACE, VK_SPACE},
    {SpecialKey::TAB, VK_TAB},
    {SpecialKey::UP, VK_UP},
    {SpecialKey::MEDIA_PLAY_PAUSE, VK_MEDIA_PLAY_PAUSE},
    {SpecialKey::MEDIA_VOLUME_MUTE, VK_VOLUME_MUTE},
    {SpecialKey::MEDIA_VOLUME_DOWN, VK_VOLUME_DOWN},
    {SpecialKey::MEDIA_VOLUME_UP, VK_VOLUME_UP},
    {SpecialKey::MEDIA_PREVIOUS, VK_MEDIA_PREV_TRACK},
    {SpecialKey::MEDIA_NEXT, VK_MEDIA_NEXT_TRACK},
};

bool isExtendedKey(WORD vk) {
    switch (vk) {
        case VK_RMENU: case VK_RCONTROL: case VK_LWIN: case VK_RWIN: case VK_APPS:
        case VK_INSERT: case VK_DELETE: case VK_HOME: case VK_END:
        case VK_PRIOR: case VK_NEXT: case VK_LEFT: case VK_RIGHT: case VK_UP: case VK_DOWN:
        case VK_SNAPSHOT: case VK_NUMLOCK:
            return true;
        default:
            return false;
    }
}

// Left-hand modifiers are reported as the generic key so that recordings use
// the same identifiers on every platform.
Key keyFromVk(DWORD vk) {
    switch (vk) {
        case VK_LCONTROL: return Key::fromSpecial(SpecialKey::CTRL);
        case VK_LSHIFT: return Key::fromSpecial(SpecialKey::SHIFT);
        case VK_LMENU: return Key::fromSpecial(SpecialKey::ALT);
        case VK_LWIN: return Key::fromSpecial(SpecialKey::CMD);
        case VK_RCONTROL: return Key::fromSpecial(SpecialKey::CTRL_R);
        case VK_RSHIFT: return Key::fromSpecial(SpecialKey::SHIFT_R);
        case VK_RMENU: return Key::fromSpecial(SpecialKey::ALT_R);
        case VK_RWIN: return Key::fromSpecial(SpecialKey::CMD_R);
        default: break;
    }
    for (const auto& entry : VK_TABLE) {
        if (entry.vk == vk) return Key::fromSpecial(entry.key);
    }
    UINT ch = MapVirtualKeyA(static_cast<UINT>(vk), MAPVK_VK_TO_CHAR) & 0x7FFF;
    if (ch >= 0x21 && ch <= 0x7E) {
        return Key::fromChar(static_cast<char>(std::tolower(static_cast<int>(ch))));
    }
    return Key::unknown("<" + std::to_string(vk) + ">");
}

WORD vkFromKey(const Key& key) {
    if (key.type == KeyType::SPECIAL) {
        for (const auto& entry : VK_TABLE) {
            if (entry.key == key.special) return entry.vk;
        }
    } else if (key.type == KeyType::CHARACTER) {
        SHORT scan = VkKeyScanA(key.character);
        if (scan != -1) return static_cast<WORD>(scan & 0xFF);
    }
    throw ValueError("unknown key '" + keyToString(key) + "'");
}

void sendKey(const Key& key, bool down) {
    WORD vk = vkFromKey(key);
    INPUT in = {0};
    in.type = INPUT_KEYBOARD;
    in.ki.wVk = vk;
    in.ki.wScan = static_cast<WORD>(MapVirtualKeyA(vk, MAPVK_VK_TO_VSC));
    in.ki.dwFlags = down ? 0 : KEYEVENTF_KEYUP;
    if (isExtendedKey(vk)) in.ki.dwFlags |= KEYEVENTF_EXTENDEDKEY;
    if (SendInput(1, &in, sizeof(INPUT)) != 1) {
        throw std::runtime_error("SendInput failed for key '" + keyToString(key) + "'");
    }
}

void sendMouse(DWORD flags, DWORD data = 0) {
    INPUT in = {0};
    in.type = INPUT_MOUSE;
    in.mi.dwFlags = flags;
    in.mi.mouseData = data;
    if (SendInput(1, &in, sizeof(INPUT)) != 1) {
        throw std::runtime_error("SendInput failed for mouse event");
    }
}

void sendButton(MouseButton button, bool down) {
    switch (button) {
        case MouseButton::LEFT:
            sendMouse(down ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP);
            return;
        case MouseButton::RIGHT:
            sendMouse(down ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP);
            return;
        case MouseButton::MIDDLE:
            sendMouse(down ? MOUSEEVENTF_MIDDLEDOWN : MOUSEEVENTF_MIDDLEUP);
            return;
        case MouseButton::X1:
            sendMouse(down ? MOUSEEVENTF_XDOWN : MOUSEEVENTF_XUP, XBUTTON1);
            return;
        case MouseButton::X2:
            sendMouse(down ? MOUSEEVENTF_XDOWN : MOUSEEVENTF_XUP, XBUTTON2);
            return;
        case MouseButton::UNKNOWN:
            break;
    }
    throw ValueError("unknown button type '" + buttonToString(button) + "'");
}

// Low-level hooks only fire on a thread that pumps messages, so every hook
// gets its own thread running a message loop until the handle is destroyed.
class HookThread {
public:
    HookThread(int hookType, HOOKPROC proc) {
        std::promise<void> ready;
        std::future<void> installed = ready.get_future();
        thread = std::thread(&HookThread::run, this, hookType, proc, std::move(ready));
        try {
            installed.get();
        } catch (...) {
            thread.join();
            throw;
        }
    }

    ~HookThread() {
        PostThreadMessageW(threadId, WM_QUIT, 0, 0);
        thread.join();
    }

private:
    void run(int hookType, HOOKPROC proc, std::promise<void> ready) {
        HHOOK hook = SetWindowsHookExW(hookType, proc, GetModuleHandleW(nullptr), 0);
        if (!hook) {
            std::cerr << "Failed to set hook! (error " << GetLastError() << ")" << std::endl;
            ready.set_exception(std::make_exception_ptr(
                std::runtime_error("failed to install input hook")));
            return;
        }

        // Create the message queue before anyone can post WM_QUIT to it.
        MSG msg;
        PeekMessageW(&msg, nullptr, WM_USER, WM_USER, PM_NOREMOVE);
        threadId = GetCurrentThreadId();
        ready.set_value();

        while (GetMessageW(&msg, nullptr, 0, 0) > 0) {
            TranslateMessage(&msg);
            DispatchMessageW(&msg);
        }
        UnhookWindowsHookEx(hook);
    }

    std::thread thread;
    DWORD threadId = 0;
};

std::mutex listenerMutex;
bool keyboardActive = false;
bool mouseActive = false;
InputDevice::KeyCallback keyPressCallback;
InputDevice::KeyCallback keyReleaseCallback;
InputDevice::ClickCallback clickCallback;
InputDevice::ScrollCallback scrollCallback;
// Only touched on the mouse hook thread, and reset before it starts.
WheelAccumulator verticalWheel(WHEEL_DELTA);
WheelAccumulator horizontalWheel(WHEEL_DELTA);

LRESULT CALLBACK keyboardHookProc(int nCode, WPARAM wParam, LPARAM lParam) {
    if (nCode == HC_ACTION) {
        const KBDLLHOOKSTRUCT* info = reinterpret_cast<const KBDLLHOOKSTRUCT*>(lParam);
        if (!(info->flags & LLKHF_INJECTED)) {
            Key key = keyFromVk(info->vkCode);
            if (wParam == WM_KEYDOWN || wParam == WM_SYSKEYDOWN) {
                keyPressCallback(key);
            } else if (wParam == WM_KEYUP || wParam == WM_SYSKEYUP) {
                keyReleaseCallback(key);
            }
        }
    }
    return CallNextHookEx(nullptr, nCode, wParam, lParam);
}

LRESULT CALLBACK mouseHookProc(int nCode, WPARAM wParam, LPARAM lParam) {
    if (nCode == HC_ACTION) {
        const MSLLHOOKSTRUCT* info = reinterpret_cast<const MSLLHOOKSTRUCT*>(lParam);
        if (!(info->flags & LLMHF_INJECTED)) {
            int x = info->pt.x;
            int y = info->pt.y;
            switch (wParam) {
                case WM_LBUTTONDOWN: clickCallback(x, y, MouseButton::LEFT, true); break;
                case WM_LBUTTONUP: clickCallback(x, y, MouseButton::LEFT, false); break;
                case WM_RBUTTONDOWN: clickCallback(x, y, MouseButton::RIGHT, true); break;
                case WM_RBUTTONUP: clickCallback(x, y, MouseButton::RIGHT, false); break;
                case WM_MBUTTONDOWN: clickCallback(x, y, MouseButton::MIDDLE, true); break;
                case WM_MBUTTONUP: clickCallback(x, y, MouseButton::MIDDLE, false); break;
                case WM_XBUTTONDOWN:
                case WM_XBUTTONUP: {
                    MouseButton button = HIWORD(info->mouseData) == XBUTTON1 ? MouseButton::X1 : MouseButton::X2;
                    clickCallback(x, y, button, wParam == WM_XBUTTONDOWN);
                    break;
                }
                case WM_MOUSEWHEEL: {
                    int notches = verticalWheel.add(GET_WHEEL_DELTA_WPARAM(info->mouseData));
                    if (notches != 0) scrollCallback(x, y, 0, notches);
                    break;
                }
                case WM_MOUSEHWHEEL: {
                    int notches = horizontalWheel.add(GET_WHEEL_DELTA_WPARAM(info->mouseData));
                    if (notches != 0) scrollCallback(x, y, notches, 0);
                    break;
                }
            }
        }
    }
    return CallNextHookEx(nullptr, nCode, wParam, lParam);
}

class KeyboardListener : public ListenerHandle {
public:
    KeyboardListener() : hook(std::make_unique<HookThread>(WH_KEYBOARD_LL, keyboardHookProc)) {}

    ~KeyboardListener() override {
        hook.reset();
        std::lock_guard<std::mutex> lk(listenerMutex);
        keyPressCallback = nullptr;
        keyReleaseCallback = nullptr;
        keyboardActive = false;
    }

private:
    std::unique_ptr<HookThread> hook;
};

class MouseListener : public ListenerHandle {
public:
    MouseListener() : hook(std::make_unique<HookThread>(WH_MOUSE_LL, mouseHookProc)) {}

    ~MouseListener() override {
        hook.reset();
        std::lock_guard<std::mutex> lk(listenerMutex);
        clickCallback = nullptr;
        scrollCallback = nullptr;
        mouseActive = false;
    }

private:
    std::unique_ptr<HookThread> hook;
};

} // namespace

Point Win32InputDevice::screenSize() {
    return Point{GetSystemMetrics(SM_CXSCREEN), GetSystemMetrics(SM_CYSCREEN)};
}

Point Win32InputDevice::cursorPosition() {
    POINT pos;
    if (!GetCursorPos(&pos)) {
        throw std::runtime_error("GetCursorPos failed (error " + std::to_string(GetLastError()) + ")");
    }
    return Point{pos.x, pos.y};
}

void Win32InputDevice::moveCursor(const Point& pos) {
    Point screen = screenSize();
    INPUT in = {0};
    in.type = INPUT_MOUSE;
    in.mi.dwFlags = MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE;
    in.mi.dx = static_cast<LONG>((static_cast<long long>(pos.x) * 65535) / (screen.x - 1));
    in.mi.dy = static_cast<LONG>((static_cast<long long>(pos.y) * 65535) / (screen.y - 1));
    if (SendInput(1, &in, sizeof(INPUT)) != 1) {
        throw std::runtime_error("SendInput failed for cursor move");
    }
}

void Win32InputDevice::pressButton(MouseButton button) {
    sendButton(button, true);
}

void Win32InputDevice::releaseButton(MouseButton button) {
    sendButton(button, false);
}

void Win32InputDevice::scroll(int dx, int dy) {
    if (dy != 0) sendMouse(MOUSEEVENTF_WHEEL, static_cast<DWORD>(dy * WHEEL_DELTA));
    if (dx != 0) sendMouse(MOUSEEVENTF_HWHEEL, static_cast<DWORD>(dx * WHEEL_DELTA));
}

void Win32InputDevice::pressKey(const Key& key) {
    sendKey(key, true);
}

void Win32InputDevice::releaseKey(const Key& key) {
    sendKey(key, false);
}

std::unique_ptr<ListenerHandle> Win32InputDevice::listenKeyboard(KeyCallback onPress,
                                                                 KeyCallback onRelease) {
    {
        std::lock_guard<std::mutex> lk(listenerMutex);
        if (keyboardActive) throw std::runtime_error("a keyboard listener is already active");
        keyboardActive = true;
        keyPressCallback = std::move(onPress);
        keyReleaseCallback = std::move(onRelease);
    }
    try {
        return std::make_unique<KeyboardListener>();
    } catch (...) {
        std::lock_guard<std::mutex> lk(listenerMutex);
        keyPressCallback = nullptr;
        keyReleaseCallback = nullptr;
        keyboardActive = false;
        throw;
    }
}

std::unique_ptr<ListenerHandle> Win32InputDevice::listenMouse(ClickCallback onClick,
                                                              ScrollCallback onScroll) {
    {
        std::lock_guard<std::mutex> lk(listenerMutex);
        if (mouseActive) throw std::runtime_error("a mouse listener is already active");
        mouseActive = true;
        clickCallback = std::move(onClick);
        scrollCallback = std::move(onScroll);
        verticalWheel.reset();
        horizontalWheel.reset();
    }
    try {
        return std::make_unique<MouseListener>();
    } catch (...) {
        std::lock_guard<std::mutex> lk(listenerMutex);
        clickCallback = nullptr;
        scrollCallback = nullptr;
        mouseActive = false;
        throw;
    }
}

} // namespace macrorec
