#pragma once

#include "macrorec/InputDevice.hpp"

namespace macrorec {

// InputDevice backed by low-level Windows hooks for capture and SendInput for
// playback. Only one keyboard and one mouse listener can be active at a time
// per process. Events injected by SendInput are not reported to listeners.
class Win32InputDevice : public InputDevice {
public:
    Point screenSize() override;
    Point cursorPosition() override;

    void moveCursor(const Point& pos) override;
    void pressButton(MouseButton button) override;
    void releaseButton(MouseButton button) override;
    void scroll(int dx, int dy) override;
    void pressKey(const Key& key) override;
    void releaseKey(const Key& key) override;

    std::unique_ptr<ListenerHandle> listenKeyboard(KeyCallback onPress,
                                                   KeyCallback onRelease) override;
    std::unique_ptr<ListenerHandle> listenMouse(ClickCallback onClick,
                                                ScrollCallback onScroll) override;
};

} // namespace macrorec
