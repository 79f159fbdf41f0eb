#pragma once

#include "macrorec/InputTypes.hpp"
#include "macrorec/Snapshot.hpp"

#include <functional>
#include <memory>

namespace macrorec {

// Keeps a device listener registered for as long as it lives.
class ListenerHandle {
public:
    virtual ~ListenerHandle() = default;
};

// Access to the live pointer and keyboard. The Recorder uses the listeners and
// the cursor query, the Player uses the injection calls. Listener callbacks run
// on threads owned by the implementation.
class InputDevice {
public:
    using KeyCallback = std::function<void(const Key&)>;
    using ClickCallback = std::function<void(int x, int y, MouseButton button, bool pressed)>;
    using ScrollCallback = std::function<void(int x, int y, int dx, int dy)>;

    virtual ~InputDevice() = default;

    // Width and height of the primary screen in pixels.
    virtual Point screenSize() = 0;
    virtual Point cursorPosition() = 0;

    virtual void moveCursor(const Point& pos) = 0;
    virtual void pressButton(MouseButton button) = 0;
    virtual void releaseButton(MouseButton button) = 0;
    virtual void scroll(int dx, int dy) = 0;
    virtual void pressKey(const Key& key) = 0;
    virtual void releaseKey(const Key& key) = 0;

    virtual std::unique_ptr<ListenerHandle> listenKeyboard(KeyCallback onPress,
                                                           KeyCallback onRelease) = 0;
    virtual std::unique_ptr<ListenerHandle> listenMouse(ClickCallback onClick,
                                                        ScrollCallback onScroll) = 0;
};

} // namespace macrorec
