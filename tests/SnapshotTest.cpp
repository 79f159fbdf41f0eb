#include "macrorec/Snapshot.hpp"

#include <gtest/gtest.h>

using namespace macrorec;

namespace {

Snapshot busySnapshot() {
    Snapshot s;
    s.timestamp = 1700000000.25;
    s.mousePos = Point{640, 480};
    s.keys.push_back(KeyPress{Key::fromChar('q'), 1700000000.1});
    s.button = ButtonEvent{MouseButton::RIGHT, true};
    s.scroll = ScrollDelta{0, -3};
    return s;
}

} // namespace

TEST(SnapshotTest, ClearTransientKeepsTimeAndPosition) {
    Snapshot s = busySnapshot();
    s.clearTransient();

    EXPECT_DOUBLE_EQ(s.timestamp, 1700000000.25);
    EXPECT_EQ(s.mousePos, (Point{640, 480}));
    EXPECT_TRUE(s.keys.empty());
    EXPECT_FALSE(s.button.has_value());
    EXPECT_FALSE(s.scroll.has_value());
}

TEST(SnapshotTest, EqualityComparesEveryField) {
    Snapshot a = busySnapshot();
    Snapshot b = busySnapshot();
    EXPECT_EQ(a, b);

    b.scroll = ScrollDelta{1, -3};
    EXPECT_NE(a, b);

    b = busySnapshot();
    b.button.reset();
    EXPECT_NE(a, b);

    b = busySnapshot();
    b.keys[0].pressTime += 0.5;
    EXPECT_NE(a, b);

    b = busySnapshot();
    b.mousePos.y = 0;
    EXPECT_NE(a, b);
}

TEST(SnapshotTest, UnknownButtonsCompareByIdentifier) {
    ButtonEvent a{MouseButton::UNKNOWN, true, "Button.button8"};
    ButtonEvent b{MouseButton::UNKNOWN, true, "Button.button9"};
    EXPECT_FALSE(a == b);
    EXPECT_EQ(a.identifier(), "Button.button8");

    ButtonEvent unnamed{MouseButton::UNKNOWN, true};
    EXPECT_EQ(unnamed.identifier(), "Button.unknown");
    EXPECT_EQ((ButtonEvent{MouseButton::LEFT, false}).identifier(), "Button.left");
}

TEST(SnapshotTest, DefaultSnapshotIsIdle) {
    Snapshot s;
    EXPECT_EQ(s.mousePos, (Point{0, 0}));
    EXPECT_TRUE(s.keys.empty());
    EXPECT_FALSE(s.button);
    EXPECT_FALSE(s.scroll);
}
