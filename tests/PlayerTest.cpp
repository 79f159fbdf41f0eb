#include "macrorec/Player.hpp"

#include "macrorec/Errors.hpp"
#include "FakeInputDevice.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace macrorec;
using namespace std::chrono_literals;

namespace {

Snapshot at(double timestamp, int x, int y) {
    Snapshot s;
    s.timestamp = timestamp;
    s.mousePos = Point{x, y};
    return s;
}

double secondsSince(std::chrono::steady_clock::time_point begin) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();
}

class PlayerTest : public ::testing::Test {
protected:
    FakeInputDevice device;
    Player player{device};
};

} // namespace

TEST_F(PlayerTest, RejectsInvalidArguments) {
    EXPECT_THROW(player.start({}), ValueError);
    EXPECT_THROW(player.start({at(0, 1, 1)}, nullptr, 0.0), ValueError);
    EXPECT_THROW(player.start({at(0, 1, 1)}, nullptr, -2.0), ValueError);
    EXPECT_FALSE(player.isPlaying());
}

TEST_F(PlayerTest, ControlCallsNeedAnActiveSession) {
    EXPECT_THROW(player.pause(), StateError);
    EXPECT_THROW(player.stop(), StateError);
    EXPECT_THROW(player.wait(), StateError);
}

TEST_F(PlayerTest, PlaysEverySnapshotInOrder) {
    player.start({at(0.0, 1, 1), at(0.15, 2, 2), at(0.3, 3, 3)});
    player.wait();

    EXPECT_FALSE(player.isPlaying());
    EXPECT_EQ(device.moves(), (std::vector<std::string>{"move 1,1", "move 2,2", "move 3,3"}));
    EXPECT_TRUE(player.lastError().empty());
}

TEST_F(PlayerTest, SingleSnapshotPlays) {
    std::promise<void> done;
    std::future<void> finished = done.get_future();
    player.start({at(5.0, 7, 8)}, [&]() { done.set_value(); });
    ASSERT_EQ(finished.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(device.moves(), (std::vector<std::string>{"move 7,8"}));
}

TEST_F(PlayerTest, SpeedScalesDelays) {
    auto begin = std::chrono::steady_clock::now();
    player.start({at(100.0, 1, 1), at(101.0, 2, 2)}, nullptr, 2.0);
    player.wait();
    double elapsed = secondsSince(begin);

    EXPECT_GE(elapsed, 0.45);
    EXPECT_LT(elapsed, 0.9);

    std::vector<std::chrono::steady_clock::time_point> times = device.moveTimestamps();
    ASSERT_EQ(times.size(), 2u);
    EXPECT_NEAR(std::chrono::duration<double>(times[1] - times[0]).count(), 0.5, 0.2);
}

TEST_F(PlayerTest, SlowerSpeedStretchesDelays) {
    auto begin = std::chrono::steady_clock::now();
    player.start({at(0.0, 1, 1), at(0.1, 2, 2)}, nullptr, 0.5);
    player.wait();
    EXPECT_GE(secondsSince(begin), 0.19);
}

TEST_F(PlayerTest, StopStillExecutesFinalSnapshot) {
    player.start({at(0.0, 1, 1), at(10.0, 2, 2), at(20.0, 3, 3)});
    std::this_thread::sleep_for(100ms);

    auto begin = std::chrono::steady_clock::now();
    player.stop();
    EXPECT_LT(secondsSince(begin), 2.0);

    EXPECT_FALSE(player.isPlaying());
    EXPECT_EQ(device.moves(), (std::vector<std::string>{"move 1,1", "move 3,3"}));
}

TEST_F(PlayerTest, StartWhilePlayingFails) {
    player.start({at(0.0, 1, 1), at(10.0, 2, 2)});
    EXPECT_THROW(player.start({at(0.0, 1, 1)}), StateError);
    player.stop();
}

TEST_F(PlayerTest, CompletionCallbackRunsOnce) {
    std::atomic<int> calls{0};
    std::promise<void> done;
    player.start({at(0.0, 1, 1), at(0.02, 2, 2)}, [&]() {
        if (++calls == 1) done.set_value();
    });

    ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(PlayerTest, CallbackRunsAfterStop) {
    std::promise<void> done;
    std::future<void> finished = done.get_future();
    player.start({at(0.0, 1, 1), at(10.0, 2, 2)}, [&]() { done.set_value(); });
    std::this_thread::sleep_for(50ms);
    player.stop();
    EXPECT_EQ(finished.wait_for(5s), std::future_status::ready);
}

TEST_F(PlayerTest, CallbackCannotRestartPlayback) {
    std::promise<bool> rejected;
    std::future<bool> result = rejected.get_future();
    player.start({at(0.0, 1, 1)}, [&]() {
        try {
            player.start({at(0.0, 2, 2)});
            rejected.set_value(false);
        } catch (const StateError&) {
            rejected.set_value(true);
        }
    });

    ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(result.get());
}

TEST_F(PlayerTest, PlayerIsReusableAfterCompletion) {
    player.start({at(0.0, 1, 1), at(0.2, 2, 2)});
    player.wait();
    player.start({at(0.0, 3, 3), at(0.2, 4, 4)});
    player.wait();
    EXPECT_EQ(device.moves(), (std::vector<std::string>{"move 1,1", "move 2,2", "move 3,3", "move 4,4"}));
}

TEST_F(PlayerTest, PauseHoldsPlaybackUntilResumed) {
    player.start({at(0.0, 1, 1), at(0.1, 2, 2), at(0.2, 3, 3)});
    player.pause();
    EXPECT_TRUE(player.isPaused());

    std::this_thread::sleep_for(400ms);
    EXPECT_TRUE(player.isPlaying());
    EXPECT_LE(device.moves().size(), 1u);

    player.pause();
    EXPECT_FALSE(player.isPaused());
    player.wait();
    EXPECT_EQ(device.moves().size(), 3u);
}

TEST_F(PlayerTest, PauseHoldsFinalSnapshot) {
    player.start({at(0.0, 1, 1), at(0.3, 2, 2)});
    std::this_thread::sleep_for(100ms);
    player.pause();

    std::this_thread::sleep_for(500ms);
    EXPECT_TRUE(player.isPlaying());
    EXPECT_TRUE(player.isPaused());
    EXPECT_EQ(device.moves(), (std::vector<std::string>{"move 1,1"}));

    player.pause();
    player.wait();
    EXPECT_EQ(device.moves(), (std::vector<std::string>{"move 1,1", "move 2,2"}));
}

TEST_F(PlayerTest, StopReleasesPauseBeforeFinalSnapshot) {
    player.start({at(0.0, 1, 1), at(0.2, 2, 2)});
    std::this_thread::sleep_for(50ms);
    player.pause();
    std::this_thread::sleep_for(400ms);

    player.stop();
    EXPECT_FALSE(player.isPlaying());
    EXPECT_EQ(device.moves(), (std::vector<std::string>{"move 1,1", "move 2,2"}));
}

TEST_F(PlayerTest, StopWhilePausedFinishes) {
    player.start({at(0.0, 1, 1), at(0.1, 2, 2), at(0.2, 3, 3)});
    player.pause();
    std::this_thread::sleep_for(50ms);
    player.stop();

    EXPECT_FALSE(player.isPlaying());
    std::vector<std::string> moves = device.moves();
    ASSERT_FALSE(moves.empty());
    EXPECT_EQ(moves.back(), "move 3,3");
}

TEST_F(PlayerTest, WaitRethrowsPlaybackError) {
    device.setScreen(100, 100);
    std::promise<void> done;
    std::future<void> finished = done.get_future();
    player.start({at(0.0, 1, 1), at(0.3, 5000, 5000), at(0.6, 2, 2)}, [&]() { done.set_value(); });

    EXPECT_THROW(player.wait(), std::out_of_range);
    EXPECT_FALSE(player.isPlaying());
    EXPECT_NE(player.lastError().find("5000"), std::string::npos);
    EXPECT_EQ(finished.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(device.moves(), (std::vector<std::string>{"move 1,1"}));
}

TEST_F(PlayerTest, KeysReplayInEverySession) {
    Snapshot s = at(0.0, 1, 1);
    s.keys.push_back(KeyPress{Key::fromChar('k'), 1.0});
    std::vector<Snapshot> session = {s, at(0.2, 2, 2)};

    player.start(session);
    player.wait();
    player.start(session);
    player.wait();

    int presses = 0;
    for (const auto& action : device.actions()) {
        if (action == "press_key k") ++presses;
    }
    EXPECT_EQ(presses, 2);
}

TEST_F(PlayerTest, DestructorCancelsPlayback) {
    auto begin = std::chrono::steady_clock::now();
    {
        Player scoped(device);
        scoped.start({at(0.0, 1, 1), at(30.0, 2, 2), at(60.0, 3, 3)});
        std::this_thread::sleep_for(50ms);
    }
    EXPECT_LT(secondsSince(begin), 5.0);
    std::vector<std::string> moves = device.moves();
    ASSERT_FALSE(moves.empty());
    EXPECT_EQ(moves.back(), "move 3,3");
}
