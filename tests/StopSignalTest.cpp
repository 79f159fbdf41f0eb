#include "macrorec/StopSignal.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace macrorec;
using namespace std::chrono_literals;

TEST(StopSignalTest, WaitForTimesOutWithoutRequest) {
    StopSignal signal;
    auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(signal.waitFor(50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - begin, 50ms);
    EXPECT_FALSE(signal.stopRequested());
}

TEST(StopSignalTest, RequestWakesWaiters) {
    StopSignal signal;
    std::thread stopper([&signal]() {
        std::this_thread::sleep_for(30ms);
        signal.requestStop();
    });

    auto begin = std::chrono::steady_clock::now();
    EXPECT_TRUE(signal.waitFor(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    stopper.join();

    signal.wait();
    EXPECT_TRUE(signal.stopRequested());
}

TEST(StopSignalTest, StaysStoppedOnceRequested) {
    StopSignal signal;
    signal.requestStop();
    EXPECT_TRUE(signal.waitUntil(std::chrono::steady_clock::now() + 10s));
    EXPECT_TRUE(signal.waitFor(0ms));
}
