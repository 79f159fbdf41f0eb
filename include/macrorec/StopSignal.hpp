#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace macrorec {

// One-shot cancellation flag that worker threads can block on.
class StopSignal {
public:
    void requestStop();
    bool stopRequested() const;

    // Blocks until requestStop() is called.
    void wait();

    // Sleeps until the deadline or a stop request, whichever comes first.
    // Returns true when a stop was requested.
    bool waitUntil(std::chrono::steady_clock::time_point deadline);
    bool waitFor(std::chrono::steady_clock::duration timeout);

private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool stopped = false;
};

} // namespace macrorec
