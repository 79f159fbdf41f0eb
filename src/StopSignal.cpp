#include "macrorec/StopSignal.hpp"

namespace macrorec {

void StopSignal::requestStop() {
    {
        std::lock_guard<std::mutex> lk(mutex);
        stopped = true;
    }
    cv.notify_all();
}

bool StopSignal::stopRequested() const {
    std::lock_guard<std::mutex> lk(mutex);
    return stopped;
}

void StopSignal::wait() {
    std::unique_lock<std::mutex> lk(mutex);
    cv.wait(lk, [this]() { return stopped; });
}

bool StopSignal::waitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mutex);
    return cv.wait_until(lk, deadline, [this]() { return stopped; });
}

bool StopSignal::waitFor(std::chrono::steady_clock::duration timeout) {
    return waitUntil(std::chrono::steady_clock::now() + timeout);
}

} // namespace macrorec
