#include "macrorec/Player.hpp"

#include "macrorec/Errors.hpp"

#include <chrono>
#include <utility>

namespace macrorec {

Player::Player(InputDevice& device)
    : executor(device) {
}

Player::~Player() {
    {
        std::lock_guard<std::mutex> lk(mutex);
        stopRequested = true;
        paused = false;
    }
    cv.notify_all();
    joinPlaybackThread();
}

void Player::start(std::vector<Snapshot> newRecords, CompletionCallback callback, double newSpeed) {
    if (newRecords.empty()) {
        throw ValueError("no records to play back");
    }
    if (!(newSpeed > 0.0)) {
        throw ValueError("speed multiplier must be a positive value");
    }
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (std::this_thread::get_id() == playbackThreadId) {
            throw StateError("playback cannot be restarted from its completion callback");
        }
    }

    std::lock_guard<std::mutex> control(controlMutex);
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (playing) throw StateError("playback already in progress");
    }

    // The previous session has finished but its thread may still be unwinding.
    joinPlaybackThread();

    records = std::move(newRecords);
    speed = newSpeed;
    onComplete = std::move(callback);
    executor.resetKeyCache();

    std::lock_guard<std::mutex> lk(mutex);
    playing = true;
    paused = false;
    stopRequested = false;
    error = nullptr;
    playbackThread = std::thread(&Player::playback, this);
    playbackThreadId = playbackThread.get_id();
}

void Player::pause() {
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (!playing) throw StateError("pause called but playback is not active");
        paused = !paused;
    }
    cv.notify_all();
}

void Player::stop() {
    std::lock_guard<std::mutex> control(controlMutex);
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (!playing) throw StateError("stop called but playback is not active");
        stopRequested = true;
        paused = false;
    }
    cv.notify_all();
    joinPlaybackThread();
}

void Player::wait() {
    std::unique_lock<std::mutex> lk(mutex);
    if (!playing) throw StateError("wait called but playback is not active");
    cv.wait(lk, [this]() { return !playing; });
    if (error) std::rethrow_exception(error);
}

bool Player::isPlaying() const {
    std::lock_guard<std::mutex> lk(mutex);
    return playing;
}

bool Player::isPaused() const {
    std::lock_guard<std::mutex> lk(mutex);
    return playing && paused;
}

std::string Player::lastError() const {
    std::lock_guard<std::mutex> lk(mutex);
    if (!error) return std::string();
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
}

void Player::playback() {
    std::exception_ptr failure;
    try {
        for (size_t i = 1; i < records.size(); ++i) {
            if (!waitWhilePaused()) break;
            executor.execute(records[i - 1]);
            if (!sleepScaled(records[i].timestamp - records[i - 1].timestamp)) break;
        }
        // A stop request releases the pause, so the final snapshot still runs.
        waitWhilePaused();
        executor.execute(records.back());
    } catch (const std::exception&) {
        failure = std::current_exception();
    }
    finish(failure);
}

void Player::finish(std::exception_ptr failure) {
    CompletionCallback callback;
    {
        std::lock_guard<std::mutex> lk(mutex);
        playing = false;
        paused = false;
        error = failure;
        callback = onComplete;
    }
    cv.notify_all();
    if (callback) callback();
}

bool Player::sleepScaled(double seconds) {
    auto delay = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds / speed));
    auto deadline = std::chrono::steady_clock::now() + delay;
    std::unique_lock<std::mutex> lk(mutex);
    return !cv.wait_until(lk, deadline, [this]() { return stopRequested; });
}

bool Player::waitWhilePaused() {
    std::unique_lock<std::mutex> lk(mutex);
    cv.wait(lk, [this]() { return !paused || stopRequested; });
    return !stopRequested;
}

void Player::joinPlaybackThread() {
    if (playbackThread.joinable()) playbackThread.join();
    std::lock_guard<std::mutex> lk(mutex);
    playbackThreadId = std::thread::id();
}

} // namespace macrorec
