#pragma once

#include "macrorec/ActionExecutor.hpp"
#include "macrorec/InputDevice.hpp"
#include "macrorec/Snapshot.hpp"

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace macrorec {

// Replays a snapshot sequence on a dedicated thread.
//
// Each snapshot is executed and followed by a sleep equal to the gap to the
// next timestamp divided by the speed multiplier. The last snapshot is always
// executed, including after stop(), so the devices end in the recorded final
// state.
class Player {
public:
    using CompletionCallback = std::function<void()>;

    explicit Player(InputDevice& device);
    ~Player();

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    // onComplete runs once on the playback thread when the session ends and
    // must not throw. Throws StateError if a session is active or when called
    // from the completion callback, and ValueError for an empty sequence or a
    // speed <= 0.
    void start(std::vector<Snapshot> records, CompletionCallback onComplete = nullptr,
               double speed = 1.0);

    // Toggles pause. A paused run holds before its next snapshot, the final one
    // included. Throws StateError if not playing.
    void pause();

    // Requests cancellation and blocks until the playback thread has exited.
    // Throws StateError if not playing.
    void stop();

    // Blocks until the session ends. Rethrows the error that ended it, if
    // any. Throws StateError if not playing.
    void wait();

    bool isPlaying() const;
    bool isPaused() const;

    // Message of the error that ended the last session, empty if none.
    std::string lastError() const;

private:
    void playback();
    void finish(std::exception_ptr error);
    // Returns false if a stop was requested while waiting.
    bool sleepScaled(double seconds);
    bool waitWhilePaused();
    void joinPlaybackThread();

    ActionExecutor executor;

    // Serializes start() and stop(), which replace or join the thread.
    std::mutex controlMutex;

    mutable std::mutex mutex;
    std::condition_variable cv;
    bool playing = false;
    bool paused = false;
    bool stopRequested = false;
    std::exception_ptr error;

    std::vector<Snapshot> records;
    double speed = 1.0;
    CompletionCallback onComplete;

    std::thread playbackThread;
    std::thread::id playbackThreadId;
};

} // namespace macrorec
