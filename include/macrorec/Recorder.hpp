#pragma once

#include "macrorec/InputDevice.hpp"
#include "macrorec/Snapshot.hpp"
#include "macrorec/StopSignal.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace macrorec {

// Captures keyboard and mouse activity as one Snapshot per sampling interval.
//
// start() launches three workers: a keyboard listener, a mouse listener and a
// sampler. The listeners write into a single in-flight snapshot; the sampler
// stamps it with the time and pointer position, appends a copy to the output
// and clears it. Keys are reported once, in the interval in which they are
// released, with the time they were pressed.
class Recorder {
public:
    explicit Recorder(InputDevice& device);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    // Throws ValueError if rateHz <= 0 and StateError if already recording.
    void start(int rateHz);

    // Blocks until every worker has exited. Throws StateError if not
    // recording. Events that arrived after the last sampler tick are dropped.
    void stop();

    bool isRecording() const;

    // Both throw StateError while recording. save() also throws when nothing
    // was captured.
    std::vector<Snapshot> getRecords() const;
    void save(const std::string& path) const;

private:
    void recordKeyEvents(std::promise<void> ready);
    void recordMouseEvents(std::promise<void> ready);
    void updateRecords();

    void onPress(const Key& key);
    void onRelease(const Key& key);
    void onClick(MouseButton button, bool pressed);
    void onScroll(int dx, int dy);

    double now() const;
    void joinWorkers();

    InputDevice& device;

    // Serializes start/stop and reads of the finished sequence.
    mutable std::mutex controlMutex;

    mutable std::mutex stateMutex;
    bool recording = false;

    std::mutex recordMutex;
    Snapshot record;

    std::mutex activeKeysMutex;
    std::vector<KeyPress> activeKeys;

    // Written only by the sampler while recording.
    std::vector<Snapshot> records;
    std::exception_ptr samplerError;

    std::chrono::steady_clock::duration interval{};
    std::chrono::steady_clock::time_point startTime;
    double startEpoch = 0.0;

    std::unique_ptr<StopSignal> terminate;
    std::thread keypressThread;
    std::thread clickThread;
    std::thread updateThread;
};

} // namespace macrorec
