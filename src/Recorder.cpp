#include "macrorec/Recorder.hpp"

#include "macrorec/Errors.hpp"
#include "macrorec/RecordingCodec.hpp"

#include <algorithm>

namespace macrorec {

Recorder::Recorder(InputDevice& device)
    : device(device) {
}

Recorder::~Recorder() {
    std::lock_guard<std::mutex> control(controlMutex);
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (!recording) return;
        recording = false;
    }
    terminate->requestStop();
    joinWorkers();
}

void Recorder::start(int rateHz) {
    if (rateHz <= 0) {
        throw ValueError("rate_hz must be a positive integer");
    }

    std::lock_guard<std::mutex> control(controlMutex);
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (recording) throw StateError("recording already in progress");
    }

    records.clear();
    samplerError = nullptr;
    {
        std::lock_guard<std::mutex> lk(recordMutex);
        record = Snapshot{};
    }
    {
        std::lock_guard<std::mutex> lk(activeKeysMutex);
        activeKeys.clear();
    }

    interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / rateHz));
    startTime = std::chrono::steady_clock::now();
    startEpoch = std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    terminate = std::make_unique<StopSignal>();

    std::promise<void> keyReady;
    std::promise<void> mouseReady;
    std::future<void> keyRegistered = keyReady.get_future();
    std::future<void> mouseRegistered = mouseReady.get_future();
    keypressThread = std::thread(&Recorder::recordKeyEvents, this, std::move(keyReady));
    clickThread = std::thread(&Recorder::recordMouseEvents, this, std::move(mouseReady));

    try {
        keyRegistered.get();
        mouseRegistered.get();
    } catch (...) {
        terminate->requestStop();
        joinWorkers();
        throw;
    }

    updateThread = std::thread(&Recorder::updateRecords, this);

    std::lock_guard<std::mutex> lk(stateMutex);
    recording = true;
}

void Recorder::stop() {
    std::lock_guard<std::mutex> control(controlMutex);
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (!recording) throw StateError("stop called but a recording was never started");
        recording = false;
    }

    terminate->requestStop();
    joinWorkers();

    if (samplerError) {
        std::exception_ptr e = samplerError;
        samplerError = nullptr;
        std::rethrow_exception(e);
    }
}

bool Recorder::isRecording() const {
    std::lock_guard<std::mutex> lk(stateMutex);
    return recording;
}

std::vector<Snapshot> Recorder::getRecords() const {
    std::lock_guard<std::mutex> control(controlMutex);
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (recording) throw StateError("failed to read records, recording in progress");
    }
    return records;
}

void Recorder::save(const std::string& path) const {
    std::lock_guard<std::mutex> control(controlMutex);
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (recording) throw StateError("failed to save, recording in progress");
    }
    saveRecords(path, records);
}

void Recorder::recordKeyEvents(std::promise<void> ready) {
    std::unique_ptr<ListenerHandle> listener;
    try {
        listener = device.listenKeyboard(
            [this](const Key& key) { onPress(key); },
            [this](const Key& key) { onRelease(key); });
    } catch (...) {
        ready.set_exception(std::current_exception());
        return;
    }
    ready.set_value();

    terminate->wait();
    listener.reset();
}

void Recorder::recordMouseEvents(std::promise<void> ready) {
    std::unique_ptr<ListenerHandle> listener;
    try {
        listener = device.listenMouse(
            [this](int, int, MouseButton button, bool pressed) { onClick(button, pressed); },
            [this](int, int, int dx, int dy) { onScroll(dx, dy); });
    } catch (...) {
        ready.set_exception(std::current_exception());
        return;
    }
    ready.set_value();

    terminate->wait();
    listener.reset();
}

void Recorder::updateRecords() {
    auto nextTick = std::chrono::steady_clock::now();
    while (!terminate->stopRequested()) {
        try {
            std::lock_guard<std::mutex> lk(recordMutex);
            record.timestamp = now();
            record.mousePos = device.cursorPosition();
            records.push_back(record);
            record.clearTransient();
        } catch (const std::exception&) {
            samplerError = std::current_exception();
            return;
        }

        // Ticks stay on a fixed grid; if one ran late, skip ahead rather than
        // firing a burst of back-to-back samples.
        nextTick += interval;
        auto current = std::chrono::steady_clock::now();
        if (nextTick <= current) nextTick = current + interval;
        if (terminate->waitUntil(nextTick)) break;
    }
}

void Recorder::onPress(const Key& key) {
    std::lock_guard<std::mutex> lk(activeKeysMutex);
    activeKeys.push_back(KeyPress{key, now()});
}

void Recorder::onRelease(const Key& key) {
    std::lock_guard<std::mutex> keysLock(activeKeysMutex);
    auto released = std::stable_partition(activeKeys.begin(), activeKeys.end(),
        [&key](const KeyPress& kp) { return kp.key != key; });
    if (released == activeKeys.end()) return;

    {
        std::lock_guard<std::mutex> recordLock(recordMutex);
        record.keys.insert(record.keys.end(), released, activeKeys.end());
    }
    activeKeys.erase(released, activeKeys.end());
}

void Recorder::onClick(MouseButton button, bool pressed) {
    std::lock_guard<std::mutex> lk(recordMutex);
    record.button = ButtonEvent{button, pressed};
}

void Recorder::onScroll(int dx, int dy) {
    if (dx == 0 && dy == 0) return;
    std::lock_guard<std::mutex> lk(recordMutex);
    record.scroll = ScrollDelta{dx, dy};
}

double Recorder::now() const {
    return startEpoch + std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
}

void Recorder::joinWorkers() {
    if (keypressThread.joinable()) keypressThread.join();
    if (clickThread.joinable()) clickThread.join();
    if (updateThread.joinable()) updateThread.join();
}

} // namespace macrorec
