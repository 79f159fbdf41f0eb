#include "macrorec/RecordingCodec.hpp"

#include "macrorec/Errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace macrorec {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;
namespace fs = std::filesystem;

namespace {

const char* const RECORDING_SUFFIX = "_recording.json";

const json& requireField(const json& record, const char* name, size_t index) {
    auto it = record.find(name);
    if (it == record.end()) {
        throw DecodeError("record " + std::to_string(index) + " is missing field '" + name + "'");
    }
    return *it;
}

ValueError badField(const char* name, size_t index, const std::string& expected) {
    return ValueError("record " + std::to_string(index) + ": field '" + name + "' must be " + expected);
}

// JSON integers are 64 bit; anything outside the range of int is rejected
// instead of being narrowed.
bool toInt(const json& v, int& out) {
    if (v.is_number_unsigned()) {
        std::uint64_t value = v.get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(value);
        return true;
    }
    if (v.is_number_integer()) {
        std::int64_t value = v.get<std::int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) return false;
        out = static_cast<int>(value);
        return true;
    }
    return false;
}

bool readIntPair(const json& v, int& first, int& second) {
    return v.is_array() && v.size() == 2 && toInt(v[0], first) && toInt(v[1], second);
}

Snapshot decodeRecord(const json& record, size_t index) {
    if (!record.is_object()) {
        throw DecodeError("record " + std::to_string(index) + " is not an object");
    }

    const json& timestamp = requireField(record, "timestamp", index);
    const json& mousePos = requireField(record, "mouse_pos", index);
    const json& keys = requireField(record, "keys", index);
    const json& button = requireField(record, "button", index);
    const json& scroll = requireField(record, "scroll", index);

    Snapshot snapshot;

    if (!timestamp.is_number()) throw badField("timestamp", index, "a number");
    snapshot.timestamp = timestamp.get<double>();

    if (!readIntPair(mousePos, snapshot.mousePos.x, snapshot.mousePos.y)) {
        throw badField("mouse_pos", index, "a pair of integers");
    }

    if (!keys.is_null()) {
        if (!keys.is_array()) throw badField("keys", index, "a list or null");
        for (const auto& entry : keys) {
            if (!entry.is_array() || entry.size() != 2 || !entry[0].is_string() || !entry[1].is_number()) {
                throw badField("keys", index, "a list of [identifier, timestamp] pairs");
            }
            KeyPress kp;
            kp.key = keyFromString(entry[0].get<std::string>());
            kp.pressTime = entry[1].get<double>();
            snapshot.keys.push_back(kp);
        }
    }

    if (!button.is_null()) {
        if (!button.is_array() || button.size() != 2 || !button[0].is_string() || !button[1].is_boolean()) {
            throw badField("button", index, "an [identifier, pressed] pair or null");
        }
        ButtonEvent ev;
        std::string identifier = button[0].get<std::string>();
        ev.button = buttonFromString(identifier);
        if (ev.button == MouseButton::UNKNOWN) ev.raw = identifier;
        ev.pressed = button[1].get<bool>();
        snapshot.button = ev;
    }

    if (!scroll.is_null()) {
        ScrollDelta delta;
        if (!readIntPair(scroll, delta.dx, delta.dy)) {
            throw badField("scroll", index, "a pair of integers or null");
        }
        snapshot.scroll = delta;
    }

    return snapshot;
}

} // namespace

std::string encodeRecords(const std::vector<Snapshot>& records) {
    ordered_json list = ordered_json::array();
    for (const auto& snapshot : records) {
        ordered_json recordJson;
        recordJson["timestamp"] = snapshot.timestamp;
        recordJson["mouse_pos"] = ordered_json::array({snapshot.mousePos.x, snapshot.mousePos.y});

        ordered_json keys = ordered_json::array();
        for (const auto& kp : snapshot.keys) {
            keys.push_back(ordered_json::array({keyToString(kp.key), kp.pressTime}));
        }
        recordJson["keys"] = keys;

        if (snapshot.button) {
            recordJson["button"] = ordered_json::array({snapshot.button->identifier(), snapshot.button->pressed});
        } else {
            recordJson["button"] = nullptr;
        }

        if (snapshot.scroll) {
            recordJson["scroll"] = ordered_json::array({snapshot.scroll->dx, snapshot.scroll->dy});
        } else {
            recordJson["scroll"] = nullptr;
        }

        list.push_back(recordJson);
    }

    ordered_json root;
    root["records"] = list;
    return root.dump(2);
}

std::vector<Snapshot> decodeRecords(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DecodeError(std::string("invalid recording: ") + e.what());
    }

    if (!root.is_object()) {
        throw DecodeError("invalid recording: top level value is not an object");
    }
    auto it = root.find("records");
    if (it == root.end() || !it->is_array()) {
        throw DecodeError("invalid recording: missing 'records' list");
    }

    std::vector<Snapshot> records;
    records.reserve(it->size());
    size_t index = 0;
    for (const auto& record : *it) {
        records.push_back(decodeRecord(record, index));
        ++index;
    }
    return records;
}

void saveRecords(const std::string& path, const std::vector<Snapshot>& records) {
    if (records.empty()) {
        throw std::runtime_error("failed to save, no data has been recorded");
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) throw std::runtime_error("cannot open for writing: " + path);
    file << encodeRecords(records) << '\n';
    file.close();
    if (!file) throw std::runtime_error("failed writing: " + path);
}

std::vector<Snapshot> loadRecords(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("cannot open: " + path);
    std::ostringstream ss;
    ss << file.rdbuf();
    return decodeRecords(ss.str());
}

std::string defaultRecordingPath(const std::string& dir) {
    fs::create_directories(dir);
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y%m%d-%H%M%S") << RECORDING_SUFFIX;
    return (fs::path(dir) / ss.str()).string();
}

std::vector<std::string> listRecordings(const std::string& dir) {
    std::vector<std::string> recordings;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return recordings;

    const std::string suffix = RECORDING_SUFFIX;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        std::string filename = entry.path().filename().string();
        if (filename.size() >= suffix.size() &&
            filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) == 0) {
            recordings.push_back(entry.path().string());
        }
    }
    std::sort(recordings.begin(), recordings.end());
    return recordings;
}

} // namespace macrorec
