#pragma once

#include "macrorec/Snapshot.hpp"

#include <string>
#include <vector>

namespace macrorec {

// JSON text of the form {"records": [...]}, one object per snapshot with the
// keys timestamp, mouse_pos, keys, button and scroll.
std::string encodeRecords(const std::vector<Snapshot>& records);

// Throws DecodeError for invalid JSON or a missing/mistyped structure and
// ValueError for a field whose value has the wrong shape.
std::vector<Snapshot> decodeRecords(const std::string& text);

// Throws std::runtime_error if records is empty or the file cannot be written.
void saveRecords(const std::string& path, const std::vector<Snapshot>& records);
std::vector<Snapshot> loadRecords(const std::string& path);

// <dir>/<YYYYmmdd-HHMMSS>_recording.json in local time. Creates dir.
std::string defaultRecordingPath(const std::string& dir);

// Files in dir ending in "_recording.json", sorted by name.
std::vector<std::string> listRecordings(const std::string& dir);

} // namespace macrorec
