#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace logship {

// Lifecycle state of a log file, encoded in its name.
// All is a query wildcard and never the state of a single file.
enum class LogReportState { Working, Closed, Rollup, Expired, All };

const char* toString(LogReportState state);

// Name suffix for a state ("dat", "log", "rollup", "bak"); empty for All.
const char* extensionOf(LogReportState state);

struct ParsedLogFileName {
    LogReportState state;
    std::optional<int64_t> timestamp;
    // State the file held before it was quarantined; equals state otherwise.
    LogReportState baseState;
};

struct FileNameParts {
    std::string path;      // parent directory
    std::string file;      // name without the last extension
    std::string extension; // last extension without the dot
};

namespace filename {

constexpr const char* kBaseName = "logdata";

// logdata.dat, logdata<ts>.log, logdata<ts>.rollup
std::string make(LogReportState state, std::optional<int64_t> timestamp = std::nullopt);

// <name>.bak
std::string expiredNameOf(const std::string& name);

// Pure name classification; nullopt when the name is outside the convention.
std::optional<ParsedLogFileName> parse(const std::string& name);

// Suffix of an archive still being written; outside the convention.
constexpr const char* kTempSuffix = ".tmp";

// True for <rollup name>.tmp left behind by an interrupted rollup.
bool isArchiveTemporary(const std::string& name);

FileNameParts split(const std::filesystem::path& file);

} // namespace filename

} // namespace logship
