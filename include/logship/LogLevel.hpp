#pragma once

#include <string>
#include <string_view>

namespace logship {

// Most severe first. A record passes a threshold when its value is <= the threshold.
enum class LogLevel : int {
    None = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Verbose = 4,
    Debug = 5
};

const char* toString(LogLevel level);

// Case-insensitive; unknown names yield fallback.
LogLevel parseLogLevel(std::string_view name, LogLevel fallback = LogLevel::Info);

inline bool levelPasses(LogLevel level, LogLevel threshold) {
    if (level == LogLevel::None || threshold == LogLevel::None) return false;
    return static_cast<int>(level) <= static_cast<int>(threshold);
}

} // namespace logship
