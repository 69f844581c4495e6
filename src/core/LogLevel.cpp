#include "logship/LogLevel.hpp"

#include <cctype>

namespace logship {

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::None: return "NONE";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Verbose: return "VERBOSE";
        case LogLevel::Debug: return "DEBUG";
    }
    return "NONE";
}

LogLevel parseLogLevel(std::string_view name, LogLevel fallback) {
    std::string upper;
    upper.reserve(name.size());
    for (unsigned char ch : name) {
        upper.push_back(static_cast<char>(std::toupper(ch)));
    }

    if (upper == "NONE") return LogLevel::None;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "VERBOSE") return LogLevel::Verbose;
    if (upper == "DEBUG") return LogLevel::Debug;
    return fallback;
}

} // namespace logship
