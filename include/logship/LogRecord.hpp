#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "logship/LogLevel.hpp"

namespace logship {

struct LogRecord {
    int64_t timestamp = 0; // epoch milliseconds
    LogLevel level = LogLevel::Info;
    std::string message;
    nlohmann::json attributes = nlohmann::json::object();

    // Stamp a record with the current wall clock time.
    static LogRecord now(LogLevel level, std::string message,
                         nlohmann::json attributes = nlohmann::json::object());

    nlohmann::json toJson() const;

    // Single line of JSON terminated by '\n'.
    std::string encode() const;

    // Returns nullopt for lines that are not a JSON object with a message.
    static std::optional<LogRecord> decode(const std::string& line);
};

int64_t currentTimeMillis();

} // namespace logship
