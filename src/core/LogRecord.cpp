#include "logship/LogRecord.hpp"

#include <chrono>

using json = nlohmann::json;

namespace logship {

int64_t currentTimeMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

LogRecord LogRecord::now(LogLevel level, std::string message, json attributes) {
    LogRecord record;
    record.timestamp = currentTimeMillis();
    record.level = level;
    record.message = std::move(message);
    record.attributes = std::move(attributes);
    return record;
}

json LogRecord::toJson() const {
    json j = {
        {"timestamp", timestamp},
        {"level", toString(level)},
        {"message", message}
    };
    if (attributes.is_object() && !attributes.empty()) {
        j["attributes"] = attributes;
    }
    return j;
}

std::string LogRecord::encode() const {
    // Invalid UTF-8 in messages is replaced rather than thrown on.
    std::string line = toJson().dump(-1, ' ', false, json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

std::optional<LogRecord> LogRecord::decode(const std::string& line) {
    auto j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    if (!j.contains("message") || !j["message"].is_string()) return std::nullopt;

    LogRecord record;
    if (j.contains("timestamp") && j["timestamp"].is_number_integer()) {
        record.timestamp = j["timestamp"].get<int64_t>();
    }
    if (j.contains("level") && j["level"].is_string()) {
        record.level = parseLogLevel(j["level"].get<std::string>(), LogLevel::Info);
    }
    record.message = j["message"].get<std::string>();
    if (j.contains("attributes") && j["attributes"].is_object()) {
        record.attributes = j["attributes"];
    }
    return record;
}

} // namespace logship
