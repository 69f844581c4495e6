#include "logship/AgentConfig.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include "logship/Errors.hpp"

using json = nlohmann::json;

namespace logship {

namespace {

RollupOrder parseRollupOrder(const std::string& v, RollupOrder fallback) {
    if (v == "oldest_first") return RollupOrder::OldestFirst;
    if (v == "newest_first") return RollupOrder::NewestFirst;
    return fallback;
}

// Keeps the previous value when the variable is not a number.
uint64_t envNumber(const char* name, const char* value, uint64_t fallback) {
    try {
        return std::stoull(value);
    } catch (const std::logic_error&) {
        std::cerr << "AgentConfig: ignoring " << name << "=" << value << "\n";
        return fallback;
    }
}

bool parseBool(const std::string& v, bool fallback) {
    if (v == "1" || v == "true" || v == "on") return true;
    if (v == "0" || v == "false" || v == "off") return false;
    return fallback;
}

template <typename T>
T readValue(const json& obj, const char* key, T fallback) {
    if (!obj.contains(key)) return fallback;
    try {
        return obj.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("AgentConfig: bad value for '") + key + "': " + e.what());
    }
}

} // namespace

AgentConfig::AgentConfig() = default;

std::shared_ptr<AgentConfig> AgentConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("AgentConfig: configuration must be a JSON object");
    }
    auto config = std::make_shared<AgentConfig>();

    config->dataDir = readValue<std::string>(j, "data_dir", config->dataDir);

    json logging = j.value("logging", json::object());
    if (!logging.is_object()) throw ConfigurationError("AgentConfig: 'logging' must be an object");
    config->setLoggingEnabled(readValue<bool>(logging, "enabled", config->loggingEnabled()));
    if (logging.contains("level")) {
        auto name = readValue<std::string>(logging, "level", "");
        LogLevel level = parseLogLevel(name, LogLevel::None);
        if (level == LogLevel::None && name != "NONE" && name != "none") {
            throw ConfigurationError("AgentConfig: unknown log level '" + name + "'");
        }
        config->setLogLevel(level);
    }
    config->maxPayloadSize = readValue<std::size_t>(logging, "max_payload_size", config->maxPayloadSize);
    config->minPayloadThreshold = readValue<std::size_t>(logging, "min_payload_threshold", config->minPayloadThreshold);
    // The budget follows the payload ceiling unless set explicitly.
    config->payloadBudget = readValue<std::size_t>(logging, "payload_budget", config->maxPayloadSize * 9 / 10);
    config->reportTTL = std::chrono::milliseconds(
        readValue<int64_t>(logging, "report_ttl_ms", config->reportTTL.count()));
    if (logging.contains("rollup_order")) {
        auto order = readValue<std::string>(logging, "rollup_order", "");
        if (order != "oldest_first" && order != "newest_first") {
            throw ConfigurationError("AgentConfig: unknown rollup_order '" + order + "'");
        }
        config->rollupOrder = parseRollupOrder(order, config->rollupOrder);
    }

    json harvest = j.value("harvest", json::object());
    if (!harvest.is_object()) throw ConfigurationError("AgentConfig: 'harvest' must be an object");
    config->harvestPeriod = std::chrono::milliseconds(
        readValue<int64_t>(harvest, "period_ms", config->harvestPeriod.count()));

    json collector = j.value("collector", json::object());
    if (!collector.is_object()) throw ConfigurationError("AgentConfig: 'collector' must be an object");
    config->collector.host = readValue<std::string>(collector, "host", config->collector.host);
    config->collector.port = readValue<int>(collector, "port", config->collector.port);
    config->collector.path = readValue<std::string>(collector, "path", config->collector.path);
    config->collector.licenseKey = readValue<std::string>(collector, "license_key", config->collector.licenseKey);
    config->collector.compress = readValue<bool>(collector, "compress", config->collector.compress);
    config->collector.compressionLevel =
        readValue<int>(collector, "compression_level", config->collector.compressionLevel);
    config->collector.timeout = std::chrono::seconds(
        readValue<int64_t>(collector, "timeout_s", config->collector.timeout.count()));

    if (config->maxPayloadSize == 0) {
        throw ConfigurationError("AgentConfig: max_payload_size must be positive");
    }
    if (config->payloadBudget == 0) {
        throw ConfigurationError("AgentConfig: payload_budget must be positive");
    }
    if (config->reportTTL.count() <= 0 || config->harvestPeriod.count() <= 0) {
        throw ConfigurationError("AgentConfig: report_ttl_ms and period_ms must be positive");
    }
    return config;
}

std::shared_ptr<AgentConfig> AgentConfig::fromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("AgentConfig: failed to open " + path.string());
    }
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigurationError("AgentConfig: parse error in " + path.string());
    }
    return fromJson(j);
}

void AgentConfig::applyEnvironment() {
    if (const char* env = std::getenv("LOGSHIP_ENABLED")) {
        setLoggingEnabled(parseBool(env, loggingEnabled()));
    }
    if (const char* env = std::getenv("LOGSHIP_LEVEL")) {
        setLogLevel(parseLogLevel(env, logLevel()));
    }
    if (const char* env = std::getenv("LOGSHIP_MAX_PAYLOAD")) {
        maxPayloadSize = std::max<std::size_t>(1, envNumber("LOGSHIP_MAX_PAYLOAD", env, maxPayloadSize));
    }
    if (const char* env = std::getenv("LOGSHIP_MIN_PAYLOAD")) {
        minPayloadThreshold = envNumber("LOGSHIP_MIN_PAYLOAD", env, minPayloadThreshold);
    }
    if (const char* env = std::getenv("LOGSHIP_PAYLOAD_BUDGET")) {
        payloadBudget = std::max<std::size_t>(1, envNumber("LOGSHIP_PAYLOAD_BUDGET", env, payloadBudget));
    }
    if (const char* env = std::getenv("LOGSHIP_REPORT_TTL_MS")) {
        reportTTL = std::chrono::milliseconds(std::max<uint64_t>(1, envNumber("LOGSHIP_REPORT_TTL_MS", env, reportTTL.count())));
    }
    if (const char* env = std::getenv("LOGSHIP_ROLLUP_ORDER")) {
        rollupOrder = parseRollupOrder(env, rollupOrder);
    }
    if (const char* env = std::getenv("LOGSHIP_HARVEST_MS")) {
        harvestPeriod = std::chrono::milliseconds(std::max<uint64_t>(1, envNumber("LOGSHIP_HARVEST_MS", env, harvestPeriod.count())));
    }
    if (const char* env = std::getenv("LOGSHIP_DATA_DIR")) {
        dataDir = env;
    }
    if (const char* env = std::getenv("LOGSHIP_COLLECTOR_HOST")) {
        collector.host = env;
    }
    if (const char* env = std::getenv("LOGSHIP_COLLECTOR_PORT")) {
        collector.port = static_cast<int>(envNumber("LOGSHIP_COLLECTOR_PORT", env, static_cast<uint64_t>(collector.port)));
    }
    if (const char* env = std::getenv("LOGSHIP_LICENSE_KEY")) {
        collector.licenseKey = env;
    }
    if (const char* env = std::getenv("LOGSHIP_COMPRESS")) {
        collector.compress = parseBool(env, collector.compress);
    }
}

} // namespace logship
