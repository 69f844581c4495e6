#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "logship/LogLevel.hpp"

namespace logship {

enum class RollupOrder { OldestFirst, NewestFirst };

struct CollectorConfig {
    std::string host = "localhost";
    int port = 8080;
    std::string path = "/log/v1";
    std::string licenseKey;
    bool compress = true;
    int compressionLevel = 3;
    std::chrono::seconds timeout{30};
};

// Agent configuration shared between the reporter, the logger and the host.
// The enabled flag and the level may change at runtime; every other knob is
// fixed once the reporter has been initialized.
class AgentConfig {
public:
    static constexpr std::size_t kDefaultMaxPayloadSize = 1024 * 1024;

    AgentConfig();

    // Throws ConfigurationError on malformed input.
    static std::shared_ptr<AgentConfig> fromJson(const nlohmann::json& j);
    static std::shared_ptr<AgentConfig> fromFile(const std::filesystem::path& path);

    // LOGSHIP_* variables override loaded values; unparsable values are ignored.
    void applyEnvironment();

    bool loggingEnabled() const { return loggingEnabled_.load(); }
    void setLoggingEnabled(bool enabled) { loggingEnabled_.store(enabled); }

    LogLevel logLevel() const { return logLevel_.load(); }
    void setLogLevel(LogLevel level) { logLevel_.store(level); }

    std::size_t maxPayloadSize = kDefaultMaxPayloadSize;
    std::size_t minPayloadThreshold = 0;
    std::size_t payloadBudget = kDefaultMaxPayloadSize * 9 / 10;
    std::chrono::milliseconds reportTTL{std::chrono::hours(24 * 3)};
    RollupOrder rollupOrder = RollupOrder::OldestFirst;
    std::chrono::milliseconds harvestPeriod{60000};
    std::string dataDir = "logdata";
    CollectorConfig collector;

private:
    std::atomic<bool> loggingEnabled_{true};
    std::atomic<LogLevel> logLevel_{LogLevel::Info};
};

} // namespace logship
