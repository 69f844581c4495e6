//RemoteLogger.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "LogReporter.hpp"
#include "logship/AgentConfig.hpp"
#include "logship/LogLevel.hpp"
#include "logship/LogRecord.hpp"
#include "logship/TaskQueue.hpp"

namespace logship {

// Buffered writer feeding the reporter's working file. log() only enqueues;
// one worker serializes and appends records in call order.
class RemoteLogger {
public:
    RemoteLogger(std::shared_ptr<LogReporter> reporter, std::shared_ptr<AgentConfig> config);
    ~RemoteLogger();

    RemoteLogger(const RemoteLogger&) = delete;
    RemoteLogger& operator=(const RemoteLogger&) = delete;

    void log(LogLevel level, const std::string& message);
    void logAttributes(LogLevel level, const std::string& message, const nlohmann::json& attributes);

    bool isLevelEnabled(LogLevel level) const;

    // Blocks until everything logged so far is in the working file.
    void flush();

    // Drains queued records and stops the worker; later calls are dropped.
    void shutdown();
    bool isShutdown() const;

    uint64_t droppedCount() const { return dropped_.load(); }
    uint64_t rollCount() const { return rolls_.load(); }

private:
    void enqueue(LogRecord record);
    void append(const LogRecord& record);

    std::shared_ptr<LogReporter> reporter_;
    std::shared_ptr<AgentConfig> config_;
    TaskQueue queue_;
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> rolls_{0};
};

} // namespace logship
