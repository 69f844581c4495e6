#include "RemoteLogger.hpp"

#include <stdexcept>
#include <utility>

namespace logship {

RemoteLogger::RemoteLogger(std::shared_ptr<LogReporter> reporter, std::shared_ptr<AgentConfig> config)
    : reporter_(std::move(reporter)), config_(std::move(config)), queue_("RemoteLogger") {
    if (!reporter_ || !config_) {
        throw std::invalid_argument("RemoteLogger: reporter and configuration are required");
    }
}

RemoteLogger::~RemoteLogger() {
    shutdown();
}

bool RemoteLogger::isLevelEnabled(LogLevel level) const {
    return levelPasses(level, config_->logLevel());
}

void RemoteLogger::log(LogLevel level, const std::string& message) {
    if (!isLevelEnabled(level)) return;
    enqueue(LogRecord::now(level, message));
}

void RemoteLogger::logAttributes(LogLevel level, const std::string& message, const nlohmann::json& attributes) {
    if (!isLevelEnabled(level)) return;
    enqueue(LogRecord::now(level, message, attributes.is_object() ? attributes : nlohmann::json::object()));
}

void RemoteLogger::enqueue(LogRecord record) {
    bool accepted = queue_.post([this, rec = std::move(record)] { append(rec); });
    if (!accepted) {
        ++dropped_;
    }
}

void RemoteLogger::append(const LogRecord& record) {
    std::size_t workingBytes = reporter_->appendToWorkingFile(record.encode());

    // Bound every working file independently of the harvest period.
    if (workingBytes > reporter_->payloadBudget()) {
        reporter_->rollWorkingFile();
        ++rolls_;
    }
}

void RemoteLogger::flush() {
    queue_.drain();
    reporter_->flushWorkingFile();
}

void RemoteLogger::shutdown() {
    queue_.shutdown();
    reporter_->flushWorkingFile();
}

bool RemoteLogger::isShutdown() const {
    return queue_.isShutdown();
}

} // namespace logship
