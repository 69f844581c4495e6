#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include "PayloadSender.hpp"
#include "logship/AgentConfig.hpp"

namespace logship {

// Posts archives to the log collector. Delivered and rejected archives are
// deleted; anything else stays on disk for the next harvest.
class HttpPayloadSender : public PayloadSender {
public:
    explicit HttpPayloadSender(CollectorConfig config);

    bool send(const std::filesystem::path& archive) override;

    int lastStatus() const { return lastStatus_.load(); }
    uint64_t sentCount() const { return sent_.load(); }

private:
    CollectorConfig config_;
    std::atomic<int> lastStatus_{0};
    std::atomic<uint64_t> sent_{0};
};

} // namespace logship
