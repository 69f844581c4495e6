#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include "LogReporter.hpp"

namespace logship {

// Drives the reporter's harvest cycle on a fixed period. Cycles never overlap.
class HarvestTimer {
public:
    HarvestTimer(std::shared_ptr<LogReporter> reporter, std::chrono::milliseconds period);
    ~HarvestTimer();

    HarvestTimer(const HarvestTimer&) = delete;
    HarvestTimer& operator=(const HarvestTimer&) = delete;

    void start();
    void stop();
    bool isRunning() const;

    // Run one harvest cycle on the calling thread.
    void tick();

    uint64_t cycles() const;

private:
    void run();

    std::shared_ptr<LogReporter> reporter_;
    std::chrono::milliseconds period_;
    mutable std::mutex mutex_;
    std::mutex cycleMutex_;
    std::condition_variable wake_;
    bool running_ = false;
    uint64_t cycles_ = 0;
    std::thread thread_;
};

} // namespace logship
