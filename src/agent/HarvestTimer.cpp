#include "HarvestTimer.hpp"

#include <iostream>

namespace logship {

HarvestTimer::HarvestTimer(std::shared_ptr<LogReporter> reporter, std::chrono::milliseconds period)
    : reporter_(std::move(reporter)), period_(period) {}

HarvestTimer::~HarvestTimer() {
    stop();
}

void HarvestTimer::start() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (running_) return;
    running_ = true;
    thread_ = std::thread([this] { run(); });
}

void HarvestTimer::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!running_) return;
        running_ = false;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool HarvestTimer::isRunning() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return running_;
}

uint64_t HarvestTimer::cycles() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return cycles_;
}

void HarvestTimer::tick() {
    std::lock_guard<std::mutex> cycle(cycleMutex_);
    try {
        reporter_->onHarvestConfigurationChanged();
        reporter_->start();
        reporter_->stop();
    } catch (const std::exception& e) {
        std::cerr << "HarvestTimer: harvest cycle failed: " << e.what() << "\n";
    }
    std::lock_guard<std::mutex> lk(mutex_);
    ++cycles_;
}

void HarvestTimer::run() {
    std::unique_lock<std::mutex> lk(mutex_);
    while (running_) {
        if (wake_.wait_for(lk, period_, [this] { return !running_; })) {
            break;
        }
        lk.unlock();
        tick();
        lk.lock();
    }
}

} // namespace logship
