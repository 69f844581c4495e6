#include "logship/TaskQueue.hpp"

#include <iostream>
#include <utility>

namespace logship {

TaskQueue::TaskQueue(std::string name) : name_(std::move(name)) {
    worker_ = std::thread([this] { workerThread(); });
}

TaskQueue::~TaskQueue() {
    shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool TaskQueue::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return false;
        tasks_.push(std::move(task));
        ++posted_;
    }
    condition_.notify_one();
    return true;
}

void TaskQueue::drain() {
    std::unique_lock<std::mutex> lock(mutex_);
    const std::size_t target = posted_;
    idle_.wait(lock, [this, target] { return completed_ >= target; });
}

void TaskQueue::shutdown() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
        // Only the first caller owns the join.
        worker = std::move(worker_);
    }
    condition_.notify_all();
    if (!worker.joinable()) return;
    if (worker.get_id() == std::this_thread::get_id()) {
        // Called from a task; the destructor joins once the queue is empty.
        std::lock_guard<std::mutex> lock(mutex_);
        worker_ = std::move(worker);
        return;
    }
    worker.join();
}

bool TaskQueue::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_;
}

std::size_t TaskQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return posted_ - completed_;
}

void TaskQueue::workerThread() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << name_ << ": task failed: " << e.what() << "\n";
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++completed_;
        }
        idle_.notify_all();
    }
}

} // namespace logship
