#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace logship {

// A single worker thread that runs posted tasks strictly in submission order.
class TaskQueue {
public:
    explicit TaskQueue(std::string name);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Returns false once the queue has been shut down.
    bool post(std::function<void()> task);

    // Block until every task posted before this call has run.
    void drain();

    // Run what is queued, then stop the worker. Idempotent; the first caller
    // waits for the worker, concurrent callers return at once.
    void shutdown();

    bool isShutdown() const;
    std::size_t pending() const;

private:
    void workerThread();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;
    std::queue<std::function<void()>> tasks_;
    std::size_t posted_ = 0;
    std::size_t completed_ = 0;
    bool stop_ = false;
    std::thread worker_;
};

} // namespace logship
