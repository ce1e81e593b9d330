#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace kb::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Stops accepting work, drains the queue and joins the workers.
    void stop();

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] size_t queueDepth() const;
    [[nodiscard]] unsigned int workerCount() const { return static_cast<unsigned int>(threads_.size()); }

private:
    void worker();

    std::vector<std::thread> threads_;
    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;
    std::atomic<bool> stopFlag{false};
};

} // namespace kb::concurrency
