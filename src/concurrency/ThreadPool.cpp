#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace kb::concurrency;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    const unsigned int n = nThreads ? nThreads : std::max(1u, std::thread::hardware_concurrency());
    threads_.reserve(n);
    for (unsigned int i = 0; i < n; ++i)
        threads_.emplace_back(&ThreadPool::worker, this);
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        stopFlag.store(true);
    }
    cv.notify_all();
    for (auto& thread : threads_)
        if (thread.joinable()) thread.join();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("[ThreadPool] submit() after stop()");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

void ThreadPool::worker() {
    while (true) {
        std::shared_ptr<Task> task;

        {
            std::unique_lock lock(mutex);
            cv.wait(lock, [this]() {
                return !queue.empty() || stopFlag.load();
            });

            if (stopFlag.load() && queue.empty()) return;

            task = std::move(queue.front());
            queue.pop();
        }

        try {
            if (task) (*task)(); // calls operator()()
        } catch (const std::exception& e) {
            kb::log::Registry::keybridge()->error("[ThreadPool] Task threw exception: {}", e.what());
        }
    }
}
