#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace usync::concurrency {

class ThreadPool {
public:
    // 0 threads: one per hardware core
    explicit ThreadPool(unsigned int nThreads = 0);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drains the queue, then joins every worker
    void stop();

    void submit(std::shared_ptr<Task> task);

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;

    static unsigned int defaultThreadCount();

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

} // namespace usync::concurrency
