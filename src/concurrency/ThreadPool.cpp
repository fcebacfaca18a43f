#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace usync::concurrency;
using namespace usync::logging;

ThreadPool::ThreadPool(unsigned int nThreads) {
    if (nThreads == 0) nThreads = defaultThreadCount();
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    stopFlag.store(true);
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    if (stopFlag.load()) throw std::runtime_error("ThreadPool: submit after stop");
    {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

unsigned int ThreadPool::defaultThreadCount() {
    return std::max(1u, std::thread::hardware_concurrency());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            // Promised tasks route their own failures through the promise;
            // anything escaping here is a bug in the task itself.
            try {
                (*task)();
            } catch (const std::exception& e) {
                LogRegistry::usync()->error("[ThreadPool] Task escaped with exception: {}", e.what());
            }
        }
    });
}
