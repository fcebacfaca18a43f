#pragma once

#include <cstdint>
#include <future>
#include <stdexcept>

namespace usync::concurrency {

// Result carried back by a promised task: bytes handled by the task
using ExpectedFuture = uint64_t;

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

struct PromisedTask : Task {
    std::promise<ExpectedFuture> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<ExpectedFuture> p) : promise(std::move(p)) {}

    std::future<ExpectedFuture> getFuture() { return promise.get_future(); }

    void operator()() override { throw std::runtime_error("PromisedTask must implement operator()()"); }
};

}
