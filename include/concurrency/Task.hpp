#pragma once

#include <future>
#include <stdexcept>

namespace dt::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Task whose outcome is reported through a future; getFuture() may be called once
template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;

    PromisedTask() = default;
    explicit PromisedTask(std::promise<T> p) : promise(std::move(p)) {}

    std::future<T> getFuture() { return promise.get_future(); }

    void operator()() override { throw std::runtime_error("PromisedTask must implement operator()()"); }
};

}
