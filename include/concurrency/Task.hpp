#pragma once

#include <exception>
#include <functional>
#include <future>
#include <type_traits>
#include <utility>

namespace kb::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Runs fn once and settles the promise with its value or its exception.
template <typename T>
struct PromisedTask : Task {
    std::promise<T> promise;
    std::function<T()> fn;

    explicit PromisedTask(std::function<T()> f) : fn(std::move(f)) {}

    std::future<T> getFuture() { return promise.get_future(); }

    void operator()() override {
        try {
            if constexpr (std::is_void_v<T>) {
                fn();
                promise.set_value();
            } else {
                promise.set_value(fn());
            }
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
};

}
