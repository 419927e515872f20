#pragma once

#include "types.hpp"

#include <exception>
#include <future>
#include <optional>
#include <stdexcept>

namespace lc::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Only tasks that report a partial result hand out a future
    virtual std::optional<std::future<PartialResult>> getFuture() { return std::nullopt; }
};

// Runs run() and routes its result or exception into the promise.
// A task is executed at most once, and its future can be taken once.
struct PromisedTask : Task {
    std::promise<PartialResult> promise;

    std::optional<std::future<PartialResult>> getFuture() override {
        if (futureTaken_) throw std::logic_error("[PromisedTask] Future already retrieved");
        futureTaken_ = true;
        return promise.get_future();
    }

    void operator()() final {
        try {
            promise.set_value(run());
        } catch (const std::exception& e) {
            onFailure(e);
            promise.set_exception(std::current_exception());
        }
    }

protected:
    virtual PartialResult run() = 0;

    // Hook for side effects before the failure is delivered to the waiter
    virtual void onFailure(const std::exception&) {}

private:
    bool futureTaken_ = false;
};

}
