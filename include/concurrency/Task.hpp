#pragma once

#include "types.hpp"

#include <future>
#include <optional>

namespace nsync::concurrency {

// Unit of work run by a ThreadPool worker
struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    virtual std::optional<std::future<ExpectedFuture>> getFuture() { return std::nullopt; }
};

// A task whose result is collected by whoever submitted it. Implementations must set
// the promise on every path; a task dropped unrun leaves the future with broken_promise.
struct PromisedTask : Task {
    std::promise<ExpectedFuture> promise;

    std::optional<std::future<ExpectedFuture>> getFuture() override { return promise.get_future(); }
};

}
