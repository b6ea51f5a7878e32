#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace layerpush {

/// Cancellation and deadline shared by every blocking call of one operation.
///
/// A Context is cancelled explicitly with cancel() or implicitly when its
/// deadline passes. wait_for() is the only deliberate wait in the library and
/// returns as soon as the context is done. Thread-safe; not copyable, pass by
/// reference.
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() = default;
    explicit Context(Clock::time_point deadline) : deadline_(deadline) {}

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    static Context with_timeout(std::chrono::milliseconds timeout) {
        return Context(Clock::now() + timeout);
    }

    /// Cancel the context and wake every waiter.
    void cancel();

    /// True once cancelled or past the deadline.
    bool done() const;

    /// "context canceled", "context deadline exceeded", or empty while live.
    std::string err() const;

    /// Sleep for up to `duration`. Returns false if the context finished
    /// before the full duration elapsed.
    bool wait_for(std::chrono::nanoseconds duration) const;

    std::optional<Clock::time_point> deadline() const { return deadline_; }

    /// Time left until the deadline (nullopt when there is none).
    std::optional<std::chrono::milliseconds> remaining() const;

private:
    std::optional<Clock::time_point> deadline_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

/// A context that is never cancelled and has no deadline.
const Context& background_context();

} // namespace layerpush
