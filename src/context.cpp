#include "layerpush/core/context.hpp"

namespace layerpush {

void Context::cancel() {
    {
        std::lock_guard lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool Context::done() const {
    {
        std::lock_guard lock(mutex_);
        if (cancelled_) return true;
    }
    return deadline_ && Clock::now() >= *deadline_;
}

std::string Context::err() const {
    {
        std::lock_guard lock(mutex_);
        if (cancelled_) return "context canceled";
    }
    if (deadline_ && Clock::now() >= *deadline_) {
        return "context deadline exceeded";
    }
    return {};
}

bool Context::wait_for(std::chrono::nanoseconds duration) const {
    auto until = Clock::now() + duration;
    bool capped = false;
    if (deadline_ && *deadline_ < until) {
        until = *deadline_;
        capped = true;
    }

    std::unique_lock lock(mutex_);
    bool cancelled = cv_.wait_until(lock, until, [this] { return cancelled_; });
    if (cancelled) return false;
    // Woke at the deadline rather than after the requested duration
    return !capped;
}

std::optional<std::chrono::milliseconds> Context::remaining() const {
    if (!deadline_) return std::nullopt;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
    if (left.count() < 0) return std::chrono::milliseconds(0);
    return left;
}

const Context& background_context() {
    static const Context ctx;
    return ctx;
}

} // namespace layerpush
