#include "layerpush/core/backoff.hpp"

#include <algorithm>

namespace layerpush {

namespace {

constexpr std::chrono::milliseconds INITIAL_DELAY{10};

}  // namespace

Backoff::Backoff(const Context& ctx, std::chrono::milliseconds max_delay)
    : ctx_(ctx)
    , max_delay_(max_delay)
    , rng_(std::random_device{}()) {}

Backoff::iterator Backoff::begin() {
    if (!started_) {
        started_ = true;
        fill_slot();
    }
    return iterator(this);
}

std::chrono::milliseconds Backoff::base_delay(int attempt, std::chrono::milliseconds max_delay) {
    if (attempt <= 1) return std::min(INITIAL_DELAY, max_delay);
    // Doubling saturates long before the shift could overflow
    int shift = std::min(attempt - 1, 30);
    auto delay = INITIAL_DELAY * (int64_t{1} << shift);
    return std::min(std::chrono::duration_cast<std::chrono::milliseconds>(delay), max_delay);
}

void Backoff::fill_slot() {
    ++attempts_;
    current_ = ctx_.err();
}

void Backoff::advance() {
    if (finished_) return;

    // The error slot is terminal
    if (!current_.empty()) {
        finished_ = true;
        return;
    }

    auto delay = base_delay(attempts_, max_delay_);
    // Jitter in [0.5, 1.5)
    std::uniform_real_distribution<double> jitter(0.5, 1.5);
    auto jittered = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double, std::milli>(static_cast<double>(delay.count()) * jitter(rng_)));

    ctx_.wait_for(jittered);
    fill_slot();
}

} // namespace layerpush
