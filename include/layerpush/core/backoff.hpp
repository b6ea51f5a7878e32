#pragma once

#include "layerpush/core/context.hpp"

#include <chrono>
#include <cstddef>
#include <iterator>
#include <random>
#include <string>

namespace layerpush {

/// Lazily evaluated sequence of retry slots with exponential, jittered delay.
///
/// Each element is an error string: empty means "attempt now", non-empty is
/// the terminal context error and is always the last element. The first slot
/// is immediate; advancing the iterator sleeps on the context, so cancellation
/// interrupts the delay rather than waiting for the next slot. The consumer
/// stops early with `break`.
///
///     for (const auto& err : backoff_upto(ctx, std::chrono::seconds(1))) {
///         if (!err.empty()) return fail(err);
///         if (try_once()) break;
///     }
///
/// A Backoff is a single-pass input range; each call to backoff_upto() starts
/// an independent sequence.
class Backoff {
public:
    Backoff(const Context& ctx, std::chrono::milliseconds max_delay);

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(Backoff* owner) : owner_(owner) {}

        reference operator*() const { return owner_->current_; }
        pointer operator->() const { return &owner_->current_; }

        iterator& operator++() {
            owner_->advance();
            return *this;
        }

        bool operator==(const iterator& other) const { return at_end() == other.at_end(); }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        bool at_end() const { return owner_ == nullptr || owner_->finished_; }

        Backoff* owner_ = nullptr;
    };

    iterator begin();
    iterator end() { return iterator(); }

    /// Number of attempt slots yielded so far (the current one included).
    int attempts() const { return attempts_; }

    /// Delay slept before the given attempt (1-based), before jitter.
    static std::chrono::milliseconds base_delay(int attempt, std::chrono::milliseconds max_delay);

private:
    void advance();
    void fill_slot();

    const Context& ctx_;
    std::chrono::milliseconds max_delay_;
    std::mt19937_64 rng_;
    std::string current_;
    int attempts_ = 0;
    bool started_ = false;
    bool finished_ = false;
};

inline Backoff backoff_upto(const Context& ctx, std::chrono::milliseconds max_delay) {
    return Backoff(ctx, max_delay);
}

} // namespace layerpush
