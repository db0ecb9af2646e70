#pragma once

#include <algorithm>
#include <chrono>

namespace termrelay::pool {

// Capped exponential reconnect policy: base * 2^failures, never above cap.
// Failures accumulate until reset() after a successful connect.
class ExponentialBackoff {
public:
    using duration = std::chrono::milliseconds;

    static constexpr duration kDefaultBase = std::chrono::seconds(1);
    static constexpr duration kDefaultCap = std::chrono::seconds(16);

    constexpr ExponentialBackoff() = default;
    constexpr ExponentialBackoff(duration base, duration cap)
        : base_(base), cap_(std::max(base, cap)) {}

    // Delay to wait before the next attempt.
    constexpr duration delay() const noexcept { return delay_for(failures_); }

    constexpr duration delay_for(unsigned failures) const noexcept {
        duration d = base_;
        for (unsigned i = 0; i < failures && d < cap_; ++i) d *= 2;
        return std::min(d, cap_);
    }

    constexpr void record_failure() noexcept { ++failures_; }
    constexpr void reset() noexcept { failures_ = 0; }
    constexpr unsigned failures() const noexcept { return failures_; }

    constexpr duration base() const noexcept { return base_; }
    constexpr duration cap() const noexcept { return cap_; }

private:
    duration base_ = kDefaultBase;
    duration cap_ = kDefaultCap;
    unsigned failures_ = 0;
};

} // namespace termrelay::pool
