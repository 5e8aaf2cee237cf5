/*
 * reconnect_backoff.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_MESSAGING_RECONNECT_BACKOFF_HPP
#define BMTL_MESSAGING_RECONNECT_BACKOFF_HPP

#include <chrono>
#include <optional>

namespace bmtl::messaging {

/**
 * @brief Exponential reconnect delay gated by the last failure time
 *
 * The first attempt is always allowed. After a failure the next attempt is
 * due once the current delay has elapsed; each failure multiplies the delay
 * up to the cap, and a success resets it to the initial value.
 */
class ReconnectBackoff {
public:
    using Clock = std::chrono::steady_clock;

    ReconnectBackoff(std::chrono::milliseconds initial,
                     std::chrono::milliseconds maximum, double multiplier = 2.0);

    [[nodiscard]] bool shouldAttempt(Clock::time_point now) const;

    void recordFailure(Clock::time_point now);

    void recordSuccess();

    /// Delay applied after the most recent failure
    [[nodiscard]] std::chrono::milliseconds currentDelay() const noexcept {
        return delay_;
    }

    [[nodiscard]] int failures() const noexcept { return failures_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds maximum_;
    double multiplier_;
    std::chrono::milliseconds delay_;
    std::optional<Clock::time_point> lastFailure_;
    int failures_{0};
};

}  // namespace bmtl::messaging

#endif  // BMTL_MESSAGING_RECONNECT_BACKOFF_HPP
