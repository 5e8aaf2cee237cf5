/*
 * reconnect_backoff.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "reconnect_backoff.hpp"

#include <algorithm>

namespace bmtl::messaging {

using std::chrono::milliseconds;

ReconnectBackoff::ReconnectBackoff(milliseconds initial, milliseconds maximum,
                                   double multiplier)
    : initial_(std::max(initial, milliseconds{1})),
      maximum_(std::max(maximum, initial_)),
      multiplier_(multiplier < 1.0 ? 1.0 : multiplier),
      delay_(initial_) {}

bool ReconnectBackoff::shouldAttempt(Clock::time_point now) const {
    return !lastFailure_ || now - *lastFailure_ >= delay_;
}

void ReconnectBackoff::recordFailure(Clock::time_point now) {
    if (lastFailure_) {
        auto next = static_cast<double>(delay_.count()) * multiplier_;
        delay_ = next >= static_cast<double>(maximum_.count())
                     ? maximum_
                     : milliseconds{static_cast<milliseconds::rep>(next)};
    }
    lastFailure_ = now;
    ++failures_;
}

void ReconnectBackoff::recordSuccess() {
    delay_ = initial_;
    lastFailure_.reset();
    failures_ = 0;
}

}  // namespace bmtl::messaging
