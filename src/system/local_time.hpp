/*
 * local_time.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Civil local time helpers shared by the scheduler, the store
             wrapper and response timestamps

**************************************************/

#ifndef BMTL_SYSTEM_LOCAL_TIME_HPP
#define BMTL_SYSTEM_LOCAL_TIME_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace bmtl::system {

/// Wall-clock time of the unit's configured zone, at second resolution.
using LocalTime = std::chrono::local_seconds;

[[nodiscard]] LocalTime toLocalTime(std::chrono::system_clock::time_point tp);

[[nodiscard]] LocalTime localNow();

/**
 * @brief Format as ISO-8601 without zone, e.g. 2024-05-01T08:30:00
 */
[[nodiscard]] std::string formatTimestamp(LocalTime t);

[[nodiscard]] std::string nowTimestamp();

/**
 * @brief Format as 20240501_083000, used in capture file names
 */
[[nodiscard]] std::string formatCompact(LocalTime t);

/**
 * @brief Parse an ISO-8601 local timestamp
 *
 * Accepts `YYYY-MM-DDTHH:MM[:SS]` with either `T` or a space as separator.
 * A fractional part and a trailing `Z` or `+HH:MM` designator are accepted
 * and ignored.
 */
[[nodiscard]] std::optional<LocalTime> parseTimestamp(std::string_view text);

}  // namespace bmtl::system

#endif  // BMTL_SYSTEM_LOCAL_TIME_HPP
