/*
 * time_of_day.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_SCHEDULE_TIME_OF_DAY_HPP
#define BMTL_SCHEDULE_TIME_OF_DAY_HPP

#include <chrono>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace bmtl::schedule {

/**
 * @brief Wall-clock time of day at minute resolution (HH:MM)
 */
struct TimeOfDay {
    int hour{0};
    int minute{0};

    /**
     * @brief Parse `H:MM` or `HH:MM`, surrounding blanks allowed
     */
    [[nodiscard]] static std::optional<TimeOfDay> parse(std::string_view text);

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] constexpr std::chrono::minutes sinceMidnight() const noexcept {
        return std::chrono::hours{hour} + std::chrono::minutes{minute};
    }

    auto operator<=>(const TimeOfDay&) const = default;
};

}  // namespace bmtl::schedule

#endif  // BMTL_SCHEDULE_TIME_OF_DAY_HPP
