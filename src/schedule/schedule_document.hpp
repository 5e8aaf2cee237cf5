/*
 * schedule_document.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: Persisted windowed-interval schedule and the user settings
             it is planned from

**************************************************/

#ifndef BMTL_SCHEDULE_SCHEDULE_DOCUMENT_HPP
#define BMTL_SCHEDULE_SCHEDULE_DOCUMENT_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "system/local_time.hpp"
#include "time_of_day.hpp"

namespace bmtl::schedule {

using json = nlohmann::json;
using system::LocalTime;

inline constexpr std::string_view WINDOWED_INTERVAL = "windowed_interval";
inline constexpr int DEFAULT_INTERVAL_MINUTES = 60;

/**
 * @brief User-supplied schedule fields, any of which may be missing
 *
 * Values are kept as received; plan() validates them.
 */
struct ScheduleSettings {
    std::optional<bool> enabled;
    std::optional<std::string> startTime;
    std::optional<std::string> endTime;
    std::optional<json> captureInterval;

    [[nodiscard]] bool empty() const noexcept {
        return !enabled && !startTime && !endTime && !captureInterval;
    }

    /**
     * @brief Accepts snake_case and the camelCase keys of the settings
     *        command (startTime, endTime, captureInterval)
     */
    [[nodiscard]] static ScheduleSettings fromJson(const json& j);
    [[nodiscard]] json toJson() const;
};

/**
 * @brief Normalized schedule, the single source of truth for captures
 *
 * When enabled, window_start < window_end and next_capture lies inside
 * [window_start, window_end]. When disabled the three are absent.
 */
struct ScheduleDocument {
    bool enabled{false};
    std::string type{WINDOWED_INTERVAL};
    TimeOfDay startTime{0, 0};
    TimeOfDay endTime{23, 59};
    int captureIntervalMinutes{DEFAULT_INTERVAL_MINUTES};
    std::optional<LocalTime> lastCapture;
    std::optional<LocalTime> windowStart;
    std::optional<LocalTime> windowEnd;
    std::optional<LocalTime> nextCapture;

    [[nodiscard]] json toJson() const;

    /**
     * @brief Lenient read of a persisted document
     *
     * Invalid fields fall back to the defaults with a warning; a zero
     * interval clears `enabled`.
     */
    [[nodiscard]] static ScheduleDocument fromJson(const json& j);

    bool operator==(const ScheduleDocument&) const = default;
};

/**
 * @brief Interpret an interval value as whole minutes
 *
 * Integers, floats (truncated) and strings holding a base-10 integer are
 * accepted; negative values clamp to zero. Anything else is rejected.
 */
[[nodiscard]] std::optional<int> parseIntervalMinutes(const json& value);

}  // namespace bmtl::schedule

#endif  // BMTL_SCHEDULE_SCHEDULE_DOCUMENT_HPP
