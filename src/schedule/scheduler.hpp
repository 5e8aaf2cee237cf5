/*
 * scheduler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file scheduler.hpp
 * @brief Windowed-interval capture planning
 *
 * Pure functions over a ScheduleDocument and the current local time. All
 * evaluation happens at minute resolution: `now` is floored to the minute
 * on entry, matching the HH:MM window bounds and whole-minute intervals.
 *
 * Windows are computed for a reference time:
 * - same-day (end > start): today's window if the reference is before or
 *   inside it, otherwise tomorrow's;
 * - overnight (end <= start): the window that contains the reference, or
 *   the one opening today at start. end == start is a 24 hour window.
 */

#ifndef BMTL_SCHEDULE_SCHEDULER_HPP
#define BMTL_SCHEDULE_SCHEDULER_HPP

#include <chrono>

#include "schedule_document.hpp"

namespace bmtl::schedule {

struct Window {
    LocalTime start;
    LocalTime end;
    bool inside{false};  ///< The reference time lies in [start, end]
};

struct DueResult {
    ScheduleDocument schedule;
    bool captureDue{false};
};

/**
 * @brief Capture counters for the schedule's current window
 */
struct WindowCounters {
    int plannedTotal{0};  ///< Grid slots in [window_start, window_end]
    int plannedDue{0};    ///< Slots at or before min(now, window_end)
    int captured{0};
    int missed{0};        ///< max(0, plannedDue - captured)
};

[[nodiscard]] LocalTime floorToMinute(LocalTime t) noexcept;

[[nodiscard]] Window calculateWindow(LocalTime reference, TimeOfDay start,
                                     TimeOfDay end);

/**
 * @brief First multiple of @p interval from @p base at or after @p reference
 */
[[nodiscard]] LocalTime alignToInterval(LocalTime base, LocalTime reference,
                                        std::chrono::minutes interval);

/**
 * @brief Same window one day later; a non-positive length becomes one day
 */
[[nodiscard]] Window advanceWindow(const Window& window);

/**
 * @brief Build a normalized schedule from user settings
 *
 * Each field falls back from the new value to @p previous; the overload
 * without a previous document starts from the defaults (00:00, 23:59,
 * 60 minutes, disabled). `enabled` is the explicit flag when
 * given, true when any other field is given, otherwise the previous value,
 * and always false for a zero interval. last_capture is carried over.
 */
[[nodiscard]] ScheduleDocument plan(const ScheduleSettings& settings,
                                    const ScheduleDocument& previous,
                                    LocalTime now);

[[nodiscard]] ScheduleDocument plan(const ScheduleSettings& settings,
                                    LocalTime now);

/**
 * @brief Per-tick decision
 *
 * Recomputes window and next_capture for @p now; the capture is due when
 * now >= next_capture. The planned slot is the returned next_capture.
 */
[[nodiscard]] DueResult due(const ScheduleDocument& schedule, LocalTime now);

/**
 * @brief Consume the slot @p planned and compute the following one
 */
[[nodiscard]] ScheduleDocument recordCapture(const ScheduleDocument& schedule,
                                             LocalTime planned);

[[nodiscard]] WindowCounters windowCounters(const ScheduleDocument& schedule,
                                            LocalTime now, int captured);

}  // namespace bmtl::schedule

#endif  // BMTL_SCHEDULE_SCHEDULER_HPP
