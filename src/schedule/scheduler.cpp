/*
 * scheduler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "scheduler.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace bmtl::schedule {

using namespace std::chrono;

namespace {

TimeOfDay resolveTime(const std::optional<std::string>& value,
                      TimeOfDay previous, const char* field) {
    if (!value) {
        return previous;
    }
    if (auto parsed = TimeOfDay::parse(*value)) {
        return *parsed;
    }
    spdlog::warn("Invalid {} '{}', keeping {}", field, *value,
                 previous.toString());
    return previous;
}

int resolveInterval(const std::optional<json>& value, int previous) {
    if (!value) {
        return std::max(previous, 0);
    }
    if (auto minutes = parseIntervalMinutes(*value)) {
        return *minutes;
    }
    spdlog::warn("Invalid capture interval {}, keeping {}", value->dump(),
                 previous);
    return std::max(previous, 0);
}

DueResult normalize(ScheduleDocument doc, LocalTime now) {
    if (!doc.enabled || doc.captureIntervalMinutes <= 0) {
        doc.enabled = false;
        doc.windowStart.reset();
        doc.windowEnd.reset();
        doc.nextCapture.reset();
        return {std::move(doc), false};
    }

    const minutes interval{doc.captureIntervalMinutes};
    Window window = calculateWindow(now, doc.startTime, doc.endTime);

    LocalTime candidate = std::max(now, window.start);
    if (doc.lastCapture) {
        candidate = std::max(candidate, *doc.lastCapture + interval);
    }
    LocalTime next = alignToInterval(window.start, candidate, interval);

    bool captureDue = false;
    if (next > window.end) {
        // Today's slots are used up.
        window = advanceWindow(window);
        next = window.start;
    } else {
        captureDue = now >= next;
    }

    doc.windowStart = window.start;
    doc.windowEnd = window.end;
    doc.nextCapture = next;
    return {std::move(doc), captureDue};
}

}  // namespace

LocalTime floorToMinute(LocalTime t) noexcept { return floor<minutes>(t); }

Window calculateWindow(LocalTime reference, TimeOfDay start, TimeOfDay end) {
    const auto today = floor<days>(reference);
    const LocalTime startToday = today + start.sinceMidnight();
    const LocalTime endToday = today + end.sinceMidnight();

    if (endToday > startToday) {
        if (reference < startToday) {
            return {startToday, endToday, false};
        }
        if (reference <= endToday) {
            return {startToday, endToday, true};
        }
        return {startToday + days{1}, endToday + days{1}, false};
    }

    // Overnight, or a full day when start == end.
    if (reference >= startToday) {
        return {startToday, endToday + days{1}, true};
    }
    if (reference <= endToday) {
        return {startToday - days{1}, endToday, true};
    }
    return {startToday, endToday + days{1}, false};
}

LocalTime alignToInterval(LocalTime base, LocalTime reference,
                          minutes interval) {
    if (reference <= base || interval <= minutes::zero()) {
        return base;
    }
    const auto elapsed = duration_cast<seconds>(reference - base).count();
    const auto step = duration_cast<seconds>(interval).count();
    const auto steps = (elapsed + step - 1) / step;
    return base + seconds{steps * step};
}

Window advanceWindow(const Window& window) {
    auto length = window.end - window.start;
    if (length <= seconds::zero()) {
        length = days{1};
    }
    const LocalTime start = window.start + days{1};
    return {start, start + length, false};
}

ScheduleDocument plan(const ScheduleSettings& settings,
                      const ScheduleDocument& previous, LocalTime now) {
    now = floorToMinute(now);

    ScheduleDocument doc;
    doc.startTime = resolveTime(settings.startTime, previous.startTime,
                                "start_time");
    doc.endTime = resolveTime(settings.endTime, previous.endTime, "end_time");
    doc.captureIntervalMinutes = resolveInterval(
        settings.captureInterval, previous.captureIntervalMinutes);

    bool enabled = previous.enabled;
    if (settings.enabled) {
        enabled = *settings.enabled;
    } else if (!settings.empty()) {
        enabled = true;
    }
    doc.enabled = enabled && doc.captureIntervalMinutes > 0;
    doc.lastCapture = previous.lastCapture;

    auto result = normalize(std::move(doc), now);
    spdlog::info(
        "Schedule planned: enabled={} {}-{} every {} min, next capture {}",
        result.schedule.enabled, result.schedule.startTime.toString(),
        result.schedule.endTime.toString(),
        result.schedule.captureIntervalMinutes,
        result.schedule.nextCapture
            ? system::formatTimestamp(*result.schedule.nextCapture)
            : std::string("none"));
    return result.schedule;
}

ScheduleDocument plan(const ScheduleSettings& settings, LocalTime now) {
    return plan(settings, ScheduleDocument{}, now);
}

DueResult due(const ScheduleDocument& schedule, LocalTime now) {
    return normalize(schedule, floorToMinute(now));
}

ScheduleDocument recordCapture(const ScheduleDocument& schedule,
                               LocalTime planned) {
    ScheduleDocument doc = schedule;
    doc.lastCapture = floorToMinute(planned);
    return normalize(std::move(doc), floorToMinute(planned)).schedule;
}

WindowCounters windowCounters(const ScheduleDocument& schedule, LocalTime now,
                              int captured) {
    WindowCounters counters;
    counters.captured = std::max(captured, 0);

    if (!schedule.enabled || !schedule.windowStart || !schedule.windowEnd ||
        schedule.captureIntervalMinutes <= 0) {
        return counters;
    }

    const auto step = minutes{schedule.captureIntervalMinutes};
    const LocalTime start = *schedule.windowStart;
    const LocalTime end = *schedule.windowEnd;

    counters.plannedTotal =
        static_cast<int>((end - start) / step) + 1;

    now = floorToMinute(now);
    if (now >= start) {
        const LocalTime upTo = std::min(now, end);
        counters.plannedDue = static_cast<int>((upTo - start) / step) + 1;
    }
    counters.missed = std::max(0, counters.plannedDue - counters.captured);
    return counters;
}

}  // namespace bmtl::schedule
