/*
 * schedule_service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "schedule_service.hpp"

#include <spdlog/spdlog.h>

#include "store/config_store.hpp"

namespace bmtl::schedule {

using namespace std::chrono;
using store::documents::CAMERA_SCHEDULE;
using store::documents::SCHEDULE_SETTINGS;

ScheduleService::ScheduleService(store::ConfigStore& store, CaptureFn capture)
    : store_(store), capture_(std::move(capture)) {}

ScheduleDocument ScheduleService::current() {
    auto stored = store_.read(CAMERA_SCHEDULE);
    if (!stored) {
        return ScheduleDocument{};
    }
    return ScheduleDocument::fromJson(*stored);
}

void ScheduleService::persist(const ScheduleDocument& before,
                              const ScheduleDocument& after) {
    if (before == after && store_.exists(CAMERA_SCHEDULE)) {
        return;
    }
    store_.write(CAMERA_SCHEDULE, after.toJson());
}

ScheduleDocument ScheduleService::initialize(LocalTime now) {
    std::lock_guard lock(mutex_);

    if (!store_.exists(CAMERA_SCHEDULE)) {
        spdlog::info("No schedule found, seeding the default schedule");
        store_.write(CAMERA_SCHEDULE, ScheduleDocument{}.toJson());
    }

    ScheduleDocument previous = current();
    ScheduleDocument next;
    auto saved = store_.read(SCHEDULE_SETTINGS);
    if (saved && saved->is_object() && !saved->empty()) {
        next = plan(ScheduleSettings::fromJson(*saved), previous, now);
    } else {
        next = due(previous, now).schedule;
    }
    persist(previous, next);
    return next;
}

ScheduleDocument ScheduleService::applySettings(
    const ScheduleSettings& settings, LocalTime now) {
    std::lock_guard lock(mutex_);

    ScheduleDocument previous = current();
    ScheduleDocument next = plan(settings, previous, now);
    persist(previous, next);
    return next;
}

TickResult ScheduleService::tick(LocalTime now) {
    std::lock_guard lock(mutex_);

    TickResult result;
    ScheduleDocument before = current();
    auto [schedule, captureDue] = due(before, now);

    if (captureDue && schedule.nextCapture) {
        const LocalTime planned = *schedule.nextCapture;
        result.captured = true;
        result.planned = planned;
        spdlog::info("Capture due for slot {}",
                     system::formatTimestamp(planned));
        try {
            result.captureSucceeded =
                capture_(planned, schedule.windowStart.value_or(planned));
        } catch (const std::exception& e) {
            spdlog::error("Capture for slot {} failed: {}",
                          system::formatTimestamp(planned), e.what());
        }
        // A failed slot is still consumed; it shows up as missed.
        schedule = recordCapture(schedule, planned);
    }

    persist(before, schedule);
    result.schedule = std::move(schedule);
    return result;
}

void ScheduleService::run(std::stop_token stop, seconds pollInterval) {
    if (pollInterval <= seconds::zero()) {
        pollInterval = seconds{60};
    }

    std::mutex waitMutex;
    std::condition_variable_any wake;

    spdlog::info("Scheduler loop started (poll every {}s)",
                 pollInterval.count());
    while (!stop.stop_requested()) {
        try {
            tick(system::localNow());
        } catch (const std::exception& e) {
            spdlog::error("Scheduler tick failed: {}", e.what());
        }

        auto now = system_clock::now();
        auto sinceEpoch = duration_cast<seconds>(now.time_since_epoch());
        auto nextBoundary =
            (sinceEpoch / pollInterval + 1) * pollInterval + seconds{1};
        auto wakeAt = system_clock::time_point{nextBoundary};

        std::unique_lock lock(waitMutex);
        wake.wait_until(lock, stop, wakeAt, [] { return false; });
    }
    spdlog::info("Scheduler loop stopped");
}

}  // namespace bmtl::schedule
