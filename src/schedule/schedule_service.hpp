/*
 * schedule_service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: Periodic schedule evaluation backed by the config store

**************************************************/

#ifndef BMTL_SCHEDULE_SCHEDULE_SERVICE_HPP
#define BMTL_SCHEDULE_SCHEDULE_SERVICE_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>

#include "scheduler.hpp"

namespace bmtl::store {
class ConfigStore;
}

namespace bmtl::schedule {

/**
 * @brief Outcome of one scheduler tick
 */
struct TickResult {
    bool captured{false};              ///< A slot was due and consumed
    bool captureSucceeded{false};
    std::optional<LocalTime> planned;  ///< The consumed slot
    ScheduleDocument schedule;
};

/**
 * @brief Owns the poll loop of the worker process
 *
 * Reads camera_schedule on every tick so that changes written by other
 * processes are honored, runs due() and hands due slots to the capture
 * callback. The document is rewritten only when it changed.
 */
class ScheduleService {
public:
    /// Performs the capture for a planned slot of the window opening at
    /// windowStart; returns success.
    using CaptureFn =
        std::function<bool(LocalTime planned, LocalTime windowStart)>;

    ScheduleService(store::ConfigStore& store, CaptureFn capture);

    /**
     * @brief Seed the schedule on first boot and apply saved settings
     */
    ScheduleDocument initialize(LocalTime now);

    /**
     * @brief Re-plan from user settings and persist the result
     */
    ScheduleDocument applySettings(const ScheduleSettings& settings,
                                   LocalTime now);

    TickResult tick(LocalTime now);

    /**
     * @brief Persisted schedule, or the defaults when none exists
     */
    [[nodiscard]] ScheduleDocument current();

    /**
     * @brief Tick until @p stop is requested
     *
     * Wakes a second after each multiple of @p pollInterval so ticks land
     * inside the minute of a slot.
     */
    void run(std::stop_token stop, std::chrono::seconds pollInterval);

private:
    void persist(const ScheduleDocument& before, const ScheduleDocument& after);

    store::ConfigStore& store_;
    CaptureFn capture_;
    std::mutex mutex_;
};

}  // namespace bmtl::schedule

#endif  // BMTL_SCHEDULE_SCHEDULE_SERVICE_HPP
