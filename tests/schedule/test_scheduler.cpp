/*
 * test_scheduler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: Tests for windowed-interval capture planning

**************************************************/

#include <gtest/gtest.h>

#include "schedule/scheduler.hpp"

#include <tuple>

using namespace bmtl::schedule;
using namespace std::chrono;

namespace {

LocalTime at(int hour, int minute, int day = 1) {
    return local_days{year{2024} / May / day} + hours{hour} + minutes{minute};
}

ScheduleSettings settings(std::string start, std::string end, json interval) {
    ScheduleSettings s;
    s.startTime = std::move(start);
    s.endTime = std::move(end);
    s.captureInterval = std::move(interval);
    return s;
}

}  // namespace

// ============================================================================
// Time parsing
// ============================================================================

TEST(TimeOfDayTest, ParsesValidTimes) {
    auto t = TimeOfDay::parse("8:05");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->hour, 8);
    EXPECT_EQ(t->minute, 5);
    EXPECT_EQ(t->toString(), "08:05");
    EXPECT_TRUE(TimeOfDay::parse(" 23:59 ").has_value());
}

TEST(TimeOfDayTest, RejectsInvalidTimes) {
    EXPECT_FALSE(TimeOfDay::parse("24:00").has_value());
    EXPECT_FALSE(TimeOfDay::parse("12:60").has_value());
    EXPECT_FALSE(TimeOfDay::parse("noon").has_value());
    EXPECT_FALSE(TimeOfDay::parse("").has_value());
}

TEST(IntervalParseTest, AcceptsNumbersAndNumericStrings) {
    EXPECT_EQ(parseIntervalMinutes(json(30)), 30);
    EXPECT_EQ(parseIntervalMinutes(json(12.9)), 12);
    EXPECT_EQ(parseIntervalMinutes(json("45")), 45);
    EXPECT_EQ(parseIntervalMinutes(json(-5)), 0);
    EXPECT_FALSE(parseIntervalMinutes(json("often")).has_value());
    EXPECT_FALSE(parseIntervalMinutes(json::array()).has_value());
}

// ============================================================================
// Window math
// ============================================================================

TEST(WindowTest, SameDayWindowBeforeInsideAfter) {
    TimeOfDay start{8, 0}, end{17, 0};

    auto before = calculateWindow(at(7, 0), start, end);
    EXPECT_EQ(before.start, at(8, 0));
    EXPECT_FALSE(before.inside);

    auto inside = calculateWindow(at(17, 0), start, end);
    EXPECT_EQ(inside.end, at(17, 0));
    EXPECT_TRUE(inside.inside);

    auto after = calculateWindow(at(18, 0), start, end);
    EXPECT_EQ(after.start, at(8, 0, 2));
    EXPECT_EQ(after.end, at(17, 0, 2));
}

TEST(WindowTest, OvernightWindowExtendsToNextDay) {
    TimeOfDay start{22, 0}, end{2, 0};

    auto evening = calculateWindow(at(23, 0), start, end);
    EXPECT_EQ(evening.start, at(22, 0));
    EXPECT_EQ(evening.end, at(2, 0, 2));
    EXPECT_TRUE(evening.inside);

    auto earlyMorning = calculateWindow(at(1, 0, 2), start, end);
    EXPECT_EQ(earlyMorning.start, at(22, 0));
    EXPECT_EQ(earlyMorning.end, at(2, 0, 2));
    EXPECT_TRUE(earlyMorning.inside);

    auto midday = calculateWindow(at(12, 0), start, end);
    EXPECT_EQ(midday.start, at(22, 0));
    EXPECT_FALSE(midday.inside);
}

TEST(WindowTest, EqualStartAndEndIsFullDay) {
    auto window = calculateWindow(at(9, 0), TimeOfDay{6, 0}, TimeOfDay{6, 0});
    EXPECT_EQ(window.end - window.start, hours{24});
    EXPECT_TRUE(window.inside);
}

TEST(WindowTest, AlignSnapsForwardToGrid) {
    EXPECT_EQ(alignToInterval(at(8, 0), at(8, 0), minutes{30}), at(8, 0));
    EXPECT_EQ(alignToInterval(at(8, 0), at(8, 1), minutes{30}), at(8, 30));
    EXPECT_EQ(alignToInterval(at(8, 0), at(8, 30), minutes{30}), at(8, 30));
    EXPECT_EQ(alignToInterval(at(8, 0), at(7, 0), minutes{30}), at(8, 0));
}

// ============================================================================
// plan()
// ============================================================================

TEST(PlanTest, PartialSettingsFallBackToDefaults) {
    ScheduleSettings s;
    s.captureInterval = 15;
    auto doc = plan(s, at(0, 30));

    EXPECT_TRUE(doc.enabled);
    EXPECT_EQ(doc.startTime, (TimeOfDay{0, 0}));
    EXPECT_EQ(doc.endTime, (TimeOfDay{23, 59}));
    EXPECT_EQ(doc.captureIntervalMinutes, 15);
}

TEST(PlanTest, InvalidValuesFallBackToPrevious) {
    auto previous = plan(settings("06:00", "18:00", 20), at(5, 0));
    auto doc = plan(settings("25:99", "soon", "x"), previous, at(5, 0));

    EXPECT_EQ(doc.startTime, (TimeOfDay{6, 0}));
    EXPECT_EQ(doc.endTime, (TimeOfDay{18, 0}));
    EXPECT_EQ(doc.captureIntervalMinutes, 20);
}

TEST(PlanTest, ZeroIntervalDisables) {
    auto doc = plan(settings("08:00", "09:00", 0), at(8, 10));
    EXPECT_FALSE(doc.enabled);
    EXPECT_FALSE(doc.nextCapture.has_value());
    EXPECT_FALSE(due(doc, at(8, 30)).captureDue);
}

TEST(PlanTest, NegativeIntervalDisables) {
    auto doc = plan(settings("08:00", "09:00", -10), at(8, 10));
    EXPECT_FALSE(doc.enabled);
}

TEST(PlanTest, ExplicitDisableWins) {
    auto s = settings("08:00", "09:00", 10);
    s.enabled = false;
    EXPECT_FALSE(plan(s, at(8, 0)).enabled);
}

TEST(PlanTest, IsIdempotent) {
    auto s = settings("07:10", "19:40", "25");
    auto first = plan(s, at(12, 3));
    auto second = plan(s, at(12, 3));
    EXPECT_EQ(first, second);

    auto replanned = plan(s, first, at(12, 3));
    EXPECT_EQ(first, replanned);
}

TEST(PlanTest, KeepsLastCapture) {
    auto doc = plan(settings("08:00", "12:00", 30), at(8, 0));
    doc = recordCapture(doc, at(8, 0));
    auto replanned = plan(settings("08:00", "12:00", 60), doc, at(8, 10));
    EXPECT_EQ(replanned.lastCapture, at(8, 0));
    EXPECT_EQ(replanned.nextCapture, at(9, 0));
}

// ============================================================================
// Scenario
// ============================================================================

TEST(SchedulerScenarioTest, HalfHourSlotsInOneHourWindow) {
    auto schedule = plan(settings("08:00", "09:00", 30), at(7, 45));
    EXPECT_EQ(schedule.nextCapture, at(8, 0));
    EXPECT_FALSE(due(schedule, at(7, 45)).captureDue);

    auto tick = due(schedule, at(8, 0));
    ASSERT_TRUE(tick.captureDue);
    schedule = recordCapture(tick.schedule, *tick.schedule.nextCapture);
    EXPECT_EQ(schedule.nextCapture, at(8, 30));

    tick = due(schedule, at(8, 20));
    EXPECT_FALSE(tick.captureDue);
    EXPECT_EQ(tick.schedule.nextCapture, at(8, 30));

    tick = due(schedule, at(8, 30));
    ASSERT_TRUE(tick.captureDue);
    schedule = recordCapture(tick.schedule, *tick.schedule.nextCapture);
    EXPECT_EQ(schedule.nextCapture, at(9, 0));

    tick = due(schedule, at(9, 0));
    ASSERT_TRUE(tick.captureDue);
    schedule = recordCapture(tick.schedule, *tick.schedule.nextCapture);
    EXPECT_EQ(schedule.lastCapture, at(9, 0));
    EXPECT_EQ(schedule.nextCapture, at(8, 0, 2));
    EXPECT_EQ(schedule.windowStart, at(8, 0, 2));
    EXPECT_EQ(schedule.windowEnd, at(9, 0, 2));
}

TEST(SchedulerScenarioTest, SecondsAreIgnored) {
    auto schedule = plan(settings("08:00", "09:00", 30), at(7, 45));
    EXPECT_TRUE(due(schedule, at(8, 0) + seconds{59}).captureDue);
}

TEST(SchedulerScenarioTest, MissedSlotsAreSkippedNotReplayed) {
    auto schedule = plan(settings("08:00", "12:00", 30), at(7, 0));
    // The unit was off until 10:10.
    auto tick = due(schedule, at(10, 10));
    EXPECT_FALSE(tick.captureDue);
    EXPECT_EQ(tick.schedule.nextCapture, at(10, 30));
}

TEST(SchedulerScenarioTest, AfterWindowRollsToTomorrow) {
    auto schedule = plan(settings("08:00", "09:00", 30), at(7, 0));
    auto tick = due(schedule, at(10, 0));
    EXPECT_FALSE(tick.captureDue);
    EXPECT_EQ(tick.schedule.windowStart, at(8, 0, 2));
    EXPECT_EQ(tick.schedule.nextCapture, at(8, 0, 2));
}

TEST(SchedulerScenarioTest, OvernightWindowCapturesAcrossMidnight) {
    auto schedule = plan(settings("23:00", "01:00", 60), at(22, 0));
    EXPECT_EQ(schedule.nextCapture, at(23, 0));

    std::vector<LocalTime> captures;
    for (auto now = at(22, 0); now <= at(2, 0, 2); now += minutes{1}) {
        auto tick = due(schedule, now);
        schedule = tick.schedule;
        if (tick.captureDue) {
            captures.push_back(*schedule.nextCapture);
            schedule = recordCapture(schedule, *schedule.nextCapture);
        }
    }
    EXPECT_EQ(captures, (std::vector<LocalTime>{at(23, 0), at(0, 0, 2), at(1, 0, 2)}));
    EXPECT_EQ(schedule.windowStart, at(23, 0, 2));
}

// ============================================================================
// Properties
// ============================================================================

class SchedulerPropertyTest
    : public ::testing::TestWithParam<std::tuple<const char*, const char*, int>> {};

TEST_P(SchedulerPropertyTest, NothingDueBeforeWindowThenDueAtStart) {
    auto [start, end, interval] = GetParam();
    auto s = settings(start, end, interval);
    auto opening = *TimeOfDay::parse(start);

    // Walk the hours leading up to the window opening on day 2.
    const LocalTime windowOpen = at(opening.hour, opening.minute, 2);
    for (auto now = windowOpen - hours{3}; now < windowOpen; now += minutes{7}) {
        auto doc = plan(s, now);
        if (doc.windowStart && *doc.windowStart != windowOpen) {
            continue;  // still inside the previous overnight window
        }
        EXPECT_FALSE(due(doc, now).captureDue) << bmtl::system::formatTimestamp(now);
    }

    auto doc = plan(s, windowOpen);
    EXPECT_TRUE(due(doc, windowOpen).captureDue);
}

TEST_P(SchedulerPropertyTest, NextCaptureIsLaterAndOnGrid) {
    auto [start, end, interval] = GetParam();
    auto schedule = plan(settings(start, end, interval), at(0, 0));

    for (auto now = at(0, 0); now < at(0, 0, 3); now += minutes{1}) {
        auto tick = due(schedule, now);
        schedule = tick.schedule;
        if (!tick.captureDue) {
            continue;
        }
        const LocalTime planned = *schedule.nextCapture;
        auto next = recordCapture(schedule, planned);
        ASSERT_TRUE(next.nextCapture.has_value());
        EXPECT_GT(*next.nextCapture, planned);
        auto offset = *next.nextCapture - *next.windowStart;
        EXPECT_EQ(offset % minutes{interval}, minutes{0});
        EXPECT_LE(*next.nextCapture, *next.windowEnd);
        schedule = next;
    }
}

TEST_P(SchedulerPropertyTest, RolloverKeepsDurationAndShiftsOneDay) {
    auto [start, end, interval] = GetParam();
    auto schedule = plan(settings(start, end, interval), at(0, 0));

    for (auto now = at(0, 0); now < at(0, 0, 4); now += minutes{1}) {
        auto tick = due(schedule, now);
        auto before = tick.schedule;
        if (!tick.captureDue) {
            schedule = before;
            continue;
        }
        auto after = recordCapture(before, *before.nextCapture);
        if (after.windowStart != before.windowStart) {
            EXPECT_EQ(*after.windowStart - *before.windowStart, hours{24});
            EXPECT_EQ(*after.windowEnd - *after.windowStart,
                      *before.windowEnd - *before.windowStart);
        }
        schedule = after;
    }
}

INSTANTIATE_TEST_SUITE_P(
    Windows, SchedulerPropertyTest,
    ::testing::Values(std::make_tuple("08:00", "09:00", 30),
                      std::make_tuple("06:15", "18:40", 45),
                      std::make_tuple("20:00", "04:00", 60),
                      std::make_tuple("10:00", "10:00", 90),
                      std::make_tuple("00:00", "23:59", 7)));

// ============================================================================
// Window counters
// ============================================================================

TEST(WindowCountersTest, CountsPlannedDueAndMissed) {
    auto schedule = plan(settings("08:00", "09:00", 30), at(7, 0));

    auto beforeWindow = windowCounters(schedule, at(7, 30), 0);
    EXPECT_EQ(beforeWindow.plannedTotal, 3);
    EXPECT_EQ(beforeWindow.plannedDue, 0);
    EXPECT_EQ(beforeWindow.missed, 0);

    auto midWindow = windowCounters(schedule, at(8, 40), 1);
    EXPECT_EQ(midWindow.plannedDue, 2);
    EXPECT_EQ(midWindow.captured, 1);
    EXPECT_EQ(midWindow.missed, 1);

    auto afterWindow = windowCounters(schedule, at(11, 0), 5);
    EXPECT_EQ(afterWindow.plannedDue, 3);
    EXPECT_EQ(afterWindow.missed, 0);
}

TEST(WindowCountersTest, DisabledScheduleHasNoSlots) {
    ScheduleDocument disabled;
    auto counters = windowCounters(disabled, at(12, 0), 2);
    EXPECT_EQ(counters.plannedTotal, 0);
    EXPECT_EQ(counters.captured, 2);
    EXPECT_EQ(counters.missed, 0);
}
