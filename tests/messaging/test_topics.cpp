/*
 * test_topics.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "messaging/reconnect_backoff.hpp"
#include "messaging/topics.hpp"

using namespace bmtl::messaging;
using namespace std::chrono_literals;

// ============================================================================
// Topic table
// ============================================================================

TEST(TopicsTest, ExpandsDevicePlaceholder) {
    EXPECT_EQ(expandTopic("bmtl/request/settings/{id}", "07"),
              "bmtl/request/settings/07");
    EXPECT_EQ(expandTopic("bmtl/request/status/all", "07"), "bmtl/request/status/all");
}

TEST(TopicsTest, SubscribesToEveryRequestTopicOnce) {
    auto topics = subscriptionTopics("03");
    EXPECT_EQ(topics.size(), TOPIC_ROUTES.size());
    std::set<std::string> unique(topics.begin(), topics.end());
    EXPECT_EQ(unique.size(), topics.size());
    EXPECT_TRUE(unique.contains("bmtl/request/settings/all"));
    EXPECT_TRUE(unique.contains("bmtl/set/settings/03"));
    EXPECT_TRUE(unique.contains("bmtl/request/capture/03"));
    EXPECT_TRUE(std::none_of(topics.begin(), topics.end(), [](const std::string& t) {
        return t.find("{id}") != std::string::npos;
    }));
}

TEST(TopicsTest, MapsTopicsToCommands) {
    EXPECT_EQ(commandForTopic("bmtl/request/settings/all", "03"),
              commands::SETTINGS_REQUEST_ALL);
    EXPECT_EQ(commandForTopic("bmtl/request/settings/03", "03"),
              commands::SETTINGS_REQUEST_INDIVIDUAL);
    EXPECT_EQ(commandForTopic("bmtl/sw-update/03", "03"), commands::SW_UPDATE);
    EXPECT_EQ(commandForTopic("bmtl/request/camera-on-off/03", "03"),
              commands::CAMERA_POWER_REQUEST);
}

TEST(TopicsTest, IgnoresOtherDevicesAndUnknownTopics) {
    EXPECT_FALSE(commandForTopic("bmtl/request/settings/04", "03").has_value());
    EXPECT_FALSE(commandForTopic("bmtl/request/unknown/03", "03").has_value());
    EXPECT_FALSE(commandForTopic("", "03").has_value());
}

TEST(TopicsTest, ResponseTopics) {
    EXPECT_EQ(responseTopic(commands::STATUS_REQUEST, "03"), "bmtl/response/status");
    EXPECT_EQ(responseTopic(commands::SET_SITENAME, "03"),
              "bmtl/response/set/sitename/03");
    EXPECT_EQ(responseTopic(commands::HEALTH_CHECK, "03"), "bmtl/status/health/03");
    EXPECT_TRUE(responseTopic("nonsense", "03").empty());
}

TEST(TopicsTest, HealthTopic) {
    EXPECT_EQ(healthTopic("12"), "bmtl/status/health/12");
}

// ============================================================================
// ReconnectBackoff
// ============================================================================

TEST(ReconnectBackoffTest, FirstAttemptIsImmediate) {
    ReconnectBackoff backoff(1000ms, 60000ms);
    EXPECT_TRUE(backoff.shouldAttempt(ReconnectBackoff::Clock::now()));
    EXPECT_EQ(backoff.failures(), 0);
}

TEST(ReconnectBackoffTest, DelayDoublesUpToCap) {
    ReconnectBackoff backoff(1000ms, 5000ms);
    auto t0 = ReconnectBackoff::Clock::time_point{} + 1h;

    backoff.recordFailure(t0);
    EXPECT_EQ(backoff.currentDelay(), 1000ms);
    EXPECT_FALSE(backoff.shouldAttempt(t0 + 999ms));
    EXPECT_TRUE(backoff.shouldAttempt(t0 + 1000ms));

    backoff.recordFailure(t0 + 1s);
    EXPECT_EQ(backoff.currentDelay(), 2000ms);
    backoff.recordFailure(t0 + 3s);
    EXPECT_EQ(backoff.currentDelay(), 4000ms);
    backoff.recordFailure(t0 + 7s);
    EXPECT_EQ(backoff.currentDelay(), 5000ms);
    backoff.recordFailure(t0 + 12s);
    EXPECT_EQ(backoff.currentDelay(), 5000ms);
    EXPECT_EQ(backoff.failures(), 5);
}

TEST(ReconnectBackoffTest, SuccessResetsDelay) {
    ReconnectBackoff backoff(500ms, 8000ms);
    auto t0 = ReconnectBackoff::Clock::time_point{} + 1h;
    backoff.recordFailure(t0);
    backoff.recordFailure(t0 + 1s);
    ASSERT_EQ(backoff.currentDelay(), 1000ms);

    backoff.recordSuccess();
    EXPECT_EQ(backoff.currentDelay(), 500ms);
    EXPECT_EQ(backoff.failures(), 0);
    EXPECT_TRUE(backoff.shouldAttempt(t0 + 1s));
}
