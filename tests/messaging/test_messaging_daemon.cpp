/*
 * test_messaging_daemon.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_messaging_daemon.cpp
 * @brief Messaging loop against the loopback transport, and the broker client
 *        without a broker
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ipc/task_queue.hpp"
#include "messaging/loopback_transport.hpp"
#include "messaging/messaging_daemon.hpp"
#include "messaging/mosquitto_transport.hpp"
#include "messaging/topics.hpp"

using namespace bmtl::messaging;
using namespace std::chrono_literals;
using json = nlohmann::json;
using bmtl::ipc::Response;
using bmtl::ipc::Task;

namespace {

std::vector<OutboundMessage> onTopic(const std::vector<OutboundMessage>& all,
                                     const std::string& topic) {
    std::vector<OutboundMessage> out;
    std::copy_if(all.begin(), all.end(), std::back_inserter(out),
                 [&topic](const OutboundMessage& m) { return m.topic == topic; });
    return out;
}

}  // namespace

// ============================================================================
// Fixture
// ============================================================================

class MessagingDaemonTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tasks_.create().has_value());
        ASSERT_TRUE(responses_.create().has_value());
        options_.deviceId = "05";
        options_.healthInterval = 60s;
        options_.reconnectInitial = 1000ms;
        options_.reconnectMax = 8000ms;
        daemon_ = std::make_unique<MessagingDaemon>(options_, transport_, tasks_,
                                                    responses_);
    }

    std::optional<Task> nextTask() {
        auto popped = tasks_.pop(100ms);
        if (!popped || !*popped) {
            return std::nullopt;
        }
        return **popped;
    }

    /// Drain tasks until a non-health task shows up.
    std::optional<Task> nextCommandTask() {
        while (auto task = nextTask()) {
            if (task->command != commands::HEALTH_CHECK) {
                return task;
            }
        }
        return std::nullopt;
    }

    MessagingDaemon::Clock::time_point t0_{MessagingDaemon::Clock::time_point{} + 1h};
    DaemonOptions options_;
    LoopbackTransport transport_;
    bmtl::ipc::TaskQueue tasks_;
    bmtl::ipc::ResponseQueue responses_;
    std::unique_ptr<MessagingDaemon> daemon_;
};

// ============================================================================
// Session
// ============================================================================

TEST_F(MessagingDaemonTest, RegistersOfflineWillBeforeConnecting) {
    auto will = transport_.will();
    ASSERT_TRUE(will.has_value());
    EXPECT_EQ(will->topic, "bmtl/status/health/05");
    EXPECT_TRUE(will->retain);
    EXPECT_EQ(json::parse(will->payload)["status"], "offline");
    EXPECT_EQ(transport_.connectAttempts(), 0);
}

TEST_F(MessagingDaemonTest, SubscribesAfterConnect) {
    EXPECT_TRUE(daemon_->step(t0_));
    EXPECT_TRUE(transport_.isConnected());
    auto subscribed = transport_.subscriptions();
    EXPECT_EQ(subscribed.size(), TOPIC_ROUTES.size());
    EXPECT_TRUE(subscribed.contains("bmtl/request/status/all"));
    EXPECT_TRUE(subscribed.contains("bmtl/set/sitename/05"));
}

TEST_F(MessagingDaemonTest, HealthCheckQueuedRightAfterConnect) {
    daemon_->step(t0_);
    auto task = nextTask();
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->command, commands::HEALTH_CHECK);
    EXPECT_FALSE(task->payload.has_value());
    EXPECT_EQ(task->deviceId, "05");
}

TEST_F(MessagingDaemonTest, HealthCheckFollowsInterval) {
    daemon_->step(t0_);
    ASSERT_TRUE(nextTask().has_value());

    daemon_->step(t0_ + 30s);
    EXPECT_FALSE(nextTask().has_value());

    daemon_->step(t0_ + 60s);
    auto task = nextTask();
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->command, commands::HEALTH_CHECK);
}

TEST_F(MessagingDaemonTest, ConnectRetriesWithBackoff) {
    transport_.failNextConnects(2);

    daemon_->step(t0_);
    EXPECT_FALSE(transport_.isConnected());
    EXPECT_EQ(transport_.connectAttempts(), 1);

    daemon_->step(t0_ + 500ms);
    EXPECT_EQ(transport_.connectAttempts(), 1);

    daemon_->step(t0_ + 1s);
    EXPECT_EQ(transport_.connectAttempts(), 2);
    EXPECT_FALSE(transport_.isConnected());

    daemon_->step(t0_ + 2s);
    EXPECT_EQ(transport_.connectAttempts(), 2);

    daemon_->step(t0_ + 3s);
    EXPECT_EQ(transport_.connectAttempts(), 3);
    EXPECT_TRUE(transport_.isConnected());
}

TEST_F(MessagingDaemonTest, ReconnectsAndResubscribesAfterLoss) {
    daemon_->step(t0_);
    transport_.simulateConnectionLoss();

    auto published = transport_.published();
    auto offline = onTopic(published, "bmtl/status/health/05");
    ASSERT_EQ(offline.size(), 1u);
    EXPECT_EQ(json::parse(offline[0].payload)["status"], "offline");

    daemon_->step(t0_ + 100ms);
    EXPECT_FALSE(transport_.isConnected());

    daemon_->step(t0_ + 1100ms);
    EXPECT_TRUE(transport_.isConnected());
    EXPECT_EQ(transport_.subscriptions().size(), TOPIC_ROUTES.size());
}

// ============================================================================
// Inbound and outbound traffic
// ============================================================================

TEST_F(MessagingDaemonTest, InboundMessageBecomesTask) {
    daemon_->step(t0_);
    transport_.inject({"bmtl/set/settings/05", R"({"iso":"400","request_id":"r1"})"});
    daemon_->step(t0_ + 1s);

    auto task = nextCommandTask();
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->command, commands::SETTINGS_CHANGE);
    ASSERT_TRUE(task->payload.has_value());
    EXPECT_EQ(json::parse(*task->payload)["request_id"], "r1");
}

TEST_F(MessagingDaemonTest, EmptyPayloadIsAbsent) {
    daemon_->step(t0_);
    transport_.inject({"bmtl/request/status/all", ""});
    daemon_->step(t0_ + 1s);

    auto task = nextCommandTask();
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->command, commands::STATUS_REQUEST);
    EXPECT_FALSE(task->payload.has_value());
}

TEST_F(MessagingDaemonTest, ForeignDeviceTopicIsIgnored) {
    daemon_->handleMessage({"bmtl/set/settings/06", "{}"});
    daemon_->handleMessage({"bmtl/unknown", "{}"});
    EXPECT_FALSE(nextTask().has_value());
}

TEST_F(MessagingDaemonTest, PublishesWorkerResponses) {
    daemon_->step(t0_);
    ASSERT_TRUE(responses_.push(Response{"bmtl/response/status", R"({"ok":true})", 1, false}));
    daemon_->step(t0_ + 1s);

    auto status = onTopic(transport_.published(), "bmtl/response/status");
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0].payload, R"({"ok":true})");
    EXPECT_EQ(daemon_->pendingResponses(), 0u);
}

TEST_F(MessagingDaemonTest, HoldsResponsesWhileDisconnected) {
    daemon_->step(t0_);
    transport_.simulateConnectionLoss();
    transport_.failNextConnects(1);

    ASSERT_TRUE(responses_.push(Response{"bmtl/response/wiper/05", "{}", 1, false}));
    daemon_->step(t0_ + 100ms);
    EXPECT_EQ(daemon_->pendingResponses(), 1u);
    EXPECT_TRUE(onTopic(transport_.published(), "bmtl/response/wiper/05").empty());

    daemon_->step(t0_ + 1100ms);
    EXPECT_FALSE(transport_.isConnected());

    daemon_->step(t0_ + 3100ms);
    EXPECT_TRUE(transport_.isConnected());
    EXPECT_EQ(daemon_->pendingResponses(), 0u);
    EXPECT_EQ(onTopic(transport_.published(), "bmtl/response/wiper/05").size(), 1u);
}

TEST_F(MessagingDaemonTest, WorkerSentinelStopsLoop) {
    daemon_->step(t0_);
    ASSERT_TRUE(responses_.pushSentinel().has_value());
    EXPECT_FALSE(daemon_->step(t0_ + 1s));
    EXPECT_FALSE(daemon_->step(t0_ + 2s));
}

TEST_F(MessagingDaemonTest, RunPublishesOfflineAndStopsWorker) {
    std::atomic<bool> stop{true};
    daemon_->step(t0_);
    ASSERT_TRUE(responses_.push(Response{"bmtl/response/options/all", "{}", 1, false}));

    EXPECT_EQ(daemon_->run(stop), 0);

    auto published = transport_.published();
    EXPECT_EQ(onTopic(published, "bmtl/response/options/all").size(), 1u);
    ASSERT_FALSE(published.empty());
    EXPECT_EQ(published.back().topic, "bmtl/status/health/05");
    EXPECT_TRUE(published.back().retain);
    EXPECT_EQ(published.back().payload, MessagingDaemon::offlinePayload());
    EXPECT_FALSE(transport_.isConnected());

    bool sawSentinel = false;
    while (true) {
        auto popped = tasks_.pop(100ms);
        if (!popped) {
            break;
        }
        if (!*popped) {
            sawSentinel = true;
            break;
        }
    }
    EXPECT_TRUE(sawSentinel);
}

// ============================================================================
// MosquittoTransport without a broker
// ============================================================================

namespace {

MosquittoOptions unreachableBroker() {
    MosquittoOptions options;
    options.host = "127.0.0.1";
    options.port = 1;  // nothing listens here
    options.clientId = "bmtl-test-05";
    options.connackTimeout = 500ms;
    return options;
}

}  // namespace

TEST(MosquittoTransportTest, RefusedConnectionReportsFailure) {
    MosquittoTransport transport(unreachableBroker());
    transport.setWill({"bmtl/status/health/05", R"({"status":"offline"})", 1, true});

    EXPECT_FALSE(transport.connect());
    EXPECT_FALSE(transport.isConnected());
}

TEST(MosquittoTransportTest, NoTrafficWhileDisconnected) {
    MosquittoTransport transport(unreachableBroker());
    EXPECT_FALSE(transport.subscribe("bmtl/request/status/all", 2));
    EXPECT_FALSE(transport.publish({"bmtl/response/status", "{}", 1, false}));

    auto started = std::chrono::steady_clock::now();
    transport.poll(50);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
}

TEST(MosquittoTransportTest, MissingCaFileFailsBeforeConnecting) {
    auto options = unreachableBroker();
    options.useTls = true;
    options.caFile = "/nonexistent/bmtl/ca.pem";
    MosquittoTransport transport(options);

    EXPECT_FALSE(transport.connect());
    EXPECT_FALSE(transport.isConnected());
}

TEST(MosquittoTransportTest, DaemonKeepsRetryingWithoutBroker) {
    MosquittoTransport transport(unreachableBroker());
    bmtl::ipc::TaskQueue tasks;
    bmtl::ipc::ResponseQueue responses;
    ASSERT_TRUE(tasks.create().has_value());
    ASSERT_TRUE(responses.create().has_value());

    DaemonOptions options;
    options.deviceId = "05";
    MessagingDaemon daemon(options, transport, tasks, responses);

    auto t0 = std::chrono::steady_clock::now();
    daemon.step(t0);
    EXPECT_FALSE(transport.isConnected());
}
