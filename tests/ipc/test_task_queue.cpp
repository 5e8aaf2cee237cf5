/*
 * test_task_queue.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file test_task_queue.cpp
 * @brief Tests for the task and response queues, in-process and across fork()
 */

#include <gtest/gtest.h>
#include "ipc/channel.hpp"
#include "ipc/message.hpp"
#include "ipc/task_queue.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <string>

using namespace bmtl::ipc;
using namespace std::chrono_literals;

// =============================================================================
// Task / Response records
// =============================================================================

TEST(TaskRecordTest, JsonRoundTripKeepsRawPayloadBytes) {
    Task task{"settings_change", std::string("{\"iso\":\"400\"}\xff\x01", 16), "03"};
    auto decoded = Task::fromJson(task.toJson());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, task);
}

TEST(TaskRecordTest, TimerTaskHasNoPayload) {
    Task task{"health_check", std::nullopt, "03"};
    auto decoded = Task::fromJson(task.toJson());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->payload.has_value());
}

TEST(TaskRecordTest, RejectsRecordsWithoutCommand) {
    EXPECT_FALSE(Task::fromJson(json{{"device_id", "01"}}).has_value());
    EXPECT_FALSE(Response::fromJson(json::array()).has_value());
}

TEST(ResponseRecordTest, CarriesDeliveryOptions) {
    Response response{"bmtl/status/health/01", "{}", 1, true};
    auto decoded = Response::fromJson(response.toJson());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, response);
}

// =============================================================================
// Queue in one process
// =============================================================================

class TaskQueueTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(queue_.create().has_value()); }

    TaskQueue queue_;
};

TEST_F(TaskQueueTest, PopTimesOutWhenEmpty) {
    auto result = queue_.pop(20ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), IPCError::Timeout);
}

TEST_F(TaskQueueTest, PreservesOrder) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(queue_.push(Task{"cmd" + std::to_string(i), std::nullopt, "01"}));
    }
    for (int i = 0; i < 5; ++i) {
        auto result = queue_.pop(100ms);
        ASSERT_TRUE(result.has_value());
        ASSERT_TRUE(result->has_value());
        EXPECT_EQ((*result)->command, "cmd" + std::to_string(i));
    }
}

TEST_F(TaskQueueTest, SentinelPopsAsNullopt) {
    ASSERT_TRUE(queue_.pushSentinel());
    auto result = queue_.pop(100ms);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->has_value());
}

TEST_F(TaskQueueTest, HeartbeatsAreSkipped) {
    ASSERT_TRUE(queue_.channel().send(Message::control(MessageType::Heartbeat)));
    ASSERT_TRUE(queue_.push(Task{"status_request", std::nullopt, "01"}));

    auto result = queue_.pop(100ms);
    ASSERT_TRUE(result.has_value() && result->has_value());
    EXPECT_EQ((*result)->command, "status_request");
}

TEST_F(TaskQueueTest, ForeignRecordTypeIsSkipped) {
    auto stray = Message::create(MessageType::Response, Response{"t", "p"}.toJson());
    ASSERT_TRUE(stray.has_value());
    ASSERT_TRUE(queue_.channel().send(*stray));
    ASSERT_TRUE(queue_.push(Task{"wiper_request", std::nullopt, "01"}));

    auto result = queue_.pop(100ms);
    ASSERT_TRUE(result.has_value() && result->has_value());
    EXPECT_EQ((*result)->command, "wiper_request");
}

TEST_F(TaskQueueTest, ClosedProducerReportsChannelClosed) {
    queue_.setupConsumer();
    auto result = queue_.pop(100ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), IPCError::ChannelClosed);
}

TEST_F(TaskQueueTest, PushAfterConsumerGoneFails) {
    // The agent ignores SIGPIPE at startup; do the same here.
    std::signal(SIGPIPE, SIG_IGN);
    queue_.setupProducer();
    auto pushed = queue_.push(Task{"x", std::nullopt, "01"});
    ASSERT_FALSE(pushed.has_value());
    EXPECT_EQ(pushed.error(), IPCError::ChannelClosed);
}

// =============================================================================
// Across fork()
// =============================================================================

TEST(ForkedQueueTest, ChildConsumesTasksAndAnswers) {
    TaskQueue tasks;
    ResponseQueue responses;
    ASSERT_TRUE(tasks.create().has_value());
    ASSERT_TRUE(responses.create().has_value());

    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        tasks.setupConsumer();
        responses.setupProducer();
        int handled = 0;
        while (true) {
            auto next = tasks.pop(5000ms);
            if (!next || !next->has_value()) {
                break;
            }
            Response reply{"bmtl/response/" + (*next)->command, *(*next)->payload};
            if (!responses.push(reply)) {
                _exit(2);
            }
            ++handled;
        }
        (void)responses.pushSentinel();
        _exit(handled == 50 ? 0 : 1);
    }

    tasks.setupProducer();
    responses.setupConsumer();
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(tasks.push(Task{"echo", std::to_string(i), "01"}));
    }
    ASSERT_TRUE(tasks.pushSentinel());

    int received = 0;
    while (true) {
        auto next = responses.pop(5000ms);
        ASSERT_TRUE(next.has_value()) << ipcErrorToString(next.error());
        if (!next->has_value()) {
            break;
        }
        EXPECT_EQ((*next)->topic, "bmtl/response/echo");
        EXPECT_EQ((*next)->payload, std::to_string(received));
        ++received;
    }
    EXPECT_EQ(received, 50);

    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(ForkedQueueTest, ConsumerSeesClosedChannelWhenProducerExits) {
    TaskQueue tasks;
    ASSERT_TRUE(tasks.create().has_value());

    pid_t child = fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        tasks.setupProducer();
        (void)tasks.push(Task{"status_request", std::nullopt, "01"});
        _exit(0);
    }

    tasks.setupConsumer();
    auto first = tasks.pop(5000ms);
    ASSERT_TRUE(first.has_value() && first->has_value());
    auto second = tasks.pop(5000ms);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), IPCError::ChannelClosed);

    int status = 0;
    waitpid(child, &status, 0);
}
