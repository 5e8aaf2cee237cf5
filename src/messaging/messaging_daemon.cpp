/*
 * messaging_daemon.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "messaging_daemon.hpp"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include "system/local_time.hpp"
#include "topics.hpp"

namespace bmtl::messaging {

using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {
// Responses kept while the broker is unreachable; the oldest are dropped.
constexpr size_t MAX_PENDING_RESPONSES = 512;
}  // namespace

DaemonOptions DaemonOptions::fromConfig(const config::AgentConfig& config) {
    DaemonOptions options;
    options.deviceId = config.device.id;
    options.healthInterval = std::chrono::seconds{
        config.health.intervalSeconds > 0 ? config.health.intervalSeconds : 60};
    options.reconnectInitial = std::chrono::milliseconds{config.reconnect.initialDelayMs};
    options.reconnectMax = std::chrono::milliseconds{config.reconnect.maxDelayMs};
    options.reconnectMultiplier = config.reconnect.multiplier;
    return options;
}

MessagingDaemon::MessagingDaemon(DaemonOptions options, MessagingTransport& transport,
                                 ipc::TaskQueue& tasks, ipc::ResponseQueue& responses,
                                 std::shared_ptr<spdlog::logger> messageLog)
    : options_(std::move(options)),
      transport_(transport),
      tasks_(tasks),
      responses_(responses),
      messageLog_(std::move(messageLog)),
      backoff_(options_.reconnectInitial, options_.reconnectMax,
               options_.reconnectMultiplier) {
    transport_.setWill({healthTopic(options_.deviceId), offlinePayload(),
                        RESPONSE_DELIVERY_LEVEL, true});
    transport_.setMessageHandler(
        [this](const InboundMessage& message) { handleMessage(message); });
}

std::string MessagingDaemon::offlinePayload() {
    return json{{"status", "offline"}}.dump();
}

void MessagingDaemon::handleMessage(const InboundMessage& message) {
    if (messageLog_) {
        messageLog_->info(json{{"topic", message.topic},
                               {"payload", message.payload},
                               {"timestamp", system::nowTimestamp()}}
                              .dump());
    }

    auto command = commandForTopic(message.topic, options_.deviceId);
    if (!command) {
        spdlog::debug("No command for topic {}", message.topic);
        return;
    }
    spdlog::info("Received {} on {}", *command, message.topic);
    pushTask(std::string(*command),
             message.payload.empty() ? std::nullopt
                                     : std::optional<std::string>(message.payload));
}

void MessagingDaemon::pushTask(std::string command,
                               std::optional<std::string> payload) {
    ipc::Task task{std::move(command), std::move(payload), options_.deviceId};
    if (auto pushed = tasks_.push(task); !pushed) {
        spdlog::error("Cannot queue {} for the worker: {}", task.command,
                      ipc::ipcErrorToString(pushed.error()));
    }
}

void MessagingDaemon::ensureConnected(Clock::time_point now) {
    bool connected = transport_.isConnected();
    if (wasConnected_ && !connected) {
        spdlog::warn("Broker session lost");
        backoff_.recordFailure(now);
        wasConnected_ = false;
    }
    if (connected || !backoff_.shouldAttempt(now)) {
        return;
    }

    if (transport_.connect()) {
        spdlog::info("Connected to broker");
        backoff_.recordSuccess();
        onConnected(now);
        return;
    }
    backoff_.recordFailure(now);
    spdlog::warn("Broker connect failed (attempt {}), retrying in {} ms",
                 backoff_.failures(), backoff_.currentDelay().count());
}

void MessagingDaemon::onConnected(Clock::time_point now) {
    wasConnected_ = true;
    for (const auto& topic : subscriptionTopics(options_.deviceId)) {
        if (!transport_.subscribe(topic, SUBSCRIBE_DELIVERY_LEVEL)) {
            spdlog::error("Subscribe to {} failed", topic);
        }
    }
    // Report health right after every (re)connect.
    nextHealth_ = now;
    flushPending();
}

bool MessagingDaemon::drainResponses() {
    while (true) {
        auto popped = responses_.pop(0ms);
        if (!popped) {
            if (popped.error() == ipc::IPCError::Timeout) {
                return true;
            }
            spdlog::warn("Response queue closed: {}",
                         ipc::ipcErrorToString(popped.error()));
            return false;
        }
        if (!*popped) {
            spdlog::info("Worker signalled shutdown");
            return false;
        }

        const auto& response = **popped;
        pending_.push_back({response.topic, response.payload, response.deliveryLevel,
                            response.retain});
        if (pending_.size() > MAX_PENDING_RESPONSES) {
            spdlog::warn("Dropping unpublished response on {}", pending_.front().topic);
            pending_.pop_front();
        }
    }
}

void MessagingDaemon::flushPending() {
    while (!pending_.empty() && transport_.isConnected()) {
        if (!transport_.publish(pending_.front())) {
            spdlog::warn("Publish to {} failed, keeping it queued", pending_.front().topic);
            return;
        }
        spdlog::debug("Published {}", pending_.front().topic);
        pending_.pop_front();
    }
}

bool MessagingDaemon::step(Clock::time_point now, std::chrono::milliseconds pollTimeout) {
    if (workerStopped_) {
        return false;
    }

    ensureConnected(now);

    transport_.poll(static_cast<int>(pollTimeout.count()));

    if (!drainResponses()) {
        workerStopped_ = true;
    }
    flushPending();

    if (transport_.isConnected() && nextHealth_ && now >= *nextHealth_) {
        pushTask(std::string(commands::HEALTH_CHECK), std::nullopt);
        nextHealth_ = now + options_.healthInterval;
    }
    return !workerStopped_;
}

void MessagingDaemon::shutdown() {
    if (transport_.isConnected()) {
        transport_.publish({healthTopic(options_.deviceId), offlinePayload(),
                            RESPONSE_DELIVERY_LEVEL, true});
        transport_.disconnect();
    }
    wasConnected_ = false;
}

int MessagingDaemon::run(const std::atomic<bool>& stop) {
    spdlog::info("Messaging loop started for device {}", options_.deviceId);
    while (!stop.load()) {
        try {
            if (!step(Clock::now(), 500ms)) {
                break;
            }
        } catch (const std::exception& e) {
            spdlog::error("Messaging loop iteration failed: {}", e.what());
        }
    }

    if (auto sent = tasks_.pushSentinel(); !sent) {
        spdlog::debug("Worker queue already closed: {}", ipc::ipcErrorToString(sent.error()));
    }
    // Publish whatever the worker handed over before going offline.
    if (!workerStopped_ && !drainResponses()) {
        workerStopped_ = true;
    }
    flushPending();
    shutdown();
    spdlog::info("Messaging loop stopped");
    return 0;
}

}  // namespace bmtl::messaging
