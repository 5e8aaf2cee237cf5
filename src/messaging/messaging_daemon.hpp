/*
 * messaging_daemon.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Messaging-side loop of the agent: topics in, tasks out,
responses back to the broker

**************************************************/

#ifndef BMTL_MESSAGING_MESSAGING_DAEMON_HPP
#define BMTL_MESSAGING_MESSAGING_DAEMON_HPP

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

#include "config/agent_config.hpp"
#include "ipc/task_queue.hpp"
#include "reconnect_backoff.hpp"
#include "transport.hpp"

namespace bmtl::messaging {

struct DaemonOptions {
    std::string deviceId{"01"};
    std::chrono::seconds healthInterval{60};
    std::chrono::milliseconds reconnectInitial{1000};
    std::chrono::milliseconds reconnectMax{60000};
    double reconnectMultiplier{2.0};

    [[nodiscard]] static DaemonOptions fromConfig(const config::AgentConfig& config);
};

/**
 * @brief Owns the broker session of the messaging process
 *
 * Every step() reconnects when the backoff allows, delivers inbound
 * messages as tasks, publishes queued worker responses and schedules the
 * periodic health tick. Responses produced while disconnected are held
 * and published after the next connect.
 */
class MessagingDaemon {
public:
    using Clock = ReconnectBackoff::Clock;

    MessagingDaemon(DaemonOptions options, MessagingTransport& transport,
                    ipc::TaskQueue& tasks, ipc::ResponseQueue& responses,
                    std::shared_ptr<spdlog::logger> messageLog = nullptr);

    /**
     * @brief One iteration of the loop
     *
     * @param pollTimeout How long to wait for inbound messages
     * @return false once the worker has stopped
     */
    bool step(Clock::time_point now,
              std::chrono::milliseconds pollTimeout = std::chrono::milliseconds{0});

    /**
     * @brief Loop until @p stop is set or the worker stops
     *
     * On exit the offline status is published, the session closed and the
     * task queue sentinel pushed.
     */
    int run(const std::atomic<bool>& stop);

    /**
     * @brief Map an inbound message to a task and queue it
     */
    void handleMessage(const InboundMessage& message);

    /**
     * @brief Publish the offline status and close the session
     */
    void shutdown();

    [[nodiscard]] static std::string offlinePayload();

    [[nodiscard]] size_t pendingResponses() const noexcept { return pending_.size(); }

private:
    void ensureConnected(Clock::time_point now);
    void onConnected(Clock::time_point now);
    bool drainResponses();
    void flushPending();
    void pushTask(std::string command, std::optional<std::string> payload);

    DaemonOptions options_;
    MessagingTransport& transport_;
    ipc::TaskQueue& tasks_;
    ipc::ResponseQueue& responses_;
    std::shared_ptr<spdlog::logger> messageLog_;

    ReconnectBackoff backoff_;
    bool wasConnected_{false};
    std::optional<Clock::time_point> nextHealth_;
    std::deque<OutboundMessage> pending_;
    bool workerStopped_{false};
};

}  // namespace bmtl::messaging

#endif  // BMTL_MESSAGING_MESSAGING_DAEMON_HPP
