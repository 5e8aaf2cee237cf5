/*
 * task_queue.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file task_queue.hpp
 * @brief Typed FIFO queues over a pipe channel
 * @date 2024
 * @version 1.0.0
 */

#ifndef BMTL_IPC_TASK_QUEUE_HPP
#define BMTL_IPC_TASK_QUEUE_HPP

#include <chrono>
#include <optional>

#include <spdlog/spdlog.h>

#include "channel.hpp"
#include "message.hpp"
#include "task.hpp"

namespace bmtl::ipc {

/**
 * @brief One-way queue of records of type T
 *
 * T provides MESSAGE_TYPE, toJson() and a static fromJson() returning
 * std::optional<T>. The queue is created before fork(); each process then
 * calls either setupProducer() or setupConsumer().
 */
template <typename T>
class FramedQueue {
public:
    FramedQueue() = default;

    [[nodiscard]] IPCResult<void> create() { return channel_.create(); }

    void setupProducer() { channel_.closeRead(); }
    void setupConsumer() { channel_.closeWrite(); }

    [[nodiscard]] IPCResult<void> push(const T& item) {
        auto msg = Message::create(T::MESSAGE_TYPE, item.toJson(),
                                   channel_.nextSequenceId());
        if (!msg) {
            return std::unexpected(msg.error());
        }
        return channel_.send(*msg);
    }

    /**
     * @brief Push the shutdown sentinel
     */
    [[nodiscard]] IPCResult<void> pushSentinel() {
        return channel_.send(
            Message::control(MessageType::Shutdown, channel_.nextSequenceId()));
    }

    /**
     * @brief Pop the next record
     *
     * Heartbeats and malformed frames are skipped.
     *
     * @return The record, std::nullopt for the sentinel, Timeout when
     *         nothing arrived in time, ChannelClosed when the producer is gone
     */
    [[nodiscard]] IPCResult<std::optional<T>> pop(
        std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() < 0) {
                remaining = std::chrono::milliseconds{0};
            }

            auto msg = channel_.receive(remaining);
            if (!msg) {
                return std::unexpected(msg.error());
            }

            if (msg->header.type == MessageType::Shutdown) {
                return std::optional<T>{};
            }
            if (msg->header.type != T::MESSAGE_TYPE) {
                if (msg->header.type != MessageType::Heartbeat) {
                    spdlog::warn("Unexpected {} frame on {} queue",
                                 messageTypeName(msg->header.type),
                                 messageTypeName(T::MESSAGE_TYPE));
                }
                continue;
            }

            auto payload = msg->getPayloadAsJson();
            if (!payload) {
                spdlog::warn("Dropping undecodable {} frame: {}",
                             messageTypeName(T::MESSAGE_TYPE),
                             ipcErrorToString(payload.error()));
                continue;
            }
            auto item = T::fromJson(*payload);
            if (!item) {
                continue;
            }
            return std::optional<T>{std::move(*item)};
        }
    }

    [[nodiscard]] PipeChannel& channel() noexcept { return channel_; }

private:
    PipeChannel channel_;
};

using TaskQueue = FramedQueue<Task>;
using ResponseQueue = FramedQueue<Response>;

}  // namespace bmtl::ipc

#endif  // BMTL_IPC_TASK_QUEUE_HPP
