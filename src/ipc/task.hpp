/*
 * task.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-2

Description: Task and Response records carried between the messaging
process and the worker

**************************************************/

#ifndef BMTL_IPC_TASK_HPP
#define BMTL_IPC_TASK_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "message_types.hpp"

namespace bmtl::ipc {

using json = nlohmann::json;

/**
 * @brief Command for the worker
 *
 * The payload is the raw inbound message body; it is opaque to the queue
 * and absent for timer-driven tasks.
 */
struct Task {
    static constexpr MessageType MESSAGE_TYPE = MessageType::Task;

    std::string command;
    std::optional<std::string> payload;
    std::string deviceId;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static std::optional<Task> fromJson(const json& j);

    bool operator==(const Task&) const = default;
};

/**
 * @brief Publication requested by the worker
 */
struct Response {
    static constexpr MessageType MESSAGE_TYPE = MessageType::Response;

    std::string topic;
    std::string payload;
    int deliveryLevel{1};
    bool retain{false};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static std::optional<Response> fromJson(const json& j);

    bool operator==(const Response&) const = default;
};

}  // namespace bmtl::ipc

#endif  // BMTL_IPC_TASK_HPP
