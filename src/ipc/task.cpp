/*
 * task.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "task.hpp"

#include <spdlog/spdlog.h>

namespace bmtl::ipc {

json Task::toJson() const {
    json j;
    j["command"] = command;
    j["device_id"] = deviceId;
    if (payload) {
        j["payload"] = json::binary(
            json::binary_t::container_type(payload->begin(), payload->end()));
    } else {
        j["payload"] = nullptr;
    }
    return j;
}

std::optional<Task> Task::fromJson(const json& j) {
    if (!j.is_object() || !j.contains("command") ||
        !j["command"].is_string()) {
        spdlog::warn("Task frame without command");
        return std::nullopt;
    }

    Task task;
    task.command = j["command"].get<std::string>();
    if (auto it = j.find("device_id"); it != j.end() && it->is_string()) {
        task.deviceId = it->get<std::string>();
    }
    if (auto it = j.find("payload"); it != j.end()) {
        if (it->is_binary()) {
            const auto& bytes = it->get_binary();
            task.payload = std::string(bytes.begin(), bytes.end());
        } else if (it->is_string()) {
            task.payload = it->get<std::string>();
        }
    }
    return task;
}

json Response::toJson() const {
    return {{"topic", topic},
            {"payload", payload},
            {"delivery_level", deliveryLevel},
            {"retain", retain}};
}

std::optional<Response> Response::fromJson(const json& j) {
    if (!j.is_object() || !j.contains("topic") || !j["topic"].is_string()) {
        spdlog::warn("Response frame without topic");
        return std::nullopt;
    }

    Response response;
    response.topic = j["topic"].get<std::string>();
    response.payload = j.value("payload", std::string{});
    response.deliveryLevel = j.value("delivery_level", 1);
    response.retain = j.value("retain", false);
    return response;
}

}  // namespace bmtl::ipc
