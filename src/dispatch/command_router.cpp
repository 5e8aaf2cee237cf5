/*
 * command_router.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_router.hpp"

#include <spdlog/spdlog.h>

namespace bmtl::dispatch {

void CommandRouter::add(std::string command, Route route) {
    routes_.insert_or_assign(std::move(command), std::move(route));
}

bool CommandRouter::handles(std::string_view command) const {
    return routes_.find(command) != routes_.end();
}

std::vector<std::string> CommandRouter::commands() const {
    std::vector<std::string> names;
    names.reserve(routes_.size());
    for (const auto& [name, route] : routes_) {
        names.push_back(name);
    }
    return names;
}

std::optional<Request> CommandRouter::parse(const ipc::Task& task) {
    Request request;
    request.command = task.command;
    request.deviceId = task.deviceId;
    request.moduleId = "bmotion" + task.deviceId;

    if (!task.payload || task.payload->empty()) {
        return request;
    }

    auto payload = json::parse(*task.payload, nullptr, false);
    if (payload.is_discarded()) {
        return std::nullopt;
    }
    if (!payload.is_object()) {
        spdlog::warn("{} payload is not an object, ignoring it", task.command);
        return request;
    }

    if (auto it = payload.find("request_id"); it != payload.end() && !it->is_null()) {
        request.requestId = *it;
    }
    request.payload = std::move(payload);
    return request;
}

std::optional<ipc::Response> CommandRouter::dispatch(const ipc::Task& task) const {
    auto it = routes_.find(task.command);
    if (it == routes_.end()) {
        spdlog::warn("Unknown command '{}' dropped", task.command);
        return std::nullopt;
    }
    const auto& route = it->second;
    const auto moduleId = "bmotion" + task.deviceId;

    auto request = parse(task);
    if (!request) {
        spdlog::warn("{}: payload is not valid JSON", task.command);
        return makeResponse(task.command, task.deviceId,
                            failureBody(route.responseType, moduleId,
                                        "Invalid JSON payload"),
                            std::nullopt, route.retain);
    }

    try {
        auto body = route.handler(*request);
        if (!body) {
            return std::nullopt;
        }
        return makeResponse(task.command, task.deviceId, std::move(*body),
                            request->requestId, route.retain);
    } catch (const std::exception& e) {
        spdlog::error("Handler for {} failed: {}", task.command, e.what());
        return makeResponse(task.command, task.deviceId,
                            failureBody(route.responseType, moduleId,
                                        std::string("Command failed: ") + e.what(),
                                        {e.what()}),
                            request->requestId, route.retain);
    }
}

}  // namespace bmtl::dispatch
