/*
 * response_builder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "response_builder.hpp"

#include "messaging/topics.hpp"
#include "system/local_time.hpp"

namespace bmtl::dispatch {

json responseBody(std::string_view responseType, std::string_view moduleId) {
    json body;
    body["response_type"] = std::string(responseType);
    if (!moduleId.empty()) {
        body["module_id"] = std::string(moduleId);
    }
    body["timestamp"] = system::nowTimestamp();
    return body;
}

json failureBody(std::string_view responseType, std::string_view moduleId,
                 std::string_view message, const std::vector<std::string>& errors) {
    auto body = responseBody(responseType, moduleId);
    body["success"] = false;
    body["message"] = std::string(message);
    body["errors"] = errors;
    return body;
}

ipc::Response makeResponse(std::string_view command, std::string_view deviceId,
                           json body, const std::optional<json>& requestId,
                           bool retain) {
    if (requestId) {
        body["request_id"] = *requestId;
    }
    if (!body.contains("timestamp")) {
        body["timestamp"] = system::nowTimestamp();
    }

    ipc::Response response;
    response.topic = messaging::responseTopic(command, deviceId);
    response.payload = body.dump(-1, ' ', false, json::error_handler_t::replace);
    response.deliveryLevel = messaging::RESPONSE_DELIVERY_LEVEL;
    response.retain = retain;
    return response;
}

}  // namespace bmtl::dispatch
