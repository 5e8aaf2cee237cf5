/*
 * response_builder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_DISPATCH_RESPONSE_BUILDER_HPP
#define BMTL_DISPATCH_RESPONSE_BUILDER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ipc/task.hpp"

namespace bmtl::dispatch {

using json = nlohmann::json;

/**
 * @brief Parsed form of a task as seen by a handler
 */
struct Request {
    std::string command;
    std::string deviceId;
    std::string moduleId;            ///< bmotion<deviceId>
    json payload = json::object();   ///< Always an object
    std::optional<json> requestId;   ///< Echoed back verbatim
};

/**
 * @brief Start a response body: response_type, module_id and timestamp
 *
 * @param moduleId Omitted from the body when empty
 */
[[nodiscard]] json responseBody(std::string_view responseType,
                                std::string_view moduleId = {});

/**
 * @brief Failure body with success=false, message and errors
 */
[[nodiscard]] json failureBody(std::string_view responseType,
                               std::string_view moduleId, std::string_view message,
                               const std::vector<std::string>& errors = {});

/**
 * @brief Wrap a body for publication on the command's response topic
 *
 * Adds request_id when the request carried one and a timestamp when the
 * body has none.
 */
[[nodiscard]] ipc::Response makeResponse(std::string_view command,
                                         std::string_view deviceId, json body,
                                         const std::optional<json>& requestId,
                                         bool retain = false);

}  // namespace bmtl::dispatch

#endif  // BMTL_DISPATCH_RESPONSE_BUILDER_HPP
