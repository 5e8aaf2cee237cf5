/*
 * topics.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Topic table mapping requests to worker commands

**************************************************/

#ifndef BMTL_MESSAGING_TOPICS_HPP
#define BMTL_MESSAGING_TOPICS_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bmtl::messaging {

namespace commands {
inline constexpr std::string_view SETTINGS_REQUEST_ALL = "settings_request_all";
inline constexpr std::string_view SETTINGS_REQUEST_INDIVIDUAL = "settings_request_individual";
inline constexpr std::string_view STATUS_REQUEST = "status_request";
inline constexpr std::string_view SETTINGS_CHANGE = "settings_change";
inline constexpr std::string_view SET_SITENAME = "set_sitename";
inline constexpr std::string_view SW_UPDATE = "sw_update";
inline constexpr std::string_view SW_ROLLBACK = "sw_rollback";
inline constexpr std::string_view SW_VERSION_REQUEST = "sw_version_request";
inline constexpr std::string_view REBOOT_ALL = "reboot_all";
inline constexpr std::string_view REBOOT_INDIVIDUAL = "reboot_individual";
inline constexpr std::string_view OPTIONS_REQUEST_ALL = "options_request_all";
inline constexpr std::string_view OPTIONS_REQUEST_INDIVIDUAL = "options_request_individual";
inline constexpr std::string_view WIPER_REQUEST = "wiper_request";
inline constexpr std::string_view CAMERA_POWER_REQUEST = "camera_power_request";
inline constexpr std::string_view CAPTURE_REQUEST = "capture_request";
inline constexpr std::string_view HEALTH_CHECK = "health_check";
}  // namespace commands

/// Subscriptions are made at this delivery level.
inline constexpr int SUBSCRIBE_DELIVERY_LEVEL = 2;
/// Responses are published at this delivery level.
inline constexpr int RESPONSE_DELIVERY_LEVEL = 1;

/**
 * @brief One row of the topic table
 *
 * `{id}` in a pattern stands for the device id.
 */
struct TopicRoute {
    std::string_view request;
    std::string_view command;
    std::string_view response;
};

inline constexpr std::array<TopicRoute, 15> TOPIC_ROUTES{{
    {"bmtl/request/settings/all", commands::SETTINGS_REQUEST_ALL,
     "bmtl/response/settings/all"},
    {"bmtl/request/settings/{id}", commands::SETTINGS_REQUEST_INDIVIDUAL,
     "bmtl/response/settings/{id}"},
    {"bmtl/request/status/all", commands::STATUS_REQUEST, "bmtl/response/status"},
    {"bmtl/set/settings/{id}", commands::SETTINGS_CHANGE,
     "bmtl/response/set/settings/{id}"},
    {"bmtl/set/sitename/{id}", commands::SET_SITENAME,
     "bmtl/response/set/sitename/{id}"},
    {"bmtl/sw-update/{id}", commands::SW_UPDATE, "bmtl/response/sw-update/{id}"},
    {"bmtl/sw-rollback/{id}", commands::SW_ROLLBACK,
     "bmtl/response/sw-rollback/{id}"},
    {"bmtl/request/sw-version/{id}", commands::SW_VERSION_REQUEST,
     "bmtl/response/sw-version/{id}"},
    {"bmtl/request/reboot/all", commands::REBOOT_ALL, "bmtl/response/reboot/all"},
    {"bmtl/request/reboot/{id}", commands::REBOOT_INDIVIDUAL,
     "bmtl/response/reboot/{id}"},
    {"bmtl/request/options/all", commands::OPTIONS_REQUEST_ALL,
     "bmtl/response/options/all"},
    {"bmtl/request/options/{id}", commands::OPTIONS_REQUEST_INDIVIDUAL,
     "bmtl/response/options/{id}"},
    {"bmtl/request/wiper/{id}", commands::WIPER_REQUEST, "bmtl/response/wiper/{id}"},
    {"bmtl/request/camera-on-off/{id}", commands::CAMERA_POWER_REQUEST,
     "bmtl/response/camera-on-off/{id}"},
    {"bmtl/request/capture/{id}", commands::CAPTURE_REQUEST,
     "bmtl/response/capture/{id}"},
}};

inline constexpr std::string_view HEALTH_TOPIC = "bmtl/status/health/{id}";

/**
 * @brief Replace `{id}` in @p pattern with @p deviceId
 */
[[nodiscard]] std::string expandTopic(std::string_view pattern,
                                      std::string_view deviceId);

/**
 * @brief Request topics to subscribe to for a device
 */
[[nodiscard]] std::vector<std::string> subscriptionTopics(std::string_view deviceId);

/**
 * @brief Worker command for an inbound topic, if it is in the table
 */
[[nodiscard]] std::optional<std::string_view> commandForTopic(
    std::string_view topic, std::string_view deviceId);

/**
 * @brief Response topic of a command; empty for unknown commands
 */
[[nodiscard]] std::string responseTopic(std::string_view command,
                                        std::string_view deviceId);

[[nodiscard]] std::string healthTopic(std::string_view deviceId);

}  // namespace bmtl::messaging

#endif  // BMTL_MESSAGING_TOPICS_HPP
