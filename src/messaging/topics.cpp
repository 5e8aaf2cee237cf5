/*
 * topics.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "topics.hpp"

namespace bmtl::messaging {

namespace {
constexpr std::string_view ID_PLACEHOLDER = "{id}";
}

std::string expandTopic(std::string_view pattern, std::string_view deviceId) {
    std::string topic(pattern);
    auto pos = topic.find(ID_PLACEHOLDER);
    if (pos != std::string::npos) {
        topic.replace(pos, ID_PLACEHOLDER.size(), deviceId);
    }
    return topic;
}

std::vector<std::string> subscriptionTopics(std::string_view deviceId) {
    std::vector<std::string> topics;
    topics.reserve(TOPIC_ROUTES.size());
    for (const auto& route : TOPIC_ROUTES) {
        topics.push_back(expandTopic(route.request, deviceId));
    }
    return topics;
}

std::optional<std::string_view> commandForTopic(std::string_view topic,
                                                std::string_view deviceId) {
    for (const auto& route : TOPIC_ROUTES) {
        if (expandTopic(route.request, deviceId) == topic) {
            return route.command;
        }
    }
    return std::nullopt;
}

std::string responseTopic(std::string_view command, std::string_view deviceId) {
    for (const auto& route : TOPIC_ROUTES) {
        if (route.command == command) {
            return expandTopic(route.response, deviceId);
        }
    }
    if (command == commands::HEALTH_CHECK) {
        return healthTopic(deviceId);
    }
    return {};
}

std::string healthTopic(std::string_view deviceId) {
    return expandTopic(HEALTH_TOPIC, deviceId);
}

}  // namespace bmtl::messaging
