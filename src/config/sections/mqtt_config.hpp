/*
 * mqtt_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Messaging session and reconnect policy settings

**************************************************/

#ifndef BMTL_CONFIG_SECTIONS_MQTT_CONFIG_HPP
#define BMTL_CONFIG_SECTIONS_MQTT_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace bmtl::config {

/**
 * @brief Broker session settings
 *
 * host, port, username, password and use_tls can be overridden with the
 * MQTT_HOST, MQTT_PORT, MQTT_USERNAME, MQTT_PASSWORD and MQTT_USE_TLS
 * environment variables.
 */
struct MqttConfig : ConfigSection<MqttConfig> {
    static constexpr std::string_view PATH = "mqtt";

    std::string host{"localhost"};
    int port{1883};
    std::string username;
    std::string password;
    bool useTls{false};
    std::string caFile;  ///< Empty: the system CA directory
    std::string clientId{"bmtl-device"};
    int keepaliveSeconds{60};
    std::string transport{"mqtt"};  ///< "mqtt" or "loopback"
    bool logAllMessages{true};
    std::string messageLog{"mqtt_messages.log"};  ///< Relative to the log dir

    [[nodiscard]] json serialize() const {
        return {{"host", host},
                {"port", port},
                {"username", username},
                {"password", password},
                {"use_tls", useTls},
                {"ca_file", caFile},
                {"client_id", clientId},
                {"keepalive_seconds", keepaliveSeconds},
                {"transport", transport},
                {"log_all_messages", logAllMessages},
                {"message_log", messageLog}};
    }

    [[nodiscard]] static MqttConfig deserialize(const json& j) {
        MqttConfig cfg;
        cfg.host = j.value("host", cfg.host);
        cfg.port = j.value("port", cfg.port);
        cfg.username = j.value("username", cfg.username);
        cfg.password = j.value("password", cfg.password);
        cfg.useTls = j.value("use_tls", cfg.useTls);
        cfg.caFile = j.value("ca_file", cfg.caFile);
        cfg.clientId = j.value("client_id", cfg.clientId);
        cfg.keepaliveSeconds = j.value("keepalive_seconds", cfg.keepaliveSeconds);
        cfg.transport = j.value("transport", cfg.transport);
        cfg.logAllMessages = j.value("log_all_messages", cfg.logAllMessages);
        cfg.messageLog = j.value("message_log", cfg.messageLog);
        return cfg;
    }
};

/**
 * @brief Exponential reconnect backoff
 */
struct ReconnectConfig : ConfigSection<ReconnectConfig> {
    static constexpr std::string_view PATH = "reconnect";

    int initialDelayMs{1000};
    int maxDelayMs{60000};
    double multiplier{2.0};

    [[nodiscard]] json serialize() const {
        return {{"initial_delay_ms", initialDelayMs},
                {"max_delay_ms", maxDelayMs},
                {"multiplier", multiplier}};
    }

    [[nodiscard]] static ReconnectConfig deserialize(const json& j) {
        ReconnectConfig cfg;
        cfg.initialDelayMs = j.value("initial_delay_ms", cfg.initialDelayMs);
        cfg.maxDelayMs = j.value("max_delay_ms", cfg.maxDelayMs);
        cfg.multiplier = j.value("multiplier", cfg.multiplier);
        return cfg;
    }
};

}  // namespace bmtl::config

#endif  // BMTL_CONFIG_SECTIONS_MQTT_CONFIG_HPP
