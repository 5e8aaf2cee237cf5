/*
 * agent_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Complete configuration of the on-device agent

**************************************************/

#ifndef BMTL_CONFIG_AGENT_CONFIG_HPP
#define BMTL_CONFIG_AGENT_CONFIG_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "sections/device_config.hpp"
#include "sections/logging_config.hpp"
#include "sections/mqtt_config.hpp"
#include "sections/runtime_config.hpp"
#include "sections/update_config.hpp"

namespace bmtl::config {

inline constexpr std::string_view DEFAULT_CONFIG_PATH =
    "/etc/bmtl-device/config.yaml";

/// Returns the value of an environment variable, if set.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

[[nodiscard]] std::optional<std::string> processEnvironment(
    const std::string& name);

struct AgentConfig {
    DeviceConfig device;
    MqttConfig mqtt;
    ReconnectConfig reconnect;
    StoreConfig store;
    ScheduleConfig schedule;
    HealthConfig health;
    UpdateConfig update;
    LoggingConfig logging;

    /// File the configuration was read from; site name changes go there.
    std::filesystem::path sourcePath;

    [[nodiscard]] json toJson() const;

    /**
     * @throws InvalidConfigException when a key has the wrong type
     */
    [[nodiscard]] static AgentConfig fromJson(const json& root);

    /**
     * @brief Load the configuration file
     *
     * A missing file yields the defaults (logged); an unreadable or
     * malformed one throws.
     */
    [[nodiscard]] static AgentConfig load(const std::filesystem::path& path);

    /**
     * @brief Apply MQTT_* overrides from the environment
     */
    void applyEnvironment(const EnvLookup& lookup = processEnvironment);

    /**
     * @brief Apply --log-level and --debug
     *
     * Any non-empty @p level replaces the configured one; @p debug wins
     * over both.
     */
    void applyLogOverrides(const std::optional<std::string>& level, bool debug);

    /**
     * @brief Fill an empty device id from the host name
     */
    void resolveDeviceId(std::string_view host);

    /**
     * @brief `bmotion<id>`, the module id used in response payloads
     */
    [[nodiscard]] std::string moduleId() const;
};

/**
 * @brief Rewrite device.location in the configuration file
 *
 * Every other key of the file is preserved; the file is replaced
 * atomically. A missing file is created.
 *
 * @throws BadConfigException on failure
 */
void persistSiteName(const std::filesystem::path& path,
                     const std::string& siteName);

}  // namespace bmtl::config

#endif  // BMTL_CONFIG_AGENT_CONFIG_HPP
