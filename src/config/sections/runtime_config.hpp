/*
 * runtime_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_CONFIG_SECTIONS_RUNTIME_CONFIG_HPP
#define BMTL_CONFIG_SECTIONS_RUNTIME_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace bmtl::config {

/**
 * @brief Directories of the document store
 */
struct StoreConfig : ConfigSection<StoreConfig> {
    static constexpr std::string_view PATH = "store";

    std::string runtimeDir{"/opt/bmtl-device/tmp"};  ///< Mailboxes, stats
    std::string persistentDir{"/etc/bmtl-device"};   ///< Schedule, defaults

    [[nodiscard]] json serialize() const {
        return {{"runtime_dir", runtimeDir}, {"persistent_dir", persistentDir}};
    }

    [[nodiscard]] static StoreConfig deserialize(const json& j) {
        StoreConfig cfg;
        cfg.runtimeDir = j.value("runtime_dir", cfg.runtimeDir);
        cfg.persistentDir = j.value("persistent_dir", cfg.persistentDir);
        return cfg;
    }
};

struct ScheduleConfig : ConfigSection<ScheduleConfig> {
    static constexpr std::string_view PATH = "schedule";

    int pollIntervalSeconds{60};

    [[nodiscard]] json serialize() const {
        return {{"poll_interval_seconds", pollIntervalSeconds}};
    }

    [[nodiscard]] static ScheduleConfig deserialize(const json& j) {
        ScheduleConfig cfg;
        cfg.pollIntervalSeconds =
            j.value("poll_interval_seconds", cfg.pollIntervalSeconds);
        return cfg;
    }
};

struct HealthConfig : ConfigSection<HealthConfig> {
    static constexpr std::string_view PATH = "health";

    int intervalSeconds{60};

    [[nodiscard]] json serialize() const {
        return {{"interval_seconds", intervalSeconds}};
    }

    [[nodiscard]] static HealthConfig deserialize(const json& j) {
        HealthConfig cfg;
        cfg.intervalSeconds = j.value("interval_seconds", cfg.intervalSeconds);
        return cfg;
    }
};

}  // namespace bmtl::config

#endif  // BMTL_CONFIG_SECTIONS_RUNTIME_CONFIG_HPP
