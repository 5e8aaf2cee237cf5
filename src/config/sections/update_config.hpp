/*
 * update_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Release slots, update source and restart settings

**************************************************/

#ifndef BMTL_CONFIG_SECTIONS_UPDATE_CONFIG_HPP
#define BMTL_CONFIG_SECTIONS_UPDATE_CONFIG_HPP

#include <string>
#include <vector>

#include "../core/config_section.hpp"

namespace bmtl::config {

/**
 * @brief Blue/green release layout
 *
 * ```yaml
 * update:
 *   base_dir: /opt/bmtl-device
 *   slot_a: v1
 *   slot_b: v2
 *   pointer: current
 *   repository_url: https://example.org/bmtl/agent.git
 *   verify_commands:
 *     - cmake -S . -B build -DCMAKE_BUILD_TYPE=Release
 *     - cmake --build build
 *   entry_point: build/bmtl-agent
 * ```
 */
struct UpdateConfig : ConfigSection<UpdateConfig> {
    static constexpr std::string_view PATH = "update";

    std::string baseDir{"/opt/bmtl-device"};
    std::string slotA{"v1"};
    std::string slotB{"v2"};
    std::string pointer{"current"};  ///< Symlink naming the live slot
    std::string repositoryUrl;
    std::string branch;  ///< Empty: the remote's default branch
    std::vector<std::string> verifyCommands{
        "cmake -S . -B build -DCMAKE_BUILD_TYPE=Release",
        "cmake --build build --parallel 2"};
    std::string entryPoint{"build/bmtl-agent"};
    std::string serviceName{"bmtl-device.service"};
    bool useSudo{true};
    int restartDelayMs{1000};
    int commandTimeoutSeconds{600};
    bool allowReboot{true};

    [[nodiscard]] json serialize() const {
        return {{"base_dir", baseDir},
                {"slot_a", slotA},
                {"slot_b", slotB},
                {"pointer", pointer},
                {"repository_url", repositoryUrl},
                {"branch", branch},
                {"verify_commands", verifyCommands},
                {"entry_point", entryPoint},
                {"service_name", serviceName},
                {"use_sudo", useSudo},
                {"restart_delay_ms", restartDelayMs},
                {"command_timeout_seconds", commandTimeoutSeconds},
                {"allow_reboot", allowReboot}};
    }

    [[nodiscard]] static UpdateConfig deserialize(const json& j) {
        UpdateConfig cfg;
        cfg.baseDir = j.value("base_dir", cfg.baseDir);
        cfg.slotA = j.value("slot_a", cfg.slotA);
        cfg.slotB = j.value("slot_b", cfg.slotB);
        cfg.pointer = j.value("pointer", cfg.pointer);
        cfg.repositoryUrl = j.value("repository_url", cfg.repositoryUrl);
        cfg.branch = j.value("branch", cfg.branch);
        if (j.contains("verify_commands") && j["verify_commands"].is_array()) {
            cfg.verifyCommands =
                j["verify_commands"].get<std::vector<std::string>>();
        }
        cfg.entryPoint = j.value("entry_point", cfg.entryPoint);
        cfg.serviceName = j.value("service_name", cfg.serviceName);
        cfg.useSudo = j.value("use_sudo", cfg.useSudo);
        cfg.restartDelayMs = j.value("restart_delay_ms", cfg.restartDelayMs);
        cfg.commandTimeoutSeconds =
            j.value("command_timeout_seconds", cfg.commandTimeoutSeconds);
        cfg.allowReboot = j.value("allow_reboot", cfg.allowReboot);
        return cfg;
    }
};

}  // namespace bmtl::config

#endif  // BMTL_CONFIG_SECTIONS_UPDATE_CONFIG_HPP
