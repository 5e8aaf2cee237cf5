/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging section of the device configuration

**************************************************/

#ifndef BMTL_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define BMTL_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace bmtl::config {

/**
 * @brief Logging configuration
 *
 * @example
 * ```yaml
 * logging:
 *   level: info
 *   console: true
 *   log_dir: /var/log/bmtl
 *   max_file_size: 5242880
 *   max_files: 3
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "logging";

    std::string level{"info"};
    bool console{true};
    bool enableFile{true};
    std::string logDir{"/var/log/bmtl"};
    size_t maxFileSize{5 * 1024 * 1024};
    size_t maxFiles{3};
    bool useDailyRotation{false};
    int rotationHour{0};
    int rotationMinute{0};

    /// Available placeholders: %Y %m %d %H %M %S %e (milliseconds)
    ///                        %l (level), %n (process role), %P (pid), %v
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%P] %v"};

    [[nodiscard]] json serialize() const {
        return {{"level", level},
                {"console", console},
                {"enable_file", enableFile},
                {"log_dir", logDir},
                {"max_file_size", maxFileSize},
                {"max_files", maxFiles},
                {"use_daily_rotation", useDailyRotation},
                {"rotation_hour", rotationHour},
                {"rotation_minute", rotationMinute},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.console = j.value("console", cfg.console);
        cfg.enableFile = j.value("enable_file", cfg.enableFile);
        cfg.logDir = j.value("log_dir", cfg.logDir);
        cfg.maxFileSize = j.value("max_file_size", cfg.maxFileSize);
        cfg.maxFiles = j.value("max_files", cfg.maxFiles);
        cfg.useDailyRotation = j.value("use_daily_rotation", cfg.useDailyRotation);
        cfg.rotationHour = j.value("rotation_hour", cfg.rotationHour);
        cfg.rotationMinute = j.value("rotation_minute", cfg.rotationMinute);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }
};

}  // namespace bmtl::config

#endif  // BMTL_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
