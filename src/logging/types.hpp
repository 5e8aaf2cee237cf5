/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Logging system type definitions

**************************************************/

#ifndef BMTL_LOGGING_TYPES_HPP
#define BMTL_LOGGING_TYPES_HPP

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace bmtl::logging {

/**
 * @brief Sink configuration structure
 */
struct SinkConfig {
    std::string name;
    std::string type;  // "console", "file", "rotating_file", "daily_file"
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;

    // File sink options
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10MB default
    size_t max_files{5};

    // Daily file options
    int rotation_hour{0};
    int rotation_minute{0};
};

/**
 * @brief Logging manager configuration
 *
 * Built from the `logging` section of the device configuration by
 * LoggingConfig::forProcess(), which names the log file after the process
 * role (`messaging` or `worker`).
 */
struct LoggingConfig {
    spdlog::level::level_enum default_level{spdlog::level::info};
    std::string default_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%P] %v"};
    std::vector<SinkConfig> sinks;

    /**
     * @brief Console only, used before the device configuration is loaded
     */
    [[nodiscard]] static auto createDefault() -> LoggingConfig;

    /**
     * @brief Sinks for one agent process
     *
     * Console (stderr) when enabled, plus `<log_dir>/<role>.log` rotated by
     * size or daily.
     */
    [[nodiscard]] static auto forProcess(const config::LoggingConfig& section,
                                         const std::string& role)
        -> LoggingConfig;
};

/**
 * @brief Convert level string to spdlog enum
 *
 * Unknown names map to info.
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

}  // namespace bmtl::logging

#endif  // BMTL_LOGGING_TYPES_HPP
