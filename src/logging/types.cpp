/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <cctype>

namespace bmtl::logging {

auto LoggingConfig::createDefault() -> LoggingConfig {
    LoggingConfig config;
    SinkConfig console;
    console.name = "console";
    console.type = "console";
    config.sinks.push_back(console);
    return config;
}

auto LoggingConfig::forProcess(const config::LoggingConfig& section,
                               const std::string& role) -> LoggingConfig {
    LoggingConfig config;
    config.default_level = levelFromString(section.level);
    config.default_pattern = section.pattern;

    if (section.console) {
        SinkConfig console;
        console.name = "console";
        console.type = "console";
        config.sinks.push_back(console);
    }

    if (section.enableFile) {
        SinkConfig file;
        file.name = "file";
        file.file_path = section.logDir + "/" + role + ".log";
        if (section.useDailyRotation) {
            file.type = "daily_file";
            file.rotation_hour = section.rotationHour;
            file.rotation_minute = section.rotationMinute;
        } else {
            file.type = "rotating_file";
            file.max_file_size = section.maxFileSize;
            file.max_files = section.maxFiles;
        }
        config.sinks.push_back(file);
    }

    return config;
}

// ============================================================================
// Level Conversion Functions
// ============================================================================

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    std::string lower = level;
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "info")
        return spdlog::level::info;
    if (lower == "warn" || lower == "warning")
        return spdlog::level::warn;
    if (lower == "error" || lower == "err")
        return spdlog::level::err;
    if (lower == "critical" || lower == "fatal")
        return spdlog::level::critical;
    if (lower == "off")
        return spdlog::level::off;
    return spdlog::level::info;  // Default
}
}  // namespace bmtl::logging
