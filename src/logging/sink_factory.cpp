/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace bmtl::logging {

auto parseSinkKind(std::string_view type) -> std::optional<SinkKind> {
    if (type == "console" || type == "stderr") {
        return SinkKind::Console;
    }
    if (type == "file" || type == "basic_file") {
        return SinkKind::File;
    }
    if (type == "rotating_file") {
        return SinkKind::RotatingFile;
    }
    if (type == "daily_file") {
        return SinkKind::DailyFile;
    }
    return std::nullopt;
}

auto SinkFactory::createSink(const SinkConfig& config) -> spdlog::sink_ptr {
    auto kind = parseSinkKind(config.type);
    if (!kind) {
        spdlog::warn("Skipping sink '{}': unknown type '{}'", config.name,
                     config.type);
        return nullptr;
    }

    spdlog::sink_ptr sink;
    try {
        sink = build(*kind, config);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create sink '{}' ({}): {}", config.name,
                      config.file_path, e.what());
        return nullptr;
    }
    if (!sink) {
        return nullptr;
    }

    sink->set_level(config.level);
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

auto SinkFactory::build(SinkKind kind, const SinkConfig& config)
    -> spdlog::sink_ptr {
    using namespace spdlog::sinks;

    if (kind == SinkKind::Console) {
        return std::make_shared<stderr_color_sink_mt>();
    }

    prepareLogDirectory(config.file_path);
    switch (kind) {
        case SinkKind::File:
            // Appending: a restarted process continues the same file.
            return std::make_shared<basic_file_sink_mt>(config.file_path, false);
        case SinkKind::RotatingFile:
            return std::make_shared<rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files);
        case SinkKind::DailyFile:
            return std::make_shared<daily_file_sink_mt>(
                config.file_path, config.rotation_hour, config.rotation_minute);
        case SinkKind::Console:
            break;
    }
    return nullptr;
}

void SinkFactory::prepareLogDirectory(const std::string& file_path) {
    auto parent = std::filesystem::path(file_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

}  // namespace bmtl::logging
