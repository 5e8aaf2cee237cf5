/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <vector>

#include "sink_factory.hpp"

namespace bmtl::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

void LoggingManager::initialize(const LoggingConfig& config,
                                const std::string& role) {
    std::unique_lock lock(mutex_);

    if (initialized_) {
        // Re-initialized after fork: the child drops the parent's loggers.
        spdlog::drop_all();
        sinks_.clear();
        loggers_.clear();
    }

    config_ = config;

    for (const auto& sink_config : config.sinks) {
        auto sink = SinkFactory::createSink(sink_config);
        if (sink) {
            sinks_[sink_config.name] = sink;
        }
    }

    setupDefaultLogger(role);

    initialized_ = true;
    spdlog::info("Logging initialized for '{}' with {} sinks", role,
                 sinks_.size());
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    if (auto def = spdlog::default_logger()) {
        def->flush();
    }

    loggers_.clear();
    sinks_.clear();
    spdlog::drop_all();
    initialized_ = false;
}

auto LoggingManager::createDedicatedLogger(const std::string& name,
                                           const SinkConfig& sink_config)
    -> std::shared_ptr<spdlog::logger> {
    auto sink = SinkFactory::createSink(sink_config);
    if (!sink) {
        return nullptr;
    }

    std::unique_lock lock(mutex_);
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::level::trace);
    logger->set_pattern(sink_config.pattern.empty() ? "%v"
                                                    : sink_config.pattern);
    logger->flush_on(spdlog::level::info);
    loggers_[name] = logger;
    return logger;
}

void LoggingManager::setupDefaultLogger(const std::string& role) {
    std::vector<spdlog::sink_ptr> sink_list;
    for (const auto& [name, sink] : sinks_) {
        sink_list.push_back(sink);
    }

    auto default_logger = std::make_shared<spdlog::logger>(
        role, sink_list.begin(), sink_list.end());

    default_logger->set_level(config_.default_level);
    default_logger->set_pattern(config_.default_pattern);
    default_logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(default_logger);
}

}  // namespace bmtl::logging
