/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Central Logging Manager for the agent processes

**************************************************/

#ifndef BMTL_LOGGING_LOGGING_MANAGER_HPP
#define BMTL_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace bmtl::logging {

/**
 * @brief Central logging manager with spdlog integration
 *
 * Each agent process initializes the manager once with its role name
 * ("messaging" or "worker"); the role becomes the default logger name so
 * that lines from both processes can be told apart in shared sinks.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Initialize logging system with configuration
     * @param config Logging configuration
     * @param role Name of the default logger
     */
    void initialize(const LoggingConfig& config, const std::string& role);

    /**
     * @brief Flush and drop all loggers
     */
    void shutdown();

    /**
     * @brief Create a logger that writes only to its own sink
     *
     * Used for the inbound message log, which must not interleave with the
     * diagnostic output.
     *
     * @return The logger, or nullptr when the sink cannot be created
     */
    auto createDedicatedLogger(const std::string& name,
                               const SinkConfig& sink)
        -> std::shared_ptr<spdlog::logger>;

    ~LoggingManager();
    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

private:
    LoggingManager() = default;

    void setupDefaultLogger(const std::string& role);

    std::mutex mutex_;
    LoggingConfig config_;
    std::unordered_map<std::string, spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
    bool initialized_{false};
};

}  // namespace bmtl::logging

#endif  // BMTL_LOGGING_LOGGING_MANAGER_HPP
