/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Builds spdlog sinks for the agent processes

**************************************************/

#ifndef BMTL_LOGGING_SINK_FACTORY_HPP
#define BMTL_LOGGING_SINK_FACTORY_HPP

#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace bmtl::logging {

enum class SinkKind { Console, File, RotatingFile, DailyFile };

/**
 * @brief Map a configured sink type name to its kind
 *
 * "stderr" is accepted as an alias of "console", "basic_file" of "file".
 */
[[nodiscard]] auto parseSinkKind(std::string_view type)
    -> std::optional<SinkKind>;

/**
 * @brief Factory for the sinks named in a LoggingConfig
 *
 * Console output always goes to stderr: stdout carries the stream
 * transport's line protocol in the messaging process.
 */
class SinkFactory {
public:
    /**
     * @brief Create a sink from configuration
     * @return Created sink, or nullptr for an unknown type or I/O failure
     */
    [[nodiscard]] static auto createSink(const SinkConfig& config)
        -> spdlog::sink_ptr;

private:
    static auto build(SinkKind kind, const SinkConfig& config)
        -> spdlog::sink_ptr;
    static void prepareLogDirectory(const std::string& file_path);
};

}  // namespace bmtl::logging

#endif  // BMTL_LOGGING_SINK_FACTORY_HPP
