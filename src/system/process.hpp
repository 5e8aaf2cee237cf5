/*
 * process.hpp
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_SYSTEM_PROCESS_HPP
#define BMTL_SYSTEM_PROCESS_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace bmtl::system {

/**
 * @brief Result of a command execution
 *
 * exitCode is -1 when the process could not be started and -2 when it was
 * killed after exceeding its timeout.
 */
struct CommandResult {
    int exitCode{-1};
    std::string output;
    std::string errorOutput;
    bool timedOut{false};

    [[nodiscard]] bool ok() const noexcept { return exitCode == 0; }
};

struct CommandOptions {
    std::filesystem::path workingDirectory;
    std::chrono::seconds timeout{300};
    std::vector<std::pair<std::string, std::string>> environment;
};

/**
 * @brief Execute a program directly (no shell) and capture its output
 * @param argv Program and arguments; argv[0] is looked up on PATH
 */
CommandResult runCommand(const std::vector<std::string>& argv,
                         const CommandOptions& options = {});

/**
 * @brief Execute a command line through /bin/sh -c
 */
CommandResult runShell(const std::string& command,
                       const CommandOptions& options = {});

}  // namespace bmtl::system

#endif
