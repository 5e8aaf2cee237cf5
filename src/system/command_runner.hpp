/*
 * command_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_SYSTEM_COMMAND_RUNNER_HPP
#define BMTL_SYSTEM_COMMAND_RUNNER_HPP

#include <string>
#include <vector>

#include "process.hpp"

namespace bmtl::system {

/**
 * @brief Seam for child process invocation
 *
 * Components that shell out to external tools (gphoto2, git, systemctl)
 * take a runner so tests can script the outcomes.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::vector<std::string>& argv,
                              const CommandOptions& options) = 0;

    virtual CommandResult shell(const std::string& command,
                                const CommandOptions& options) = 0;
};

class ProcessCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv,
                      const CommandOptions& options) override {
        return runCommand(argv, options);
    }

    CommandResult shell(const std::string& command,
                        const CommandOptions& options) override {
        return runShell(command, options);
    }
};

}  // namespace bmtl::system

#endif  // BMTL_SYSTEM_COMMAND_RUNNER_HPP
