/*
 * process.cpp
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern char** environ;

namespace bmtl::system {

namespace {

std::vector<std::string> buildEnvironment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        bool overridden = false;
        for (const auto& [key, value] : overrides) {
            if (eq != std::string::npos && entry.compare(0, eq, key) == 0 &&
                key.size() == eq) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> toCStrings(std::vector<std::string>& strings) {
    std::vector<char*> result;
    result.reserve(strings.size() + 1);
    for (auto& s : strings) {
        result.push_back(s.data());
    }
    result.push_back(nullptr);
    return result;
}

}  // namespace

CommandResult runCommand(const std::vector<std::string>& argv,
                         const CommandOptions& options) {
    CommandResult result;
    if (argv.empty()) {
        result.errorOutput = "Empty command";
        return result;
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> args = argv;
    auto cargs = toCStrings(args);
    std::vector<std::string> env = buildEnvironment(options.environment);
    auto cenv = toCStrings(env);
    std::string cwd = options.workingDirectory.string();

    std::array<int, 2> stdoutPipe{-1, -1};
    std::array<int, 2> stderrPipe{-1, -1};

    if (pipe2(stdoutPipe.data(), O_CLOEXEC) != 0) {
        result.errorOutput = "Failed to create pipes";
        return result;
    }
    if (pipe2(stderrPipe.data(), O_CLOEXEC) != 0) {
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        result.errorOutput = "Failed to create pipes";
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        for (int fd : {stdoutPipe[0], stdoutPipe[1], stderrPipe[0],
                       stderrPipe[1]}) {
            close(fd);
        }
        result.errorOutput = "Failed to fork";
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(stdoutPipe[1], STDOUT_FILENO);
        dup2(stderrPipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        execvpe(cargs[0], cargs.data(), cenv.data());
        _exit(127);
    }

    // Parent process
    close(stdoutPipe[1]);
    close(stderrPipe[1]);

    auto deadline = std::chrono::steady_clock::now() + options.timeout;
    std::array<pollfd, 2> fds{pollfd{stdoutPipe[0], POLLIN, 0},
                              pollfd{stderrPipe[0], POLLIN, 0}};
    std::array<std::string*, 2> sinks{&result.output, &result.errorOutput};
    int openCount = 2;
    std::array<char, 4096> buffer;

    while (openCount > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            kill(pid, SIGKILL);
            result.timedOut = true;
            break;
        }

        int ret = poll(fds.data(), fds.size(),
                       static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            kill(pid, SIGKILL);
            break;
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            auto bytesRead = read(fds[i].fd, buffer.data(), buffer.size());
            if (bytesRead > 0) {
                sinks[i]->append(buffer.data(),
                                 static_cast<size_t>(bytesRead));
            } else if (bytesRead == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --openCount;
            }
        }
    }

    for (const auto& pfd : fds) {
        if (pfd.fd >= 0) {
            close(pfd.fd);
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (result.timedOut) {
        result.exitCode = -2;
        spdlog::warn("Command '{}' timed out after {}s", argv[0],
                     options.timeout.count());
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else {
        result.exitCode = -1;
    }

    return result;
}

CommandResult runShell(const std::string& command,
                       const CommandOptions& options) {
    return runCommand({"/bin/sh", "-c", command}, options);
}

}  // namespace bmtl::system
