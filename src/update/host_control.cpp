/*
 * host_control.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "host_control.hpp"

#include <spdlog/spdlog.h>

namespace bmtl::update {

using namespace std::chrono_literals;

SystemdRestarter::SystemdRestarter(std::string serviceName, bool useSudo,
                                   std::shared_ptr<system::CommandRunner> runner)
    : serviceName_(std::move(serviceName)),
      useSudo_(useSudo),
      runner_(std::move(runner)) {}

bool SystemdRestarter::restartService() {
    spdlog::info("Restarting service {}", serviceName_);
    return invoke({"systemctl", "restart", serviceName_});
}

bool SystemdRestarter::rebootHost() {
    spdlog::warn("Rebooting host");
    return invoke({"systemctl", "reboot"});
}

bool SystemdRestarter::invoke(std::vector<std::string> argv) {
    if (useSudo_) {
        std::vector<std::string> prefix{"sudo", "-n"};
        argv.insert(argv.begin(), prefix.begin(), prefix.end());
    }
    system::CommandOptions options;
    options.timeout = 30s;
    auto result = runner_->run(argv, options);
    if (!result.ok()) {
        spdlog::error("{} failed ({}): {}", argv[useSudo_ ? 2 : 0],
                      result.exitCode, result.errorOutput);
        return false;
    }
    return true;
}

}  // namespace bmtl::update
