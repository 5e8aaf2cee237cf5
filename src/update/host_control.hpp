/*
 * host_control.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_UPDATE_HOST_CONTROL_HPP
#define BMTL_UPDATE_HOST_CONTROL_HPP

#include <memory>
#include <string>

#include "system/command_runner.hpp"

namespace bmtl::update {

/**
 * @brief Asks the host process manager to restart the agent service
 */
class RestartRequester {
public:
    virtual ~RestartRequester() = default;

    /// @return true if the process manager accepted the request
    virtual bool restartService() = 0;
};

/**
 * @brief Service restart plus whole-host reboot
 */
class HostControl : public RestartRequester {
public:
    virtual bool rebootHost() = 0;
};

/**
 * @brief HostControl through systemctl, optionally via sudo
 */
class SystemdRestarter : public HostControl {
public:
    SystemdRestarter(std::string serviceName, bool useSudo,
                     std::shared_ptr<system::CommandRunner> runner);

    bool restartService() override;
    bool rebootHost() override;

private:
    bool invoke(std::vector<std::string> argv);

    std::string serviceName_;
    bool useSudo_;
    std::shared_ptr<system::CommandRunner> runner_;
};

}  // namespace bmtl::update

#endif  // BMTL_UPDATE_HOST_CONTROL_HPP
