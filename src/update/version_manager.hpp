/*
 * version_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_UPDATE_VERSION_MANAGER_HPP
#define BMTL_UPDATE_VERSION_MANAGER_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "slot_layout.hpp"
#include "system/command_runner.hpp"

namespace bmtl::update {

struct VersionInfo {
    std::string version{"unknown"};
    std::string commitHash{"unknown"};
    std::string branch{"unknown"};
    std::string activeSlot{"unknown"};

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Describes the running release
 *
 * The commit comes from `git rev-parse --short HEAD` in the active slot.
 * The version is the slot's VERSION file, else the commit, else "unknown".
 */
class VersionManager {
public:
    VersionManager(const config::UpdateConfig& config,
                   std::shared_ptr<system::CommandRunner> runner);

    [[nodiscard]] VersionInfo current();

private:
    std::optional<std::string> git(const std::filesystem::path& dir,
                                   std::vector<std::string> args);

    SlotLayout layout_;
    std::string configuredBranch_;
    std::shared_ptr<system::CommandRunner> runner_;
};

}  // namespace bmtl::update

#endif  // BMTL_UPDATE_VERSION_MANAGER_HPP
