/*
 * version_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "version_manager.hpp"

#include <spdlog/spdlog.h>

#include "system/atomic_file.hpp"

namespace bmtl::update {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

std::string firstLine(const std::string& text) {
    auto end = text.find_first_of("\r\n");
    std::string line = text.substr(0, end);
    auto last = line.find_last_not_of(" \t");
    return last == std::string::npos ? std::string{} : line.substr(0, last + 1);
}

}  // namespace

json VersionInfo::toJson() const {
    return {{"sw_version", version},
            {"commit_hash", commitHash},
            {"branch", branch},
            {"active_slot", activeSlot}};
}

VersionManager::VersionManager(const config::UpdateConfig& config,
                               std::shared_ptr<system::CommandRunner> runner)
    : layout_(config), configuredBranch_(config.branch), runner_(std::move(runner)) {}

std::optional<std::string> VersionManager::git(const fs::path& dir,
                                               std::vector<std::string> args) {
    args.insert(args.begin(), "git");
    system::CommandOptions options;
    options.workingDirectory = dir;
    options.timeout = 10s;
    auto result = runner_->run(args, options);
    if (!result.ok()) {
        return std::nullopt;
    }
    auto line = firstLine(result.output);
    if (line.empty()) {
        return std::nullopt;
    }
    return line;
}

VersionInfo VersionManager::current() {
    VersionInfo info;

    fs::path releaseDir = layout_.baseDir();
    if (auto active = layout_.activeSlot()) {
        info.activeSlot = *active;
        releaseDir = layout_.slotPath(*active);
    }

    std::error_code ec;
    if (fs::exists(releaseDir / ".git", ec)) {
        if (auto hash = git(releaseDir, {"rev-parse", "--short", "HEAD"})) {
            info.commitHash = *hash;
        }
        if (auto branch = git(releaseDir, {"rev-parse", "--abbrev-ref", "HEAD"});
            branch && *branch != "HEAD") {
            info.branch = *branch;
        }
    }
    if (info.branch == "unknown" && !configuredBranch_.empty()) {
        info.branch = configuredBranch_;
    }

    auto versionFile = releaseDir / "VERSION";
    if (fs::is_regular_file(versionFile, ec)) {
        try {
            auto text = firstLine(system::readFile(versionFile));
            if (!text.empty()) {
                info.version = text;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Cannot read {}: {}", versionFile.string(), e.what());
        }
    }
    if (info.version == "unknown" && info.commitHash != "unknown") {
        info.version = info.commitHash;
    }
    return info;
}

}  // namespace bmtl::update
