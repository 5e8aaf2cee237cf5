/*
 * update_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "update_manager.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>

namespace bmtl::update {

namespace fs = std::filesystem;

namespace {

constexpr size_t MAX_ERROR_TAIL = 512;

std::string tail(const std::string& text) {
    auto last = text.find_last_not_of(" \t\r\n");
    if (last == std::string::npos) {
        return {};
    }
    auto trimmed = text.substr(0, last + 1);
    if (trimmed.size() <= MAX_ERROR_TAIL) {
        return trimmed;
    }
    return "..." + trimmed.substr(trimmed.size() - MAX_ERROR_TAIL);
}

std::vector<std::string> commandErrors(const system::CommandResult& result) {
    if (result.timedOut) {
        return {"command timed out"};
    }
    auto err = tail(result.errorOutput);
    if (err.empty()) {
        err = tail(result.output);
    }
    if (err.empty()) {
        err = "exit code " + std::to_string(result.exitCode);
    }
    return {std::move(err)};
}

}  // namespace

// ============================================================================
// Guard
// ============================================================================

/// Non-blocking claim of the single-cycle flag.
class UpdateManager::Guard {
public:
    explicit Guard(std::atomic<bool>& flag) : flag_(&flag) {
        bool expected = false;
        owned_ = flag.compare_exchange_strong(expected, true);
    }

    Guard(Guard&& other) noexcept
        : flag_(other.flag_), owned_(std::exchange(other.owned_, false)) {}

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard& operator=(Guard&&) = delete;

    ~Guard() {
        if (owned_) {
            flag_->store(false);
        }
    }

    explicit operator bool() const noexcept { return owned_; }

private:
    std::atomic<bool>* flag_;
    bool owned_{false};
};

// ============================================================================
// UpdateManager
// ============================================================================

UpdateManager::UpdateManager(const config::UpdateConfig& config,
                             std::shared_ptr<system::CommandRunner> runner,
                             std::shared_ptr<RestartRequester> restarter)
    : config_(config),
      layout_(config),
      runner_(std::move(runner)),
      restarter_(std::move(restarter)) {}

UpdateManager::~UpdateManager() { join(); }

void UpdateManager::join() {
    std::lock_guard lock(threadMutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

UpdateResult<UpdateOutcome> UpdateManager::runUpdate(const ProgressCallback& progress) {
    Guard guard(busy_);
    if (!guard) {
        return std::unexpected(UpdateFailure{FailureKind::AlreadyInProgress,
                                             state_.load(),
                                             "Update already in progress", {}});
    }
    return updateCycle(progress);
}

UpdateResult<UpdateOutcome> UpdateManager::runRollback(
    const std::optional<std::string>& target, const ProgressCallback& progress) {
    Guard guard(busy_);
    if (!guard) {
        return std::unexpected(UpdateFailure{FailureKind::AlreadyInProgress,
                                             state_.load(),
                                             "Update already in progress", {}});
    }
    return rollbackCycle(target, progress);
}

bool UpdateManager::startUpdate(CompletionCallback done, ProgressCallback progress) {
    return launch(
        [this, progress = std::move(progress)] { return updateCycle(progress); },
        std::move(done));
}

bool UpdateManager::startRollback(std::optional<std::string> target,
                                  CompletionCallback done, ProgressCallback progress) {
    return launch(
        [this, target = std::move(target), progress = std::move(progress)] {
            return rollbackCycle(target, progress);
        },
        std::move(done));
}

bool UpdateManager::launch(std::function<UpdateResult<UpdateOutcome>()> cycle,
                           CompletionCallback done) {
    Guard guard(busy_);
    if (!guard) {
        spdlog::warn("Rejecting request: an update cycle is already running");
        return false;
    }

    std::lock_guard lock(threadMutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_ = std::jthread([guard = std::move(guard), cycle = std::move(cycle),
                            done = std::move(done)]() mutable {
        auto held = std::move(guard);
        UpdateResult<UpdateOutcome> result = std::unexpected(UpdateFailure{
            FailureKind::Configuration, UpdateState::Failed, "Update did not run", {}});
        try {
            result = cycle();
        } catch (const std::exception& e) {
            spdlog::error("Update cycle raised: {}", e.what());
            result = std::unexpected(UpdateFailure{FailureKind::Configuration,
                                                   UpdateState::Failed, e.what(), {}});
        }
        if (done) {
            done(result);
        }
    });
    return true;
}

void UpdateManager::enter(UpdateState state, std::string_view detail,
                          const ProgressCallback& progress) {
    state_ = state;
    spdlog::info("Update stage {}: {}", updateStateName(state), detail);
    if (progress) {
        progress(state, detail);
    }
}

UpdateFailure UpdateManager::fail(UpdateFailure failure) {
    state_ = UpdateState::Failed;
    spdlog::error("Update failed in {} ({}): {}", updateStateName(failure.stage),
                  failureKindName(failure.kind), failure.message);
    for (const auto& error : failure.errors) {
        spdlog::error("  {}", error);
    }
    state_ = UpdateState::Idle;
    return failure;
}

UpdateResult<UpdateOutcome> UpdateManager::updateCycle(const ProgressCallback& progress) {
    state_ = UpdateState::Idle;

    auto active = layout_.activeSlot();
    if (!active) {
        return std::unexpected(fail(active.error()));
    }
    const std::string previous = *active;
    const std::string target = layout_.otherSlot(previous);
    spdlog::info("Active slot {}, installing the new release into {}", previous, target);

    if (config_.repositoryUrl.empty()) {
        return std::unexpected(fail({FailureKind::Configuration, UpdateState::Idle,
                                     "update.repository_url is not configured", {}}));
    }

    enter(UpdateState::Cloning, target, progress);
    if (auto cloned = clone(target); !cloned) {
        layout_.removeSlot(target);
        return std::unexpected(fail(cloned.error()));
    }

    enter(UpdateState::Verifying, target, progress);
    if (auto verified = verify(target); !verified) {
        layout_.removeSlot(target);
        return std::unexpected(fail(verified.error()));
    }

    if (auto switched = switchTo(previous, target, progress); !switched) {
        layout_.removeSlot(target);
        return std::unexpected(fail(switched.error()));
    }

    constexpr std::string_view message = "Update successful. Restarting service.";
    if (auto restarted = restart(progress, message); !restarted) {
        return std::unexpected(fail(restarted.error()));
    }

    state_ = UpdateState::Idle;
    return UpdateOutcome{previous, target, std::string(message)};
}

UpdateResult<UpdateOutcome> UpdateManager::rollbackCycle(
    const std::optional<std::string>& requested, const ProgressCallback& progress) {
    state_ = UpdateState::Idle;

    auto active = layout_.activeSlot();
    if (!active) {
        return std::unexpected(fail(active.error()));
    }
    const std::string previous = *active;
    const std::string target = requested && !requested->empty()
                                   ? *requested
                                   : layout_.otherSlot(previous);

    if (!layout_.isSlotName(target)) {
        return std::unexpected(fail({FailureKind::InvalidTarget, UpdateState::Idle,
                                     "Unknown rollback target '" + target + "'", {}}));
    }
    if (target == previous) {
        return std::unexpected(fail({FailureKind::AlreadyActive, UpdateState::Idle,
                                     "Slot " + target + " is already active", {}}));
    }

    enter(UpdateState::Verifying, target, progress);
    if (!layout_.hasRunnableEntryPoint(target)) {
        return std::unexpected(fail({FailureKind::VerifyFailed, UpdateState::Verifying,
                                     "Slot " + target + " holds no runnable release",
                                     {layout_.entryPointOf(target).string()}}));
    }

    if (auto switched = switchTo(previous, target, progress); !switched) {
        return std::unexpected(fail(switched.error()));
    }

    constexpr std::string_view message = "Rollback successful. Restarting service.";
    if (auto restarted = restart(progress, message); !restarted) {
        return std::unexpected(fail(restarted.error()));
    }

    state_ = UpdateState::Idle;
    return UpdateOutcome{previous, target, std::string(message)};
}

UpdateResult<void> UpdateManager::clone(const std::string& slot) {
    auto path = layout_.slotPath(slot);

    std::error_code ec;
    fs::create_directories(layout_.baseDir(), ec);
    fs::remove_all(path, ec);
    if (ec) {
        return std::unexpected(UpdateFailure{FailureKind::CloneFailed, UpdateState::Cloning,
                                             "Cannot clear slot " + slot, {ec.message()}});
    }

    std::vector<std::string> argv{"git", "clone", "--depth=1"};
    if (!config_.branch.empty()) {
        argv.push_back("--branch");
        argv.push_back(config_.branch);
    }
    argv.push_back(config_.repositoryUrl);
    argv.push_back(path.string());

    system::CommandOptions options;
    options.workingDirectory = layout_.baseDir();
    options.timeout = std::chrono::seconds{config_.commandTimeoutSeconds};

    auto result = runner_->run(argv, options);
    if (!result.ok()) {
        return std::unexpected(UpdateFailure{FailureKind::CloneFailed, UpdateState::Cloning,
                                             "git clone failed", commandErrors(result)});
    }
    spdlog::info("Cloned {} into {}", config_.repositoryUrl, path.string());
    return {};
}

UpdateResult<void> UpdateManager::verify(const std::string& slot) {
    auto path = layout_.slotPath(slot);

    system::CommandOptions options;
    options.workingDirectory = path;
    options.timeout = std::chrono::seconds{config_.commandTimeoutSeconds};
    options.environment = {{"BMTL_SLOT", path.string()}};

    for (const auto& command : config_.verifyCommands) {
        spdlog::info("Verifying {}: {}", slot, command);
        auto result = runner_->shell(command, options);
        if (!result.ok()) {
            return std::unexpected(UpdateFailure{FailureKind::VerifyFailed,
                                                 UpdateState::Verifying,
                                                 "Verification failed: " + command,
                                                 commandErrors(result)});
        }
    }

    if (!layout_.hasRunnableEntryPoint(slot)) {
        return std::unexpected(UpdateFailure{
            FailureKind::VerifyFailed, UpdateState::Verifying,
            "Entry point missing or not executable",
            {layout_.entryPointOf(slot).string()}});
    }
    return {};
}

UpdateResult<void> UpdateManager::switchTo(const std::string& previous,
                                           const std::string& next,
                                           const ProgressCallback& progress) {
    enter(UpdateState::Switching, next, progress);
    if (auto relinked = layout_.relink(next); !relinked) {
        return relinked;
    }

    auto active = layout_.activeSlot();
    if (active && *active == next && layout_.hasRunnableEntryPoint(next)) {
        return {};
    }

    spdlog::error("Post-switch check of {} failed, restoring {}", next, previous);
    UpdateFailure failure{FailureKind::PostSwitchCheckFailed, UpdateState::Switching,
                          "Post-switch check failed; pointer restored to " + previous,
                          {layout_.entryPointOf(next).string()}};
    if (auto restored = layout_.relink(previous); !restored) {
        failure.message = "Post-switch check failed and the pointer could not be restored";
        failure.errors.push_back(restored.error().message);
    }
    return std::unexpected(std::move(failure));
}

UpdateResult<void> UpdateManager::restart(const ProgressCallback& progress,
                                          std::string_view message) {
    enter(UpdateState::Restarting, message, progress);
    std::this_thread::sleep_for(std::chrono::milliseconds{config_.restartDelayMs});
    if (!restarter_ || !restarter_->restartService()) {
        return std::unexpected(UpdateFailure{FailureKind::RestartFailed,
                                             UpdateState::Restarting,
                                             "Service restart request failed", {}});
    }
    return {};
}

}  // namespace bmtl::update
