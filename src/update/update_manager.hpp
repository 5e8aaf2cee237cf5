/*
 * update_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Blue/green software update and rollback

**************************************************/

#ifndef BMTL_UPDATE_UPDATE_MANAGER_HPP
#define BMTL_UPDATE_UPDATE_MANAGER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "config/sections/update_config.hpp"
#include "host_control.hpp"
#include "slot_layout.hpp"
#include "system/command_runner.hpp"
#include "update_types.hpp"

namespace bmtl::update {

/**
 * @brief Called on every stage transition
 *
 * The Restarting notification is delivered before the restart request so
 * the caller can publish the success result first.
 */
using ProgressCallback = std::function<void(UpdateState, std::string_view)>;

/// Receives the terminal result of a background cycle.
using CompletionCallback = std::function<void(const UpdateResult<UpdateOutcome>&)>;

/**
 * @brief Blue/green update state machine
 *
 * Idle -> Cloning -> Verifying -> Switching -> Restarting, with any error
 * going through Failed back to Idle. Only one update or rollback runs at a
 * time; a second request is rejected with AlreadyInProgress, never queued.
 *
 * The live slot is never modified. The inactive slot is replaced during
 * Cloning and deleted again on any failure. The pointer is moved only after
 * verification and is moved back if the post-switch check fails.
 */
class UpdateManager {
public:
    UpdateManager(const config::UpdateConfig& config,
                  std::shared_ptr<system::CommandRunner> runner,
                  std::shared_ptr<RestartRequester> restarter);
    ~UpdateManager();

    UpdateManager(const UpdateManager&) = delete;
    UpdateManager& operator=(const UpdateManager&) = delete;

    /**
     * @brief Run a full update cycle on the calling thread
     */
    UpdateResult<UpdateOutcome> runUpdate(const ProgressCallback& progress = {});

    /**
     * @brief Re-activate @p target, or the inactive slot when empty
     */
    UpdateResult<UpdateOutcome> runRollback(
        const std::optional<std::string>& target,
        const ProgressCallback& progress = {});

    /**
     * @brief Claim the guard and run the update on a background thread
     *
     * @return false if another cycle holds the guard; nothing is started
     */
    bool startUpdate(CompletionCallback done, ProgressCallback progress = {});

    /**
     * @brief Background variant of runRollback()
     */
    bool startRollback(std::optional<std::string> target, CompletionCallback done,
                       ProgressCallback progress = {});

    [[nodiscard]] bool inProgress() const noexcept { return busy_.load(); }

    [[nodiscard]] UpdateState state() const noexcept { return state_.load(); }

    [[nodiscard]] const SlotLayout& layout() const noexcept { return layout_; }

    /**
     * @brief Wait for a background cycle to finish
     */
    void join();

private:
    class Guard;

    UpdateResult<UpdateOutcome> updateCycle(const ProgressCallback& progress);
    UpdateResult<UpdateOutcome> rollbackCycle(const std::optional<std::string>& target,
                                              const ProgressCallback& progress);
    UpdateResult<void> switchTo(const std::string& previous, const std::string& next,
                                const ProgressCallback& progress);
    UpdateResult<void> restart(const ProgressCallback& progress,
                               std::string_view message);
    UpdateResult<void> clone(const std::string& slot);
    UpdateResult<void> verify(const std::string& slot);

    void enter(UpdateState state, std::string_view detail,
               const ProgressCallback& progress);
    UpdateFailure fail(UpdateFailure failure);
    bool launch(std::function<UpdateResult<UpdateOutcome>()> cycle,
                CompletionCallback done);

    config::UpdateConfig config_;
    SlotLayout layout_;
    std::shared_ptr<system::CommandRunner> runner_;
    std::shared_ptr<RestartRequester> restarter_;

    std::atomic<bool> busy_{false};
    std::atomic<UpdateState> state_{UpdateState::Idle};
    std::mutex threadMutex_;
    std::jthread worker_;
};

}  // namespace bmtl::update

#endif  // BMTL_UPDATE_UPDATE_MANAGER_HPP
