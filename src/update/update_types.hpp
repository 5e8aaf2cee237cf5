/*
 * update_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: States and results of the blue/green update cycle

**************************************************/

#ifndef BMTL_UPDATE_UPDATE_TYPES_HPP
#define BMTL_UPDATE_UPDATE_TYPES_HPP

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace bmtl::update {

using json = nlohmann::json;

enum class UpdateState { Idle, Cloning, Verifying, Switching, Restarting, Failed };

[[nodiscard]] constexpr std::string_view updateStateName(UpdateState state) noexcept {
    switch (state) {
        case UpdateState::Idle: return "idle";
        case UpdateState::Cloning: return "cloning";
        case UpdateState::Verifying: return "verifying";
        case UpdateState::Switching: return "switching";
        case UpdateState::Restarting: return "restarting";
        case UpdateState::Failed: return "failed";
    }
    return "unknown";
}

enum class FailureKind {
    AlreadyInProgress,
    Configuration,   ///< Pointer missing or naming neither slot
    InvalidTarget,   ///< Rollback target is not a slot name
    AlreadyActive,
    CloneFailed,
    VerifyFailed,
    SwitchFailed,
    PostSwitchCheckFailed,
    RestartFailed
};

[[nodiscard]] constexpr std::string_view failureKindName(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::AlreadyInProgress: return "already_in_progress";
        case FailureKind::Configuration: return "configuration_error";
        case FailureKind::InvalidTarget: return "invalid_target";
        case FailureKind::AlreadyActive: return "already_active";
        case FailureKind::CloneFailed: return "clone_failed";
        case FailureKind::VerifyFailed: return "verify_failed";
        case FailureKind::SwitchFailed: return "switch_failed";
        case FailureKind::PostSwitchCheckFailed: return "post_switch_check_failed";
        case FailureKind::RestartFailed: return "restart_failed";
    }
    return "unknown";
}

/**
 * @brief Structured failure of an update or rollback attempt
 */
struct UpdateFailure {
    FailureKind kind{FailureKind::Configuration};
    UpdateState stage{UpdateState::Idle};  ///< Stage that failed
    std::string message;
    std::vector<std::string> errors;

    [[nodiscard]] json toJson() const {
        return {{"reason", std::string(failureKindName(kind))},
                {"stage", std::string(updateStateName(stage))},
                {"message", message},
                {"errors", errors}};
    }
};

struct UpdateOutcome {
    std::string previousSlot;
    std::string activeSlot;
    std::string message;
};

template <typename T>
using UpdateResult = std::expected<T, UpdateFailure>;

}  // namespace bmtl::update

#endif  // BMTL_UPDATE_UPDATE_TYPES_HPP
