/*
 * slot_layout.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "slot_layout.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "exception.hpp"

namespace bmtl::update {

namespace fs = std::filesystem;

namespace {

bool isPlainName(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos;
}

void syncDirectory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return;
    }
    if (::fsync(fd) != 0) {
        spdlog::warn("fsync of {} failed: {}", dir.string(), std::strerror(errno));
    }
    ::close(fd);
}

}  // namespace

SlotLayout::SlotLayout(const config::UpdateConfig& config)
    : baseDir_(config.baseDir),
      slotA_(config.slotA),
      slotB_(config.slotB),
      pointer_(config.pointer),
      entryPoint_(config.entryPoint) {
    if (!isPlainName(slotA_) || !isPlainName(slotB_) || !isPlainName(pointer_)) {
        THROW_UPDATE_CONFIG_ERROR("Slot and pointer names must be plain names: ",
                                  slotA_, ", ", slotB_, ", ", pointer_);
    }
    if (slotA_ == slotB_ || slotA_ == pointer_ || slotB_ == pointer_) {
        THROW_UPDATE_CONFIG_ERROR("Slot and pointer names must differ");
    }
    if (baseDir_.empty()) {
        THROW_UPDATE_CONFIG_ERROR("update.base_dir is empty");
    }
    if (entryPoint_.empty() || entryPoint_.is_absolute()) {
        THROW_UPDATE_CONFIG_ERROR("update.entry_point must be a relative path");
    }
}

UpdateResult<std::string> SlotLayout::activeSlot() const {
    auto link = pointerPath();
    std::error_code ec;
    if (!fs::is_symlink(fs::symlink_status(link, ec))) {
        return std::unexpected(UpdateFailure{
            FailureKind::Configuration, UpdateState::Idle,
            "Activation pointer " + link.string() + " is missing or not a symlink",
            {}});
    }

    auto target = fs::read_symlink(link, ec);
    if (ec) {
        return std::unexpected(UpdateFailure{
            FailureKind::Configuration, UpdateState::Idle,
            "Cannot read activation pointer: " + ec.message(), {}});
    }

    auto name = target.filename().string();
    if (name.empty()) {
        name = target.parent_path().filename().string();
    }
    if (!isSlotName(name)) {
        return std::unexpected(UpdateFailure{
            FailureKind::Configuration, UpdateState::Idle,
            "Activation pointer references unknown slot '" + target.string() + "'",
            {}});
    }
    return name;
}

std::string SlotLayout::otherSlot(const std::string& slot) const {
    return slot == slotA_ ? slotB_ : slotA_;
}

bool SlotLayout::isSlotName(const std::string& name) const noexcept {
    return name == slotA_ || name == slotB_;
}

fs::path SlotLayout::slotPath(const std::string& slot) const {
    return baseDir_ / slot;
}

fs::path SlotLayout::pointerPath() const {
    return baseDir_ / pointer_;
}

fs::path SlotLayout::entryPointOf(const std::string& slot) const {
    return slotPath(slot) / entryPoint_;
}

bool SlotLayout::hasRunnableEntryPoint(const std::string& slot) const {
    auto entry = entryPointOf(slot);
    std::error_code ec;
    return fs::is_regular_file(entry, ec) && ::access(entry.c_str(), X_OK) == 0;
}

UpdateResult<void> SlotLayout::relink(const std::string& slot) const {
    if (!isSlotName(slot)) {
        return std::unexpected(UpdateFailure{FailureKind::InvalidTarget,
                                             UpdateState::Switching,
                                             "Unknown slot '" + slot + "'", {}});
    }

    auto temp = baseDir_ / ("." + pointer_ + ".tmp-" + std::to_string(::getpid()));
    std::error_code ec;
    fs::remove(temp, ec);

    if (::symlink(slot.c_str(), temp.c_str()) != 0) {
        return std::unexpected(UpdateFailure{
            FailureKind::SwitchFailed, UpdateState::Switching,
            "Cannot create " + temp.string() + ": " + std::strerror(errno), {}});
    }
    if (::rename(temp.c_str(), pointerPath().c_str()) != 0) {
        std::string reason = std::strerror(errno);
        ::unlink(temp.c_str());
        return std::unexpected(UpdateFailure{
            FailureKind::SwitchFailed, UpdateState::Switching,
            "Cannot replace activation pointer: " + reason, {}});
    }
    syncDirectory(baseDir_);

    spdlog::info("Activation pointer {} -> {}", pointerPath().string(), slot);
    return {};
}

bool SlotLayout::removeSlot(const std::string& slot) const {
    if (!isSlotName(slot)) {
        return false;
    }
    if (auto active = activeSlot(); active && *active == slot) {
        spdlog::error("Refusing to remove the active slot {}", slot);
        return false;
    }
    std::error_code ec;
    fs::remove_all(slotPath(slot), ec);
    if (ec) {
        spdlog::error("Failed to remove slot {}: {}", slot, ec.message());
        return false;
    }
    return true;
}

}  // namespace bmtl::update
