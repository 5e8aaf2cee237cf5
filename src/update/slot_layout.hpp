/*
 * slot_layout.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_UPDATE_SLOT_LAYOUT_HPP
#define BMTL_UPDATE_SLOT_LAYOUT_HPP

#include <filesystem>
#include <string>

#include "config/sections/update_config.hpp"
#include "update_types.hpp"

namespace bmtl::update {

/**
 * @brief Two release slots and the symlink naming the live one
 *
 * base_dir/
 *   slot_a/    release A
 *   slot_b/    release B
 *   pointer -> slot_a | slot_b
 */
class SlotLayout {
public:
    /**
     * @throws UpdateConfigException when the slot names are empty, equal,
     *         or not plain directory names
     */
    explicit SlotLayout(const config::UpdateConfig& config);

    /**
     * @brief Slot the pointer currently resolves to
     *
     * A missing pointer, one that is not a symlink, or one naming neither
     * slot is a Configuration failure.
     */
    [[nodiscard]] UpdateResult<std::string> activeSlot() const;

    [[nodiscard]] std::string otherSlot(const std::string& slot) const;

    [[nodiscard]] bool isSlotName(const std::string& name) const noexcept;

    [[nodiscard]] std::filesystem::path slotPath(const std::string& slot) const;

    [[nodiscard]] std::filesystem::path pointerPath() const;

    [[nodiscard]] std::filesystem::path entryPointOf(const std::string& slot) const;

    /**
     * @brief Entry point exists in @p slot and is executable
     */
    [[nodiscard]] bool hasRunnableEntryPoint(const std::string& slot) const;

    /**
     * @brief Atomically repoint the pointer at @p slot
     *
     * A sibling temporary symlink is renamed over the pointer, so readers
     * see either the old or the new target.
     */
    [[nodiscard]] UpdateResult<void> relink(const std::string& slot) const;

    /**
     * @brief Delete a slot's contents; refuses the active slot
     */
    bool removeSlot(const std::string& slot) const;

    [[nodiscard]] const std::filesystem::path& baseDir() const noexcept {
        return baseDir_;
    }

private:
    std::filesystem::path baseDir_;
    std::string slotA_;
    std::string slotB_;
    std::string pointer_;
    std::filesystem::path entryPoint_;
};

}  // namespace bmtl::update

#endif  // BMTL_UPDATE_SLOT_LAYOUT_HPP
