/*
 * document_names.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_STORE_DOCUMENT_NAMES_HPP
#define BMTL_STORE_DOCUMENT_NAMES_HPP

#include <algorithm>
#include <array>
#include <string_view>

namespace bmtl::store {

namespace documents {
inline constexpr std::string_view CAMERA_SCHEDULE = "camera_schedule";
inline constexpr std::string_view CAMERA_DEFAULT_CONFIG = "camera_default_config";
inline constexpr std::string_view DEVICE_SETTINGS = "device_settings";
inline constexpr std::string_view SCHEDULE_SETTINGS = "schedule_settings";
inline constexpr std::string_view IMAGE_SETTINGS = "image_settings";
inline constexpr std::string_view CAMERA_SETTINGS = "camera_settings";
inline constexpr std::string_view CAMERA_COMMAND = "camera_command";
inline constexpr std::string_view CAMERA_RESULT = "camera_result";
inline constexpr std::string_view CAMERA_STATS = "camera_stats";
inline constexpr std::string_view CAMERA_STATUS = "camera_status";
}  // namespace documents

enum class StorageClass {
    Persistent,  ///< Survives reboots and tmpfs clearing
    Volatile     ///< Mailboxes and transient statistics
};

/// Documents kept in the persistent directory; everything else is volatile.
inline constexpr std::array<std::string_view, 3> PERSISTENT_DOCUMENTS{
    documents::CAMERA_SCHEDULE, documents::CAMERA_DEFAULT_CONFIG,
    documents::DEVICE_SETTINGS};

[[nodiscard]] constexpr StorageClass storageClassOf(
    std::string_view name) noexcept {
    return std::ranges::find(PERSISTENT_DOCUMENTS, name) !=
                   PERSISTENT_DOCUMENTS.end()
               ? StorageClass::Persistent
               : StorageClass::Volatile;
}

}  // namespace bmtl::store

#endif  // BMTL_STORE_DOCUMENT_NAMES_HPP
