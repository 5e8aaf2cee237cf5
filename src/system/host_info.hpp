/*
 * host_info.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_SYSTEM_HOST_INFO_HPP
#define BMTL_SYSTEM_HOST_INFO_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "local_time.hpp"

namespace bmtl::system {

struct StorageUsage {
    uint64_t totalBytes{0};
    uint64_t usedBytes{0};
    uint64_t freeBytes{0};
    double usedPercent{0.0};
};

[[nodiscard]] std::string hostname();

/**
 * @brief Derive the two-digit unit id from a `bmotion<N>` host name
 *
 * Returns "01" when the host name carries no number.
 */
[[nodiscard]] std::string deriveDeviceId(std::string_view host);

/**
 * @brief Local time of the last boot, from /proc/uptime
 */
[[nodiscard]] std::optional<LocalTime> bootTime(
    const std::filesystem::path& uptimeFile = "/proc/uptime");

/**
 * @brief SoC temperature in degrees Celsius
 */
[[nodiscard]] std::optional<double> cpuTemperature(
    const std::filesystem::path& sensor =
        "/sys/class/thermal/thermal_zone0/temp");

[[nodiscard]] std::optional<StorageUsage> storageUsage(
    const std::filesystem::path& path);

}  // namespace bmtl::system

#endif  // BMTL_SYSTEM_HOST_INFO_HPP
