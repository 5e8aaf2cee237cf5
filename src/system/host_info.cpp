/*
 * host_info.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "host_info.hpp"

#include <cmath>
#include <fstream>
#include <regex>

#include <sys/statvfs.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace bmtl::system {

std::string hostname() {
    char buffer[256] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return {};
    }
    return buffer;
}

std::string deriveDeviceId(std::string_view host) {
    static const std::regex pattern(R"(bmotion(\d+))",
                                    std::regex::icase);
    std::string text(host);
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return "01";
    }

    std::string digits = match[1].str();
    // Strip leading zeros before re-padding so "bmotion007" becomes "07".
    auto first = digits.find_first_not_of('0');
    digits = first == std::string::npos ? "0" : digits.substr(first);
    if (digits.size() < 2) {
        digits.insert(0, 2 - digits.size(), '0');
    }
    return digits;
}

std::optional<LocalTime> bootTime(const std::filesystem::path& uptimeFile) {
    std::ifstream in(uptimeFile);
    double uptimeSeconds = 0.0;
    if (!(in >> uptimeSeconds)) {
        spdlog::debug("Cannot read uptime from {}", uptimeFile.string());
        return std::nullopt;
    }

    auto boot = std::chrono::system_clock::now() -
                std::chrono::seconds(
                    static_cast<long long>(std::llround(uptimeSeconds)));
    return toLocalTime(boot);
}

std::optional<double> cpuTemperature(const std::filesystem::path& sensor) {
    std::ifstream in(sensor);
    long milliDegrees = 0;
    if (!(in >> milliDegrees)) {
        return std::nullopt;
    }
    return std::round(static_cast<double>(milliDegrees) / 100.0) / 10.0;
}

std::optional<StorageUsage> storageUsage(const std::filesystem::path& path) {
    struct statvfs st {};
    if (::statvfs(path.c_str(), &st) != 0) {
        spdlog::debug("statvfs failed for {}", path.string());
        return std::nullopt;
    }

    StorageUsage usage;
    usage.totalBytes = static_cast<uint64_t>(st.f_blocks) * st.f_frsize;
    usage.freeBytes = static_cast<uint64_t>(st.f_bavail) * st.f_frsize;
    uint64_t available = static_cast<uint64_t>(st.f_bfree) * st.f_frsize;
    usage.usedBytes = usage.totalBytes - available;
    if (usage.totalBytes > 0) {
        usage.usedPercent =
            std::round(static_cast<double>(usage.usedBytes) * 1000.0 /
                       static_cast<double>(usage.totalBytes)) /
            10.0;
    }
    return usage;
}

}  // namespace bmtl::system
