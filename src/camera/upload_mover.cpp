/*
 * upload_mover.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "upload_mover.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <mutex>
#include <set>
#include <system_error>

namespace bmtl::camera {

namespace fs = std::filesystem;

UploadMover::UploadMover(UploadMoverOptions options) : options_(std::move(options)) {
    if (options_.settle < std::chrono::seconds::zero()) {
        options_.settle = std::chrono::seconds::zero();
    }
    if (options_.scanInterval <= std::chrono::seconds::zero()) {
        options_.scanInterval = std::chrono::seconds{20};
    }
}

bool UploadMover::isCapture(const fs::path& path) const {
    auto extension = path.extension().string();
    std::ranges::transform(extension, extension.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return std::ranges::find(options_.extensions, extension) !=
           options_.extensions.end();
}

int UploadMover::scanOnce(FileClock::time_point now) {
    std::error_code ec;
    fs::create_directories(options_.uploadDir, ec);
    fs::create_directories(options_.backupDir, ec);
    if (ec) {
        spdlog::warn("Cannot create backup directory {}: {}",
                     options_.backupDir.string(), ec.message());
        return 0;
    }

    int moved = 0;
    std::set<std::string> seen;
    std::error_code scanError;
    for (const auto& entry : fs::directory_iterator(options_.uploadDir, scanError)) {
        std::error_code entryError;
        if (!entry.is_regular_file(entryError) || !isCapture(entry.path())) {
            continue;
        }
        auto name = entry.path().filename().string();
        auto size = entry.file_size(entryError);
        if (entryError) {
            continue;
        }
        auto modified = entry.last_write_time(entryError);
        if (entryError) {
            continue;
        }
        seen.insert(name);

        auto it = observed_.find(name);
        if (it == observed_.end() || it->second.size != size) {
            observed_[name] = Observation{size, now};
            continue;
        }
        if (now - modified < options_.settle || now - it->second.since < options_.settle) {
            continue;
        }

        if (moveToBackup(entry.path())) {
            ++moved;
            seen.erase(name);
        }
    }
    if (scanError) {
        spdlog::warn("Cannot scan {}: {}", options_.uploadDir.string(),
                     scanError.message());
    }

    std::erase_if(observed_, [&seen](const auto& item) {
        return !seen.contains(item.first);
    });
    return moved;
}

bool UploadMover::moveToBackup(const fs::path& source) {
    auto target = options_.backupDir / source.filename();
    std::error_code ec;
    fs::rename(source, target, ec);
    if (ec == std::errc::cross_device_link) {
        ec.clear();
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::remove(source, ec);
        }
    }
    if (ec) {
        spdlog::warn("Failed to move {} to {}: {}", source.string(), target.string(),
                     ec.message());
        return false;
    }
    spdlog::info("Moved uploaded file to backup: {}", source.filename().string());
    return true;
}

void UploadMover::run(std::stop_token stop) {
    std::mutex waitMutex;
    std::condition_variable_any wake;

    spdlog::info("Upload mover started: {} -> {}", options_.uploadDir.string(),
                 options_.backupDir.string());
    while (!stop.stop_requested()) {
        try {
            scanOnce(FileClock::now());
        } catch (const std::exception& e) {
            spdlog::error("Upload mover pass failed: {}", e.what());
        }

        std::unique_lock lock(waitMutex);
        wake.wait_for(lock, stop, options_.scanInterval, [] { return false; });
    }
    spdlog::info("Upload mover stopped");
}

}  // namespace bmtl::camera
