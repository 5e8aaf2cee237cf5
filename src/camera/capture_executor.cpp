/*
 * capture_executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "capture_executor.hpp"

#include <spdlog/spdlog.h>

#include "store/config_store.hpp"

namespace bmtl::camera {

using store::documents::CAMERA_RESULT;
using store::documents::CAMERA_STATS;
using store::documents::CAMERA_STATUS;

namespace {

json optionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> stringField(const json& j, const char* key) {
    if (auto it = j.find(key); it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

int intField(const json& j, const char* key) {
    if (auto it = j.find(key); it != j.end() && it->is_number_integer()) {
        return it->get<int>();
    }
    return 0;
}

}  // namespace

json CaptureStats::toJson() const {
    return {{"window_start", windowStart ? json(system::formatTimestamp(*windowStart))
                                         : json(nullptr)},
            {"attempted", attempted},
            {"captured", captured},
            {"failed", failed},
            {"last_capture_time", optionalString(lastCaptureTime)},
            {"last_successful_capture", optionalString(lastSuccessfulCapture)}};
}

CaptureStats CaptureStats::fromJson(const json& j) {
    CaptureStats stats;
    if (!j.is_object()) {
        return stats;
    }
    if (auto start = stringField(j, "window_start")) {
        stats.windowStart = system::parseTimestamp(*start);
    }
    stats.attempted = intField(j, "attempted");
    stats.captured = intField(j, "captured");
    stats.failed = intField(j, "failed");
    stats.lastCaptureTime = stringField(j, "last_capture_time");
    stats.lastSuccessfulCapture = stringField(j, "last_successful_capture");
    return stats;
}

int CaptureStats::capturedIn(std::optional<LocalTime> start) const {
    return start && windowStart == start ? captured : 0;
}

CaptureExecutor::CaptureExecutor(store::ConfigStore& store,
                                 std::shared_ptr<CameraController> camera)
    : store_(store), camera_(std::move(camera)) {}

CaptureResult CaptureExecutor::capture(LocalTime windowStart,
                                       const std::optional<std::string>& filename) {
    std::lock_guard lock(mutex_);

    CaptureResult result;
    try {
        result = camera_->capture(filename);
    } catch (const std::exception& e) {
        spdlog::error("Camera capture raised: {}", e.what());
        result = CaptureResult{};
        result.error = e.what();
        result.timestamp = system::nowTimestamp();
    }
    recordOutcome(windowStart, result);
    return result;
}

void CaptureExecutor::recordOutcome(LocalTime windowStart,
                                    const CaptureResult& result) {
    try {
        store_.write(CAMERA_RESULT, result.toJson());

        auto stats = CaptureStats::fromJson(store_.readObject(CAMERA_STATS));
        if (stats.windowStart != windowStart) {
            stats = CaptureStats{};
            stats.windowStart = windowStart;
        }
        ++stats.attempted;
        stats.lastCaptureTime = result.timestamp;
        if (result.success) {
            ++stats.captured;
            stats.lastSuccessfulCapture = result.timestamp;
        } else {
            ++stats.failed;
        }
        store_.write(CAMERA_STATS, stats.toJson());
    } catch (const std::exception& e) {
        spdlog::error("Failed to record capture outcome: {}", e.what());
    }
}

CaptureStats CaptureExecutor::stats() {
    return CaptureStats::fromJson(store_.readObject(CAMERA_STATS));
}

json CaptureExecutor::refreshStatus() {
    json status;
    try {
        status["connected"] = camera_->checkConnection();
    } catch (const std::exception& e) {
        status["connected"] = false;
        status["error"] = e.what();
    }
    status["timestamp"] = system::nowTimestamp();
    store_.write(CAMERA_STATUS, status);
    return status;
}

void CaptureExecutor::seedDocuments() {
    if (!store_.exists(CAMERA_STATS)) {
        store_.write(CAMERA_STATS, CaptureStats{}.toJson());
    }
    if (!store_.exists(CAMERA_STATUS)) {
        store_.write(CAMERA_STATUS, {{"connected", false},
                                     {"timestamp", system::nowTimestamp()}});
    }
    if (!store_.exists(CAMERA_RESULT)) {
        store_.write(CAMERA_RESULT, json::object());
    }
}

}  // namespace bmtl::camera
