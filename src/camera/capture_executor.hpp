/*
 * capture_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-18

Description: Runs captures and records their outcome in the store

**************************************************/

#ifndef BMTL_CAMERA_CAPTURE_EXECUTOR_HPP
#define BMTL_CAMERA_CAPTURE_EXECUTOR_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "camera_controller.hpp"
#include "system/local_time.hpp"

namespace bmtl::store {
class ConfigStore;
}

namespace bmtl::camera {

using system::LocalTime;

/**
 * @brief Capture counters of one operating window (camera_stats)
 */
struct CaptureStats {
    std::optional<LocalTime> windowStart;
    int attempted{0};
    int captured{0};
    int failed{0};
    std::optional<std::string> lastCaptureTime;
    std::optional<std::string> lastSuccessfulCapture;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static CaptureStats fromJson(const json& j);

    /// Successful captures if these counters belong to @p windowStart
    [[nodiscard]] int capturedIn(std::optional<LocalTime> windowStart) const;
};

class CaptureExecutor {
public:
    CaptureExecutor(store::ConfigStore& store,
                    std::shared_ptr<CameraController> camera);

    /**
     * @brief Capture one photo for the window opening at @p windowStart
     *
     * Writes camera_result and updates camera_stats. Counters restart when
     * the window differs from the one recorded. Never throws for camera or
     * store faults.
     */
    CaptureResult capture(LocalTime windowStart,
                          const std::optional<std::string>& filename = std::nullopt);

    [[nodiscard]] CaptureStats stats();

    /**
     * @brief Refresh camera_status from the camera
     */
    json refreshStatus();

    /**
     * @brief Create the camera documents missing on first boot
     */
    void seedDocuments();

    [[nodiscard]] CameraController& camera() noexcept { return *camera_; }

private:
    void recordOutcome(LocalTime windowStart, const CaptureResult& result);

    store::ConfigStore& store_;
    std::shared_ptr<CameraController> camera_;
    std::mutex mutex_;
};

}  // namespace bmtl::camera

#endif  // BMTL_CAMERA_CAPTURE_EXECUTOR_HPP
