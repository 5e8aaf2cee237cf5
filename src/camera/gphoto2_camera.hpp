/*
 * gphoto2_camera.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_CAMERA_GPHOTO2_CAMERA_HPP
#define BMTL_CAMERA_GPHOTO2_CAMERA_HPP

#include <filesystem>
#include <memory>
#include <mutex>

#include "camera_controller.hpp"
#include "system/command_runner.hpp"

namespace bmtl::camera {

/**
 * @brief CameraController driving the gphoto2 command line tool
 *
 * Captures are downloaded straight into the upload directory as
 * photo_YYYYMMDD_HHMMSS.jpg. Calls are serialized since gphoto2 holds the
 * USB device exclusively.
 */
class GPhoto2Camera : public CameraController {
public:
    GPhoto2Camera(std::filesystem::path uploadDir,
                  std::shared_ptr<system::CommandRunner> runner);

    bool checkConnection() override;
    CaptureResult capture(const std::optional<std::string>& filename) override;
    ApplyResult applySettings(const json& settings) override;
    std::map<std::string, std::string> currentSettings() override;
    OptionsResult options() override;
    PowerState powerState() override;

    /**
     * @brief Parse `gphoto2 --get-config` output
     */
    [[nodiscard]] static CameraOption parseConfigOutput(const std::string& text);

private:
    bool checkConnectionLocked();
    CameraOption readOption(const std::string& configPath);

    std::filesystem::path uploadDir_;
    std::shared_ptr<system::CommandRunner> runner_;
    std::mutex mutex_;
};

}  // namespace bmtl::camera

#endif  // BMTL_CAMERA_GPHOTO2_CAMERA_HPP
