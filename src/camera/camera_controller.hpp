/*
 * camera_controller.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-18

Description: Narrow interface to the still camera

**************************************************/

#ifndef BMTL_CAMERA_CAMERA_CONTROLLER_HPP
#define BMTL_CAMERA_CAMERA_CONTROLLER_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace bmtl::camera {

using json = nlohmann::json;

struct CaptureResult {
    bool success{false};
    std::optional<std::string> filename;
    std::optional<std::string> filepath;
    std::optional<std::string> error;
    std::string timestamp;

    [[nodiscard]] json toJson() const;
};

struct ApplyResult {
    bool success{true};
    json applied = json::object();
    std::vector<std::string> errors;

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Metadata of one camera configuration entry
 */
struct CameraOption {
    std::string label;
    std::string type;
    bool readOnly{false};
    std::string current;
    std::vector<std::string> choices;
    std::optional<std::string> error;

    [[nodiscard]] json toJson() const;
};

struct OptionsResult {
    bool success{false};
    std::map<std::string, CameraOption> options;

    [[nodiscard]] json optionsJson() const;
};

enum class PowerState { On, Off };

[[nodiscard]] constexpr const char* powerStateName(PowerState state) noexcept {
    return state == PowerState::On ? "on" : "off";
}

/**
 * @brief Camera collaborator used by the capture executor and the handlers
 *
 * Implementations report failures in their results; they throw only for
 * unexpected faults, which callers turn into failed results.
 */
class CameraController {
public:
    virtual ~CameraController() = default;

    virtual bool checkConnection() = 0;

    /**
     * @param filename File name inside the upload directory; generated from
     *        the current time when empty
     */
    virtual CaptureResult capture(
        const std::optional<std::string>& filename) = 0;

    /**
     * @param settings Flat object of setting name to value
     */
    virtual ApplyResult applySettings(const json& settings) = 0;

    /// Current values keyed iso, aperture, shutter_speed, whitebalance, imageformat
    virtual std::map<std::string, std::string> currentSettings() = 0;

    virtual OptionsResult options() = 0;

    virtual PowerState powerState() = 0;
};

}  // namespace bmtl::camera

#endif  // BMTL_CAMERA_CAMERA_CONTROLLER_HPP
