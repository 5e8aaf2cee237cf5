/*
 * camera_controller.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "camera_controller.hpp"

namespace bmtl::camera {

json CaptureResult::toJson() const {
    json j;
    j["success"] = success;
    j["filename"] = filename ? json(*filename) : json(nullptr);
    j["filepath"] = filepath ? json(*filepath) : json(nullptr);
    if (error) {
        j["error"] = *error;
    }
    j["timestamp"] = timestamp;
    return j;
}

json ApplyResult::toJson() const {
    return {{"success", success},
            {"applied_settings", applied},
            {"errors", errors}};
}

json CameraOption::toJson() const {
    json j = {{"label", label},
              {"type", type},
              {"read_only", readOnly},
              {"current", current},
              {"choices", choices}};
    if (error) {
        j["error"] = *error;
    }
    return j;
}

json OptionsResult::optionsJson() const {
    json j = json::object();
    if (!success) {
        return j;
    }
    for (const auto& [key, option] : options) {
        j[key] = option.toJson();
    }
    return j;
}

}  // namespace bmtl::camera
