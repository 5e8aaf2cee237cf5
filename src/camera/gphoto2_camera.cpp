/*
 * gphoto2_camera.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "gphoto2_camera.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

#include "system/local_time.hpp"

namespace bmtl::camera {

using namespace std::chrono_literals;

namespace {

constexpr std::string_view GPHOTO2 = "gphoto2";

// Setting name (with aliases) -> gphoto2 config path
constexpr std::array<std::pair<std::string_view, std::string_view>, 9>
    SETTING_PATHS{{
        {"iso", "/main/imgsettings/iso"},
        {"aperture", "/main/capturesettings/exposurecompensation"},
        {"shutterspeed", "/main/capturesettings/shutterspeed"},
        {"shutter_speed", "/main/capturesettings/shutterspeed"},
        {"whitebalance", "/main/imgsettings/whitebalance"},
        {"imagequality", "/main/capturesettings/imagequality"},
        {"image_quality", "/main/capturesettings/imagequality"},
        {"focusmode2", "/main/capturesettings/focusmode2"},
        {"focus_mode", "/main/capturesettings/focusmode2"},
    }};

// Reported option -> gphoto2 config path
constexpr std::array<std::pair<std::string_view, std::string_view>, 5>
    OPTION_PATHS{{
        {"resolution", "/main/imgsettings/imagesize"},
        {"iso", "/main/imgsettings/iso"},
        {"aperture", "/main/capturesettings/exposurecompensation"},
        {"image_quality", "/main/capturesettings/imagequality"},
        {"focus_mode", "/main/capturesettings/focusmode2"},
    }};

// Reported setting -> gphoto2 config name
constexpr std::array<std::pair<std::string_view, std::string_view>, 5>
    CURRENT_SETTINGS{{
        {"iso", "iso"},
        {"aperture", "aperture"},
        {"shutter_speed", "shutterspeed"},
        {"whitebalance", "whitebalance"},
        {"imageformat", "imageformat"},
    }};

std::optional<std::string_view> settingPath(std::string_view key) {
    for (const auto& [name, path] : SETTING_PATHS) {
        if (name == key) {
            return path;
        }
    }
    return std::nullopt;
}

std::string trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(begin, end - begin + 1));
}

std::string valueAfterColon(std::string_view line) {
    auto colon = line.find(':');
    return colon == std::string_view::npos ? std::string{}
                                           : trim(line.substr(colon + 1));
}

std::string scalarText(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

system::CommandOptions withTimeout(std::chrono::seconds timeout) {
    system::CommandOptions options;
    options.timeout = timeout;
    return options;
}

}  // namespace

GPhoto2Camera::GPhoto2Camera(std::filesystem::path uploadDir,
                             std::shared_ptr<system::CommandRunner> runner)
    : uploadDir_(std::move(uploadDir)), runner_(std::move(runner)) {}

bool GPhoto2Camera::checkConnection() {
    std::lock_guard lock(mutex_);
    return checkConnectionLocked();
}

bool GPhoto2Camera::checkConnectionLocked() {
    auto result = runner_->run({std::string(GPHOTO2), "--auto-detect"},
                               withTimeout(10s));
    bool connected = result.ok() && result.output.find("usb:") != std::string::npos;
    if (connected) {
        spdlog::debug("Camera detected");
    } else {
        spdlog::warn("No camera detected");
    }
    return connected;
}

CaptureResult GPhoto2Camera::capture(const std::optional<std::string>& filename) {
    std::lock_guard lock(mutex_);

    CaptureResult result;
    std::string name = filename && !filename->empty()
                           ? *filename
                           : "photo_" + system::formatCompact(system::localNow()) + ".jpg";
    auto filepath = uploadDir_ / name;

    std::error_code ec;
    std::filesystem::create_directories(uploadDir_, ec);
    if (ec) {
        spdlog::error("Cannot create upload directory {}: {}",
                      uploadDir_.string(), ec.message());
    }

    auto run = runner_->run({std::string(GPHOTO2), "--capture-image-and-download",
                             "--filename", filepath.string()},
                            withTimeout(60s));
    result.timestamp = system::nowTimestamp();
    if (run.ok()) {
        result.success = true;
        result.filename = name;
        result.filepath = filepath.string();
        spdlog::info("Photo captured: {}", name);
    } else {
        result.error = run.timedOut ? std::string("gphoto2 capture timed out")
                                    : trim(run.errorOutput);
        if (result.error->empty()) {
            result.error = "gphoto2 exited with " + std::to_string(run.exitCode);
        }
        spdlog::error("Photo capture failed: {}", *result.error);
    }
    return result;
}

ApplyResult GPhoto2Camera::applySettings(const json& settings) {
    std::lock_guard lock(mutex_);

    ApplyResult result;
    if (!settings.is_object()) {
        result.success = false;
        result.errors.emplace_back("settings must be an object");
        return result;
    }
    if (!checkConnectionLocked()) {
        result.success = false;
        result.errors.emplace_back("Camera not connected");
        return result;
    }

    for (const auto& [key, value] : settings.items()) {
        auto path = settingPath(key);
        if (!path) {
            spdlog::debug("Skipping unsupported camera setting {}", key);
            continue;
        }
        auto text = scalarText(value);
        auto run = runner_->run({std::string(GPHOTO2), "--set-config",
                                 std::string(*path) + "=" + text},
                                withTimeout(30s));
        if (run.ok()) {
            result.applied[key] = value;
            spdlog::info("Applied {}={}", key, text);
        } else {
            auto message = "Failed to set " + key + "=" + text + ": " +
                           trim(run.errorOutput);
            spdlog::error("{}", message);
            result.errors.push_back(std::move(message));
        }
    }
    result.success = result.errors.empty();
    return result;
}

std::map<std::string, std::string> GPhoto2Camera::currentSettings() {
    std::lock_guard lock(mutex_);

    std::map<std::string, std::string> settings;
    if (!checkConnectionLocked()) {
        return settings;
    }
    for (const auto& [key, config] : CURRENT_SETTINGS) {
        auto option = readOption(std::string(config));
        if (!option.error) {
            settings.emplace(std::string(key), option.current);
        }
    }
    return settings;
}

OptionsResult GPhoto2Camera::options() {
    std::lock_guard lock(mutex_);

    OptionsResult result;
    if (!checkConnectionLocked()) {
        return result;
    }
    for (const auto& [key, path] : OPTION_PATHS) {
        auto option = readOption(std::string(path));
        if (!option.error) {
            result.success = true;
        }
        result.options.emplace(std::string(key), std::move(option));
    }
    return result;
}

PowerState GPhoto2Camera::powerState() {
    std::lock_guard lock(mutex_);
    return checkConnectionLocked() ? PowerState::On : PowerState::Off;
}

CameraOption GPhoto2Camera::readOption(const std::string& configPath) {
    auto run = runner_->run({std::string(GPHOTO2), "--get-config", configPath},
                            withTimeout(10s));
    if (!run.ok()) {
        CameraOption option;
        auto error = trim(run.errorOutput);
        option.error = error.empty()
                           ? "gphoto2 returned " + std::to_string(run.exitCode)
                           : error;
        spdlog::warn("Failed to read {}: {}", configPath, *option.error);
        return option;
    }
    return parseConfigOutput(run.output);
}

CameraOption GPhoto2Camera::parseConfigOutput(const std::string& text) {
    CameraOption option;
    std::istringstream stream(text);
    std::string raw;
    while (std::getline(stream, raw)) {
        auto line = trim(raw);
        if (line.empty()) {
            continue;
        }
        if (line.starts_with("Label:")) {
            option.label = valueAfterColon(line);
        } else if (line.starts_with("Type:")) {
            option.type = valueAfterColon(line);
            for (auto& c : option.type) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
        } else if (line.starts_with("Readonly:")) {
            auto value = valueAfterColon(line);
            option.readOnly = value == "1" || value == "true" || value == "True";
        } else if (line.starts_with("Current:")) {
            option.current = valueAfterColon(line);
        } else if (line.starts_with("Choice:")) {
            // "Choice: <index> <value>"
            auto first = line.find(' ');
            auto second = first == std::string::npos ? first : line.find(' ', first + 1);
            if (second != std::string::npos) {
                option.choices.push_back(trim(std::string_view(line).substr(second + 1)));
            }
        }
    }
    return option;
}

}  // namespace bmtl::camera
