/*
 * device_handlers.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "device_handlers.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cmath>
#include <condition_variable>
#include <utility>

#include "camera/capture_executor.hpp"
#include "config/agent_config.hpp"
#include "messaging/topics.hpp"
#include "schedule/schedule_service.hpp"
#include "schedule/scheduler.hpp"
#include "settings_diff.hpp"
#include "store/config_store.hpp"
#include "system/host_info.hpp"
#include "update/update_manager.hpp"
#include "update/version_manager.hpp"

namespace bmtl::dispatch {

namespace commands = messaging::commands;
using store::documents::CAMERA_SETTINGS;
using store::documents::IMAGE_SETTINGS;
using store::documents::SCHEDULE_SETTINGS;

namespace {

// Request key -> stored key, per settings group
struct KeyMapping {
    const char* request;
    const char* stored;
};

constexpr KeyMapping CAMERA_KEYS[] = {{"iso", "iso"},
                                      {"aperture", "aperture"},
                                      {"shutter_speed", "shutter_speed"},
                                      {"whitebalance", "whitebalance"}};
constexpr KeyMapping SCHEDULE_KEYS[] = {{"startTime", "start_time"},
                                        {"endTime", "end_time"},
                                        {"captureInterval", "capture_interval"}};
constexpr KeyMapping IMAGE_KEYS[] = {{"imageSize", "image_size"},
                                     {"quality", "quality"},
                                     {"format", "format"}};

template <size_t N>
json pick(const json& payload, const KeyMapping (&keys)[N]) {
    json picked = json::object();
    for (const auto& key : keys) {
        if (auto it = payload.find(key.request); it != payload.end()) {
            picked[key.stored] = *it;
        }
    }
    return picked;
}

json groupResult(bool success, const std::vector<std::string>& errors) {
    return {{"success", success}, {"errors", errors}};
}

json valueOr(const json& doc, const char* key, json fallback) {
    if (doc.is_object()) {
        if (auto it = doc.find(key); it != doc.end() && !it->is_null()) {
            return *it;
        }
    }
    return fallback;
}

std::optional<std::string> stringField(const json& payload, const char* key) {
    if (auto it = payload.find(key); it != payload.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

json optionalString(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace

DeviceHandlers::DeviceHandlers(HandlerServices services)
    : services_(std::move(services)) {}

DeviceHandlers::~DeviceHandlers() {
    std::lock_guard lock(backgroundMutex_);
    for (auto& action : background_) {
        action.thread.request_stop();
    }
    background_.clear();
}

void DeviceHandlers::registerAll(CommandRouter& router) {
    auto bind = [this](auto method) {
        return [this, method](const Request& request) { return (this->*method)(request); };
    };

    router.add(std::string(commands::SETTINGS_REQUEST_ALL),
               {"all_settings", bind(&DeviceHandlers::settingsRequestAll)});
    router.add(std::string(commands::SETTINGS_REQUEST_INDIVIDUAL),
               {"settings", bind(&DeviceHandlers::settingsRequestIndividual)});
    router.add(std::string(commands::STATUS_REQUEST),
               {"status", bind(&DeviceHandlers::statusRequest)});
    router.add(std::string(commands::SETTINGS_CHANGE),
               {"set_settings_result", bind(&DeviceHandlers::settingsChange)});
    router.add(std::string(commands::SET_SITENAME),
               {"set_sitename_result", bind(&DeviceHandlers::setSiteName)});
    router.add(std::string(commands::SW_UPDATE),
               {"sw_update_result", bind(&DeviceHandlers::softwareUpdate)});
    router.add(std::string(commands::SW_ROLLBACK),
               {"sw_rollback_result", bind(&DeviceHandlers::softwareRollback)});
    router.add(std::string(commands::SW_VERSION_REQUEST),
               {"sw_version_result", bind(&DeviceHandlers::softwareVersion)});
    router.add(std::string(commands::REBOOT_ALL),
               {"reboot_all_result",
                [this](const Request& request) { return reboot(request, true); }});
    router.add(std::string(commands::REBOOT_INDIVIDUAL),
               {"reboot_result",
                [this](const Request& request) { return reboot(request, false); }});
    router.add(std::string(commands::OPTIONS_REQUEST_ALL),
               {"all_options",
                [this](const Request& request) { return options(request, true); }});
    router.add(std::string(commands::OPTIONS_REQUEST_INDIVIDUAL),
               {"options",
                [this](const Request& request) { return options(request, false); }});
    router.add(std::string(commands::WIPER_REQUEST),
               {"wiper_result", bind(&DeviceHandlers::wiper)});
    router.add(std::string(commands::CAMERA_POWER_REQUEST),
               {"camera_power_result", bind(&DeviceHandlers::cameraPower)});
    router.add(std::string(commands::CAPTURE_REQUEST),
               {"capture_result", bind(&DeviceHandlers::captureRequest)});
    router.add(std::string(commands::HEALTH_CHECK),
               {"health", bind(&DeviceHandlers::healthCheck), true});
}

// ============================================================================
// Settings
// ============================================================================

json DeviceHandlers::settingsView() {
    std::map<std::string, std::string> camera;
    try {
        camera = services_.capture.camera().currentSettings();
    } catch (const std::exception& e) {
        spdlog::warn("Cannot read camera settings: {}", e.what());
    }
    auto cameraValue = [&camera](const char* key, const char* fallback) {
        auto it = camera.find(key);
        return it != camera.end() && !it->second.empty() ? it->second
                                                         : std::string(fallback);
    };

    auto scheduleSettings = services_.store.readObject(SCHEDULE_SETTINGS);
    auto schedule = services_.schedule.current();
    auto image = services_.store.readObject(IMAGE_SETTINGS);

    return {{"iso", cameraValue("iso", "auto")},
            {"aperture", cameraValue("aperture", "f/2.8")},
            {"shutter_speed", cameraValue("shutter_speed", "1/60")},
            {"startTime", valueOr(scheduleSettings, "start_time",
                                  schedule.startTime.toString())},
            {"endTime", valueOr(scheduleSettings, "end_time",
                                schedule.endTime.toString())},
            {"captureInterval", valueOr(scheduleSettings, "capture_interval",
                                        schedule.captureIntervalMinutes)},
            {"imageSize", valueOr(image, "image_size", "1920x1080")},
            {"quality", valueOr(image, "quality", "85")},
            {"format", valueOr(image, "format", "jpeg")}};
}

std::optional<json> DeviceHandlers::settingsRequestAll(const Request& request) {
    auto body = responseBody("all_settings");
    body["modules"] = {{request.moduleId, settingsView()}};
    return body;
}

std::optional<json> DeviceHandlers::settingsRequestIndividual(const Request& request) {
    auto body = responseBody("settings", request.moduleId);
    body["settings"] = settingsView();
    return body;
}

std::optional<json> DeviceHandlers::statusRequest(const Request& request) {
    auto body = responseBody("status");
    body["system_status"] = "normal";
    body["connected_modules"] = json::array({request.moduleId});
    return body;
}

std::optional<json> DeviceHandlers::settingsChange(const Request& request) {
    json payload = request.payload;
    payload.erase("request_id");
    spdlog::info("Settings change requested: {}", payload.dump());

    json results = json::object();
    std::vector<std::string> allErrors;

    // Camera
    auto cameraSettings = pick(payload, CAMERA_KEYS);
    if (!cameraSettings.empty()) {
        try {
            auto applied = services_.capture.camera().applySettings(cameraSettings);
            results["camera_settings"] = applied.toJson();
            allErrors.insert(allErrors.end(), applied.errors.begin(),
                             applied.errors.end());
        } catch (const std::exception& e) {
            results["camera_settings"] = groupResult(false, {e.what()});
            allErrors.emplace_back(e.what());
        }
    } else {
        results["camera_settings"] = groupResult(true, {});
    }

    // Schedule
    auto scheduleSettings = pick(payload, SCHEDULE_KEYS);
    results["schedule_settings"] = groupResult(true, {});
    if (!scheduleSettings.empty()) {
        try {
            auto merged = mergeDocument(services_.store, SCHEDULE_SETTINGS, scheduleSettings);
            results["schedule_settings"]["changed"] = merged.changed;
            if (merged.written) {
                auto next = services_.schedule.applySettings(
                    schedule::ScheduleSettings::fromJson(merged.merged), services_.clock());
                results["schedule_settings"]["schedule"] = next.toJson();
            }
        } catch (const std::exception& e) {
            results["schedule_settings"] = groupResult(false, {e.what()});
            allErrors.emplace_back(e.what());
        }
    }

    // Image
    auto imageSettings = pick(payload, IMAGE_KEYS);
    results["image_settings"] = groupResult(true, {});
    if (!imageSettings.empty()) {
        try {
            auto merged = mergeDocument(services_.store, IMAGE_SETTINGS, imageSettings);
            results["image_settings"]["changed"] = merged.changed;
        } catch (const std::exception& e) {
            results["image_settings"] = groupResult(false, {e.what()});
            allErrors.emplace_back(e.what());
        }
    }

    // The full request is kept for the record.
    if (!payload.empty()) {
        try {
            (void)mergeDocument(services_.store, CAMERA_SETTINGS, payload);
        } catch (const std::exception& e) {
            spdlog::error("Cannot record camera_settings: {}", e.what());
            allErrors.emplace_back(e.what());
        }
    }

    bool success = true;
    for (const auto& [group, result] : results.items()) {
        success = success && result.value("success", false);
    }
    success = success && allErrors.empty();

    auto body = responseBody("set_settings_result", request.moduleId);
    body["success"] = success;
    body["message"] = success ? "Settings applied successfully"
                              : "Some settings failed to apply";
    body["results"] = results;
    body["errors"] = allErrors;
    return body;
}

// ============================================================================
// Site name, reboot and software lifecycle
// ============================================================================

std::optional<json> DeviceHandlers::setSiteName(const Request& request) {
    auto siteName = stringField(request.payload, "site_name");
    if (!siteName || siteName->empty()) {
        return failureBody("set_sitename_result", request.moduleId,
                           "site_name is required");
    }

    config::persistSiteName(services_.config.sourcePath, *siteName);
    services_.config.device.location = *siteName;
    spdlog::info("Site name updated to '{}', restarting service", *siteName);

    runLater("service restart", [this] {
        if (!services_.host.restartService()) {
            spdlog::error("Service restart after site name change failed");
        }
    });

    auto body = responseBody("set_sitename_result", request.moduleId);
    body["success"] = true;
    body["message"] = "Site name updated to '" + *siteName + "'. Service will restart.";
    body["new_sitename"] = *siteName;
    return body;
}

std::optional<json> DeviceHandlers::reboot(const Request& request, bool all) {
    const char* responseType = all ? "reboot_all_result" : "reboot_result";
    const auto moduleId = all ? std::string{} : request.moduleId;

    if (!services_.config.update.allowReboot) {
        spdlog::warn("Reboot requested but disabled by configuration");
        return failureBody(responseType, moduleId, "Reboot is disabled on this device");
    }

    runLater("reboot", [this] {
        if (!services_.host.rebootHost()) {
            spdlog::error("Reboot request failed");
        }
    });

    auto body = responseBody(responseType, moduleId);
    body["success"] = true;
    if (all) {
        body["message"] = "Global reboot initiated successfully";
        body["affected_modules"] = json::array({request.moduleId});
    } else {
        body["message"] = "Reboot initiated successfully";
    }
    return body;
}

std::optional<json> DeviceHandlers::softwareUpdate(const Request& request) {
    auto publish = services_.publish;
    auto reply = [request, publish](json body) {
        if (publish) {
            publish(makeResponse(commands::SW_UPDATE, request.deviceId,
                                 std::move(body), request.requestId));
        }
    };

    auto progress = [request, reply](update::UpdateState state, std::string_view detail) {
        if (state == update::UpdateState::Restarting) {
            auto body = responseBody("sw_update_result", request.moduleId);
            body["success"] = true;
            body["status"] = "restarting";
            body["message"] = std::string(detail);
            reply(std::move(body));
        }
    };

    auto done = [request, reply](const update::UpdateResult<update::UpdateOutcome>& result) {
        if (result) {
            spdlog::info("Update finished, now on slot {}", result->activeSlot);
            return;
        }
        auto body = failureBody("sw_update_result", request.moduleId,
                                "Update failed: " + result.error().message,
                                result.error().errors);
        body["status"] = "failed";
        body["failure"] = result.error().toJson();
        reply(std::move(body));
    };

    if (!services_.updates.startUpdate(done, progress)) {
        auto body = failureBody("sw_update_result", request.moduleId,
                                "Update already in progress");
        body["status"] = "rejected";
        return body;
    }

    auto body = responseBody("sw_update_result", request.moduleId);
    body["success"] = true;
    body["status"] = "in_progress";
    body["message"] = "Software update process initiated";
    return body;
}

std::optional<json> DeviceHandlers::softwareRollback(const Request& request) {
    std::optional<std::string> target = stringField(request.payload, "target");

    auto publish = services_.publish;
    auto progress = [request, publish](update::UpdateState state, std::string_view detail) {
        if (state != update::UpdateState::Restarting || !publish) {
            return;
        }
        auto body = responseBody("sw_rollback_result", request.moduleId);
        body["success"] = true;
        body["status"] = "restarting";
        body["message"] = std::string(detail);
        publish(makeResponse(commands::SW_ROLLBACK, request.deviceId, std::move(body),
                             request.requestId));
    };

    auto result = services_.updates.runRollback(target, progress);
    if (result) {
        // Already reported before the restart.
        return std::nullopt;
    }
    auto body = failureBody("sw_rollback_result", request.moduleId,
                            "Rollback failed: " + result.error().message,
                            result.error().errors);
    body["failure"] = result.error().toJson();
    return body;
}

std::optional<json> DeviceHandlers::softwareVersion(const Request& request) {
    auto info = services_.versions.current();
    auto body = responseBody("sw_version_result", request.moduleId);
    body["success"] = true;
    body.update(info.toJson());
    return body;
}

// ============================================================================
// Camera
// ============================================================================

std::optional<json> DeviceHandlers::options(const Request& request, bool all) {
    auto result = services_.capture.camera().options();
    if (all) {
        auto body = responseBody("all_options");
        body["modules"] = {{request.moduleId, result.optionsJson()}};
        return body;
    }
    auto body = responseBody("options", request.moduleId);
    body["options"] = result.optionsJson();
    return body;
}

std::optional<json> DeviceHandlers::wiper(const Request& request) {
    // No wiper actuator is wired on current units.
    spdlog::info("Wiper operation simulated");
    auto body = responseBody("wiper_result", request.moduleId);
    body["success"] = true;
    body["message"] = "Wiper operation completed";
    return body;
}

std::optional<json> DeviceHandlers::cameraPower(const Request& request) {
    auto state = services_.capture.camera().powerState();
    auto body = responseBody("camera_power_result", request.moduleId);
    body["success"] = true;
    body["message"] = "Camera power status checked";
    body["new_state"] = camera::powerStateName(state);
    return body;
}

std::optional<json> DeviceHandlers::captureRequest(const Request& request) {
    auto now = schedule::floorToMinute(services_.clock());
    auto schedule = services_.schedule.current();
    auto windowStart = schedule.windowStart.value_or(now);

    auto result = services_.capture.capture(windowStart,
                                            stringField(request.payload, "filename"));
    auto body = responseBody("capture_result", request.moduleId);
    body.update(result.toJson());
    body["message"] = result.success ? "Capture completed" : "Capture failed";
    return body;
}

// ============================================================================
// Health
// ============================================================================

json DeviceHandlers::healthPayload(const std::string& moduleId) {
    const auto now = services_.clock();
    auto schedule = services_.schedule.current();
    auto stats = services_.capture.stats();
    auto counters = schedule::windowCounters(schedule, now,
                                             stats.capturedIn(schedule.windowStart));

    auto body = responseBody("health", moduleId);
    body["status"] = "online";

    if (auto usage = system::storageUsage(services_.config.device.storagePath)) {
        body["storage_used"] = std::round(usage->usedPercent * 10.0) / 10.0;
    } else {
        body["storage_used"] = nullptr;
    }
    if (auto temperature = system::cpuTemperature()) {
        body["temperature"] = *temperature;
    } else {
        body["temperature"] = nullptr;
    }

    body["planned_total"] = counters.plannedTotal;
    body["planned_due"] = counters.plannedDue;
    body["captured"] = counters.captured;
    body["missed"] = counters.missed;
    body["last_capture_time"] = optionalString(stats.lastSuccessfulCapture);
    if (auto boot = system::bootTime()) {
        body["last_boot_time"] = system::formatTimestamp(*boot);
    } else {
        body["last_boot_time"] = nullptr;
    }
    body["site_name"] = services_.config.device.location;
    body["sw_version"] = services_.versions.current().version;
    body["timestamp"] = system::formatTimestamp(now);
    return body;
}

std::optional<json> DeviceHandlers::healthCheck(const Request& request) {
    return healthPayload(request.moduleId);
}

// ============================================================================
// Background actions
// ============================================================================

void DeviceHandlers::runLater(std::string what, std::function<void()> action) {
    auto delay = services_.actionDelay;
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard lock(backgroundMutex_);
    pruneFinished();
    background_.push_back(BackgroundAction{
        finished,
        std::jthread([what = std::move(what), action = std::move(action), delay,
                      finished](std::stop_token stop) {
            std::mutex waitMutex;
            std::condition_variable_any wake;
            std::unique_lock waitLock(waitMutex);
            wake.wait_for(waitLock, stop, delay, [] { return false; });
            if (stop.stop_requested()) {
                spdlog::info("Pending {} cancelled", what);
            } else {
                try {
                    action();
                } catch (const std::exception& e) {
                    spdlog::error("Delayed {} failed: {}", what, e.what());
                }
            }
            finished->store(true);
        })});
}

std::size_t DeviceHandlers::pendingActions() {
    std::lock_guard lock(backgroundMutex_);
    pruneFinished();
    return background_.size();
}

// Caller holds backgroundMutex_.
void DeviceHandlers::pruneFinished() {
    std::erase_if(background_,
                  [](const BackgroundAction& action) { return action.finished->load(); });
}

}  // namespace bmtl::dispatch
