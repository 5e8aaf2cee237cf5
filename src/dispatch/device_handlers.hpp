/*
 * device_handlers.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-07

Description: Worker-side handlers for every device command

**************************************************/

#ifndef BMTL_DISPATCH_DEVICE_HANDLERS_HPP
#define BMTL_DISPATCH_DEVICE_HANDLERS_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "command_router.hpp"
#include "system/local_time.hpp"

namespace bmtl::config {
struct AgentConfig;
}
namespace bmtl::store {
class ConfigStore;
}
namespace bmtl::camera {
class CaptureExecutor;
}
namespace bmtl::schedule {
class ScheduleService;
}
namespace bmtl::update {
class UpdateManager;
class VersionManager;
class HostControl;
}  // namespace bmtl::update

namespace bmtl::dispatch {

/// Hands a response to the messaging process.
using ResponseSink = std::function<void(ipc::Response)>;

struct HandlerServices {
    config::AgentConfig& config;
    store::ConfigStore& store;
    camera::CaptureExecutor& capture;
    schedule::ScheduleService& schedule;
    update::UpdateManager& updates;
    update::VersionManager& versions;
    update::HostControl& host;
    ResponseSink publish;
    /// Pause between replying and rebooting or restarting
    std::chrono::milliseconds actionDelay{2000};
    std::function<system::LocalTime()> clock = system::localNow;
};

/**
 * @brief The device command set
 *
 * Long-running work (software update, delayed reboot or restart) runs on
 * background threads that report through the response sink. Delayed
 * actions still pending at destruction are cancelled.
 */
class DeviceHandlers {
public:
    explicit DeviceHandlers(HandlerServices services);
    ~DeviceHandlers();

    DeviceHandlers(const DeviceHandlers&) = delete;
    DeviceHandlers& operator=(const DeviceHandlers&) = delete;

    /**
     * @brief Register every command in @p router
     */
    void registerAll(CommandRouter& router);

    /**
     * @brief Merged camera, schedule and image settings
     */
    [[nodiscard]] json settingsView();

    [[nodiscard]] json healthPayload(const std::string& moduleId);

    /**
     * @brief Delayed actions that have not finished yet
     */
    [[nodiscard]] std::size_t pendingActions();

private:
    std::optional<json> settingsRequestAll(const Request& request);
    std::optional<json> settingsRequestIndividual(const Request& request);
    std::optional<json> statusRequest(const Request& request);
    std::optional<json> settingsChange(const Request& request);
    std::optional<json> setSiteName(const Request& request);
    std::optional<json> softwareUpdate(const Request& request);
    std::optional<json> softwareRollback(const Request& request);
    std::optional<json> softwareVersion(const Request& request);
    std::optional<json> reboot(const Request& request, bool all);
    std::optional<json> options(const Request& request, bool all);
    std::optional<json> wiper(const Request& request);
    std::optional<json> cameraPower(const Request& request);
    std::optional<json> captureRequest(const Request& request);
    std::optional<json> healthCheck(const Request& request);

    struct BackgroundAction {
        std::shared_ptr<std::atomic<bool>> finished;
        std::jthread thread;
    };

    void runLater(std::string what, std::function<void()> action);
    void pruneFinished();

    HandlerServices services_;
    std::mutex backgroundMutex_;
    std::vector<BackgroundAction> background_;
};

}  // namespace bmtl::dispatch

#endif  // BMTL_DISPATCH_DEVICE_HANDLERS_HPP
