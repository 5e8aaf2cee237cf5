/*
 * agent_processes.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "agent_processes.hpp"

#include <filesystem>
#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

#include "camera/capture_executor.hpp"
#include "camera/gphoto2_camera.hpp"
#include "camera/upload_mover.hpp"
#include "dispatch/command_router.hpp"
#include "dispatch/device_handlers.hpp"
#include "dispatch/worker.hpp"
#include "logging/logging_manager.hpp"
#include "messaging/loopback_transport.hpp"
#include "messaging/messaging_daemon.hpp"
#include "messaging/mosquitto_transport.hpp"
#include "schedule/schedule_service.hpp"
#include "store/exception.hpp"
#include "system/command_runner.hpp"
#include "system/local_time.hpp"
#include "update/host_control.hpp"
#include "update/update_manager.hpp"
#include "update/version_manager.hpp"

namespace bmtl::app {

namespace fs = std::filesystem;

int runWorker(config::AgentConfig& config, store::ConfigStore& store,
              ipc::TaskQueue& tasks, ipc::ResponseQueue& responses,
              const std::atomic<bool>& stop) {
    auto runner = std::make_shared<system::ProcessCommandRunner>();
    auto camera = std::make_shared<camera::GPhoto2Camera>(config.device.uploadPath, runner);
    camera::CaptureExecutor capture(store, camera);

    schedule::ScheduleService schedule(
        store, [&capture](system::LocalTime planned, system::LocalTime windowStart) {
            spdlog::info("Scheduled capture for {}", system::formatTimestamp(planned));
            return capture.capture(windowStart).success;
        });

    try {
        capture.seedDocuments();
        auto initial = schedule.initialize(system::localNow());
        spdlog::info("Schedule {} to {} every {} min", initial.startTime.toString(),
                     initial.endTime.toString(), initial.captureIntervalMinutes);
        capture.refreshStatus();
    } catch (const store::StoreException& e) {
        spdlog::critical("Cannot prepare the document store: {}", e.what());
        return 1;
    }

    auto host = std::make_shared<update::SystemdRestarter>(config.update.serviceName,
                                                           config.update.useSudo, runner);
    update::UpdateManager updates(config.update, runner, host);
    update::VersionManager versions(config.update, runner);

    dispatch::CommandRouter router;
    dispatch::Worker worker(tasks, responses, router);
    int exitCode = 0;
    {
        dispatch::DeviceHandlers handlers(dispatch::HandlerServices{
            config, store, capture, schedule, updates, versions, *host, worker.sink()});
        handlers.registerAll(router);

        const auto pollInterval = std::chrono::seconds{
            config.schedule.pollIntervalSeconds > 0 ? config.schedule.pollIntervalSeconds : 60};
        std::jthread scheduler([&schedule, pollInterval](std::stop_token token) {
            schedule.run(token, pollInterval);
        });

        camera::UploadMover mover(camera::UploadMoverOptions{
            config.device.uploadPath, config.device.backupPath,
            std::chrono::seconds{config.device.backupSettleSeconds},
            std::chrono::seconds{config.device.backupScanSeconds}});
        std::jthread backup([&mover](std::stop_token token) { mover.run(token); });

        exitCode = worker.run(stop);
        backup.request_stop();
        scheduler.request_stop();
    }
    // A running update reports through the worker; let it finish first.
    updates.join();
    return exitCode;
}

int runMessaging(const config::AgentConfig& config, ipc::TaskQueue& tasks,
                 ipc::ResponseQueue& responses, const std::atomic<bool>& stop) {
    std::unique_ptr<messaging::MessagingTransport> transport;
    if (config.mqtt.transport == "loopback") {
        spdlog::warn("Loopback transport selected; no broker traffic");
        transport = std::make_unique<messaging::LoopbackTransport>();
    } else {
        messaging::MosquittoOptions options;
        options.host = config.mqtt.host;
        options.port = config.mqtt.port;
        options.clientId = config.mqtt.clientId + "-" + config.device.id;
        options.username = config.mqtt.username;
        options.password = config.mqtt.password;
        options.useTls = config.mqtt.useTls;
        options.caFile = config.mqtt.caFile;
        options.keepaliveSeconds = config.mqtt.keepaliveSeconds;
        try {
            transport = std::make_unique<messaging::MosquittoTransport>(std::move(options));
        } catch (const std::exception& e) {
            spdlog::critical("Cannot create the broker client: {}", e.what());
            return 1;
        }
    }

    std::shared_ptr<spdlog::logger> messageLog;
    if (config.mqtt.logAllMessages) {
        logging::SinkConfig sink;
        sink.name = "messages";
        sink.type = "rotating_file";
        sink.pattern = "%v";
        sink.file_path = (fs::path(config.logging.logDir) / config.mqtt.messageLog).string();
        sink.max_file_size = config.logging.maxFileSize;
        sink.max_files = config.logging.maxFiles;
        messageLog = logging::LoggingManager::getInstance().createDedicatedLogger(
            "messages", sink);
        if (!messageLog) {
            spdlog::warn("Message log disabled: cannot open {}", sink.file_path);
        }
    }

    messaging::MessagingDaemon daemon(messaging::DaemonOptions::fromConfig(config),
                                      *transport, tasks, responses, messageLog);
    return daemon.run(stop);
}

}  // namespace bmtl::app
