/*
 * agent_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "agent_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <spdlog/spdlog.h>

#include "components/document_loader.hpp"
#include "core/exception.hpp"
#include "system/host_info.hpp"

namespace bmtl::config {

std::optional<std::string> processEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

json AgentConfig::toJson() const {
    json root = json::object();
    root[std::string(DeviceConfig::PATH)] = device.toJson();
    root[std::string(MqttConfig::PATH)] = mqtt.toJson();
    root[std::string(ReconnectConfig::PATH)] = reconnect.toJson();
    root[std::string(StoreConfig::PATH)] = store.toJson();
    root[std::string(ScheduleConfig::PATH)] = schedule.toJson();
    root[std::string(HealthConfig::PATH)] = health.toJson();
    root[std::string(UpdateConfig::PATH)] = update.toJson();
    root[std::string(LoggingConfig::PATH)] = logging.toJson();
    return root;
}

AgentConfig AgentConfig::fromJson(const json& root) {
    AgentConfig cfg;
    try {
        cfg.device = DeviceConfig::fromRoot(root);
        cfg.mqtt = MqttConfig::fromRoot(root);
        cfg.reconnect = ReconnectConfig::fromRoot(root);
        cfg.store = StoreConfig::fromRoot(root);
        cfg.schedule = ScheduleConfig::fromRoot(root);
        cfg.health = HealthConfig::fromRoot(root);
        cfg.update = UpdateConfig::fromRoot(root);
        cfg.logging = LoggingConfig::fromRoot(root);
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIG_EXCEPTION("Invalid configuration value: ",
                                       e.what());
    }
    return cfg;
}

AgentConfig AgentConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::warn("Configuration file {} not found, using defaults",
                     path.string());
        AgentConfig cfg;
        cfg.sourcePath = path;
        return cfg;
    }

    auto cfg = fromJson(loadDocument(path));
    cfg.sourcePath = path;
    spdlog::info("Configuration loaded from {}", path.string());
    return cfg;
}

void AgentConfig::applyEnvironment(const EnvLookup& lookup) {
    if (auto host = lookup("MQTT_HOST")) {
        mqtt.host = *host;
    }
    if (auto port = lookup("MQTT_PORT")) {
        try {
            mqtt.port = std::stoi(*port);
        } catch (const std::logic_error&) {
            spdlog::warn("Ignoring invalid MQTT_PORT '{}'", *port);
        }
    }
    if (auto user = lookup("MQTT_USERNAME")) {
        mqtt.username = *user;
    }
    if (auto password = lookup("MQTT_PASSWORD")) {
        mqtt.password = *password;
    }
    if (auto tls = lookup("MQTT_USE_TLS")) {
        std::string value = *tls;
        std::ranges::transform(value, value.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        mqtt.useTls = value == "true";
    }
}

void AgentConfig::applyLogOverrides(const std::optional<std::string>& level,
                                    bool debug) {
    if (level && !level->empty()) {
        logging.level = *level;
    }
    if (debug) {
        logging.level = "debug";
    }
}

void AgentConfig::resolveDeviceId(std::string_view host) {
    if (!device.id.empty()) {
        return;
    }
    device.id = system::deriveDeviceId(host);
    spdlog::info("Device id derived from host name '{}': {}", host, device.id);
}

std::string AgentConfig::moduleId() const { return "bmotion" + device.id; }

void persistSiteName(const std::filesystem::path& path,
                     const std::string& siteName) {
    json root = json::object();
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        root = loadDocument(path);
        if (!root.is_object()) {
            THROW_INVALID_CONFIG_EXCEPTION("Configuration root of ",
                                           path.string(),
                                           " is not a mapping");
        }
    }

    if (!root.contains("device") || !root["device"].is_object()) {
        root["device"] = json::object();
    }
    root["device"]["location"] = siteName;
    saveDocument(path, root);
    spdlog::info("Site name set to '{}' in {}", siteName, path.string());
}

}  // namespace bmtl::config
