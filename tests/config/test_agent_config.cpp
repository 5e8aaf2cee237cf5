/*
 * test_agent_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Tests for loading the device configuration

**************************************************/

#include <gtest/gtest.h>

#include "config/agent_config.hpp"
#include "config/components/document_loader.hpp"
#include "config/core/exception.hpp"

#include <filesystem>
#include <fstream>
#include <map>

using namespace bmtl::config;
namespace fs = std::filesystem;

class AgentConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("bmtl_config_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    fs::path writeFile(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path dir_;
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(AgentConfigTest, MissingFileYieldsDefaults) {
    auto cfg = AgentConfig::load(dir_ / "absent.yaml");
    EXPECT_EQ(cfg.mqtt.host, "localhost");
    EXPECT_EQ(cfg.mqtt.port, 1883);
    EXPECT_EQ(cfg.device.location, "unknown");
    EXPECT_EQ(cfg.health.intervalSeconds, 60);
    EXPECT_EQ(cfg.mqtt.transport, "mqtt");
    EXPECT_TRUE(cfg.mqtt.caFile.empty());
    EXPECT_EQ(cfg.sourcePath, dir_ / "absent.yaml");
}

TEST_F(AgentConfigTest, LoadsYamlSections) {
    auto path = writeFile("config.yaml", R"(
device:
  id: "07"
  location: ridge-north
mqtt:
  host: broker.local
  port: 8883
  use_tls: yes
  ca_file: /etc/bmtl-device/ca.pem
update:
  slot_a: v1
  slot_b: v2
  verify_commands:
    - ./check.sh
  allow_reboot: true
schedule:
  poll_interval_seconds: 30
)");

    auto cfg = AgentConfig::load(path);
    EXPECT_EQ(cfg.device.id, "07");
    EXPECT_EQ(cfg.device.location, "ridge-north");
    EXPECT_EQ(cfg.mqtt.host, "broker.local");
    EXPECT_EQ(cfg.mqtt.port, 8883);
    EXPECT_TRUE(cfg.mqtt.useTls);
    EXPECT_EQ(cfg.mqtt.caFile, "/etc/bmtl-device/ca.pem");
    EXPECT_EQ(cfg.update.verifyCommands, (std::vector<std::string>{"./check.sh"}));
    EXPECT_TRUE(cfg.update.allowReboot);
    EXPECT_EQ(cfg.schedule.pollIntervalSeconds, 30);
    EXPECT_EQ(cfg.moduleId(), "bmotion07");
}

TEST_F(AgentConfigTest, LoadsJsonByExtension) {
    auto path = writeFile("config.json", R"({"mqtt": {"client_id": "cam-7"}})");
    EXPECT_TRUE(isJsonPath(path));
    auto cfg = AgentConfig::load(path);
    EXPECT_EQ(cfg.mqtt.clientId, "cam-7");
}

TEST_F(AgentConfigTest, MalformedYamlThrows) {
    auto path = writeFile("broken.yaml", "mqtt: [unclosed\n");
    EXPECT_THROW((void)AgentConfig::load(path), InvalidConfigException);
}

TEST_F(AgentConfigTest, WrongValueTypeThrows) {
    auto path = writeFile("typed.yaml", "mqtt:\n  port: not-a-number\n");
    EXPECT_THROW((void)AgentConfig::load(path), InvalidConfigException);
}

TEST_F(AgentConfigTest, YamlScalarsAreTyped) {
    auto doc = parseYaml("a: on\nb: 12\nc: 1.5\nd: ~\ne: text\n");
    EXPECT_TRUE(doc["a"].is_boolean());
    EXPECT_EQ(doc["b"], 12);
    EXPECT_DOUBLE_EQ(doc["c"].get<double>(), 1.5);
    EXPECT_TRUE(doc["d"].is_null());
    EXPECT_EQ(doc["e"], "text");
}

// ============================================================================
// Overrides
// ============================================================================

TEST_F(AgentConfigTest, EnvironmentOverridesBroker) {
    std::map<std::string, std::string> env{{"MQTT_HOST", "10.0.0.5"},
                                           {"MQTT_PORT", "1884"},
                                           {"MQTT_USERNAME", "cam"},
                                           {"MQTT_USE_TLS", "TRUE"}};
    AgentConfig cfg;
    cfg.applyEnvironment([&env](const std::string& name) -> std::optional<std::string> {
        if (auto it = env.find(name); it != env.end()) {
            return it->second;
        }
        return std::nullopt;
    });

    EXPECT_EQ(cfg.mqtt.host, "10.0.0.5");
    EXPECT_EQ(cfg.mqtt.port, 1884);
    EXPECT_EQ(cfg.mqtt.username, "cam");
    EXPECT_TRUE(cfg.mqtt.useTls);
}

TEST_F(AgentConfigTest, InvalidPortOverrideIsIgnored) {
    AgentConfig cfg;
    cfg.applyEnvironment([](const std::string& name) -> std::optional<std::string> {
        if (name == "MQTT_PORT") {
            return "eighty";
        }
        return std::nullopt;
    });
    EXPECT_EQ(cfg.mqtt.port, 1883);
}

TEST_F(AgentConfigTest, ExplicitInfoLevelReplacesConfiguredDebug) {
    AgentConfig cfg;
    cfg.logging.level = "debug";
    cfg.applyLogOverrides(std::string("info"), false);
    EXPECT_EQ(cfg.logging.level, "info");
}

TEST_F(AgentConfigTest, AbsentLevelKeepsConfiguredOne) {
    AgentConfig cfg;
    cfg.logging.level = "warn";
    cfg.applyLogOverrides(std::nullopt, false);
    EXPECT_EQ(cfg.logging.level, "warn");
    cfg.applyLogOverrides(std::string(), false);
    EXPECT_EQ(cfg.logging.level, "warn");

    cfg.applyLogOverrides(std::string("error"), true);
    EXPECT_EQ(cfg.logging.level, "debug");
}

TEST_F(AgentConfigTest, DeviceIdFromHostName) {
    AgentConfig cfg;
    cfg.resolveDeviceId("bmotion3");
    EXPECT_EQ(cfg.device.id, "03");

    AgentConfig other;
    other.resolveDeviceId("raspberrypi");
    EXPECT_EQ(other.device.id, "01");

    AgentConfig configured;
    configured.device.id = "12";
    configured.resolveDeviceId("bmotion3");
    EXPECT_EQ(configured.device.id, "12");
}

// ============================================================================
// Site name
// ============================================================================

TEST_F(AgentConfigTest, PersistSiteNameKeepsOtherKeys) {
    auto path = writeFile("config.yaml", "device:\n  id: \"05\"\nmqtt:\n  host: broker\n");

    persistSiteName(path, "valley-east");

    auto cfg = AgentConfig::load(path);
    EXPECT_EQ(cfg.device.location, "valley-east");
    EXPECT_EQ(cfg.device.id, "05");
    EXPECT_EQ(cfg.mqtt.host, "broker");
}

TEST_F(AgentConfigTest, PersistSiteNameCreatesMissingFile) {
    auto path = dir_ / "new.yaml";
    persistSiteName(path, "summit");
    EXPECT_EQ(AgentConfig::load(path).device.location, "summit");
}
