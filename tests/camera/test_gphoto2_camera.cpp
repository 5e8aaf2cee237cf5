/*
 * test_gphoto2_camera.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Tests for the gphoto2 camera driver with a scripted runner

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "camera/gphoto2_camera.hpp"
#include "support/mocks.hpp"

using namespace bmtl::camera;
using namespace bmtl::test;
using ::testing::_;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Return;

namespace {

constexpr const char* AUTO_DETECT =
    "Model                          Port\n"
    "----------------------------------------------------------\n"
    "Canon EOS 80D                  usb:001,004\n";

constexpr const char* ISO_CONFIG =
    "Label: ISO Speed\n"
    "Readonly: 0\n"
    "Type: RADIO\n"
    "Current: 400\n"
    "Choice: 0 Auto\n"
    "Choice: 1 100\n"
    "Choice: 2 400\n"
    "END\n";

auto argvIs(const std::string& flag) {
    return ::testing::Truly([flag](const std::vector<std::string>& argv) {
        return argv.size() > 1 && argv[1] == flag;
    });
}

}  // namespace

class GPhoto2CameraTest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_shared<::testing::NiceMock<MockCommandRunner>>();
        camera_ = std::make_unique<GPhoto2Camera>(scratch_.path(), runner_);
    }

    void cameraPresent(bool present) {
        ON_CALL(*runner_, run(argvIs("--auto-detect"), _))
            .WillByDefault(Return(succeeded(present ? AUTO_DETECT : "Model  Port\n")));
    }

    ScratchDir scratch_{"gphoto2"};
    std::shared_ptr<::testing::NiceMock<MockCommandRunner>> runner_;
    std::unique_ptr<GPhoto2Camera> camera_;
};

// ============================================================================
// Output parsing
// ============================================================================

TEST(GPhoto2ParseTest, ParsesRadioOption) {
    auto option = GPhoto2Camera::parseConfigOutput(ISO_CONFIG);
    EXPECT_EQ(option.label, "ISO Speed");
    EXPECT_EQ(option.type, "radio");
    EXPECT_FALSE(option.readOnly);
    EXPECT_EQ(option.current, "400");
    EXPECT_THAT(option.choices, ElementsAre("Auto", "100", "400"));
}

TEST(GPhoto2ParseTest, ChoicesMayContainSpaces) {
    auto option = GPhoto2Camera::parseConfigOutput(
        "Label: Image Format\nType: MENU\nReadonly: 1\nCurrent: Large Fine JPEG\n"
        "Choice: 0 Large Fine JPEG\nChoice: 1 RAW + Large Fine JPEG\n");
    EXPECT_TRUE(option.readOnly);
    EXPECT_THAT(option.choices, ElementsAre("Large Fine JPEG", "RAW + Large Fine JPEG"));
}

// ============================================================================
// Commands
// ============================================================================

TEST_F(GPhoto2CameraTest, DetectsCameraOnUsb) {
    cameraPresent(true);
    EXPECT_TRUE(camera_->checkConnection());
    EXPECT_EQ(camera_->powerState(), PowerState::On);

    cameraPresent(false);
    EXPECT_FALSE(camera_->checkConnection());
    EXPECT_EQ(camera_->powerState(), PowerState::Off);
}

TEST_F(GPhoto2CameraTest, CaptureDownloadsIntoUploadDirectory) {
    std::vector<std::string> seen;
    EXPECT_CALL(*runner_, run(argvIs("--capture-image-and-download"), _))
        .WillOnce([&seen](const std::vector<std::string>& argv,
                      const bmtl::system::CommandOptions&) {
            seen = argv;
            return succeeded();
        });

    auto result = camera_->capture(std::string("manual.jpg"));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.filename, "manual.jpg");
    EXPECT_EQ(result.filepath, (scratch_.path() / "manual.jpg").string());
    EXPECT_THAT(seen, Contains((scratch_.path() / "manual.jpg").string()));
}

TEST_F(GPhoto2CameraTest, GeneratedFileNameUsesTimestamp) {
    EXPECT_CALL(*runner_, run(argvIs("--capture-image-and-download"), _))
        .WillOnce(Return(succeeded()));

    auto result = camera_->capture(std::nullopt);
    ASSERT_TRUE(result.filename.has_value());
    EXPECT_THAT(*result.filename, ::testing::StartsWith("photo_"));
    EXPECT_THAT(*result.filename, ::testing::EndsWith(".jpg"));
}

TEST_F(GPhoto2CameraTest, CaptureFailureCarriesToolError) {
    EXPECT_CALL(*runner_, run(argvIs("--capture-image-and-download"), _))
        .WillOnce(Return(failed("*** Error: No camera found. ***")));

    auto result = camera_->capture(std::nullopt);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(*result.error, HasSubstr("No camera found"));
}

TEST_F(GPhoto2CameraTest, ApplySettingsMapsNamesToConfigPaths) {
    cameraPresent(true);
    std::vector<std::string> setCalls;
    ON_CALL(*runner_, run(argvIs("--set-config"), _))
        .WillByDefault([&setCalls](const std::vector<std::string>& argv,
                      const bmtl::system::CommandOptions&) {
            setCalls.push_back(argv.at(2));
            return succeeded();
        });

    auto result = camera_->applySettings({{"iso", "800"}, {"shutter_speed", "1/125"},
                                          {"unknown_knob", 3}});
    EXPECT_TRUE(result.success);
    EXPECT_THAT(setCalls, ::testing::UnorderedElementsAre(
                              "/main/imgsettings/iso=800",
                              "/main/capturesettings/shutterspeed=1/125"));
    EXPECT_EQ(result.applied["iso"], "800");
    EXPECT_FALSE(result.applied.contains("unknown_knob"));
}

TEST_F(GPhoto2CameraTest, ApplySettingsWithoutCameraFails) {
    cameraPresent(false);
    EXPECT_CALL(*runner_, run(argvIs("--set-config"), _)).Times(0);

    auto result = camera_->applySettings({{"iso", "800"}});
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.errors, Contains("Camera not connected"));
}

TEST_F(GPhoto2CameraTest, OptionsReadEachConfigEntry) {
    cameraPresent(true);
    ON_CALL(*runner_, run(argvIs("--get-config"), _))
        .WillByDefault(Return(succeeded(ISO_CONFIG)));

    auto result = camera_->options();
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.options.size(), 5u);
    EXPECT_EQ(result.options.at("iso").current, "400");
    EXPECT_TRUE(result.optionsJson().contains("resolution"));
}
