/*
 * test_capture_executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "camera/capture_executor.hpp"
#include "store/config_store.hpp"
#include "support/mocks.hpp"

using namespace bmtl::camera;
using namespace bmtl::test;
using namespace std::chrono;
using ::testing::Return;
namespace documents = bmtl::store::documents;

namespace {

LocalTime windowAt(int day) {
    return local_days{year{2024} / July / day} + hours{8};
}

CaptureResult shot(bool success) {
    CaptureResult result;
    result.success = success;
    result.timestamp = "2024-07-01T08:00:00";
    if (success) {
        result.filename = "photo.jpg";
    } else {
        result.error = "busy";
    }
    return result;
}

}  // namespace

class CaptureExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<bmtl::store::ConfigStore>(
            bmtl::store::StoreDirectories{scratch_.path() / "etc", scratch_.path() / "tmp"});
        camera_ = std::make_shared<::testing::NiceMock<MockCameraController>>();
        executor_ = std::make_unique<CaptureExecutor>(*store_, camera_);
    }

    ScratchDir scratch_{"capture_executor"};
    std::unique_ptr<bmtl::store::ConfigStore> store_;
    std::shared_ptr<::testing::NiceMock<MockCameraController>> camera_;
    std::unique_ptr<CaptureExecutor> executor_;
};

TEST_F(CaptureExecutorTest, SeedCreatesCameraDocuments) {
    executor_->seedDocuments();
    EXPECT_TRUE(store_->exists(documents::CAMERA_STATS));
    EXPECT_TRUE(store_->exists(documents::CAMERA_STATUS));
    EXPECT_TRUE(store_->exists(documents::CAMERA_RESULT));
}

TEST_F(CaptureExecutorTest, CountsWithinOneWindow) {
    EXPECT_CALL(*camera_, capture(::testing::_))
        .WillOnce(Return(shot(true)))
        .WillOnce(Return(shot(false)))
        .WillOnce(Return(shot(true)));

    for (int i = 0; i < 3; ++i) {
        executor_->capture(windowAt(1));
    }

    auto stats = executor_->stats();
    EXPECT_EQ(stats.attempted, 3);
    EXPECT_EQ(stats.captured, 2);
    EXPECT_EQ(stats.failed, 1);
    EXPECT_EQ(stats.capturedIn(windowAt(1)), 2);
    EXPECT_EQ(stats.capturedIn(windowAt(2)), 0);
    EXPECT_EQ(store_->readObject(documents::CAMERA_RESULT)["success"], true);
}

TEST_F(CaptureExecutorTest, NewWindowResetsCounters) {
    ON_CALL(*camera_, capture(::testing::_)).WillByDefault(Return(shot(true)));

    executor_->capture(windowAt(1));
    executor_->capture(windowAt(1));
    executor_->capture(windowAt(2));

    auto stats = executor_->stats();
    EXPECT_EQ(stats.windowStart, windowAt(2));
    EXPECT_EQ(stats.captured, 1);
}

TEST_F(CaptureExecutorTest, CameraExceptionBecomesFailedResult) {
    EXPECT_CALL(*camera_, capture(::testing::_))
        .WillOnce([](const std::optional<std::string>&) -> CaptureResult {
            throw std::runtime_error("usb reset");
        });

    auto result = executor_->capture(windowAt(1));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "usb reset");
    EXPECT_EQ(executor_->stats().failed, 1);
}

TEST_F(CaptureExecutorTest, RefreshStatusRecordsConnection) {
    EXPECT_CALL(*camera_, checkConnection()).WillOnce(Return(true));
    auto status = executor_->refreshStatus();
    EXPECT_EQ(status["connected"], true);
    EXPECT_EQ(store_->readObject(documents::CAMERA_STATUS)["connected"], true);
}
