/*
 * test_config_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Tests for the document store

**************************************************/

#include <gtest/gtest.h>

#include "store/config_store.hpp"
#include "store/exception.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

using namespace bmtl::store;
namespace fs = std::filesystem;

class ConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("bmtl_store_test_" + std::to_string(::testing::UnitTest::GetInstance()
                                                          ->random_seed()) +
                 "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        store_ = std::make_unique<ConfigStore>(
            StoreDirectories{root_ / "etc", root_ / "tmp"});
    }

    void TearDown() override {
        store_.reset();
        fs::remove_all(root_);
    }

    void writeRaw(const fs::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

    fs::path root_;
    std::unique_ptr<ConfigStore> store_;
};

// ============================================================================
// Read / Write
// ============================================================================

TEST_F(ConfigStoreTest, CreatesDirectories) {
    EXPECT_TRUE(fs::is_directory(root_ / "etc"));
    EXPECT_TRUE(fs::is_directory(root_ / "tmp"));
}

TEST_F(ConfigStoreTest, MissingDocumentReadsAsNullopt) {
    EXPECT_FALSE(store_->read("camera_result").has_value());
    EXPECT_TRUE(store_->readObject("camera_result").empty());
    EXPECT_FALSE(store_->exists("camera_result"));
}

TEST_F(ConfigStoreTest, WriteThenRead) {
    json doc = {{"iso", "400"}, {"aperture", "f/4"}};
    store_->write("camera_settings", doc);

    auto read = store_->read("camera_settings");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, doc);
    EXPECT_TRUE(store_->exists("camera_settings"));
}

TEST_F(ConfigStoreTest, DocumentIsWrappedWithTimestamp) {
    store_->write("image_settings", {{"quality", "90"}});

    std::ifstream in(store_->pathFor("image_settings"));
    auto onDisk = json::parse(in);
    EXPECT_TRUE(onDisk.contains("timestamp"));
    EXPECT_EQ(onDisk["data"]["quality"], "90");
}

TEST_F(ConfigStoreTest, BareLegacyDocumentIsReadAsIs) {
    writeRaw(store_->pathFor("image_settings"), R"({"quality": "70"})");
    auto read = store_->read("image_settings");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ((*read)["quality"], "70");
}

TEST_F(ConfigStoreTest, InvalidJsonThrowsFormatError) {
    writeRaw(store_->pathFor("camera_stats"), "{not json");
    EXPECT_THROW((void)store_->read("camera_stats"), StoreFormatException);
}

TEST_F(ConfigStoreTest, RejectsPathLikeNames) {
    EXPECT_THROW(store_->write("../escape", json::object()), StoreException);
    EXPECT_THROW(store_->write("", json::object()), StoreException);
    EXPECT_THROW(store_->write(".hidden", json::object()), StoreException);
}

// ============================================================================
// Routing
// ============================================================================

TEST_F(ConfigStoreTest, PersistentDocumentsGoToPersistentDirectory) {
    EXPECT_EQ(storageClassOf(documents::CAMERA_SCHEDULE), StorageClass::Persistent);
    EXPECT_EQ(storageClassOf(documents::DEVICE_SETTINGS), StorageClass::Persistent);
    EXPECT_EQ(storageClassOf(documents::CAMERA_STATS), StorageClass::Volatile);

    store_->write(documents::CAMERA_SCHEDULE, {{"enabled", true}});
    store_->write(documents::CAMERA_RESULT, {{"success", true}});

    EXPECT_TRUE(fs::exists(root_ / "etc" / "camera_schedule.json"));
    EXPECT_TRUE(fs::exists(root_ / "tmp" / "camera_result.json"));
    EXPECT_FALSE(fs::exists(root_ / "tmp" / "camera_schedule.json"));
}

TEST_F(ConfigStoreTest, ListSpansBothDirectoriesAndSkipsTemporaries) {
    store_->write("camera_schedule", json::object());
    store_->write("camera_stats", json::object());
    writeRaw(root_ / "tmp" / ".camera_stats.json.tmp-123", "{}");
    writeRaw(root_ / "tmp" / "notes.txt", "x");

    auto names = store_->list();
    EXPECT_EQ(names, (std::vector<std::string>{"camera_schedule", "camera_stats"}));
}

TEST_F(ConfigStoreTest, RemoveDeletesDocument) {
    store_->write("camera_command", {{"command", "capture"}});
    EXPECT_TRUE(store_->remove("camera_command"));
    EXPECT_FALSE(store_->exists("camera_command"));
    EXPECT_FALSE(store_->read("camera_command").has_value());
    EXPECT_FALSE(store_->remove("camera_command"));
}

// ============================================================================
// Cache
// ============================================================================

TEST_F(ConfigStoreTest, ExternalRewriteInvalidatesCache) {
    store_->write("schedule_settings", {{"start_time", "08:00"}});
    ASSERT_EQ(store_->readObject("schedule_settings")["start_time"], "08:00");

    // Another process replaces the file.
    ConfigStore other(StoreDirectories{root_ / "etc", root_ / "tmp"});
    other.write("schedule_settings", {{"start_time", "09:30"}});
    auto path = store_->pathFor("schedule_settings");
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(5));

    EXPECT_EQ(store_->readObject("schedule_settings")["start_time"], "09:30");
}

TEST_F(ConfigStoreTest, SameTickRewriteByAnotherStoreIsNoticed) {
    // Equal-sized payloads written back to back usually share an mtime.
    ConfigStore other(StoreDirectories{root_ / "etc", root_ / "tmp"});
    for (int i = 0; i < 50; ++i) {
        store_->write("image_settings", {{"writer", "A"}, {"n", i}});
        other.write("image_settings", {{"writer", "B"}, {"n", i}});

        auto doc = store_->readObject("image_settings");
        ASSERT_EQ(doc["writer"], "B") << "iteration " << i;
        ASSERT_EQ(doc["n"], i);
    }
}

TEST_F(ConfigStoreTest, ExternalDeleteIsNoticed) {
    store_->write("camera_status", {{"connected", true}});
    ASSERT_TRUE(store_->read("camera_status").has_value());

    fs::remove(store_->pathFor("camera_status"));
    EXPECT_FALSE(store_->read("camera_status").has_value());
}

// ============================================================================
// Atomicity
// ============================================================================

TEST_F(ConfigStoreTest, ConcurrentReaderNeverSeesPartialDocument) {
    json big = {{"round", -1}};
    for (int i = 0; i < 200; ++i) {
        big["key_" + std::to_string(i)] = std::string(64, static_cast<char>('a' + i % 26));
    }
    store_->write("camera_settings", big);

    std::atomic<bool> done{false};
    std::atomic<int> failures{0};
    std::thread reader([&] {
        ConfigStore readerStore(StoreDirectories{root_ / "etc", root_ / "tmp"});
        while (!done.load()) {
            try {
                readerStore.clearCache();
                auto doc = readerStore.read("camera_settings");
                if (!doc || doc->size() != 201) {
                    ++failures;
                }
            } catch (const StoreException&) {
                ++failures;
            }
        }
    });

    for (int round = 0; round < 100; ++round) {
        big["round"] = round;
        store_->write("camera_settings", big);
    }
    done = true;
    reader.join();

    EXPECT_EQ(failures.load(), 0);
}

TEST_F(ConfigStoreTest, ConcurrentWriterProcessesNeverInterleave) {
    auto payloadFor = [](const std::string& writer) {
        json doc = {{"writer", writer}};
        for (int i = 0; i < 300; ++i) {
            doc["field_" + std::to_string(i)] = writer + "_" + std::string(48, 'x');
        }
        return doc;
    };
    const json payloadA = payloadFor("A");
    const json payloadB = payloadFor("B");
    store_->write("camera_schedule", payloadA);

    auto spawnWriter = [this](const json& payload) {
        pid_t pid = ::fork();
        if (pid == 0) {
            int code = 0;
            try {
                ConfigStore writer(StoreDirectories{root_ / "etc", root_ / "tmp"});
                for (int round = 0; round < 150; ++round) {
                    writer.write("camera_schedule", payload);
                }
            } catch (const std::exception&) {
                code = 1;
            }
            ::_exit(code);
        }
        return pid;
    };

    pid_t writerA = spawnWriter(payloadA);
    ASSERT_GT(writerA, 0);
    pid_t writerB = spawnWriter(payloadB);
    ASSERT_GT(writerB, 0);

    int reads = 0;
    int mismatches = 0;
    std::vector<pid_t> running{writerA, writerB};
    int exitCodes = 0;
    while (!running.empty()) {
        if (reads % 2 == 0) {
            store_->clearCache();
        }
        auto doc = store_->read("camera_schedule");
        ++reads;
        if (!doc || (*doc != payloadA && *doc != payloadB)) {
            ++mismatches;
        }

        std::erase_if(running, [&exitCodes](pid_t pid) {
            int status = 0;
            if (::waitpid(pid, &status, WNOHANG) != pid) {
                return false;
            }
            exitCodes += WIFEXITED(status) ? WEXITSTATUS(status) : 1;
            return true;
        });
    }

    EXPECT_GT(reads, 0);
    EXPECT_EQ(mismatches, 0);
    EXPECT_EQ(exitCodes, 0);

    store_->clearCache();
    auto last = store_->read("camera_schedule");
    ASSERT_TRUE(last.has_value());
    EXPECT_TRUE(*last == payloadA || *last == payloadB);
}

TEST_F(ConfigStoreTest, NoTemporaryFilesLeftBehind) {
    for (int i = 0; i < 10; ++i) {
        store_->write("camera_result", {{"n", i}});
    }
    for (const auto& entry : fs::directory_iterator(root_ / "tmp")) {
        auto name = entry.path().filename().string();
        EXPECT_EQ(name.find(".tmp"), std::string::npos) << name;
    }
}
