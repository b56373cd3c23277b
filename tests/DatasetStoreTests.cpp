#include <gtest/gtest.h>

#include "DatasetStore.h"
#include "TestRecords.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace fs = std::filesystem;

class DatasetStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("netviz_store_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
        path = (dir / "net.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void writeDataset(const std::string& content) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    fs::path dir;
    std::string path;
};

TEST_F(DatasetStoreTest, NewStore_PublishesEmptySnapshot) {
    DatasetStore store;
    ASSERT_NE(store.snapshot(), nullptr);
    EXPECT_TRUE(store.snapshot()->empty());
    EXPECT_EQ(store.generation(), 0u);
}

TEST_F(DatasetStoreTest, Reload_ValidFile_PublishesNewGeneration) {
    writeDataset(R"({"data": [{"id": 1}, {"id": 2}]})");
    DatasetStore store;

    const LoadResult result = store.reload(path);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(store.snapshot()->size(), 2u);
    EXPECT_EQ(store.generation(), 1u);
}

TEST_F(DatasetStoreTest, Reload_MalformedFile_KeepsPreviousSnapshot) {
    writeDataset(R"({"data": [{"id": 1}, {"id": 2}, {"id": 3}]})");
    DatasetStore store;
    ASSERT_TRUE(store.reload(path).ok());

    writeDataset("{\"data\": [ {\"id\": ");
    const LoadResult result = store.reload(path);

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(store.snapshot()->size(), 3u);
    EXPECT_EQ(store.generation(), 1u);
}

TEST_F(DatasetStoreTest, Reload_MissingFile_KeepsPreviousSnapshot) {
    DatasetStore store;
    store.publish(std::make_shared<const NetworkCollection>(NetworkCollection{TestRecords::make(7)}));

    const LoadResult result = store.reload((dir / "missing.json").string());

    ASSERT_TRUE(result.diagnostic.has_value());
    EXPECT_EQ(result.diagnostic->kind, LoadDiagnostic::Kind::SOURCE_UNAVAILABLE);
    ASSERT_EQ(store.snapshot()->size(), 1u);
    EXPECT_EQ(store.snapshot()->front().id, 7);
}

TEST_F(DatasetStoreTest, Snapshot_HeldByReaderSurvivesPublish) {
    DatasetStore store;
    store.publish(std::make_shared<const NetworkCollection>(
        NetworkCollection{TestRecords::make(1), TestRecords::make(2)}));
    const NetworkSnapshot held = store.snapshot();

    store.publish(std::make_shared<const NetworkCollection>(NetworkCollection{TestRecords::make(3)}));

    ASSERT_EQ(held->size(), 2u);
    EXPECT_EQ((*held)[0].id, 1);
    EXPECT_EQ(store.snapshot()->size(), 1u);
    EXPECT_EQ(store.generation(), 2u);
}

TEST_F(DatasetStoreTest, Publish_Null_TreatedAsEmpty) {
    DatasetStore store;
    store.publish(nullptr);
    ASSERT_NE(store.snapshot(), nullptr);
    EXPECT_TRUE(store.snapshot()->empty());
}

TEST_F(DatasetStoreTest, PeriodicReloader_ZeroInterval_StartIsNoOp) {
    DatasetStore store;
    PeriodicReloader reloader(store, path, std::chrono::seconds(0));
    reloader.start();
    reloader.stop();
    EXPECT_EQ(store.generation(), 0u);
}

TEST_F(DatasetStoreTest, PeriodicReloader_StopBeforeFirstTick_ReturnsPromptly) {
    writeDataset(R"({"data": [{"id": 1}]})");
    DatasetStore store;
    const auto started = std::chrono::steady_clock::now();
    {
        PeriodicReloader reloader(store, path, std::chrono::seconds(3600));
        reloader.start();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(store.generation(), 0u);
}

TEST_F(DatasetStoreTest, PeriodicReloader_ThrowingTask_KeepsTicking) {
    std::atomic<int> calls{0};
    PeriodicReloader reloader([&calls] {
        if (calls.fetch_add(1) == 0) {
            throw std::runtime_error("out of memory while reading");
        }
    }, std::chrono::seconds(1));
    reloader.start();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (calls.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    reloader.stop();

    EXPECT_GE(calls.load(), 2);
}
