/*
 * Unit tests for MemoryPolicyStore and FilePolicyStore
 */
#include <gtest/gtest.h>
#include "../storage/PolicyStore.h"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <thread>

using namespace scoutbot;

class MemoryPolicyStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<MemoryPolicyStore>();
    }

    std::shared_ptr<MemoryPolicyStore> store;
};

TEST_F(MemoryPolicyStoreTest, MissingKeyReturnsDefault) {
    PolicyEntry entry;
    EXPECT_FALSE(store->get("s|a", entry));
    PolicyEntry fallback = store->getOrDefault("s|a");
    EXPECT_DOUBLE_EQ(fallback.value, 0.0);
    EXPECT_EQ(fallback.visits, 0);
    EXPECT_DOUBLE_EQ(fallback.feedback, 0.0);
}

TEST_F(MemoryPolicyStoreTest, UpsertReplacesEntry) {
    PolicyEntry entry;
    entry.value = 0.4;
    entry.visits = 2;
    store->upsert("s|a", entry);
    entry.value = -0.2;
    store->upsert("s|a", entry);

    PolicyEntry stored;
    ASSERT_TRUE(store->get("s|a", stored));
    EXPECT_DOUBLE_EQ(stored.value, -0.2);
    EXPECT_EQ(stored.visits, 2);
    EXPECT_EQ(store->entries().size(), 1u);
}

TEST_F(MemoryPolicyStoreTest, IncrementVisitCountCreatesEntry) {
    EXPECT_EQ(store->incrementVisitCount("s|a"), 1);
    EXPECT_EQ(store->incrementVisitCount("s|a"), 2);
    EXPECT_EQ(store->getOrDefault("s|a").visits, 2);
}

TEST_F(MemoryPolicyStoreTest, RevisionOnlyMovesOnChange) {
    long before = store->revision();
    store->addDangerousPattern("com.example", "Button|logout|top");
    long afterFirst = store->revision();
    store->addDangerousPattern("com.example", "Button|logout|top");
    EXPECT_GT(afterFirst, before);
    EXPECT_EQ(store->revision(), afterFirst);
    EXPECT_EQ(store->dangerousPatterns("com.example").size(), 1u);
}

TEST_F(MemoryPolicyStoreTest, DangerousPatternsAreKeptPerTarget) {
    store->addDangerousPattern("com.first", "Button|none|center");
    store->addDangerousPattern("com.second", "TextView|row_*|top");
    EXPECT_EQ(store->dangerousPatterns("com.first").count("Button|none|center"), 1u);
    EXPECT_EQ(store->dangerousPatterns("com.second").count("Button|none|center"), 0u);
    EXPECT_TRUE(store->dangerousPatterns("com.third").empty());
}

TEST_F(MemoryPolicyStoreTest, ScreenVisitsAndStrategies) {
    store->setScreenVisits("abc", 3);
    store->setScreenVisits("abc", 5);
    EXPECT_EQ(store->screenVisits().at("abc"), 5);

    std::string strategy;
    EXPECT_FALSE(store->getBestStrategy("com.example", strategy));
    store->recordBestStrategy("com.example", "depth_first");
    ASSERT_TRUE(store->getBestStrategy("com.example", strategy));
    EXPECT_EQ(strategy, "depth_first");
}

class FilePolicyStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "scoutbot_policy_test.spm";
        std::remove(path.c_str());
    }

    void TearDown() override {
        std::remove(path.c_str());
        std::remove((path + ".tmp").c_str());
    }

    std::string path;
};

TEST_F(FilePolicyStoreTest, LoadMissingFileFails) {
    auto store = FilePolicyStore::create(path);
    EXPECT_FALSE(store->load());
    EXPECT_TRUE(store->entries().empty());
}

TEST_F(FilePolicyStoreTest, SaveThenLoadRestoresEverything) {
    {
        auto store = FilePolicyStore::create(path);
        PolicyEntry entry;
        entry.value = 0.15;
        entry.visits = 3;
        entry.feedback = -1.0;
        store->upsert("s1|Button|save|bottom", entry);
        store->addDangerousPattern("com.example", "Button|logout|top");
        store->addDangerousPattern("com.other", "View|close|top");
        store->setScreenVisits("s1", 7);
        store->recordBestStrategy("com.example", "breadth_first");
        ASSERT_TRUE(store->save());
    }

    auto reloaded = FilePolicyStore::create(path);
    ASSERT_TRUE(reloaded->load());
    PolicyEntry entry;
    ASSERT_TRUE(reloaded->get("s1|Button|save|bottom", entry));
    EXPECT_DOUBLE_EQ(entry.value, 0.15);
    EXPECT_EQ(entry.visits, 3);
    EXPECT_DOUBLE_EQ(entry.feedback, -1.0);
    EXPECT_EQ(reloaded->dangerousPatterns("com.example").count("Button|logout|top"), 1u);
    EXPECT_EQ(reloaded->dangerousPatterns("com.example").count("View|close|top"), 0u);
    EXPECT_EQ(reloaded->dangerousPatterns("com.other").count("View|close|top"), 1u);
    EXPECT_EQ(reloaded->screenVisits().at("s1"), 7);
    std::string strategy;
    ASSERT_TRUE(reloaded->getBestStrategy("com.example", strategy));
    EXPECT_EQ(strategy, "breadth_first");
}

TEST_F(FilePolicyStoreTest, CorruptFileIsRejected) {
    {
        std::ofstream out(path, std::ios::binary);
        out << "definitely not a flatbuffer";
    }
    auto store = FilePolicyStore::create(path);
    PolicyEntry entry;
    entry.value = 1.0;
    store->upsert("keep|me", entry);
    EXPECT_FALSE(store->load());
    EXPECT_TRUE(store->get("keep|me", entry));
}

TEST_F(FilePolicyStoreTest, SaveWithEmptyPathFails) {
    auto store = FilePolicyStore::create("");
    EXPECT_FALSE(store->save());
}

TEST_F(FilePolicyStoreTest, BackgroundSaveWritesDirtyStore) {
    auto store = FilePolicyStore::create(path);
    PolicyEntry entry;
    entry.value = 0.5;
    store->upsert("s|a", entry);
    store->startBackgroundSave(20);

    bool written = false;
    for (int i = 0; i < 100 && !written; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        std::ifstream saved(path, std::ios::binary);
        written = saved.is_open();
    }
    store->stopBackgroundSave();
    ASSERT_TRUE(written);

    auto reloaded = FilePolicyStore::create(path);
    ASSERT_TRUE(reloaded->load());
    EXPECT_DOUBLE_EQ(reloaded->getOrDefault("s|a").value, 0.5);
}
