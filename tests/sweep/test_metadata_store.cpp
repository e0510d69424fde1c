#include <gtest/gtest.h>
#include <sweep/storage/metadata_store.hpp>

#include "test_doubles.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace sweep;
namespace fs = std::filesystem;

class MetadataStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = sweep::test::scratch_dir("sweep_store");
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        journal_ = test_dir_ / "metadata.journal";
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    std::unique_ptr<MetadataStore> open_store() {
        auto result = MetadataStore::open(journal_);
        EXPECT_TRUE(result.ok()) << result.error().to_string();
        return std::move(result.value());
    }

    static CacheEntry entry(const std::string& path, uint64_t size, int64_t mtime = 10) {
        return CacheEntry{path, size, mtime, 1000};
    }

    fs::path test_dir_;
    fs::path journal_;
};

// ============================================================================
// Basic Operations
// ============================================================================

TEST_F(MetadataStoreTest, OpenCreatesJournal) {
    auto store = open_store();
    EXPECT_TRUE(store->is_open());
    EXPECT_EQ(store->size(), 0);
    EXPECT_TRUE(fs::exists(journal_));
    EXPECT_FALSE(store->recovered_from_corruption());
}

TEST_F(MetadataStoreTest, PutAndGet) {
    auto store = open_store();
    ASSERT_TRUE(store->put(entry("/a", 5)).ok());

    auto row = store->get("/a");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->size, 5);
    EXPECT_EQ(row->mtime_ns, 10);
    EXPECT_FALSE(store->get("/missing").has_value());
}

TEST_F(MetadataStoreTest, RowsSurviveReopen) {
    {
        auto store = open_store();
        ASSERT_TRUE(store->put(entry("/a", 1)).ok());
        ASSERT_TRUE(store->put(entry("/b", 2)).ok());
        ASSERT_TRUE(store->put(entry("/a", 3, 20)).ok());
        ASSERT_TRUE(store->erase("/b").ok());
        store->close();
    }

    auto store = open_store();
    EXPECT_EQ(store->size(), 1);
    auto row = store->get("/a");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->size, 3);
    EXPECT_EQ(row->mtime_ns, 20);
    EXPECT_FALSE(store->get("/b").has_value());
}

TEST_F(MetadataStoreTest, EraseReportsWhetherRowExisted) {
    auto store = open_store();
    ASSERT_TRUE(store->put(entry("/a", 1)).ok());

    auto first = store->erase("/a");
    ASSERT_TRUE(first.ok());
    EXPECT_TRUE(*first);

    auto second = store->erase("/a");
    ASSERT_TRUE(second.ok());
    EXPECT_FALSE(*second);
}

TEST_F(MetadataStoreTest, PathsWithSpecialCharacters) {
    const std::string odd = "/Library/Application Support/Foo\tBar/ü.plist";
    {
        auto store = open_store();
        ASSERT_TRUE(store->put(entry(odd, 42)).ok());
    }
    auto store = open_store();
    auto row = store->get(odd);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->size, 42);
}

// ============================================================================
// Recovery
// ============================================================================

TEST_F(MetadataStoreTest, TruncatedTailIsDiscarded) {
    {
        auto store = open_store();
        ASSERT_TRUE(store->put(entry("/a", 1)).ok());
        ASSERT_TRUE(store->put(entry("/b", 2)).ok());
    }
    {
        std::ofstream out(journal_, std::ios::binary | std::ios::app);
        out.write("\x40\x00\x00\x00\x01", 5);
    }

    {
        auto store = open_store();
        EXPECT_TRUE(store->recovered_from_corruption());
        EXPECT_EQ(store->size(), 2);
        EXPECT_TRUE(store->get("/a").has_value());
        EXPECT_TRUE(store->get("/b").has_value());
    }

    // The damaged tail was rewritten away
    auto store = open_store();
    EXPECT_FALSE(store->recovered_from_corruption());
    EXPECT_EQ(store->size(), 2);
}

TEST_F(MetadataStoreTest, ChecksumMismatchDropsRecord) {
    {
        auto store = open_store();
        ASSERT_TRUE(store->put(entry("/a", 1)).ok());
        ASSERT_TRUE(store->put(entry("/b", 2)).ok());
    }
    {
        std::fstream io(journal_, std::ios::binary | std::ios::in | std::ios::out);
        io.seekg(-1, std::ios::end);
        char last = 0;
        io.get(last);
        io.seekp(-1, std::ios::end);
        io.put(static_cast<char>(last ^ 0x5A));
    }

    auto store = open_store();
    EXPECT_TRUE(store->recovered_from_corruption());
    EXPECT_EQ(store->size(), 1);
    EXPECT_TRUE(store->get("/a").has_value());
    EXPECT_FALSE(store->get("/b").has_value());
}

TEST_F(MetadataStoreTest, ForeignFileStartsEmpty) {
    {
        std::ofstream out(journal_, std::ios::binary);
        out << "this is not a journal";
    }

    auto store = open_store();
    EXPECT_TRUE(store->recovered_from_corruption());
    EXPECT_EQ(store->size(), 0);
    ASSERT_TRUE(store->put(entry("/a", 1)).ok());
}

// ============================================================================
// Compaction
// ============================================================================

TEST_F(MetadataStoreTest, OverwritesTriggerCompaction) {
    {
        auto store = open_store();
        for (uint64_t i = 0; i < 200; ++i) {
            ASSERT_TRUE(store->put(entry("/hot", i)).ok());
        }
        EXPECT_LT(store->dead_record_count(), MetadataStore::COMPACTION_MIN_DEAD);
    }

    auto store = open_store();
    EXPECT_EQ(store->size(), 1);
    EXPECT_EQ(store->get("/hot")->size, 199);
}

TEST_F(MetadataStoreTest, ExplicitCompactShrinksJournal) {
    auto store = open_store();
    for (uint64_t i = 0; i < 20; ++i) {
        ASSERT_TRUE(store->put(entry("/hot", i)).ok());
    }
    ASSERT_TRUE(store->flush().ok());
    const auto before = fs::file_size(journal_);
    EXPECT_EQ(store->dead_record_count(), 19);

    ASSERT_TRUE(store->compact().ok());
    EXPECT_EQ(store->dead_record_count(), 0);
    EXPECT_LT(fs::file_size(journal_), before);
    EXPECT_EQ(store->get("/hot")->size, 19);
}

TEST_F(MetadataStoreTest, ClearRemovesEverything) {
    {
        auto store = open_store();
        ASSERT_TRUE(store->put(entry("/a", 1)).ok());
        ASSERT_TRUE(store->put(entry("/b", 2)).ok());
        ASSERT_TRUE(store->clear().ok());
        EXPECT_EQ(store->size(), 0);
    }
    auto store = open_store();
    EXPECT_EQ(store->size(), 0);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(MetadataStoreTest, ClosedStoreRejectsWrites) {
    auto store = open_store();
    store->close();
    EXPECT_FALSE(store->is_open());

    auto put = store->put(entry("/a", 1));
    ASSERT_FALSE(put.ok());
    EXPECT_EQ(put.error().code(), ErrorCode::STORE_NOT_OPEN);

    auto erased = store->erase("/a");
    ASSERT_FALSE(erased.ok());
    EXPECT_EQ(erased.error().code(), ErrorCode::STORE_NOT_OPEN);
}

TEST_F(MetadataStoreTest, InMemoryStoreKeepsNoFile) {
    auto store = MetadataStore::open_in_memory();
    ASSERT_TRUE(store->put(entry("/a", 1)).ok());
    EXPECT_EQ(store->size(), 1);
    EXPECT_TRUE(store->flush().ok());
    EXPECT_TRUE(store->compact().ok());
    EXPECT_EQ(store->get("/a")->size, 1);
    EXPECT_FALSE(fs::exists(journal_));
}

TEST_F(MetadataStoreTest, CloseIsSeenByOtherThreads) {
    auto store = open_store();
    std::atomic<bool> saw_open{false};

    std::thread watcher([&] {
        while (store->is_open()) {
            saw_open = true;
            std::this_thread::yield();
        }
    });
    while (!saw_open) {
        std::this_thread::yield();
    }
    store->close();
    watcher.join();

    EXPECT_FALSE(store->is_open());
}
