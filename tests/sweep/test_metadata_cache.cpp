#include <gtest/gtest.h>
#include <sweep/metadata_cache.hpp>
#include <sweep/util/path_utils.hpp>

#include "test_doubles.hpp"

#include <chrono>
#include <memory>

using namespace sweep;
using sweep::test::FakeFileSystem;

class MetadataCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs_ = std::make_shared<FakeFileSystem>();
        fs_->add_file("/data/app/a.bin", 100);
        fs_->add_file("/data/app/b.bin", 20);
        fs_->add_file("/data/app/nested/c.bin", 3);
        fs_->set_mtime("/data/app", 50);

        store_ = MetadataStore::open_in_memory();
        now_ = from_unix_ns(1'000'000'000'000'000'000LL);

        CacheOptions options;
        options.clock = [this]() { return now_; };
        cache_ = std::make_unique<MetadataCache>(store_, fs_, options);
    }

    void advance(std::chrono::nanoseconds by) {
        now_ += std::chrono::duration_cast<Clock::duration>(by);
    }

    std::shared_ptr<FakeFileSystem> fs_;
    std::shared_ptr<MetadataStore> store_;
    std::unique_ptr<MetadataCache> cache_;
    TimePoint now_;
};

// ============================================================================
// Size computation
// ============================================================================

TEST_F(MetadataCacheTest, FileSizeIsItsLength) {
    EXPECT_EQ(cache_->size("/data/app/a.bin"), 100);
}

TEST_F(MetadataCacheTest, DirectorySizeIsRecursiveSum) {
    EXPECT_EQ(cache_->size("/data/app"), 123);

    auto row = cache_->peek("/data/app");
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->size, 123);
    EXPECT_EQ(row->mtime_ns, 50);
    EXPECT_EQ(row->last_checked_ns, to_unix_ns(now_));
}

TEST_F(MetadataCacheTest, KeysAreNormalized) {
    EXPECT_EQ(MetadataCache::key_for("/data/app/"), "/data/app");
    EXPECT_EQ(MetadataCache::key_for("/data/./app/nested/.."), "/data/app");
    EXPECT_EQ(MetadataCache::key_for("/"), "/");
}

// ============================================================================
// Hits and invalidation
// ============================================================================

TEST_F(MetadataCacheTest, FreshRowIsServedWithoutListing) {
    ASSERT_EQ(cache_->size("/data/app"), 123);
    fs_->reset_counters();

    advance(std::chrono::hours(1));
    EXPECT_EQ(cache_->size("/data/app"), 123);
    EXPECT_EQ(fs_->list_calls(), 0);
    EXPECT_EQ(cache_->stats().hits, 1);
}

TEST_F(MetadataCacheTest, ChangedMtimeForcesRecompute) {
    ASSERT_EQ(cache_->size("/data/app"), 123);

    fs_->add_file("/data/app/d.bin", 7);
    fs_->set_mtime("/data/app", 51);
    fs_->reset_counters();

    EXPECT_EQ(cache_->size("/data/app"), 130);
    EXPECT_TRUE(fs_->was_listed("/data/app"));
    EXPECT_EQ(cache_->peek("/data/app")->mtime_ns, 51);
}

TEST_F(MetadataCacheTest, StaleRowIsRecomputed) {
    ASSERT_EQ(cache_->size("/data/app"), 123);
    const auto recomputes = cache_->stats().recomputes;

    advance(CACHE_FRESHNESS_WINDOW + std::chrono::seconds(1));
    fs_->reset_counters();

    EXPECT_EQ(cache_->size("/data/app"), 123);
    EXPECT_TRUE(fs_->was_listed("/data/app"));
    EXPECT_GT(cache_->stats().recomputes, recomputes);
    EXPECT_EQ(cache_->peek("/data/app")->last_checked_ns, to_unix_ns(now_));
}

TEST_F(MetadataCacheTest, InvalidateDropsRow) {
    ASSERT_EQ(cache_->size("/data/app"), 123);
    ASSERT_TRUE(cache_->invalidate("/data/app/").ok());
    EXPECT_FALSE(cache_->peek("/data/app").has_value());

    fs_->reset_counters();
    EXPECT_EQ(cache_->size("/data/app"), 123);
    EXPECT_TRUE(fs_->was_listed("/data/app"));
}

TEST_F(MetadataCacheTest, InvalidateUnknownPathSucceeds) {
    EXPECT_TRUE(cache_->invalidate("/nowhere").ok());
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(MetadataCacheTest, MissingPathIsZeroAndDropsRow) {
    ASSERT_EQ(cache_->size("/data/app/a.bin"), 100);
    ASSERT_TRUE(cache_->peek("/data/app/a.bin").has_value());

    fs_->fail_stat("/data/app/a.bin", ErrorCode::NOT_FOUND);
    EXPECT_EQ(cache_->size("/data/app/a.bin"), 0);
    EXPECT_FALSE(cache_->peek("/data/app/a.bin").has_value());
}

TEST_F(MetadataCacheTest, UnreadableStatIsNotCached) {
    fs_->fail_stat("/data/app/b.bin", ErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(cache_->size("/data/app/b.bin"), 0);
    EXPECT_FALSE(cache_->peek("/data/app/b.bin").has_value());
}

TEST_F(MetadataCacheTest, UnlistableDirectoryIsNotCached) {
    fs_->fail_list("/data/app/nested", ErrorCode::PERMISSION_DENIED);

    EXPECT_EQ(cache_->size("/data/app"), 120);
    EXPECT_FALSE(cache_->peek("/data/app/nested").has_value());
}

// ============================================================================
// Expiry
// ============================================================================

TEST_F(MetadataCacheTest, SweepExpiredRemovesOldRows) {
    ASSERT_EQ(cache_->size("/data/app/a.bin"), 100);
    advance(std::chrono::hours(24 * 6));
    ASSERT_EQ(cache_->size("/data/app/b.bin"), 20);

    EXPECT_EQ(cache_->sweep_expired(), 0);

    advance(std::chrono::hours(24) + std::chrono::seconds(1));
    EXPECT_EQ(cache_->sweep_expired(), 1);
    EXPECT_FALSE(cache_->peek("/data/app/a.bin").has_value());
    EXPECT_TRUE(cache_->peek("/data/app/b.bin").has_value());
}

TEST_F(MetadataCacheTest, ClearEmptiesStore) {
    ASSERT_EQ(cache_->size("/data/app"), 123);
    EXPECT_GT(cache_->stats().entries, 0);

    ASSERT_TRUE(cache_->clear().ok());
    EXPECT_EQ(cache_->stats().entries, 0);
}
