#pragma once

#include <sweep/core_types.hpp>
#include <sweep/fs/file_system.hpp>
#include <sweep/result.hpp>
#include <sweep/storage/metadata_store.hpp>
#include <sweep/util/logger.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sweep {

struct CacheOptions {
    // A row is trusted for this long after it was computed
    std::chrono::nanoseconds freshness = CACHE_FRESHNESS_WINDOW;
    // Rows older than this are removed by sweep_expired()
    std::chrono::nanoseconds retention = CACHE_RETENTION_WINDOW;
    // Time source; Clock::now when empty
    std::function<TimePoint()> clock;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t recomputes = 0;
    size_t entries = 0;
};

/**
 * MetadataCache - Memoized recursive sizes keyed by path.
 *
 * A stored row answers size() only while both hold:
 *   - lstat mtime of the path equals the stored mtime
 *   - now - last_checked < freshness
 * Otherwise the size is recomputed: a regular file or symlink reports its
 * own lstat size (links are never followed), a directory reports the sum of
 * its children's sizes, computed through the cache. Children that cannot be
 * stat'ed are skipped.
 *
 * A directory row is keyed on the directory's own mtime. Changes deep in
 * the tree that leave it untouched are only seen once the row goes stale.
 *
 * Thread safety: size() may be called concurrently. Lookups and writes of
 * one key are serialized by a striped mutex; no stripe is held while
 * children are sized.
 */
class MetadataCache {
public:
    static constexpr size_t STRIPE_COUNT = 64;

    MetadataCache(std::shared_ptr<MetadataStore> store,
                  std::shared_ptr<FileSystem> file_system,
                  CacheOptions options = CacheOptions(),
                  std::shared_ptr<Logger> logger = nullptr);

    /**
     * Aggregated size of the entry in bytes.
     *
     * @return 0 if the path cannot be stat'ed; nothing is cached then
     */
    uint64_t size(const fs::path& path);

    /**
     * Stored row for the path, without validation.
     */
    std::optional<CacheEntry> peek(const fs::path& path) const;

    /**
     * Remove rows last checked more than `retention` ago.
     *
     * @return Number of rows removed
     */
    size_t sweep_expired();

    Result<void> invalidate(const fs::path& path);

    /**
     * Remove every row.
     */
    Result<void> clear();

    CacheStats stats() const;

    /**
     * Cache key for a path: lexically normalized, no trailing separator.
     */
    static std::string key_for(const fs::path& path);

private:
    std::mutex& stripe_for(const std::string& key);
    TimePoint now() const;
    uint64_t compute(const fs::path& path, const FileStat& st, bool& complete);

    std::shared_ptr<MetadataStore> store_;
    std::shared_ptr<FileSystem> fs_;
    CacheOptions options_;
    std::shared_ptr<Logger> logger_;

    std::array<std::mutex, STRIPE_COUNT> stripes_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> recomputes_{0};
};

}  // namespace sweep
