#include <sweep/metadata_cache.hpp>
#include <sweep/util/path_utils.hpp>

namespace sweep {

MetadataCache::MetadataCache(std::shared_ptr<MetadataStore> store,
                             std::shared_ptr<FileSystem> file_system,
                             CacheOptions options,
                             std::shared_ptr<Logger> logger)
    : store_(std::move(store))
    , fs_(std::move(file_system))
    , options_(std::move(options))
    , logger_(logger_or_null(std::move(logger))) {
    if (!store_) {
        store_ = MetadataStore::open_in_memory();
    }
    if (!fs_) {
        fs_ = std::make_shared<LocalFileSystem>();
    }
}

std::string MetadataCache::key_for(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal.string();
}

std::mutex& MetadataCache::stripe_for(const std::string& key) {
    return stripes_[std::hash<std::string>{}(key) % STRIPE_COUNT];
}

TimePoint MetadataCache::now() const {
    return options_.clock ? options_.clock() : Clock::now();
}

uint64_t MetadataCache::size(const fs::path& path) {
    const std::string key = key_for(path);

    auto st = fs_->stat(path);
    if (!st.ok()) {
        // Gone or unreadable: drop any row for it and report nothing
        std::lock_guard<std::mutex> lock(stripe_for(key));
        auto erased = store_->erase(key);
        if (!erased.ok()) {
            logger_->debug("Cache erase failed for " + key + ": " + erased.error().to_string());
        }
        return 0;
    }

    const int64_t now_ns = to_unix_ns(now());
    {
        std::lock_guard<std::mutex> lock(stripe_for(key));
        auto entry = store_->get(key);
        if (entry && entry->mtime_ns == st->mtime_ns &&
            now_ns - entry->last_checked_ns < options_.freshness.count()) {
            ++hits_;
            return entry->size;
        }
    }
    ++misses_;

    bool complete = true;
    const uint64_t total = compute(path, *st, complete);
    if (!complete) {
        return total;
    }

    {
        std::lock_guard<std::mutex> lock(stripe_for(key));
        auto stored = store_->put(CacheEntry{key, total, st->mtime_ns, now_ns});
        if (!stored.ok()) {
            logger_->warning("Failed to cache size of " + key + ": " + stored.error().to_string());
        }
    }
    ++recomputes_;
    return total;
}

uint64_t MetadataCache::compute(const fs::path& path, const FileStat& st, bool& complete) {
    if (st.type != EntryType::DIRECTORY) {
        return st.size;
    }

    auto children = fs_->list(path);
    if (!children.ok()) {
        logger_->debug("Cannot list " + path.string() + ": " + children.error().to_string());
        complete = false;
        return 0;
    }

    uint64_t total = 0;
    for (const auto& name : *children) {
        total += size(path / name);
    }
    return total;
}

std::optional<CacheEntry> MetadataCache::peek(const fs::path& path) const {
    return store_->get(key_for(path));
}

size_t MetadataCache::sweep_expired() {
    const int64_t now_ns = to_unix_ns(now());
    const int64_t retention_ns = options_.retention.count();

    size_t removed = 0;
    for (const auto& entry : store_->entries()) {
        if (now_ns - entry.last_checked_ns <= retention_ns) continue;

        std::lock_guard<std::mutex> lock(stripe_for(entry.path));
        // Re-check: the row may have been refreshed since the snapshot
        auto current = store_->get(entry.path);
        if (!current || now_ns - current->last_checked_ns <= retention_ns) continue;

        auto erased = store_->erase(entry.path);
        if (!erased.ok()) {
            logger_->warning("Failed to evict " + entry.path + ": " + erased.error().to_string());
            continue;
        }
        if (*erased) ++removed;
    }

    if (removed > 0) {
        logger_->info("Evicted " + std::to_string(removed) + " expired cache entries");
    }
    return removed;
}

Result<void> MetadataCache::invalidate(const fs::path& path) {
    const std::string key = key_for(path);
    std::lock_guard<std::mutex> lock(stripe_for(key));
    auto erased = store_->erase(key);
    if (!erased.ok()) {
        return erased.error();
    }
    return Ok();
}

Result<void> MetadataCache::clear() {
    return store_->clear();
}

CacheStats MetadataCache::stats() const {
    CacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.recomputes = recomputes_.load();
    s.entries = store_->size();
    return s;
}

}  // namespace sweep
