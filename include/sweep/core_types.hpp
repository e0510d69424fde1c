#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace sweep {

namespace fs = std::filesystem;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Metadata cache windows
constexpr std::chrono::hours CACHE_FRESHNESS_WINDOW{24};
constexpr std::chrono::hours CACHE_RETENTION_WINDOW{24 * 7};

// Snapshot copy tuning
constexpr uint64_t LARGE_FILE_THRESHOLD = 100ULL * 1024 * 1024;  // 100 MiB
constexpr size_t COPY_CHUNK_SIZE = 1024 * 1024;                  // 1 MiB

// Worker pools
constexpr size_t MAX_WORKERS = 32;
constexpr size_t REMOVAL_BATCH_SIZE = 1000;

constexpr const char* DEFAULT_BUNDLE_EXTENSION = ".app";
constexpr const char* MANIFEST_FILE_NAME = "manifest.json";
constexpr const char* SNAPSHOT_ARCHIVE_SUFFIX = ".tar.gz";

// Type of a directory entry as seen by lstat (links are never followed)
enum class EntryType : uint8_t {
    NONE = 0x00,   // Entry does not exist
    REGULAR = 0x01,
    DIRECTORY = 0x02,
    SYMLINK = 0x03,
    OTHER = 0x04   // Sockets, fifos, devices
};

// Result of an lstat call
struct FileStat {
    EntryType type = EntryType::NONE;
    uint64_t size = 0;
    int64_t mtime_ns = 0;  // Modification time, nanoseconds since epoch
    uint32_t mode = 0;     // Permission bits
};

// Which matching rule admitted a candidate. Diagnostic only.
enum class MatchTier : uint8_t {
    BUNDLE_ANCHOR = 0,  // <clean-name>.<ext> or an entry inside it
    STRICT_NAME = 1,    // Base name contains the raw app name
    LOOSE_NAME = 2,     // Base name contains the clean app name
    TEMPLATE = 3,       // Full path matches a pattern table template
    TOKEN = 4           // Base name contains a derived token
};

inline const char* match_tier_name(MatchTier tier) {
    switch (tier) {
        case MatchTier::BUNDLE_ANCHOR: return "bundle";
        case MatchTier::STRICT_NAME: return "strict";
        case MatchTier::LOOSE_NAME: return "loose";
        case MatchTier::TEMPLATE: return "template";
        case MatchTier::TOKEN: return "token";
    }
    return "unknown";
}

// One row of the metadata cache
struct CacheEntry {
    std::string path;          // Canonical path (cache key)
    uint64_t size = 0;         // Aggregated size in bytes
    int64_t mtime_ns = 0;      // Modification time observed when computed
    int64_t last_checked_ns = 0;

    bool operator==(const CacheEntry& other) const {
        return path == other.path && size == other.size &&
               mtime_ns == other.mtime_ns && last_checked_ns == other.last_checked_ns;
    }
};

}  // namespace sweep
