#pragma once

#include <sweep/core_types.hpp>
#include <sweep/result.hpp>
#include <sweep/util/logger.hpp>

#include <fstream>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sweep {

// Journal record types
enum class JournalRecordType : uint8_t {
    PUT = 0x01,
    ERASE = 0x02
};

/**
 * MetadataStore - Persistent table of CacheEntry rows.
 *
 * The table lives in memory; every mutation is appended to a journal file
 * so it survives restarts.
 *
 * Journal layout:
 *   header  [magic:4][version:4]
 *   record  [len:4][crc32:4][type:1][payload:len-1]
 *   PUT     payload = [path_len:4][path][size:8][mtime_ns:8][last_checked_ns:8]
 *   ERASE   payload = [path_len:4][path]
 *
 * The checksum covers the type byte and payload. open() replays records in
 * order and stops at the first truncated or checksum-failing record; the
 * rows read up to that point are kept and the journal is rewritten without
 * the damaged tail.
 *
 * Thread safety: readers share a std::shared_mutex, writers take it
 * exclusively.
 */
class MetadataStore {
public:
    static constexpr uint32_t JOURNAL_MAGIC = 0x53575045;  // "SWPE"
    static constexpr uint32_t JOURNAL_VERSION = 1;

    // Overwritten or erased records tolerated before compaction is considered
    static constexpr size_t COMPACTION_MIN_DEAD = 64;

    /**
     * Open or create a journal.
     *
     * @param journal_path Journal file; parent directories are created
     * @param logger Receives corruption warnings
     * @return The opened store, or IO_ERROR if the file cannot be written
     */
    static Result<std::unique_ptr<MetadataStore>> open(const fs::path& journal_path,
                                                       std::shared_ptr<Logger> logger = nullptr);

    /**
     * A store with no backing file. Used by tests and --no-cache runs.
     */
    static std::unique_ptr<MetadataStore> open_in_memory();

    ~MetadataStore();

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    /**
     * Flush and close the journal. Later mutations fail with STORE_NOT_OPEN.
     */
    void close();

    std::optional<CacheEntry> get(const std::string& path) const;

    /**
     * Insert or replace the row for entry.path.
     */
    Result<void> put(const CacheEntry& entry);

    /**
     * Remove a row. Erasing an absent key is not an error.
     *
     * @return true if a row was removed
     */
    Result<bool> erase(const std::string& path);

    /**
     * Drop every row and truncate the journal to its header.
     */
    Result<void> clear();

    std::vector<std::string> keys() const;
    std::vector<CacheEntry> entries() const;
    size_t size() const;

    Result<void> flush();

    /**
     * Rewrite the journal with one PUT per live row.
     */
    Result<void> compact();

    bool is_open() const;
    const fs::path& path() const { return journal_path_; }

    // Journal records that no longer describe a live row
    size_t dead_record_count() const;

    // True if open() found and discarded a damaged journal tail
    bool recovered_from_corruption() const { return recovered_; }

private:
    MetadataStore(fs::path journal_path, std::shared_ptr<Logger> logger);

    Result<void> replay();
    Result<void> append_record(JournalRecordType type, const std::string& payload);
    Result<void> compact_locked();
    Result<void> open_for_append();
    void maybe_compact_locked();

    static std::string encode_put(const CacheEntry& entry);
    static std::string encode_erase(const std::string& path);

    fs::path journal_path_;
    std::shared_ptr<Logger> logger_;
    std::ofstream journal_;

    std::unordered_map<std::string, CacheEntry> rows_;
    size_t dead_records_ = 0;

    bool persistent_ = false;
    bool is_open_ = false;
    bool recovered_ = false;

    mutable std::shared_mutex mutex_;
};

}  // namespace sweep
