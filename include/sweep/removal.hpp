#pragma once

#include <sweep/fs/file_system.hpp>
#include <sweep/privilege.hpp>
#include <sweep/result.hpp>
#include <sweep/scanner.hpp>
#include <sweep/snapshot/snapshot_manager.hpp>
#include <sweep/types.hpp>
#include <sweep/util/logger.hpp>
#include <sweep/util/tree_lock.hpp>
#include <sweep/util/worker_pool.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sweep {

enum class RemovalMode {
    STANDARD,   // Permission problems are reported as failures
    FORCED      // Reset permissions, then fall back to the elevator
};

enum class EntryStatus {
    REMOVED,
    SKIPPED,    // Already absent, or cancelled before it was attempted
    FAILED
};

inline const char* entry_status_name(EntryStatus status) {
    switch (status) {
        case EntryStatus::REMOVED: return "removed";
        case EntryStatus::SKIPPED: return "skipped";
        case EntryStatus::FAILED: return "failed";
    }
    return "unknown";
}

struct RemovalOptions {
    bool snapshot_before = false;
    std::string snapshot_name;      // Passed to SnapshotManager::create_snapshot
    size_t batch_size = REMOVAL_BATCH_SIZE;
    size_t max_workers = 0;         // 0 = default_worker_count()
    CancellationToken cancel;
};

struct EntryOutcome {
    std::string path;
    EntryStatus status = EntryStatus::FAILED;
    std::string reason;
};

struct RemovalReport {
    std::vector<EntryOutcome> outcomes;  // One per distinct candidate, ordered by path
    size_t removed = 0;
    size_t skipped = 0;
    size_t failed = 0;
    size_t worker_failures = 0;
    bool cancelled = false;
    std::optional<Snapshot> snapshot;

    std::vector<FailureRecord> failures() const;
    const EntryOutcome* find(const std::string& path) const;
};

/**
 * RemovalOrchestrator - Deletes candidates and reports every outcome.
 *
 * Candidates are processed outermost first. An entry whose ancestor was
 * removed is reported REMOVED without being touched; an entry whose
 * ancestor failed is attempted on its own. Each nesting level is split into
 * batches that run on a worker pool.
 *
 * Per entry: a missing entry is SKIPPED; files and links are unlinked and
 * directories removed recursively. In FORCED mode a permission failure is
 * retried after make_writable() and then as "rm -rf -- <path>" through the
 * elevator before the entry is reported FAILED.
 */
class RemovalOrchestrator {
public:
    RemovalOrchestrator(std::shared_ptr<FileSystem> file_system,
                        RemovalOptions options = RemovalOptions(),
                        std::shared_ptr<Logger> logger = nullptr,
                        PrivilegeElevator* elevator = nullptr,
                        SnapshotManager* snapshots = nullptr,
                        TreeLockRegistry* locks = nullptr);

    /**
     * Remove the given paths.
     *
     * @return The snapshot error when options.snapshot_before is set and
     *         the snapshot could not be created; nothing is deleted then
     */
    Result<RemovalReport> remove(const std::vector<std::string>& candidates, RemovalMode mode);

    Result<RemovalReport> remove(const ScanResult& scan, RemovalMode mode);

private:
    EntryOutcome remove_entry(const std::string& path, RemovalMode mode);
    EntryOutcome escalate(const std::string& path, EntryType type, const Error& first_error);

    std::shared_ptr<FileSystem> fs_;
    RemovalOptions options_;
    std::shared_ptr<Logger> logger_;
    PrivilegeElevator* elevator_;
    SnapshotManager* snapshots_;
    TreeLockRegistry* locks_;
};

}  // namespace sweep
