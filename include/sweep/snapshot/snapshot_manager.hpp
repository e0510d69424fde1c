#pragma once

#include <sweep/privilege.hpp>
#include <sweep/result.hpp>
#include <sweep/snapshot/file_copier.hpp>
#include <sweep/types.hpp>
#include <sweep/util/logger.hpp>
#include <sweep/util/tree_lock.hpp>
#include <sweep/util/worker_pool.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sweep {

struct SnapshotOptions {
    fs::path backup_dir;
    std::vector<SnapshotCategory> categories;
    uint64_t large_file_threshold = LARGE_FILE_THRESHOLD;
    size_t copy_workers = 0;        // 0 = default_worker_count()
    std::string creator;            // Empty = login name
    std::function<TimePoint()> clock;
};

struct SnapshotReport {
    Snapshot snapshot;
    CopyStats copy;
};

struct RestoreOptions {
    // Category name -> live root, replacing the root recorded in the manifest
    std::map<std::string, fs::path> root_overrides;
    CancellationToken cancel;
};

/**
 * One restore in progress: the snapshot and where each category goes.
 */
struct RestoreJob {
    Snapshot snapshot;
    SnapshotManifest manifest;
    std::map<std::string, fs::path> roots;
};

struct RestoreReport {
    Snapshot snapshot;
    std::map<std::string, fs::path> roots;
    CopyStats copy;
    bool cancelled = false;
};

/**
 * SnapshotManager - Creates, lists and restores compressed snapshots.
 *
 * A snapshot is one "<id>.tar.gz" file in the backup directory holding
 * manifest.json and one directory per category; sources are stored
 * relative to their category root. The archive is built under a ".partial"
 * name and renamed into place, so a listed snapshot is always complete.
 *
 * Copy failures of individual files do not fail a snapshot or a restore;
 * they are counted and listed in the report. Restore never touches a live
 * file before the archive has been extracted and its manifest validated.
 */
class SnapshotManager {
public:
    static constexpr int MANIFEST_FORMAT = 1;
    static constexpr const char* STAGING_DIR_NAME = ".staging";
    static constexpr const char* PARTIAL_SUFFIX = ".partial";
    static constexpr const char* DEFAULT_SNAPSHOT_NAME = "RestorePoint";

    SnapshotManager(SnapshotOptions options,
                    std::shared_ptr<Logger> logger = nullptr,
                    PrivilegeElevator* elevator = nullptr,
                    TreeLockRegistry* locks = nullptr);

    /**
     * Capture every category into a new snapshot.
     *
     * @param name Human-readable name; empty means "RestorePoint"
     * @return The sealed snapshot and copy counts, or the error that
     *         prevented sealing (nothing is left in the backup directory)
     */
    Result<SnapshotReport> create_snapshot(const std::string& name,
                                           CancellationToken cancel = CancellationToken());

    /**
     * Copy a snapshot's contents back onto the live roots.
     *
     * @param name Snapshot id, archive file name, or snapshot name (latest wins)
     * @return NOT_FOUND, ARCHIVE_ERROR or MANIFEST_INVALID without touching
     *         live files; otherwise a report with per-file failures
     */
    Result<RestoreReport> restore(const std::string& name,
                                  RestoreOptions options = RestoreOptions());

    /**
     * Sealed snapshots, newest first.
     */
    std::vector<Snapshot> list_snapshots() const;

    Result<Snapshot> find_snapshot(const std::string& name) const;

    Result<void> delete_snapshot(const std::string& name);

    /**
     * Read the manifest of a sealed snapshot without extracting it.
     */
    Result<SnapshotManifest> read_manifest(const std::string& name) const;

    const SnapshotOptions& options() const { return options_; }

    /**
     * Categories captured by default: user data under `home` and
     * application/launch directories under "/" (elevated).
     */
    static std::vector<SnapshotCategory> default_categories(const fs::path& home);

    /**
     * Keep [A-Za-z0-9._-], replace anything else with '_'.
     */
    static std::string sanitize_name(const std::string& name);

    static nlohmann::json manifest_to_json(const SnapshotManifest& manifest);

    /**
     * Write the manifest as indented JSON. The file is closed before the
     * stream state is checked so that a failing final flush is reported.
     */
    static Result<void> write_manifest(const fs::path& path, const SnapshotManifest& manifest);

    /**
     * Parse and validate a manifest. Any structural problem is
     * MANIFEST_INVALID.
     */
    static Result<SnapshotManifest> manifest_from_json(const std::string& text);

private:
    std::string allocate_id(const std::string& base) const;
    Result<Snapshot> describe(const fs::path& archive_path) const;
    TimePoint now() const;

    SnapshotOptions options_;
    std::shared_ptr<Logger> logger_;
    PrivilegeElevator* elevator_;
    TreeLockRegistry* locks_;
};

}  // namespace sweep
