#pragma once

#include <sweep/core_types.hpp>
#include <sweep/privilege.hpp>
#include <sweep/result.hpp>
#include <sweep/types.hpp>
#include <sweep/util/logger.hpp>
#include <sweep/util/worker_pool.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sweep {

struct CopyStats {
    size_t files = 0;
    size_t directories = 0;
    size_t symlinks = 0;
    size_t skipped = 0;     // Missing sources, sockets, fifos, devices
    size_t failed = 0;
    uint64_t bytes = 0;
    std::vector<FailureRecord> failures;

    CopyStats& operator+=(const CopyStats& other);
};

/**
 * Copy a regular file with std::filesystem, then its permissions and times.
 * An existing non-directory destination is replaced.
 */
Result<void> copy_file_buffered(const fs::path& src, const fs::path& dst);

/**
 * Stream a regular file through a `chunk_size` buffer, then copy its
 * permissions and times. Intended for large files.
 *
 * @return IO_ERROR if the source ends before `expected_size` bytes
 */
Result<void> copy_file_chunked(const fs::path& src, const fs::path& dst, uint64_t expected_size,
                               size_t chunk_size = COPY_CHUNK_SIZE);

/**
 * Apply the permission bits and access/modification times of src to dst
 * without following links.
 */
Result<void> copy_metadata(const fs::path& src, const fs::path& dst);

/**
 * Recreate a symbolic link. An existing non-directory destination is
 * replaced.
 */
Result<void> copy_symlink(const fs::path& src, const fs::path& dst);

/**
 * TreeCopier - Copies file trees with file payloads spread over a pool.
 *
 * Directories and symlinks are created by the calling thread while it
 * walks; regular files are queued on the pool. Files below the large-file
 * threshold take the buffered path, larger ones the chunked path. Directory
 * permissions and times are applied by finish(), deepest first, after all
 * files are in place.
 *
 * With `elevated` set, a copy that fails with PERMISSION_DENIED is retried
 * through the elevator: "cp -pP <src> <dst>" for files and links,
 * "cp -pPR <src> <dst>" for a directory that could not be created.
 */
class TreeCopier {
public:
    TreeCopier(WorkerPool& pool,
               uint64_t large_file_threshold,
               std::shared_ptr<Logger> logger = nullptr,
               PrivilegeElevator* elevator = nullptr,
               CancellationToken cancel = CancellationToken());

    /**
     * Copy src (any entry type) to dst. Missing sources are counted as
     * skipped. Does not wait for queued files.
     */
    void copy(const fs::path& src, const fs::path& dst, bool elevated = false);

    /**
     * Wait for queued files, apply directory metadata and return the totals.
     */
    CopyStats finish();

private:
    struct PendingDirectory {
        fs::path src;
        fs::path dst;
    };

    void copy_entry(const fs::path& src, const fs::path& dst, bool elevated);
    void copy_regular(const fs::path& src, const fs::path& dst, uint64_t size, bool elevated);
    bool try_elevated(const fs::path& src, const fs::path& dst, const Error& error);
    bool copy_tree_elevated(const fs::path& src, const fs::path& dst, const Error& error);
    void record_failure(const fs::path& path, const Error& error);

    WorkerPool& pool_;
    uint64_t large_file_threshold_;
    std::shared_ptr<Logger> logger_;
    PrivilegeElevator* elevator_;
    CancellationToken cancel_;

    std::mutex mutex_;
    CopyStats stats_;
    std::vector<PendingDirectory> directories_;
};

}  // namespace sweep
