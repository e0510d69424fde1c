#pragma once

#include <sweep/core_types.hpp>
#include <sweep/result.hpp>
#include <sweep/util/worker_pool.hpp>

#include <string>
#include <vector>

namespace sweep {

struct ArchiveStats {
    size_t entries = 0;
    uint64_t bytes = 0;  // Regular file payload
};

/**
 * Pack a directory tree into a gzip-compressed pax tarball.
 *
 * Member names are relative to source_dir. Symlinks are stored as links;
 * owners, permissions and times are taken from the files. Members named in
 * `first` (relative to source_dir) are written before the walk so readers
 * that only need them can stop early.
 *
 * @return ARCHIVE_ERROR on any libarchive failure; the output file may be
 *         incomplete and is left for the caller to remove
 */
Result<ArchiveStats> write_tar_gz(const fs::path& source_dir,
                                  const fs::path& archive_path,
                                  const std::vector<std::string>& first = {},
                                  const CancellationToken& cancel = CancellationToken());

/**
 * Extract a tarball into dest_dir.
 *
 * Absolute member names and names containing ".." are rejected, as are
 * writes through symlinks created by earlier members.
 */
Result<ArchiveStats> extract_tar_gz(const fs::path& archive_path, const fs::path& dest_dir);

/**
 * Read one regular-file member into memory without extracting the rest.
 *
 * @return NOT_FOUND if the archive has no such member, INVALID_ARGUMENT if
 *         the member is larger than max_size
 */
Result<std::string> read_archive_member(const fs::path& archive_path,
                                        const std::string& member,
                                        size_t max_size = 16 * 1024 * 1024);

}  // namespace sweep
