#pragma once

#include <sweep/core_types.hpp>
#include <sweep/result.hpp>

#include <string>
#include <vector>

namespace sweep {

/**
 * FileSystem - The filesystem operations the engine depends on.
 *
 * The scanner, metadata cache and removal orchestrator go through this
 * interface so tests can count traversal and inject permission failures.
 * No operation follows symbolic links.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    /**
     * lstat the path.
     *
     * @return NOT_FOUND if the entry does not exist
     */
    virtual Result<FileStat> stat(const fs::path& path) const = 0;

    /**
     * List the names of a directory's children, sorted lexicographically.
     */
    virtual Result<std::vector<std::string>> list(const fs::path& dir) const = 0;

    /**
     * Unlink a regular file, symlink or other non-directory entry.
     */
    virtual Result<void> remove_file(const fs::path& path) = 0;

    /**
     * Remove a directory and everything beneath it.
     */
    virtual Result<void> remove_tree(const fs::path& path) = 0;

    /**
     * Clear read-only attributes so that a removal can be retried.
     * Grants owner write on the entry's parent and, for a directory, on
     * every directory beneath it.
     */
    virtual Result<void> make_writable(const fs::path& path) = 0;

    bool exists(const fs::path& path) const { return stat(path).ok(); }
};

/**
 * FileSystem backed by POSIX calls and std::filesystem.
 */
class LocalFileSystem : public FileSystem {
public:
    Result<FileStat> stat(const fs::path& path) const override;
    Result<std::vector<std::string>> list(const fs::path& dir) const override;
    Result<void> remove_file(const fs::path& path) override;
    Result<void> remove_tree(const fs::path& path) override;
    Result<void> make_writable(const fs::path& path) override;
};

/**
 * lstat into a FileStat. Shared by LocalFileSystem and the snapshot copier.
 */
Result<FileStat> lstat_path(const fs::path& path);

}  // namespace sweep
