#include <sweep/snapshot/file_copier.hpp>
#include <sweep/fs/file_system.hpp>

#include <algorithm>
#include <cerrno>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sweep {

namespace {

class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) ::close(fd_);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

    // Close explicitly so that a failing close is reported
    int close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

// Remove a file or link occupying dst; directories are left alone
Result<void> clear_destination(const fs::path& dst) {
    struct stat st{};
    if (::lstat(dst.c_str(), &st) != 0) {
        if (errno == ENOENT) return Ok();
        return error_from_errno(errno, "lstat " + dst.string());
    }
    if (S_ISDIR(st.st_mode)) {
        return Error(ErrorCode::ALREADY_EXISTS, dst.string() + " is a directory");
    }
    if (::unlink(dst.c_str()) != 0 && errno != ENOENT) {
        return error_from_errno(errno, "unlink " + dst.string());
    }
    return Ok();
}

Result<void> write_all(int fd, const char* data, size_t len, const fs::path& dst) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return error_from_errno(errno, "write " + dst.string());
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return Ok();
}

}  // namespace

CopyStats& CopyStats::operator+=(const CopyStats& other) {
    files += other.files;
    directories += other.directories;
    symlinks += other.symlinks;
    skipped += other.skipped;
    failed += other.failed;
    bytes += other.bytes;
    failures.insert(failures.end(), other.failures.begin(), other.failures.end());
    return *this;
}

// =============================================================================
// Single-entry copies
// =============================================================================

Result<void> copy_metadata(const fs::path& src, const fs::path& dst) {
    struct stat st{};
    if (::lstat(src.c_str(), &st) != 0) {
        return error_from_errno(errno, "lstat " + src.string());
    }

    if (!S_ISLNK(st.st_mode)) {
        if (::chmod(dst.c_str(), st.st_mode & 07777) != 0) {
            return error_from_errno(errno, "chmod " + dst.string());
        }
    }

    struct timespec times[2];
    times[0] = st.st_atim;
    times[1] = st.st_mtim;
    if (::utimensat(AT_FDCWD, dst.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        return error_from_errno(errno, "utimensat " + dst.string());
    }
    return Ok();
}

Result<void> copy_file_buffered(const fs::path& src, const fs::path& dst) {
    auto cleared = clear_destination(dst);
    if (!cleared.ok()) return cleared;

    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return error_from_code(ec, "copy " + src.string());
    }
    return copy_metadata(src, dst);
}

Result<void> copy_file_chunked(const fs::path& src, const fs::path& dst, uint64_t expected_size,
                               size_t chunk_size) {
    FdGuard in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0) {
        return error_from_errno(errno, "open " + src.string());
    }

    auto cleared = clear_destination(dst);
    if (!cleared.ok()) return cleared;

    FdGuard out(::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
    if (out.get() < 0) {
        return error_from_errno(errno, "create " + dst.string());
    }

    ::posix_fadvise(in.get(), 0, 0, POSIX_FADV_SEQUENTIAL);

    std::vector<char> buffer(std::max<size_t>(chunk_size, 1));
    uint64_t copied = 0;
    for (;;) {
        ssize_t n = ::read(in.get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return error_from_errno(errno, "read " + src.string());
        }
        if (n == 0) break;

        auto written = write_all(out.get(), buffer.data(), static_cast<size_t>(n), dst);
        if (!written.ok()) return written;
        copied += static_cast<uint64_t>(n);
    }

    if (copied < expected_size) {
        return Error(ErrorCode::IO_ERROR,
                     src.string() + " shrank during copy (" + std::to_string(copied) + " of " +
                         std::to_string(expected_size) + " bytes)");
    }

    if (out.close() != 0) {
        return error_from_errno(errno, "close " + dst.string());
    }
    return copy_metadata(src, dst);
}

Result<void> copy_symlink(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    fs::path target = fs::read_symlink(src, ec);
    if (ec) {
        return error_from_code(ec, "readlink " + src.string());
    }

    auto cleared = clear_destination(dst);
    if (!cleared.ok()) return cleared;

    fs::create_symlink(target, dst, ec);
    if (ec) {
        return error_from_code(ec, "symlink " + dst.string());
    }
    return Ok();
}

// =============================================================================
// TreeCopier
// =============================================================================

TreeCopier::TreeCopier(WorkerPool& pool,
                       uint64_t large_file_threshold,
                       std::shared_ptr<Logger> logger,
                       PrivilegeElevator* elevator,
                       CancellationToken cancel)
    : pool_(pool)
    , large_file_threshold_(large_file_threshold)
    , logger_(logger_or_null(std::move(logger)))
    , elevator_(elevator)
    , cancel_(std::move(cancel)) {}

void TreeCopier::copy(const fs::path& src, const fs::path& dst, bool elevated) {
    auto st = lstat_path(src);
    if (!st.ok()) {
        if (st.error_code() == ErrorCode::NOT_FOUND) {
            logger_->debug("Skipping missing " + src.string());
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.skipped;
        } else {
            record_failure(src, st.error());
        }
        return;
    }

    // Parents of the first entry are created without copying their metadata
    std::error_code ec;
    fs::create_directories(dst.parent_path(), ec);
    if (ec) {
        record_failure(dst.parent_path(), error_from_code(ec, "mkdir " + dst.parent_path().string()));
        return;
    }

    copy_entry(src, dst, elevated);
}

void TreeCopier::copy_entry(const fs::path& src, const fs::path& dst, bool elevated) {
    if (cancel_.cancelled()) return;

    auto st = lstat_path(src);
    if (!st.ok()) {
        if (st.error_code() == ErrorCode::NOT_FOUND) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.skipped;
        } else {
            record_failure(src, st.error());
        }
        return;
    }

    switch (st->type) {
        case EntryType::REGULAR:
            copy_regular(src, dst, st->size, elevated);
            return;

        case EntryType::SYMLINK: {
            auto linked = sweep::copy_symlink(src, dst);
            if (!linked.ok() && !(elevated && try_elevated(src, dst, linked.error()))) {
                record_failure(src, linked.error());
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.symlinks;
            return;
        }

        case EntryType::DIRECTORY: {
            std::error_code ec;
            fs::create_directory(dst, ec);
            if (ec) {
                Error error = error_from_code(ec, "mkdir " + dst.string());
                if (elevated && copy_tree_elevated(src, dst, error)) {
                    return;
                }
                record_failure(dst, error);
                return;
            }
            // Owner needs write access while the children are copied in
            fs::permissions(dst, fs::perms::owner_all, fs::perm_options::add, ec);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++stats_.directories;
                directories_.push_back(PendingDirectory{src, dst});
            }

            std::vector<std::string> names;
            for (fs::directory_iterator it(src, ec), end; !ec && it != end; it.increment(ec)) {
                names.push_back(it->path().filename().string());
            }
            if (ec) {
                record_failure(src, error_from_code(ec, "list " + src.string()));
                return;
            }
            std::sort(names.begin(), names.end());
            for (const auto& name : names) {
                copy_entry(src / name, dst / name, elevated);
            }
            return;
        }

        default: {
            logger_->debug("Skipping special file " + src.string());
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.skipped;
            return;
        }
    }
}

void TreeCopier::copy_regular(const fs::path& src, const fs::path& dst, uint64_t size,
                              bool elevated) {
    pool_.submit([this, src, dst, size, elevated] {
        if (cancel_.cancelled()) return;

        auto copied = size >= large_file_threshold_ ? copy_file_chunked(src, dst, size)
                                                    : copy_file_buffered(src, dst);
        if (!copied.ok()) {
            if (!elevated || !try_elevated(src, dst, copied.error())) {
                record_failure(src, copied.error());
                return;
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.files;
        stats_.bytes += size;
    });
}

bool TreeCopier::try_elevated(const fs::path& src, const fs::path& dst, const Error& error) {
    if (!elevator_ || error.code() != ErrorCode::PERMISSION_DENIED) {
        return false;
    }

    auto result = elevator_->elevate_and_run({"cp", "-pP", src.string(), dst.string()});
    if (!result.ok()) {
        logger_->warning("Elevated copy of " + src.string() + " failed: " +
                         result.error().to_string());
        return false;
    }
    return true;
}

bool TreeCopier::copy_tree_elevated(const fs::path& src, const fs::path& dst,
                                    const Error& error) {
    if (!elevator_ || error.code() != ErrorCode::PERMISSION_DENIED) {
        return false;
    }

    // Tally before copying so the totals describe what was handed over
    CopyStats tally;
    tally.directories = 1;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(src, ec), end; !ec && it != end; it.increment(ec)) {
        auto st = it->symlink_status(ec);
        if (ec) break;
        if (fs::is_directory(st)) {
            ++tally.directories;
        } else if (fs::is_symlink(st)) {
            ++tally.symlinks;
        } else if (fs::is_regular_file(st)) {
            ++tally.files;
            tally.bytes += it->file_size(ec);
            if (ec) break;
        } else {
            ++tally.skipped;
        }
    }
    if (ec) {
        record_failure(src, error_from_code(ec, "list " + src.string()));
        return true;
    }

    auto result = elevator_->elevate_and_run({"cp", "-pPR", src.string(), dst.string()});
    if (!result.ok()) {
        logger_->warning("Elevated copy of " + src.string() + " failed: " +
                         result.error().to_string());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats_ += tally;
    return true;
}

void TreeCopier::record_failure(const fs::path& path, const Error& error) {
    logger_->warning("Copy failed for " + path.string() + ": " + error.to_string());
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.failed;
    stats_.failures.push_back(FailureRecord{path.string(), error.to_string()});
}

CopyStats TreeCopier::finish() {
    pool_.wait_idle();

    std::vector<PendingDirectory> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(directories_);
    }

    // Children were recorded after their parents; apply in reverse
    for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
        auto applied = copy_metadata(it->src, it->dst);
        if (!applied.ok()) {
            logger_->debug("Directory metadata not preserved for " + it->dst.string() +
                           ": " + applied.error().to_string());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    CopyStats result = std::move(stats_);
    stats_ = CopyStats();
    return result;
}

}  // namespace sweep
