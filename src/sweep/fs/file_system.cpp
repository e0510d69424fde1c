#include <sweep/fs/file_system.hpp>

#include <algorithm>
#include <cerrno>
#include <sys/stat.h>
#include <unistd.h>

namespace sweep {

namespace {

EntryType entry_type_from_mode(mode_t mode) {
    if (S_ISREG(mode)) return EntryType::REGULAR;
    if (S_ISDIR(mode)) return EntryType::DIRECTORY;
    if (S_ISLNK(mode)) return EntryType::SYMLINK;
    return EntryType::OTHER;
}

}  // namespace

Result<FileStat> lstat_path(const fs::path& path) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        return error_from_errno(errno, "lstat " + path.string());
    }

    FileStat result;
    result.type = entry_type_from_mode(st.st_mode);
    result.size = static_cast<uint64_t>(st.st_size);
    result.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                      static_cast<int64_t>(st.st_mtim.tv_nsec);
    result.mode = static_cast<uint32_t>(st.st_mode & 07777);
    return result;
}

Result<FileStat> LocalFileSystem::stat(const fs::path& path) const {
    return lstat_path(path);
}

Result<std::vector<std::string>> LocalFileSystem::list(const fs::path& dir) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return error_from_code(ec, "list " + dir.string());
    }

    std::vector<std::string> names;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return error_from_code(ec, "list " + dir.string());
        }
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        return error_from_code(ec, "list " + dir.string());
    }

    std::sort(names.begin(), names.end());
    return names;
}

Result<void> LocalFileSystem::remove_file(const fs::path& path) {
    if (::unlink(path.c_str()) != 0) {
        return error_from_errno(errno, "unlink " + path.string());
    }
    return Ok();
}

Result<void> LocalFileSystem::remove_tree(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        return error_from_code(ec, "remove " + path.string());
    }
    return Ok();
}

Result<void> LocalFileSystem::make_writable(const fs::path& path) {
    std::error_code ec;
    Error first_error;

    auto grant = [&](const fs::path& p, fs::perms perms) {
        fs::permissions(p, perms, fs::perm_options::add | fs::perm_options::nofollow, ec);
        if (ec && first_error.ok()) {
            first_error = error_from_code(ec, "chmod " + p.string());
        }
        ec.clear();
    };

    if (path.has_parent_path()) {
        grant(path.parent_path(), fs::perms::owner_all);
    }

    auto st = lstat_path(path);
    if (!st.ok()) {
        return st.error();
    }

    if (st->type == EntryType::DIRECTORY) {
        grant(path, fs::perms::owner_all);
        fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return error_from_code(ec, "walk " + path.string());
        }
        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) break;
            if (it->is_directory(ec) && !it->is_symlink(ec)) {
                grant(it->path(), fs::perms::owner_all);
            }
        }
    } else if (st->type == EntryType::REGULAR) {
        grant(path, fs::perms::owner_write);
    }

    if (!first_error.ok()) {
        return first_error;
    }
    return Ok();
}

}  // namespace sweep
