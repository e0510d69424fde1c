#include <sweep/snapshot/archive.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <fstream>
#include <memory>

namespace sweep {

namespace {

constexpr size_t READ_BLOCK_SIZE = 10240;
constexpr size_t DATA_BUFFER_SIZE = 64 * 1024;

using ReadArchive = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
using WriteArchive = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
using EntryPtr = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

Error archive_error(struct archive* a, const std::string& context) {
    const char* msg = archive_error_string(a);
    return Error(ErrorCode::ARCHIVE_ERROR, context + ": " + (msg ? msg : "unknown error"));
}

// Reject members that would land outside the destination
bool is_safe_member(const std::string& name) {
    if (name.empty() || name[0] == '/') return false;
    for (const auto& part : fs::path(name)) {
        if (part == "..") return false;
    }
    return true;
}

std::string normalize_member(std::string name) {
    while (name.rfind("./", 0) == 0) {
        name.erase(0, 2);
    }
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    return name;
}

ReadArchive open_for_read(const fs::path& archive_path, Error& error) {
    ReadArchive a(archive_read_new(), &archive_read_free);
    archive_read_support_format_tar(a.get());
    archive_read_support_filter_all(a.get());

    if (archive_read_open_filename(a.get(), archive_path.c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        error = archive_error(a.get(), "open " + archive_path.string());
        return ReadArchive(nullptr, &archive_read_free);
    }
    return a;
}

class TarWriter {
public:
    TarWriter(const fs::path& source_dir, const CancellationToken& cancel)
        : source_dir_(source_dir)
        , cancel_(cancel)
        , out_(archive_write_new(), &archive_write_free)
        , disk_(archive_read_disk_new(), &archive_read_free) {}

    Result<void> open(const fs::path& archive_path) {
        archive_write_add_filter_gzip(out_.get());
        archive_write_set_format_pax_restricted(out_.get());
        if (archive_write_open_filename(out_.get(), archive_path.c_str()) != ARCHIVE_OK) {
            return archive_error(out_.get(), "create " + archive_path.string());
        }
        archive_read_disk_set_standard_lookup(disk_.get());
        archive_read_disk_set_symlink_physical(disk_.get());
        return Ok();
    }

    Result<void> add_tree(const std::vector<std::string>& first) {
        for (const auto& member : first) {
            std::error_code ec;
            if (fs::exists(fs::symlink_status(source_dir_ / member, ec))) {
                auto added = add_entry(source_dir_ / member, member);
                if (!added.ok()) return added;
                skip_.push_back(member);
            }
        }
        return add_directory(source_dir_, "");
    }

    Result<void> close() {
        if (archive_write_close(out_.get()) != ARCHIVE_OK) {
            return archive_error(out_.get(), "finish archive");
        }
        return Ok();
    }

    const ArchiveStats& stats() const { return stats_; }

private:
    Result<void> add_directory(const fs::path& dir, const std::string& rel) {
        std::error_code ec;
        std::vector<std::string> names;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            names.push_back(it->path().filename().string());
        }
        if (ec) {
            return error_from_code(ec, "list " + dir.string());
        }
        std::sort(names.begin(), names.end());

        for (const auto& name : names) {
            if (cancel_.cancelled()) {
                return Error(ErrorCode::CANCELLED, "Archiving cancelled");
            }

            const std::string child_rel = rel.empty() ? name : rel + "/" + name;
            if (std::find(skip_.begin(), skip_.end(), child_rel) != skip_.end()) {
                continue;
            }

            const fs::path child = dir / name;
            auto added = add_entry(child, child_rel);
            if (!added.ok()) return added;

            auto status = fs::symlink_status(child, ec);
            if (!ec && fs::is_directory(status)) {
                auto nested = add_directory(child, child_rel);
                if (!nested.ok()) return nested;
            }
        }
        return Ok();
    }

    Result<void> add_entry(const fs::path& path, const std::string& rel) {
        EntryPtr entry(archive_entry_new(), &archive_entry_free);
        archive_entry_copy_sourcepath(entry.get(), path.c_str());
        if (archive_read_disk_entry_from_file(disk_.get(), entry.get(), -1, nullptr) < ARCHIVE_WARN) {
            return archive_error(disk_.get(), "stat " + path.string());
        }
        archive_entry_copy_pathname(entry.get(), rel.c_str());

        if (archive_write_header(out_.get(), entry.get()) < ARCHIVE_WARN) {
            return archive_error(out_.get(), "write header " + rel);
        }
        ++stats_.entries;

        if (archive_entry_filetype(entry.get()) != AE_IFREG || archive_entry_size(entry.get()) <= 0) {
            return Ok();
        }

        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return Error(ErrorCode::IO_ERROR, "Failed to read " + path.string());
        }

        std::vector<char> buffer(DATA_BUFFER_SIZE);
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize n = in.gcount();
            if (n <= 0) break;
            if (archive_write_data(out_.get(), buffer.data(), static_cast<size_t>(n)) < 0) {
                return archive_error(out_.get(), "write data " + rel);
            }
            stats_.bytes += static_cast<uint64_t>(n);
        }
        if (in.bad()) {
            return Error(ErrorCode::IO_ERROR, "Failed to read " + path.string());
        }
        return Ok();
    }

    fs::path source_dir_;
    CancellationToken cancel_;
    WriteArchive out_;
    ReadArchive disk_;
    std::vector<std::string> skip_;
    ArchiveStats stats_;
};

}  // namespace

Result<ArchiveStats> write_tar_gz(const fs::path& source_dir,
                                  const fs::path& archive_path,
                                  const std::vector<std::string>& first,
                                  const CancellationToken& cancel) {
    TarWriter writer(source_dir, cancel);

    auto opened = writer.open(archive_path);
    if (!opened.ok()) return opened.error();

    auto added = writer.add_tree(first);
    if (!added.ok()) return added.error();

    auto closed = writer.close();
    if (!closed.ok()) return closed.error();

    return writer.stats();
}

Result<ArchiveStats> extract_tar_gz(const fs::path& archive_path, const fs::path& dest_dir) {
    Error open_error;
    ReadArchive in = open_for_read(archive_path, open_error);
    if (!in) return open_error;

    WriteArchive out(archive_write_disk_new(), &archive_write_free);
    archive_write_disk_set_options(out.get(),
                                   ARCHIVE_EXTRACT_TIME |
                                   ARCHIVE_EXTRACT_PERM |
                                   ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                   ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(out.get());

    ArchiveStats stats;
    struct archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const char* raw_name = archive_entry_pathname(entry);
        const std::string name = raw_name ? raw_name : "";
        if (!is_safe_member(name)) {
            return Error(ErrorCode::ARCHIVE_ERROR, "Unsafe member name '" + name + "'");
        }

        const fs::path target = dest_dir / name;
        archive_entry_copy_pathname(entry, target.c_str());

        const char* hardlink = archive_entry_hardlink(entry);
        if (hardlink) {
            if (!is_safe_member(hardlink)) {
                return Error(ErrorCode::ARCHIVE_ERROR, "Unsafe link target '" + std::string(hardlink) + "'");
            }
            const fs::path link_target = dest_dir / hardlink;
            archive_entry_copy_hardlink(entry, link_target.c_str());
        }

        if (archive_write_header(out.get(), entry) < ARCHIVE_WARN) {
            return archive_error(out.get(), "extract " + name);
        }

        if (archive_entry_size(entry) > 0) {
            const void* block = nullptr;
            size_t size = 0;
            la_int64_t offset = 0;
            int rd;
            while ((rd = archive_read_data_block(in.get(), &block, &size, &offset)) == ARCHIVE_OK) {
                if (archive_write_data_block(out.get(), block, size, offset) < ARCHIVE_WARN) {
                    return archive_error(out.get(), "extract " + name);
                }
                stats.bytes += size;
            }
            if (rd != ARCHIVE_EOF) {
                return archive_error(in.get(), "read " + name);
            }
        }

        if (archive_write_finish_entry(out.get()) < ARCHIVE_WARN) {
            return archive_error(out.get(), "finish " + name);
        }
        ++stats.entries;
    }

    if (r != ARCHIVE_EOF) {
        return archive_error(in.get(), "read " + archive_path.string());
    }
    if (archive_write_close(out.get()) != ARCHIVE_OK) {
        return archive_error(out.get(), "finish extraction");
    }
    return stats;
}

Result<std::string> read_archive_member(const fs::path& archive_path,
                                        const std::string& member,
                                        size_t max_size) {
    Error open_error;
    ReadArchive in = open_for_read(archive_path, open_error);
    if (!in) return open_error;

    const std::string wanted = normalize_member(member);
    struct archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const char* raw_name = archive_entry_pathname(entry);
        if (!raw_name || normalize_member(raw_name) != wanted ||
            archive_entry_filetype(entry) != AE_IFREG) {
            archive_read_data_skip(in.get());
            continue;
        }

        const la_int64_t size = archive_entry_size(entry);
        if (size < 0 || static_cast<uint64_t>(size) > max_size) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         "Member " + member + " exceeds " + std::to_string(max_size) + " bytes");
        }

        std::string content(static_cast<size_t>(size), '\0');
        size_t filled = 0;
        while (filled < content.size()) {
            la_ssize_t n = archive_read_data(in.get(), &content[filled], content.size() - filled);
            if (n < 0) {
                return archive_error(in.get(), "read " + member);
            }
            if (n == 0) break;
            filled += static_cast<size_t>(n);
        }
        if (filled != content.size()) {
            return Error(ErrorCode::ARCHIVE_ERROR, "Member " + member + " is truncated");
        }
        return content;
    }

    if (r != ARCHIVE_EOF) {
        return archive_error(in.get(), "read " + archive_path.string());
    }
    return Error(ErrorCode::NOT_FOUND, "No member " + member + " in " + archive_path.string());
}

}  // namespace sweep
