#pragma once

#include <gtest/gtest.h>
#include <sweep/fs/file_system.hpp>
#include <sweep/privilege.hpp>
#include <sweep/util/path_utils.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sweep::test {

/**
 * Scratch directory under the system temp dir, named after the running
 * test so that tests of one fixture can run in parallel.
 */
inline fs::path scratch_dir(const std::string& prefix) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = prefix;
    if (info) {
        name += "_";
        name += info->test_suite_name();
        name += "_";
        name += info->name();
    }
    return fs::temp_directory_path() / name;
}

/**
 * In-memory file system with call counters and injectable failures.
 *
 * Paths are stored lexically normalized. Adding an entry creates its
 * missing parent directories.
 */
class FakeFileSystem : public FileSystem {
public:
    void add_dir(const fs::path& path, int64_t mtime_ns = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        add_locked(path, EntryType::DIRECTORY, 0, mtime_ns);
    }

    void add_file(const fs::path& path, uint64_t size, int64_t mtime_ns = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        add_locked(path, EntryType::REGULAR, size, mtime_ns);
    }

    void add_symlink(const fs::path& path, uint64_t size = 16, int64_t mtime_ns = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        add_locked(path, EntryType::SYMLINK, size, mtime_ns);
    }

    void set_mtime(const fs::path& path, int64_t mtime_ns) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.at(key(path)).mtime_ns = mtime_ns;
    }

    void set_size(const fs::path& path, uint64_t size) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.at(key(path)).size = size;
    }

    void fail_stat(const fs::path& path, ErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex_);
        stat_faults_[key(path)] = code;
    }

    void fail_list(const fs::path& path, ErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex_);
        list_faults_[key(path)] = code;
    }

    /**
     * Make removal of the path fail with PERMISSION_DENIED. With
     * `cleared_by_make_writable`, a make_writable() call lifts the fault.
     */
    void deny_removal(const fs::path& path, bool cleared_by_make_writable = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        denied_[key(path)] = cleared_by_make_writable;
    }

    Result<FileStat> stat(const fs::path& path) const override {
        ++stat_calls_;
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string k = key(path);
        auto fault = stat_faults_.find(k);
        if (fault != stat_faults_.end()) {
            return Error(fault->second, "stat " + k);
        }
        auto it = entries_.find(k);
        if (it == entries_.end()) {
            return Error(ErrorCode::NOT_FOUND, "stat " + k);
        }
        return it->second;
    }

    Result<std::vector<std::string>> list(const fs::path& dir) const override {
        ++list_calls_;
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string k = key(dir);
        listed_.insert(k);
        auto fault = list_faults_.find(k);
        if (fault != list_faults_.end()) {
            return Error(fault->second, "list " + k);
        }
        auto it = entries_.find(k);
        if (it == entries_.end()) {
            return Error(ErrorCode::NOT_FOUND, "list " + k);
        }
        if (it->second.type != EntryType::DIRECTORY) {
            return Error(ErrorCode::IO_ERROR, "not a directory: " + k);
        }

        std::vector<std::string> names;
        for (const auto& [path, st] : entries_) {
            fs::path p(path);
            if (p.parent_path().string() == k && p != fs::path(k)) {
                names.push_back(p.filename().string());
            }
        }
        return names;  // std::map order is already lexicographic
    }

    Result<void> remove_file(const fs::path& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string k = key(path);
        ++remove_calls_;
        if (denied_.count(k)) {
            return Error(ErrorCode::PERMISSION_DENIED, "unlink " + k);
        }
        if (entries_.erase(k) == 0) {
            return Error(ErrorCode::NOT_FOUND, "unlink " + k);
        }
        removed_.push_back(k);
        return Ok();
    }

    Result<void> remove_tree(const fs::path& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string k = key(path);
        ++remove_calls_;
        for (const auto& [denied, cleared] : denied_) {
            if (is_within(denied, k)) {
                return Error(ErrorCode::PERMISSION_DENIED, "remove " + denied);
            }
        }
        if (entries_.find(k) == entries_.end()) {
            return Error(ErrorCode::NOT_FOUND, "remove " + k);
        }
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (is_within(it->first, k)) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
        removed_.push_back(k);
        return Ok();
    }

    Result<void> make_writable(const fs::path& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string k = key(path);
        writable_calls_.push_back(k);
        for (auto it = denied_.begin(); it != denied_.end();) {
            if (it->second && is_within(it->first, k)) {
                it = denied_.erase(it);
            } else {
                ++it;
            }
        }
        return Ok();
    }

    bool has(const fs::path& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(key(path)) > 0;
    }

    bool was_listed(const fs::path& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listed_.count(key(path)) > 0;
    }

    std::vector<std::string> removed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed_;
    }

    std::vector<std::string> writable_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writable_calls_;
    }

    size_t stat_calls() const { return stat_calls_.load(); }
    size_t list_calls() const { return list_calls_.load(); }
    size_t remove_calls() const { return remove_calls_.load(); }

    void reset_counters() {
        stat_calls_ = 0;
        list_calls_ = 0;
        remove_calls_ = 0;
        std::lock_guard<std::mutex> lock(mutex_);
        listed_.clear();
    }

private:
    static std::string key(const fs::path& path) {
        fs::path normal = path.lexically_normal();
        if (!normal.has_filename() && normal != normal.root_path()) {
            normal = normal.parent_path();
        }
        return normal.string();
    }

    void add_locked(const fs::path& path, EntryType type, uint64_t size, int64_t mtime_ns) {
        const fs::path normal(key(path));
        for (fs::path parent = normal.parent_path();
             !parent.empty() && parent != parent.root_path();
             parent = parent.parent_path()) {
            FileStat dir;
            dir.type = EntryType::DIRECTORY;
            dir.mtime_ns = 1;
            dir.mode = 0755;
            entries_.emplace(parent.string(), dir);
        }

        FileStat st;
        st.type = type;
        st.size = size;
        st.mtime_ns = mtime_ns;
        st.mode = type == EntryType::DIRECTORY ? 0755 : 0644;
        entries_[normal.string()] = st;
    }

    mutable std::mutex mutex_;
    std::map<std::string, FileStat> entries_;
    std::map<std::string, ErrorCode> stat_faults_;
    std::map<std::string, ErrorCode> list_faults_;
    std::map<std::string, bool> denied_;

    mutable std::set<std::string> listed_;
    std::vector<std::string> removed_;
    std::vector<std::string> writable_calls_;

    mutable std::atomic<size_t> stat_calls_{0};
    mutable std::atomic<size_t> list_calls_{0};
    std::atomic<size_t> remove_calls_{0};
};

/**
 * LocalFileSystem that records every directory it lists.
 */
class CountingFileSystem : public LocalFileSystem {
public:
    Result<std::vector<std::string>> list(const fs::path& dir) const override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listed_.insert(dir.lexically_normal().string());
        }
        return LocalFileSystem::list(dir);
    }

    bool was_listed(const fs::path& dir) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listed_.count(dir.lexically_normal().string()) > 0;
    }

    size_t list_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listed_.size();
    }

    std::set<std::string> listed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listed_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::set<std::string> listed_;
};

/**
 * Records elevated commands instead of running them.
 */
class RecordingElevator : public PrivilegeElevator {
public:
    explicit RecordingElevator(bool succeed = true) : succeed_(succeed) {}

    Result<void> elevate_and_run(const std::vector<std::string>& argv) override {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(argv);
        if (!succeed_) {
            return Error(ErrorCode::ELEVATION_FAILED, argv.empty() ? "" : argv[0] + " refused");
        }
        return Ok();
    }

    std::vector<std::vector<std::string>> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

private:
    bool succeed_;
    mutable std::mutex mutex_;
    std::vector<std::vector<std::string>> commands_;
};

}  // namespace sweep::test
