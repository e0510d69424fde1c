#include <sweep/removal.hpp>
#include <sweep/util/path_utils.hpp>

#include <algorithm>
#include <map>
#include <set>

namespace sweep {

namespace {

std::string normalize_candidate(const std::string& path) {
    fs::path normal = fs::path(path).lexically_normal();
    if (!normal.has_filename() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal.string();
}

// Nearest ancestor of `path` in the candidate set, if any
std::optional<std::string> nearest_ancestor(const std::string& path,
                                            const std::set<std::string>& candidates) {
    fs::path p(path);
    fs::path parent = p.parent_path();
    while (!parent.empty() && parent != p) {
        auto it = candidates.find(parent.string());
        if (it != candidates.end()) {
            return *it;
        }
        p = parent;
        parent = p.parent_path();
    }
    return std::nullopt;
}

}  // namespace

std::vector<FailureRecord> RemovalReport::failures() const {
    std::vector<FailureRecord> result;
    for (const auto& outcome : outcomes) {
        if (outcome.status == EntryStatus::FAILED) {
            result.push_back(FailureRecord{outcome.path, outcome.reason});
        }
    }
    return result;
}

const EntryOutcome* RemovalReport::find(const std::string& path) const {
    for (const auto& outcome : outcomes) {
        if (outcome.path == path) return &outcome;
    }
    return nullptr;
}

RemovalOrchestrator::RemovalOrchestrator(std::shared_ptr<FileSystem> file_system,
                                         RemovalOptions options,
                                         std::shared_ptr<Logger> logger,
                                         PrivilegeElevator* elevator,
                                         SnapshotManager* snapshots,
                                         TreeLockRegistry* locks)
    : fs_(std::move(file_system))
    , options_(std::move(options))
    , logger_(logger_or_null(std::move(logger)))
    , elevator_(elevator)
    , snapshots_(snapshots)
    , locks_(locks) {
    if (!fs_) {
        fs_ = std::make_shared<LocalFileSystem>();
    }
    if (options_.batch_size == 0) {
        options_.batch_size = REMOVAL_BATCH_SIZE;
    }
}

Result<RemovalReport> RemovalOrchestrator::remove(const ScanResult& scan, RemovalMode mode) {
    return remove(scan.paths(), mode);
}

Result<RemovalReport> RemovalOrchestrator::remove(const std::vector<std::string>& candidates,
                                                  RemovalMode mode) {
    RemovalReport report;

    if (options_.snapshot_before) {
        if (!snapshots_) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         "Snapshot requested but no snapshot manager configured");
        }
        auto snapshot = snapshots_->create_snapshot(options_.snapshot_name, options_.cancel);
        if (!snapshot.ok()) {
            logger_->error("Pre-removal snapshot failed, nothing removed: " +
                           snapshot.error().to_string());
            return snapshot.error();
        }
        report.snapshot = snapshot->snapshot;
    }

    std::set<std::string> unique;
    for (const auto& candidate : candidates) {
        if (!candidate.empty()) {
            unique.insert(normalize_candidate(candidate));
        }
    }

    // Nesting depth of every candidate and its nearest candidate ancestor
    std::map<std::string, size_t> depth;
    std::map<std::string, std::string> parent_of;
    size_t max_depth = 0;
    for (const auto& path : unique) {
        size_t d = 0;
        std::string current = path;
        while (auto ancestor = nearest_ancestor(current, unique)) {
            if (d == 0) parent_of[path] = *ancestor;
            ++d;
            current = *ancestor;
        }
        depth[path] = d;
        max_depth = std::max(max_depth, d);
    }

    std::vector<fs::path> top_level;
    for (const auto& [path, d] : depth) {
        if (d == 0) top_level.emplace_back(path);
    }
    TreeLock lock;
    if (locks_ && !top_level.empty()) {
        lock = locks_->acquire(top_level);
    }

    std::map<std::string, EntryOutcome> outcomes;
    for (const auto& path : unique) {
        outcomes[path] = EntryOutcome{path, EntryStatus::FAILED, "not processed"};
    }

    const size_t workers = options_.max_workers > 0 ? options_.max_workers
                                                    : default_worker_count();
    WorkerPool pool(workers, "removal", logger_);

    for (size_t level = 0; level <= max_depth && !unique.empty(); ++level) {
        std::vector<EntryOutcome*> pending;
        for (const auto& [path, d] : depth) {
            if (d != level) continue;

            EntryOutcome& outcome = outcomes[path];
            auto parent = parent_of.find(path);
            if (parent != parent_of.end() &&
                outcomes[parent->second].status == EntryStatus::REMOVED) {
                outcome.status = EntryStatus::REMOVED;
                outcome.reason = "removed with ancestor";
                continue;
            }
            pending.push_back(&outcome);
        }

        for (size_t start = 0; start < pending.size(); start += options_.batch_size) {
            const size_t end = std::min(pending.size(), start + options_.batch_size);
            for (size_t i = start; i < end; ++i) {
                EntryOutcome* target = pending[i];
                const std::string path = target->path;
                pool.submit([this, target, path, mode] {
                    *target = remove_entry(path, mode);
                });
            }
            pool.wait_idle();
        }
    }
    report.worker_failures = pool.failure_count();

    for (auto& [path, outcome] : outcomes) {
        switch (outcome.status) {
            case EntryStatus::REMOVED: ++report.removed; break;
            case EntryStatus::SKIPPED: ++report.skipped; break;
            case EntryStatus::FAILED: ++report.failed; break;
        }
        report.outcomes.push_back(std::move(outcome));
    }
    report.cancelled = options_.cancel.cancelled();

    logger_->info("Removal finished: " + std::to_string(report.removed) + " removed, " +
                  std::to_string(report.skipped) + " skipped, " +
                  std::to_string(report.failed) + " failed");
    return report;
}

EntryOutcome RemovalOrchestrator::remove_entry(const std::string& path, RemovalMode mode) {
    EntryOutcome outcome{path, EntryStatus::FAILED, ""};

    if (options_.cancel.cancelled()) {
        outcome.status = EntryStatus::SKIPPED;
        outcome.reason = "cancelled";
        return outcome;
    }

    auto st = fs_->stat(path);
    if (!st.ok()) {
        if (st.error_code() == ErrorCode::NOT_FOUND) {
            outcome.status = EntryStatus::SKIPPED;
            outcome.reason = "already absent";
        } else {
            outcome.reason = st.error().to_string();
            logger_->warning("Cannot remove " + path + ": " + outcome.reason);
        }
        return outcome;
    }

    const EntryType type = st->type;
    auto attempt = [&]() {
        return type == EntryType::DIRECTORY ? fs_->remove_tree(path) : fs_->remove_file(path);
    };

    auto removed = attempt();
    if (removed.ok()) {
        outcome.status = EntryStatus::REMOVED;
        logger_->debug("Removed " + path);
        return outcome;
    }

    if (removed.error_code() == ErrorCode::NOT_FOUND) {
        outcome.status = EntryStatus::SKIPPED;
        outcome.reason = "already absent";
        return outcome;
    }

    if (removed.error_code() == ErrorCode::PERMISSION_DENIED && mode == RemovalMode::FORCED) {
        return escalate(path, type, removed.error());
    }

    outcome.reason = removed.error().to_string();
    logger_->warning("Failed to remove " + path + ": " + outcome.reason);
    return outcome;
}

EntryOutcome RemovalOrchestrator::escalate(const std::string& path, EntryType type,
                                           const Error& first_error) {
    EntryOutcome outcome{path, EntryStatus::FAILED, first_error.to_string()};

    auto writable = fs_->make_writable(path);
    if (!writable.ok()) {
        logger_->debug("Resetting permissions of " + path + " failed: " +
                       writable.error().to_string());
    }

    auto retried = type == EntryType::DIRECTORY ? fs_->remove_tree(path) : fs_->remove_file(path);
    if (retried.ok()) {
        outcome.status = EntryStatus::REMOVED;
        outcome.reason = "removed after resetting permissions";
        return outcome;
    }
    if (retried.error_code() == ErrorCode::NOT_FOUND) {
        outcome.status = EntryStatus::SKIPPED;
        outcome.reason = "already absent";
        return outcome;
    }

    if (elevator_) {
        auto elevated = elevator_->elevate_and_run({"rm", "-rf", "--", path});
        if (elevated.ok()) {
            outcome.status = EntryStatus::REMOVED;
            outcome.reason = "removed with elevated privileges";
            return outcome;
        }
        outcome.reason = elevated.error().to_string();
    } else {
        outcome.reason = retried.error().to_string();
    }

    logger_->warning("Failed to remove " + path + ": " + outcome.reason);
    return outcome;
}

}  // namespace sweep
