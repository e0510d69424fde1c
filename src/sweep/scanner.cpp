#include <sweep/scanner.hpp>
#include <sweep/util/path_utils.hpp>

#include <algorithm>
#include <mutex>
#include <utility>

namespace sweep {

// =============================================================================
// ScanStats / ScanResult
// =============================================================================

ScanStats& ScanStats::operator+=(const ScanStats& other) {
    directories_visited += other.directories_visited;
    directories_pruned += other.directories_pruned;
    entry_errors += other.entry_errors;
    worker_failures += other.worker_failures;
    cancelled = cancelled || other.cancelled;
    return *this;
}

void ScanResult::add(MatchCandidate candidate) {
    auto it = candidates_.find(candidate.path);
    if (it == candidates_.end()) {
        std::string key = candidate.path;
        candidates_.emplace(std::move(key), std::move(candidate));
        return;
    }
    // Keep the strongest tier
    if (candidate.tier < it->second.tier) {
        it->second.tier = candidate.tier;
    }
    it->second.size = std::max(it->second.size, candidate.size);
}

void ScanResult::merge(const ScanResult& other) {
    for (const auto& [path, candidate] : other.candidates_) {
        add(candidate);
    }
    stats_ += other.stats_;
}

bool ScanResult::has_ancestor(const std::string& path) const {
    fs::path p(path);
    fs::path parent = p.parent_path();
    while (!parent.empty() && parent != p) {
        if (candidates_.count(parent.string()) > 0) {
            return true;
        }
        p = parent;
        parent = p.parent_path();
    }
    return false;
}

std::vector<MatchCandidate> ScanResult::top_level() const {
    std::vector<MatchCandidate> result;
    for (const auto& [path, candidate] : candidates_) {
        if (!has_ancestor(path)) {
            result.push_back(candidate);
        }
    }
    return result;
}

void ScanResult::update_total_size() {
    total_size_ = 0;
    for (const auto& candidate : top_level()) {
        total_size_ += candidate.size;
    }
}

std::map<std::string, std::vector<MatchCandidate>> ScanResult::groups() const {
    std::map<std::string, std::vector<MatchCandidate>> result;
    for (const auto& [path, candidate] : candidates_) {
        result[fs::path(path).parent_path().string()].push_back(candidate);
    }
    return result;
}

std::vector<std::string> ScanResult::paths() const {
    std::vector<std::string> result;
    result.reserve(candidates_.size());
    for (const auto& [path, candidate] : candidates_) {
        result.push_back(path);
    }
    return result;
}

// =============================================================================
// ParallelScanner
// =============================================================================

ParallelScanner::ParallelScanner(const ExclusionEngine& exclusions,
                                 std::shared_ptr<FileSystem> file_system,
                                 ScannerOptions options,
                                 std::shared_ptr<Logger> logger)
    : exclusions_(exclusions)
    , fs_(std::move(file_system))
    , options_(std::move(options))
    , logger_(logger_or_null(std::move(logger))) {
    if (!fs_) {
        fs_ = std::make_shared<LocalFileSystem>();
    }
}

ScanResult ParallelScanner::scan(const PathMatcher& matcher,
                                 const std::vector<fs::path>& roots,
                                 MetadataCache* cache) {
    ScanResult merged;
    std::mutex merge_mutex;

    const size_t workers = options_.max_workers > 0 ? options_.max_workers
                                                    : default_worker_count();
    {
        WorkerPool pool(std::min(workers, std::max<size_t>(1, roots.size())),
                        "scanner", logger_);

        for (const auto& root : roots) {
            pool.submit([this, &matcher, &merged, &merge_mutex, root] {
                ScanResult local;
                walk_root(matcher, root, local);
                std::lock_guard<std::mutex> lock(merge_mutex);
                merged.merge(local);
            });
        }
        pool.wait_idle();

        if (cache && !merged.empty()) {
            // Each task writes only its own candidate's size
            for (auto& [path, candidate] : merged.candidates_) {
                MatchCandidate* target = &candidate;
                pool.submit([cache, target] {
                    target->size = cache->size(target->path);
                });
            }
            pool.wait_idle();
        }
        merged.stats_.worker_failures += pool.failure_count();
    }

    merged.update_total_size();

    const auto& stats = merged.stats();
    logger_->info("Scan for '" + matcher.app_name() + "' found " +
                  std::to_string(merged.size()) + " entries (" +
                  format_size(merged.total_size()) + ") in " +
                  std::to_string(stats.directories_visited) + " directories, " +
                  std::to_string(stats.directories_pruned) + " pruned, " +
                  std::to_string(stats.entry_errors) + " errors");
    return merged;
}

void ParallelScanner::walk_root(const PathMatcher& matcher, const fs::path& root,
                                ScanResult& out) {
    ScanStats& stats = out.stats_;
    const fs::path start = root.lexically_normal();

    auto root_stat = fs_->stat(start);
    if (!root_stat.ok()) {
        if (root_stat.error_code() != ErrorCode::NOT_FOUND) {
            ++stats.entry_errors;
            logger_->warning("Cannot scan " + start.string() + ": " +
                             root_stat.error().to_string());
        } else {
            logger_->debug("Search root " + start.string() + " does not exist");
        }
        return;
    }
    if (root_stat->type != EntryType::DIRECTORY) {
        return;
    }
    if (exclusions_.is_excluded(start)) {
        ++stats.directories_pruned;
        return;
    }

    // (directory, inside a bundle anchor)
    std::vector<std::pair<fs::path, bool>> stack;
    stack.emplace_back(start, false);

    while (!stack.empty()) {
        if (options_.cancel.cancelled()) {
            stats.cancelled = true;
            break;
        }

        auto [dir, in_bundle] = std::move(stack.back());
        stack.pop_back();
        ++stats.directories_visited;

        if (!in_bundle) {
            const fs::path anchor = dir / matcher.bundle_name();
            if (fs_->stat(anchor).ok()) {
                out.add(MatchCandidate{canonical_key(anchor), 0, MatchTier::BUNDLE_ANCHOR});
            }
        }

        auto children = fs_->list(dir);
        if (!children.ok()) {
            ++stats.entry_errors;
            logger_->debug("Cannot list " + dir.string() + ": " + children.error().to_string());
            continue;
        }

        std::vector<std::pair<fs::path, bool>> subdirs;
        for (const auto& name : *children) {
            const fs::path child = dir / name;

            if (exclusions_.is_excluded(child)) {
                auto st = fs_->stat(child);
                if (st.ok() && st->type == EntryType::DIRECTORY) {
                    ++stats.directories_pruned;
                }
                continue;
            }

            auto st = fs_->stat(child);
            if (!st.ok()) {
                ++stats.entry_errors;
                logger_->debug("Cannot stat " + child.string() + ": " + st.error().to_string());
                continue;
            }

            const bool is_dir = st->type == EntryType::DIRECTORY;
            if (in_bundle) {
                if (!is_dir) {
                    out.add(MatchCandidate{canonical_key(child), 0, MatchTier::BUNDLE_ANCHOR});
                }
            } else if (auto tier = matcher.match(child)) {
                out.add(MatchCandidate{canonical_key(child), 0, *tier});
            }

            if (is_dir) {
                subdirs.emplace_back(child, in_bundle || matcher.is_bundle_name(name));
            }
        }

        // Reverse so the lexicographically first child is walked first
        for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
            stack.push_back(std::move(*it));
        }
    }

    logger_->debug("Walked " + start.string() + ": " + std::to_string(out.size()) + " entries");
}

}  // namespace sweep
