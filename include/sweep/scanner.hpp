#pragma once

#include <sweep/exclusion_rules.hpp>
#include <sweep/fs/file_system.hpp>
#include <sweep/metadata_cache.hpp>
#include <sweep/path_matcher.hpp>
#include <sweep/types.hpp>
#include <sweep/util/logger.hpp>
#include <sweep/util/worker_pool.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sweep {

struct ScannerOptions {
    size_t max_workers = 0;  // 0 = default_worker_count()
    CancellationToken cancel;
};

struct ScanStats {
    size_t directories_visited = 0;
    size_t directories_pruned = 0;   // Excluded subtrees never listed
    size_t entry_errors = 0;         // stat/list failures, skipped
    size_t worker_failures = 0;      // Walk or sizing tasks that threw
    bool cancelled = false;

    ScanStats& operator+=(const ScanStats& other);
};

/**
 * ScanResult - Deduplicated candidates of one scan.
 *
 * Candidates are keyed by canonical path. When the same entry is reached
 * from two roots the strongest tier is kept.
 */
class ScanResult {
public:
    using CandidateMap = std::map<std::string, MatchCandidate>;

    const CandidateMap& candidates() const { return candidates_; }
    bool contains(const std::string& path) const { return candidates_.count(path) > 0; }
    size_t size() const { return candidates_.size(); }
    bool empty() const { return candidates_.empty(); }

    /**
     * Sum of candidate sizes, counting only candidates with no ancestor in
     * the set so nested entries are not counted twice.
     */
    uint64_t total_size() const { return total_size_; }

    /**
     * Candidates bucketed by parent directory. Both levels are ordered
     * lexicographically.
     */
    std::map<std::string, std::vector<MatchCandidate>> groups() const;

    /**
     * Candidates that have no ancestor in the set.
     */
    std::vector<MatchCandidate> top_level() const;

    std::vector<std::string> paths() const;

    const ScanStats& stats() const { return stats_; }

    void add(MatchCandidate candidate);
    void merge(const ScanResult& other);

    /**
     * Recompute total_size() from the current candidate sizes.
     */
    void update_total_size();

private:
    friend class ParallelScanner;

    bool has_ancestor(const std::string& path) const;

    CandidateMap candidates_;
    uint64_t total_size_ = 0;
    ScanStats stats_;
};

/**
 * ParallelScanner - Walks search roots and collects matching entries.
 *
 * Each root is walked depth-first by one task of a bounded worker pool;
 * children are visited in lexicographic order. A directory that the
 * exclusion engine rejects is never listed. In every visited directory the
 * bundle anchor "<dir>/<clean>.<ext>" is probed before the children are
 * matched. Symbolic links are reported but never followed.
 *
 * Entries inside a bundle anchor belong to the application: the files and
 * links beneath it are reported with tier BUNDLE_ANCHOR.
 */
class ParallelScanner {
public:
    ParallelScanner(const ExclusionEngine& exclusions,
                    std::shared_ptr<FileSystem> file_system,
                    ScannerOptions options = ScannerOptions(),
                    std::shared_ptr<Logger> logger = nullptr);

    /**
     * Scan all roots.
     *
     * @param matcher Decides which entries belong to the application
     * @param roots Absolute directories; missing roots are skipped
     * @param cache When given, every candidate is sized through it
     */
    ScanResult scan(const PathMatcher& matcher,
                    const std::vector<fs::path>& roots,
                    MetadataCache* cache = nullptr);

private:
    void walk_root(const PathMatcher& matcher, const fs::path& root, ScanResult& out);

    const ExclusionEngine& exclusions_;
    std::shared_ptr<FileSystem> fs_;
    ScannerOptions options_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace sweep
