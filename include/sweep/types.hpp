#pragma once

#include <sweep/core_types.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sweep {

/**
 * A named group of exclusion fragments, switched on or off as a whole.
 */
struct ExclusionCategory {
    bool enabled = true;
    std::vector<std::string> fragments;
};

using ExclusionMap = std::map<std::string, ExclusionCategory>;

/**
 * One discovered filesystem entry.
 */
struct MatchCandidate {
    std::string path;          // Canonical path
    uint64_t size = 0;         // Filled in when a metadata cache is supplied
    MatchTier tier = MatchTier::TOKEN;

    bool operator==(const MatchCandidate& other) const {
        return path == other.path && tier == other.tier;
    }
};

/**
 * A logical group of source paths captured by a snapshot.
 *
 * Paths are absolute and must lie under `root`; inside the archive they are
 * stored relative to it, beneath a directory named after the category.
 */
struct SnapshotCategory {
    std::string name;               // "home", "system"
    fs::path root;                  // Live root the paths are relative to
    std::vector<fs::path> paths;    // Sources to capture
    bool elevated = false;          // Retry permission failures via the elevator
};

/**
 * Manifest stored at the top level of every snapshot archive.
 */
struct SnapshotManifest {
    int format = 1;
    std::string id;
    std::string name;
    std::string timestamp;          // YYYYmmdd_HHMMSS
    std::string created_by;
    std::vector<SnapshotCategory> categories;
};

/**
 * Descriptor of a sealed snapshot archive.
 */
struct Snapshot {
    std::string id;                 // <name>_<timestamp>, archive file stem
    std::string name;
    std::string timestamp;
    fs::path archive_path;
    uint64_t archive_size = 0;
};

/**
 * A failed unit of work (copy, removal) and the reason.
 */
struct FailureRecord {
    std::string path;
    std::string reason;
};

}  // namespace sweep
