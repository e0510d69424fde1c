#pragma once

#include <sweep/core_types.hpp>

#include <cstdint>
#include <string>

namespace sweep {

/**
 * Lower-case an ASCII string.
 */
std::string to_lower(const std::string& s);

/**
 * Case-insensitive substring test.
 */
bool contains_icase(const std::string& haystack, const std::string& needle);

/**
 * Glob match using fnmatch(3).
 *
 * '*' crosses '/' boundaries unless match_segments is true.
 */
bool glob_match(const std::string& pattern, const std::string& text,
                bool case_insensitive = true, bool match_segments = false);

/**
 * Expand a leading "~" to $HOME.
 */
fs::path expand_home(const std::string& path);

/**
 * Home directory from $HOME, falling back to the password database.
 */
fs::path home_directory();

/**
 * Canonical key used to deduplicate candidates.
 *
 * The parent directory is resolved (symlinks, "..", duplicate separators)
 * while the final component is kept as-is so that a symlink candidate keys
 * on the link itself rather than its target. No trailing separator.
 */
std::string canonical_key(const fs::path& path);

/**
 * True if `path` equals `ancestor` or lies beneath it, compared segment-wise.
 * "/a/bc" is not within "/a/b".
 */
bool is_within(const fs::path& path, const fs::path& ancestor);

/**
 * True if either path is within the other.
 */
bool paths_overlap(const fs::path& a, const fs::path& b);

/**
 * Human-readable size: "512.00 B", "1.50 MB".
 */
std::string format_size(uint64_t bytes);

/**
 * Nanoseconds since the epoch for a system_clock time point.
 */
int64_t to_unix_ns(TimePoint tp);
TimePoint from_unix_ns(int64_t ns);

/**
 * Local time formatted as YYYYmmdd_HHMMSS (snapshot id suffix).
 */
std::string format_timestamp(TimePoint tp);

/**
 * Name of the invoking user ($SUDO_USER, $LOGNAME, $USER, the password
 * database, "unknown").
 */
std::string current_user_name();

}  // namespace sweep
