#pragma once

#include <sweep/core_types.hpp>
#include <sweep/result.hpp>
#include <sweep/types.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace sweep {

/**
 * Settings read from config.json.
 *
 * Empty search_roots and snapshot_categories mean "use the defaults for
 * the current home directory"; they are filled in by resolve_defaults().
 */
struct SweepConfig {
    ExclusionMap excluded_locations;    // Merged over the built-in categories
    std::vector<fs::path> search_roots;
    std::string bundle_extension = DEFAULT_BUNDLE_EXTENSION;
    std::map<std::string, std::vector<std::string>> app_patterns;

    bool backup_enabled = true;
    fs::path backup_location;
    std::vector<SnapshotCategory> snapshot_categories;
    uint64_t large_file_threshold = LARGE_FILE_THRESHOLD;

    fs::path cache_path;
    size_t max_workers = 0;             // 0 = default_worker_count()
    size_t removal_batch_size = REMOVAL_BATCH_SIZE;
};

/**
 * Defaults for the current user: built-in exclusions, backups under
 * ~/sweep_backups, the journal under ~/.cache/sweep.
 */
SweepConfig default_config();

/**
 * Application, library and XDG data directories for a home directory.
 */
std::vector<fs::path> default_search_roots(const fs::path& home);

/**
 * Fill empty search roots and snapshot categories with the defaults.
 */
void resolve_defaults(SweepConfig& config, const fs::path& home);

/**
 * $SWEEP_CONFIG, else $XDG_CONFIG_HOME/sweep/config.json, else
 * ~/.config/sweep/config.json.
 */
fs::path default_config_path();

/**
 * Load a config file. A missing file yields default_config().
 *
 * Keys that are absent keep their defaults and unknown keys are ignored.
 * A leading "~" in any path value is expanded.
 *
 * @return INVALID_ARGUMENT if the file is not valid JSON or a key has the
 *         wrong type
 */
Result<SweepConfig> load_config(const fs::path& path);

/**
 * Write the config as indented JSON, creating parent directories.
 */
Result<void> save_config(const SweepConfig& config, const fs::path& path);

nlohmann::json config_to_json(const SweepConfig& config);
Result<SweepConfig> config_from_json(const nlohmann::json& json);

}  // namespace sweep
