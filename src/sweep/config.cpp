#include <sweep/config.hpp>
#include <sweep/exclusion_rules.hpp>
#include <sweep/snapshot/snapshot_manager.hpp>
#include <sweep/util/path_utils.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sweep {

namespace {

using json = nlohmann::json;

std::vector<std::string> string_list(const json& value, const char* key) {
    if (!value.is_array()) {
        throw std::invalid_argument(std::string(key) + " must be an array of strings");
    }
    return value.get<std::vector<std::string>>();
}

std::vector<fs::path> path_list(const json& value, const char* key) {
    std::vector<fs::path> result;
    for (const auto& item : string_list(value, key)) {
        result.push_back(expand_home(item));
    }
    return result;
}

json path_list_to_json(const std::vector<fs::path>& paths) {
    json array = json::array();
    for (const auto& p : paths) {
        array.push_back(p.string());
    }
    return array;
}

}  // namespace

std::vector<fs::path> default_search_roots(const fs::path& home) {
    return {
        "/Applications",
        "/Library",
        "/usr/local",
        home / "Applications",
        home / "Library",
        home / ".config",
        home / ".cache",
        home / ".local" / "share",
    };
}

SweepConfig default_config() {
    const fs::path home = home_directory();

    SweepConfig config;
    config.excluded_locations = ExclusionEngine::builtin_categories();
    config.backup_location = home / "sweep_backups";
    config.cache_path = home / ".cache" / "sweep" / "metadata.journal";
    return config;
}

void resolve_defaults(SweepConfig& config, const fs::path& home) {
    if (config.search_roots.empty()) {
        config.search_roots = default_search_roots(home);
    }
    if (config.snapshot_categories.empty()) {
        config.snapshot_categories = SnapshotManager::default_categories(home);
    }
}

fs::path default_config_path() {
    const char* explicit_path = std::getenv("SWEEP_CONFIG");
    if (explicit_path && explicit_path[0] != '\0') {
        return expand_home(explicit_path);
    }
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return fs::path(xdg) / "sweep" / "config.json";
    }
    return home_directory() / ".config" / "sweep" / "config.json";
}

// =============================================================================
// JSON mapping
// =============================================================================

json config_to_json(const SweepConfig& config) {
    json j;

    json excluded = json::object();
    for (const auto& [name, category] : config.excluded_locations) {
        excluded[name] = {{"enabled", category.enabled}, {"paths", category.fragments}};
    }
    j["excluded_locations"] = excluded;

    j["search_roots"] = path_list_to_json(config.search_roots);
    j["bundle_extension"] = config.bundle_extension;
    j["app_patterns"] = config.app_patterns;
    j["backup_enabled"] = config.backup_enabled;
    j["backup_location"] = config.backup_location.string();

    json categories = json::array();
    for (const auto& category : config.snapshot_categories) {
        categories.push_back({{"name", category.name},
                              {"root", category.root.string()},
                              {"paths", path_list_to_json(category.paths)},
                              {"elevated", category.elevated}});
    }
    j["snapshot_categories"] = categories;

    j["large_file_threshold"] = config.large_file_threshold;
    j["cache_path"] = config.cache_path.string();
    j["max_workers"] = config.max_workers;
    j["removal_batch_size"] = config.removal_batch_size;
    return j;
}

Result<SweepConfig> config_from_json(const json& j) {
    if (!j.is_object()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Config root must be an object");
    }

    SweepConfig config = default_config();
    try {
        if (j.contains("excluded_locations")) {
            const json& excluded = j.at("excluded_locations");
            if (!excluded.is_object()) {
                return Error(ErrorCode::INVALID_ARGUMENT, "excluded_locations must be an object");
            }
            ExclusionMap configured;
            for (auto it = excluded.begin(); it != excluded.end(); ++it) {
                ExclusionCategory category;
                const json& value = it.value();
                if (value.contains("enabled")) {
                    category.enabled = value.at("enabled").get<bool>();
                }
                if (value.contains("paths")) {
                    category.fragments = string_list(value.at("paths"), "paths");
                }
                configured[it.key()] = std::move(category);
            }
            config.excluded_locations = ExclusionEngine::merge(config.excluded_locations,
                                                               configured);
        }

        if (j.contains("search_roots")) {
            config.search_roots = path_list(j.at("search_roots"), "search_roots");
        }
        if (j.contains("bundle_extension")) {
            config.bundle_extension = j.at("bundle_extension").get<std::string>();
        }
        if (j.contains("app_patterns")) {
            const json& patterns = j.at("app_patterns");
            for (auto it = patterns.begin(); it != patterns.end(); ++it) {
                config.app_patterns[to_lower(it.key())] = string_list(it.value(), "app_patterns");
            }
        }
        if (j.contains("backup_enabled")) {
            config.backup_enabled = j.at("backup_enabled").get<bool>();
        }
        if (j.contains("backup_location")) {
            config.backup_location = expand_home(j.at("backup_location").get<std::string>());
        }
        if (j.contains("snapshot_categories")) {
            const json& categories = j.at("snapshot_categories");
            if (!categories.is_array()) {
                return Error(ErrorCode::INVALID_ARGUMENT, "snapshot_categories must be an array");
            }
            for (const auto& item : categories) {
                SnapshotCategory category;
                category.name = item.at("name").get<std::string>();
                category.root = expand_home(item.at("root").get<std::string>());
                if (item.contains("paths")) {
                    category.paths = path_list(item.at("paths"), "paths");
                }
                if (item.contains("elevated")) {
                    category.elevated = item.at("elevated").get<bool>();
                }
                config.snapshot_categories.push_back(std::move(category));
            }
        }
        if (j.contains("large_file_threshold")) {
            config.large_file_threshold = j.at("large_file_threshold").get<uint64_t>();
        }
        if (j.contains("cache_path")) {
            config.cache_path = expand_home(j.at("cache_path").get<std::string>());
        }
        if (j.contains("max_workers")) {
            config.max_workers = j.at("max_workers").get<size_t>();
        }
        if (j.contains("removal_batch_size")) {
            config.removal_batch_size = j.at("removal_batch_size").get<size_t>();
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_ARGUMENT, std::string("Invalid config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return Error(ErrorCode::INVALID_ARGUMENT, std::string("Invalid config: ") + e.what());
    }

    return config;
}

// =============================================================================
// Files
// =============================================================================

Result<SweepConfig> load_config(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return default_config();
        }
        return Error(ErrorCode::IO_ERROR, "Cannot read " + path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    json parsed;
    try {
        parsed = json::parse(ss.str());
    } catch (const json::parse_error& e) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Cannot parse " + path.string() + ": " + e.what());
    }
    return config_from_json(parsed);
}

Result<void> save_config(const SweepConfig& config, const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return error_from_code(ec, "mkdir " + path.parent_path().string());
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot write " + path.string());
    }
    file << config_to_json(config).dump(4) << "\n";
    file.flush();
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Write failed for " + path.string());
    }
    return Ok();
}

}  // namespace sweep
