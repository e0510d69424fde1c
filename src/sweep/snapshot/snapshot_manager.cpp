#include <sweep/snapshot/snapshot_manager.hpp>
#include <sweep/fs/file_system.hpp>
#include <sweep/snapshot/archive.hpp>
#include <sweep/util/path_utils.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <regex>

namespace sweep {

namespace {

// Extraction directory removed when the restore finishes, however it ends
class ScopedTempDir {
public:
    explicit ScopedTempDir(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}
    ~ScopedTempDir() { remove(); }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    Result<void> create(const std::string& prefix) {
        std::error_code ec;
        fs::path base = fs::temp_directory_path(ec);
        if (ec) base = "/tmp";

        std::string tmpl = (base / (prefix + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data()) == nullptr) {
            return error_from_errno(errno, "mkdtemp " + tmpl);
        }
        path_ = fs::path(buf.data());
        return Ok();
    }

    const fs::path& path() const { return path_; }

private:
    void remove() {
        if (path_.empty()) return;
        LocalFileSystem local;
        // Extracted read-only directories would block removal
        auto writable = local.make_writable(path_);
        if (!writable.ok()) {
            logger_->debug("chmod of " + path_.string() + " incomplete: " + writable.error().to_string());
        }
        auto removed = local.remove_tree(path_);
        if (!removed.ok()) {
            logger_->warning("Failed to remove " + path_.string() + ": " + removed.error().to_string());
        }
        path_.clear();
    }

    std::shared_ptr<Logger> logger_;
    fs::path path_;
};

bool is_safe_category_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name != MANIFEST_FILE_NAME;
}

// Relative location of `path` below `root`; "." when they are equal
fs::path relative_to_root(const fs::path& path, const fs::path& root) {
    return path.lexically_normal().lexically_relative(root.lexically_normal());
}

fs::path staged_location(const fs::path& category_dir, const fs::path& rel) {
    if (rel.empty() || rel == ".") return category_dir;
    return category_dir / rel;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

SnapshotManager::SnapshotManager(SnapshotOptions options,
                                 std::shared_ptr<Logger> logger,
                                 PrivilegeElevator* elevator,
                                 TreeLockRegistry* locks)
    : options_(std::move(options))
    , logger_(logger_or_null(std::move(logger)))
    , elevator_(elevator)
    , locks_(locks) {
    if (options_.creator.empty()) {
        options_.creator = current_user_name();
    }
}

TimePoint SnapshotManager::now() const {
    return options_.clock ? options_.clock() : Clock::now();
}

std::vector<SnapshotCategory> SnapshotManager::default_categories(const fs::path& home) {
    SnapshotCategory user;
    user.name = "home";
    user.root = home;
    for (const char* rel : {"Documents", "Downloads", "Desktop", "Pictures", "Music", "Movies",
                            "Library/Application Support", "Library/Preferences"}) {
        user.paths.push_back(home / rel);
    }

    SnapshotCategory system;
    system.name = "system";
    system.root = "/";
    system.elevated = true;
    for (const char* path : {"/Applications", "/usr/local/bin",
                             "/Library/LaunchAgents", "/Library/LaunchDaemons"}) {
        system.paths.emplace_back(path);
    }

    return {user, system};
}

std::string SnapshotManager::sanitize_name(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            result.push_back(static_cast<char>(c));
        } else {
            result.push_back('_');
        }
    }
    // A leading dot would hide the archive
    while (!result.empty() && result.front() == '.') {
        result.erase(result.begin());
    }
    return result;
}

// =============================================================================
// Manifest
// =============================================================================

nlohmann::json SnapshotManager::manifest_to_json(const SnapshotManifest& manifest) {
    nlohmann::json categories = nlohmann::json::object();
    for (const auto& category : manifest.categories) {
        nlohmann::json paths = nlohmann::json::array();
        for (const auto& p : category.paths) {
            paths.push_back(p.string());
        }
        categories[category.name] = {
            {"root", category.root.string()},
            {"paths", paths},
            {"elevated", category.elevated}
        };
    }

    return {
        {"format", manifest.format},
        {"id", manifest.id},
        {"name", manifest.name},
        {"timestamp", manifest.timestamp},
        {"created_by", manifest.created_by},
        {"categories", categories}
    };
}

Result<void> SnapshotManager::write_manifest(const fs::path& path,
                                             const SnapshotManifest& manifest) {
    std::ofstream out(path);
    if (!out.is_open()) {
        return Error(ErrorCode::IO_ERROR, "Cannot open " + path.string());
    }
    out << manifest_to_json(manifest).dump(4) << "\n";
    out.close();
    if (out.fail()) {
        return Error(ErrorCode::IO_ERROR, "Failed to write " + path.string());
    }
    return Ok();
}

Result<SnapshotManifest> SnapshotManager::manifest_from_json(const std::string& text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Error(ErrorCode::MANIFEST_INVALID, std::string("Unparsable manifest: ") + e.what());
    }

    auto invalid = [](const std::string& what) {
        return Error(ErrorCode::MANIFEST_INVALID, what);
    };

    if (!doc.is_object()) return invalid("Manifest is not an object");
    if (!doc.contains("format") || !doc["format"].is_number_integer() ||
        doc["format"].get<int>() != MANIFEST_FORMAT) {
        return invalid("Unsupported manifest format");
    }
    for (const char* key : {"id", "name", "timestamp"}) {
        if (!doc.contains(key) || !doc[key].is_string()) {
            return invalid(std::string("Manifest field '") + key + "' missing");
        }
    }
    if (!doc.contains("categories") || !doc["categories"].is_object()) {
        return invalid("Manifest has no categories");
    }

    SnapshotManifest manifest;
    manifest.format = doc["format"].get<int>();
    manifest.id = doc["id"].get<std::string>();
    manifest.name = doc["name"].get<std::string>();
    manifest.timestamp = doc["timestamp"].get<std::string>();
    if (doc.contains("created_by") && doc["created_by"].is_string()) {
        manifest.created_by = doc["created_by"].get<std::string>();
    }
    if (manifest.id.empty()) return invalid("Manifest id is empty");

    const nlohmann::json& categories = doc.at("categories");
    for (auto it = categories.begin(); it != categories.end(); ++it) {
        const std::string& name = it.key();
        const nlohmann::json& value = it.value();
        if (!is_safe_category_name(name)) {
            return invalid("Invalid category name '" + name + "'");
        }
        if (!value.is_object() || !value.contains("root") || !value.at("root").is_string() ||
            !value.contains("paths") || !value.at("paths").is_array()) {
            return invalid("Category '" + name + "' is malformed");
        }

        SnapshotCategory category;
        category.name = name;
        category.root = value.at("root").get<std::string>();
        if (!category.root.is_absolute()) {
            return invalid("Category '" + name + "' root is not absolute");
        }
        if (value.contains("elevated") && value.at("elevated").is_boolean()) {
            category.elevated = value.at("elevated").get<bool>();
        }

        for (const auto& p : value.at("paths")) {
            if (!p.is_string()) {
                return invalid("Category '" + name + "' has a non-string path");
            }
            fs::path path = p.get<std::string>();
            if (!path.is_absolute() || !is_within(path, category.root)) {
                return invalid("Path " + path.string() + " is outside category root " +
                               category.root.string());
            }
            category.paths.push_back(std::move(path));
        }
        manifest.categories.push_back(std::move(category));
    }
    return manifest;
}

// =============================================================================
// Catalogue
// =============================================================================

Result<Snapshot> SnapshotManager::describe(const fs::path& archive_path) const {
    static const std::regex id_pattern(R"(^(.*)_([0-9]{8}_[0-9]{6})(-[0-9]+)?$)");

    std::string file = archive_path.filename().string();
    if (!ends_with(file, SNAPSHOT_ARCHIVE_SUFFIX)) {
        return Error(ErrorCode::INVALID_ARGUMENT, file + " is not a snapshot archive");
    }

    Snapshot snapshot;
    snapshot.id = file.substr(0, file.size() - std::string(SNAPSHOT_ARCHIVE_SUFFIX).size());
    snapshot.archive_path = archive_path;

    std::smatch m;
    if (std::regex_match(snapshot.id, m, id_pattern)) {
        snapshot.name = m[1].str();
        snapshot.timestamp = m[2].str();
    } else {
        snapshot.name = snapshot.id;
    }

    std::error_code ec;
    auto size = fs::file_size(archive_path, ec);
    if (ec) {
        return error_from_code(ec, "stat " + archive_path.string());
    }
    snapshot.archive_size = size;
    return snapshot;
}

std::vector<Snapshot> SnapshotManager::list_snapshots() const {
    std::vector<Snapshot> result;

    std::error_code ec;
    for (fs::directory_iterator it(options_.backup_dir, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string file = it->path().filename().string();
        if (!ends_with(file, SNAPSHOT_ARCHIVE_SUFFIX)) continue;  // Skips ".partial" too
        if (!it->is_regular_file(ec)) continue;

        auto described = describe(it->path());
        if (described.ok()) {
            result.push_back(std::move(described.value()));
        }
    }

    std::sort(result.begin(), result.end(), [](const Snapshot& a, const Snapshot& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return a.id > b.id;
    });
    return result;
}

Result<Snapshot> SnapshotManager::find_snapshot(const std::string& name) const {
    if (name.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Snapshot name is empty");
    }

    std::string id = name;
    if (ends_with(id, SNAPSHOT_ARCHIVE_SUFFIX)) {
        id.resize(id.size() - std::string(SNAPSHOT_ARCHIVE_SUFFIX).size());
    }
    if (id.find('/') == std::string::npos) {
        const fs::path direct = options_.backup_dir / (id + SNAPSHOT_ARCHIVE_SUFFIX);
        std::error_code ec;
        if (fs::is_regular_file(direct, ec)) {
            return describe(direct);
        }
    }

    const std::string sanitized = sanitize_name(name);
    for (const auto& snapshot : list_snapshots()) {
        if (snapshot.name == name || snapshot.name == sanitized) {
            return snapshot;
        }
    }
    return Error(ErrorCode::NOT_FOUND, "No snapshot named " + name);
}

Result<void> SnapshotManager::delete_snapshot(const std::string& name) {
    auto found = find_snapshot(name);
    if (!found.ok()) return found.error();

    std::error_code ec;
    fs::remove(found->archive_path, ec);
    if (ec) {
        return error_from_code(ec, "remove " + found->archive_path.string());
    }
    logger_->info("Deleted snapshot " + found->id);
    return Ok();
}

Result<SnapshotManifest> SnapshotManager::read_manifest(const std::string& name) const {
    auto found = find_snapshot(name);
    if (!found.ok()) return found.error();

    auto content = read_archive_member(found->archive_path, MANIFEST_FILE_NAME);
    if (!content.ok()) {
        if (content.error_code() == ErrorCode::NOT_FOUND) {
            return Error(ErrorCode::MANIFEST_INVALID, "Snapshot " + found->id + " has no manifest");
        }
        return content.error();
    }
    return manifest_from_json(*content);
}

// =============================================================================
// Create
// =============================================================================

std::string SnapshotManager::allocate_id(const std::string& base) const {
    auto taken = [this](const std::string& id) {
        std::error_code ec;
        return fs::exists(options_.backup_dir / (id + SNAPSHOT_ARCHIVE_SUFFIX), ec) ||
               fs::exists(options_.backup_dir / (id + SNAPSHOT_ARCHIVE_SUFFIX + PARTIAL_SUFFIX), ec) ||
               fs::exists(options_.backup_dir / STAGING_DIR_NAME / id, ec);
    };

    if (!taken(base)) return base;
    for (int n = 2;; ++n) {
        std::string id = base + "-" + std::to_string(n);
        if (!taken(id)) return id;
    }
}

Result<SnapshotReport> SnapshotManager::create_snapshot(const std::string& name,
                                                        CancellationToken cancel) {
    if (options_.backup_dir.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "No backup directory configured");
    }

    std::error_code ec;
    fs::create_directories(options_.backup_dir / STAGING_DIR_NAME, ec);
    if (ec) {
        return error_from_code(ec, "create " + options_.backup_dir.string());
    }

    std::string base = sanitize_name(name);
    if (base.empty()) base = DEFAULT_SNAPSHOT_NAME;
    const std::string timestamp = format_timestamp(now());
    const std::string id = allocate_id(base + "_" + timestamp);

    std::vector<fs::path> roots;
    for (const auto& category : options_.categories) {
        roots.push_back(category.root);
    }
    TreeLock lock;
    if (locks_) {
        lock = locks_->acquire(roots);
    }

    const fs::path staging = options_.backup_dir / STAGING_DIR_NAME / id;
    const fs::path partial = options_.backup_dir / (id + SNAPSHOT_ARCHIVE_SUFFIX + PARTIAL_SUFFIX);
    const fs::path final_path = options_.backup_dir / (id + SNAPSHOT_ARCHIVE_SUFFIX);

    auto discard_staging = [&] {
        LocalFileSystem local;
        auto writable = local.make_writable(staging);
        if (!writable.ok()) {
            logger_->debug("chmod of " + staging.string() + " incomplete: " + writable.error().to_string());
        }
        auto removed = local.remove_tree(staging);
        if (!removed.ok()) {
            logger_->warning("Failed to remove staging " + staging.string() + ": " +
                             removed.error().to_string());
        }
        std::error_code ignored;
        fs::remove(options_.backup_dir / STAGING_DIR_NAME, ignored);  // Only if empty
    };

    fs::create_directories(staging, ec);
    if (ec) {
        return error_from_code(ec, "create " + staging.string());
    }

    logger_->info("Creating snapshot " + id);

    SnapshotManifest manifest;
    manifest.format = MANIFEST_FORMAT;
    manifest.id = id;
    manifest.name = base;
    manifest.timestamp = timestamp;
    manifest.created_by = options_.creator;

    CopyStats copied;
    {
        const size_t workers = options_.copy_workers > 0 ? options_.copy_workers
                                                         : default_worker_count();
        WorkerPool pool(workers, "snapshot-copy", logger_);
        TreeCopier copier(pool, options_.large_file_threshold, logger_, elevator_, cancel);

        for (const auto& category : options_.categories) {
            if (!is_safe_category_name(category.name)) {
                discard_staging();
                return Error(ErrorCode::INVALID_ARGUMENT,
                             "Invalid snapshot category name '" + category.name + "'");
            }

            const fs::path category_dir = staging / category.name;
            fs::create_directories(category_dir, ec);
            if (ec) {
                discard_staging();
                return error_from_code(ec, "create " + category_dir.string());
            }

            SnapshotCategory recorded;
            recorded.name = category.name;
            recorded.root = category.root;
            recorded.elevated = category.elevated;

            for (const auto& source : category.paths) {
                if (!is_within(source, category.root)) {
                    logger_->warning("Skipping " + source.string() + ": outside " +
                                     category.root.string());
                    continue;
                }
                recorded.paths.push_back(source);
                copier.copy(source, staged_location(category_dir, relative_to_root(source, category.root)),
                            category.elevated);
            }
            manifest.categories.push_back(std::move(recorded));
        }

        copied = copier.finish();
        copied.failed += pool.failure_count();
    }

    if (cancel.cancelled()) {
        discard_staging();
        return Error(ErrorCode::CANCELLED, "Snapshot " + id + " cancelled");
    }

    auto written = write_manifest(staging / MANIFEST_FILE_NAME, manifest);
    if (!written.ok()) {
        discard_staging();
        return Error(ErrorCode::IO_ERROR,
                     "Failed to write manifest for " + id + ": " + written.error().message());
    }

    auto sealed = write_tar_gz(staging, partial, {MANIFEST_FILE_NAME}, cancel);
    if (!sealed.ok()) {
        fs::remove(partial, ec);
        discard_staging();
        return sealed.error();
    }

    fs::rename(partial, final_path, ec);
    if (ec) {
        Error error = error_from_code(ec, "rename " + partial.string());
        fs::remove(partial, ec);
        discard_staging();
        return error;
    }
    discard_staging();

    auto described = describe(final_path);
    if (!described.ok()) return described.error();

    SnapshotReport report;
    report.snapshot = std::move(described.value());
    report.copy = std::move(copied);

    logger_->info("Snapshot " + id + " sealed: " + std::to_string(report.copy.files) + " files, " +
                  std::to_string(report.copy.failed) + " failures, " +
                  format_size(report.snapshot.archive_size));
    return report;
}

// =============================================================================
// Restore
// =============================================================================

Result<RestoreReport> SnapshotManager::restore(const std::string& name, RestoreOptions options) {
    auto found = find_snapshot(name);
    if (!found.ok()) return found.error();

    ScopedTempDir extract_dir(logger_);
    auto created = extract_dir.create("sweep-restore-");
    if (!created.ok()) return created.error();

    auto extracted = extract_tar_gz(found->archive_path, extract_dir.path());
    if (!extracted.ok()) {
        return Error(ErrorCode::ARCHIVE_ERROR, extracted.error().message());
    }

    std::string manifest_text;
    {
        std::ifstream in(extract_dir.path() / MANIFEST_FILE_NAME);
        if (!in.is_open()) {
            return Error(ErrorCode::MANIFEST_INVALID, "Snapshot " + found->id + " has no manifest");
        }
        manifest_text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    auto manifest = manifest_from_json(manifest_text);
    if (!manifest.ok()) return manifest.error();

    RestoreJob job;
    job.snapshot = *found;
    job.manifest = std::move(manifest.value());
    for (const auto& category : job.manifest.categories) {
        auto override_it = options.root_overrides.find(category.name);
        job.roots[category.name] = override_it != options.root_overrides.end()
                                       ? override_it->second
                                       : category.root;
    }

    std::vector<fs::path> roots;
    for (const auto& [category, root] : job.roots) {
        roots.push_back(root);
    }
    TreeLock lock;
    if (locks_) {
        lock = locks_->acquire(roots);
    }

    logger_->info("Restoring snapshot " + job.snapshot.id);

    RestoreReport report;
    report.snapshot = job.snapshot;
    report.roots = job.roots;
    {
        const size_t workers = options_.copy_workers > 0 ? options_.copy_workers
                                                         : default_worker_count();
        WorkerPool pool(workers, "restore-copy", logger_);
        TreeCopier copier(pool, options_.large_file_threshold, logger_, elevator_, options.cancel);

        for (const auto& category : job.manifest.categories) {
            const fs::path staged_dir = extract_dir.path() / category.name;
            const fs::path& live_root = job.roots[category.name];

            for (const auto& source : category.paths) {
                const fs::path rel = relative_to_root(source, category.root);
                const fs::path staged = staged_location(staged_dir, rel);

                std::error_code ec;
                if (!fs::exists(fs::symlink_status(staged, ec))) {
                    // Source was absent when the snapshot was taken
                    continue;
                }
                copier.copy(staged, staged_location(live_root, rel), category.elevated);
            }
        }

        report.copy = copier.finish();
        report.copy.failed += pool.failure_count();
    }
    report.cancelled = options.cancel.cancelled();

    logger_->info("Restored snapshot " + job.snapshot.id + ": " +
                  std::to_string(report.copy.files) + " files, " +
                  std::to_string(report.copy.failed) + " failures");
    return report;
}

}  // namespace sweep
