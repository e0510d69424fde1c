#include <sweep/quick_locator.hpp>
#include <sweep/path_matcher.hpp>
#include <sweep/util/path_utils.hpp>

#include <algorithm>

namespace sweep {

QuickLocator::QuickLocator(const ExclusionEngine& exclusions,
                           std::shared_ptr<FileSystem> file_system,
                           std::string bundle_extension,
                           fs::path system_root,
                           std::shared_ptr<Logger> logger)
    : exclusions_(exclusions)
    , fs_(std::move(file_system))
    , bundle_extension_(std::move(bundle_extension))
    , system_root_(std::move(system_root))
    , logger_(logger_or_null(std::move(logger))) {
    if (!fs_) {
        fs_ = std::make_shared<LocalFileSystem>();
    }
}

std::vector<fs::path> QuickLocator::locations(const std::string& app_name,
                                              const fs::path& home) const {
    const std::string name = PathMatcher::clean_app_name(app_name, bundle_extension_);
    if (name.empty()) {
        return {};
    }
    const std::string bundle = name + bundle_extension_;
    const fs::path library = home / "Library";

    return {
        system_root_ / "Applications" / bundle,
        system_root_ / "Applications" / name,
        home / "Applications" / bundle,
        home / "Applications" / name,
        library / "Application Support" / name,
        library / "Caches" / name,
        library / "Preferences" / ("*" + name + "*"),
        library / "Saved Application State" / (name + "*"),
        library / "Logs" / name,
        home / ".config" / name,
        home / ".cache" / name,
        home / ".local" / "share" / name,
    };
}

std::vector<std::string> QuickLocator::locate(const std::string& app_name,
                                              const fs::path& home) const {
    std::vector<std::string> found;
    for (const auto& location : locations(app_name, home)) {
        expand(location, found);
    }

    std::sort(found.begin(), found.end());
    found.erase(std::unique(found.begin(), found.end()), found.end());

    found.erase(std::remove_if(found.begin(), found.end(),
                               [this](const std::string& path) {
                                   if (!exclusions_.is_excluded(path)) return false;
                                   logger_->debug("Quick locate: excluded " + path);
                                   return true;
                               }),
                found.end());
    return found;
}

void QuickLocator::expand(const fs::path& location, std::vector<std::string>& out) const {
    const std::string pattern = location.filename().string();
    if (pattern.find('*') == std::string::npos) {
        if (fs_->stat(location).ok()) {
            out.push_back(location.lexically_normal().string());
        }
        return;
    }

    const fs::path dir = location.parent_path();
    auto names = fs_->list(dir);
    if (!names.ok()) {
        if (names.error_code() != ErrorCode::NOT_FOUND) {
            logger_->debug("Quick locate: cannot list " + dir.string() + ": " +
                           names.error().to_string());
        }
        return;
    }
    for (const auto& name : *names) {
        if (glob_match(pattern, name, true, true)) {
            out.push_back((dir / name).lexically_normal().string());
        }
    }
}

}  // namespace sweep
