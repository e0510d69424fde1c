#pragma once

#include <sweep/exclusion_rules.hpp>
#include <sweep/fs/file_system.hpp>
#include <sweep/util/logger.hpp>

#include <memory>
#include <string>
#include <vector>

namespace sweep {

/**
 * QuickLocator - Probes a fixed list of well-known locations.
 *
 * A fast alternative to a full scan that only looks where applications
 * usually keep their bundle, support data, caches, preferences, saved state
 * and logs, in both the macOS layout and the XDG layout. A location whose
 * base name holds '*' is expanded by listing its directory and matching
 * names case-insensitively. Excluded paths are dropped.
 */
class QuickLocator {
public:
    /**
     * @param system_root Prefix for the system-wide locations ("/Applications")
     */
    QuickLocator(const ExclusionEngine& exclusions,
                 std::shared_ptr<FileSystem> file_system = nullptr,
                 std::string bundle_extension = DEFAULT_BUNDLE_EXTENSION,
                 fs::path system_root = "/",
                 std::shared_ptr<Logger> logger = nullptr);

    /**
     * Existing entries for the application, sorted and deduplicated.
     * An empty name locates nothing.
     */
    std::vector<std::string> locate(const std::string& app_name, const fs::path& home) const;

    /**
     * The locations probed for an application, before expansion.
     */
    std::vector<fs::path> locations(const std::string& app_name, const fs::path& home) const;

private:
    void expand(const fs::path& location, std::vector<std::string>& out) const;

    const ExclusionEngine& exclusions_;
    std::shared_ptr<FileSystem> fs_;
    std::string bundle_extension_;
    fs::path system_root_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace sweep
