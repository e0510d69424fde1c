#pragma once

#include <sweep/core_types.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sweep {

/**
 * PatternTable - Per-application path templates.
 *
 * Maps a lower-cased clean application name to glob templates in which
 * "{name}" stands for the clean name. Lookup never fails: names without an
 * entry get the general set.
 */
class PatternTable {
public:
    PatternTable() = default;
    explicit PatternTable(std::map<std::string, std::vector<std::string>> entries)
        : entries_(std::move(entries)) {}

    /**
     * Templates for the given name, or general_templates() when absent.
     * The key is lower-cased before lookup.
     */
    const std::vector<std::string>& lookup(const std::string& clean_name) const;

    void set(const std::string& clean_name, std::vector<std::string> templates);

    const std::map<std::string, std::vector<std::string>>& entries() const { return entries_; }

    /**
     * "com.*.{name}*", "*.{name}.*", "{name}*"
     */
    static const std::vector<std::string>& general_templates();

private:
    std::map<std::string, std::vector<std::string>> entries_;
};

/**
 * PathMatcher - Decides whether an entry belongs to an application.
 *
 * Tiers are tried in order and the first hit wins:
 *   BUNDLE_ANCHOR  base name equals "<clean>.<ext>"
 *   STRICT_NAME    base name contains the raw app name
 *   LOOSE_NAME     base name contains the clean name
 *   TEMPLATE       full path matches an expanded template ('*' crosses '/')
 *   TOKEN          base name contains clean, com.clean, org.clean or clean.plist
 *
 * The token set is derived from the clean name, so TOKEN is shadowed by
 * LOOSE_NAME and never reported for a matcher built this way.
 *
 * All comparisons are case-insensitive. The matcher is immutable and can be
 * shared between scanner workers. It knows nothing about exclusions; the
 * scanner applies those first.
 */
class PathMatcher {
public:
    PathMatcher(const std::string& app_name,
                const PatternTable& patterns = PatternTable(),
                const std::string& bundle_extension = DEFAULT_BUNDLE_EXTENSION);

    std::optional<MatchTier> match(const fs::path& path) const;

    /**
     * "<clean>.<ext>", the entry the scanner probes for in every directory.
     */
    const std::string& bundle_name() const { return bundle_name_; }

    bool is_bundle_name(const std::string& name) const;

    const std::string& app_name() const { return app_name_; }
    const std::string& clean_name() const { return clean_name_; }

    /**
     * App name with one trailing bundle extension removed, compared
     * case-insensitively. "Foo.app" -> "Foo".
     */
    static std::string clean_app_name(const std::string& app_name,
                                      const std::string& bundle_extension);

private:
    std::string app_name_;
    std::string clean_name_;
    std::string bundle_name_;

    // Lower-cased copies for the contains tests
    std::string app_lower_;
    std::string clean_lower_;
    std::string bundle_lower_;

    std::vector<std::string> templates_;  // "{name}" already substituted
    std::vector<std::string> tokens_;
};

}  // namespace sweep
