#pragma once

#include <sweep/result.hpp>
#include <sweep/types.hpp>

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace sweep {

/**
 * ExclusionEngine - Compiled exclusion categories.
 *
 * Each enabled category contributes one matcher per fragment:
 * - plain fragment ("node_modules", "usr/bin"): its segments must appear as
 *   consecutive whole segments of the path, compared case-insensitively;
 * - glob fragment (contains '*', '?' or '['): matched against each path
 *   segment, case-insensitively;
 * - "re:" prefixed fragment: case-insensitive regex searched in the path.
 *
 * Disabled categories contribute nothing. Matchers are kept in category
 * order, then fragment order.
 */
class ExclusionEngine {
public:
    /**
     * Compile the given categories. Fragments that fail to compile (bad
     * regex) are skipped and reported by rejected_fragments().
     */
    explicit ExclusionEngine(const ExclusionMap& categories = {});

    /**
     * Compile strictly: any rejected fragment is an INVALID_ARGUMENT error.
     */
    static Result<ExclusionEngine> compile(const ExclusionMap& categories);

    /**
     * Built-in categories: development tooling, plugin/extension
     * directories, protected system directories, and an empty "custom".
     */
    static ExclusionMap builtin_categories();

    /**
     * Union configured categories into a base set. A configured category
     * overrides the `enabled` flag of a base category of the same name and
     * appends its fragments; unknown categories are added as-is.
     */
    static ExclusionMap merge(const ExclusionMap& base, const ExclusionMap& configured);

    bool is_excluded(const fs::path& path) const;

    /**
     * Name of the first category whose matcher hits the path.
     */
    std::optional<std::string> matching_category(const fs::path& path) const;

    size_t matcher_count() const { return matchers_.size(); }
    const std::vector<std::string>& rejected_fragments() const { return rejected_; }

private:
    enum class MatcherKind { SEGMENTS, GLOB, REGEX };

    struct Matcher {
        MatcherKind kind = MatcherKind::SEGMENTS;
        std::string category;
        std::vector<std::string> segments;  // lower-cased, for SEGMENTS
        std::string glob;                   // for GLOB
        std::regex regex;                   // for REGEX
    };

    static std::vector<std::string> split_segments(const std::string& path);
    bool matches(const Matcher& matcher, const std::string& raw,
                 const std::vector<std::string>& segments) const;

    std::vector<Matcher> matchers_;
    std::vector<std::string> rejected_;
};

}  // namespace sweep
