#include <sweep/exclusion_rules.hpp>
#include <sweep/util/path_utils.hpp>

#include <algorithm>
#include <sstream>

namespace sweep {

namespace {

constexpr const char* REGEX_PREFIX = "re:";

bool is_glob(const std::string& fragment) {
    return fragment.find_first_of("*?[") != std::string::npos;
}

}  // namespace

ExclusionEngine::ExclusionEngine(const ExclusionMap& categories) {
    for (const auto& [name, category] : categories) {
        if (!category.enabled) continue;

        for (const auto& fragment : category.fragments) {
            if (fragment.empty()) continue;

            Matcher matcher;
            matcher.category = name;

            if (fragment.rfind(REGEX_PREFIX, 0) == 0) {
                try {
                    matcher.kind = MatcherKind::REGEX;
                    matcher.regex = std::regex(fragment.substr(3),
                                               std::regex::ECMAScript | std::regex::icase);
                } catch (const std::regex_error&) {
                    rejected_.push_back(fragment);
                    continue;
                }
            } else if (is_glob(fragment)) {
                matcher.kind = MatcherKind::GLOB;
                matcher.glob = fragment;
            } else {
                matcher.kind = MatcherKind::SEGMENTS;
                matcher.segments = split_segments(to_lower(fragment));
                if (matcher.segments.empty()) continue;
            }

            matchers_.push_back(std::move(matcher));
        }
    }
}

Result<ExclusionEngine> ExclusionEngine::compile(const ExclusionMap& categories) {
    ExclusionEngine engine(categories);
    if (!engine.rejected_.empty()) {
        std::ostringstream msg;
        msg << "Invalid exclusion fragment(s):";
        for (const auto& f : engine.rejected_) {
            msg << " '" << f << "'";
        }
        return Error(ErrorCode::INVALID_ARGUMENT, msg.str());
    }
    return engine;
}

ExclusionMap ExclusionEngine::builtin_categories() {
    ExclusionMap categories;
    categories["development"] = ExclusionCategory{true, {
        "site-packages", "node_modules", "venv", "env", ".virtualenv",
        "pip", "npm", "yarn", "composer", "gradle", "maven", "*.py"
    }};
    categories["plugins_extensions"] = ExclusionCategory{true, {
        "plugins", "extensions", "addons", "modules", "plug-ins"
    }};
    categories["system"] = ExclusionCategory{true, {
        "System", "Private", "bin", "sbin", "usr/bin", "usr/sbin", "usr/local/bin"
    }};
    categories["custom"] = ExclusionCategory{true, {}};
    return categories;
}

ExclusionMap ExclusionEngine::merge(const ExclusionMap& base, const ExclusionMap& configured) {
    ExclusionMap result = base;
    for (const auto& [name, category] : configured) {
        auto it = result.find(name);
        if (it == result.end()) {
            result.emplace(name, category);
            continue;
        }
        it->second.enabled = category.enabled;
        auto& fragments = it->second.fragments;
        for (const auto& fragment : category.fragments) {
            if (std::find(fragments.begin(), fragments.end(), fragment) == fragments.end()) {
                fragments.push_back(fragment);
            }
        }
    }
    return result;
}

std::vector<std::string> ExclusionEngine::split_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                segments.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    return segments;
}

bool ExclusionEngine::matches(const Matcher& matcher, const std::string& raw,
                              const std::vector<std::string>& segments) const {
    switch (matcher.kind) {
        case MatcherKind::SEGMENTS: {
            const auto& needle = matcher.segments;
            if (needle.size() > segments.size()) return false;
            auto it = std::search(segments.begin(), segments.end(),
                                  needle.begin(), needle.end());
            return it != segments.end();
        }
        case MatcherKind::GLOB:
            return std::any_of(segments.begin(), segments.end(),
                               [&](const std::string& seg) {
                                   return glob_match(matcher.glob, seg, true, true);
                               });
        case MatcherKind::REGEX:
            return std::regex_search(raw, matcher.regex);
    }
    return false;
}

bool ExclusionEngine::is_excluded(const fs::path& path) const {
    return matching_category(path).has_value();
}

std::optional<std::string> ExclusionEngine::matching_category(const fs::path& path) const {
    if (matchers_.empty()) return std::nullopt;

    const std::string raw = path.string();
    const std::vector<std::string> segments = split_segments(to_lower(raw));

    for (const auto& matcher : matchers_) {
        if (matches(matcher, raw, segments)) {
            return matcher.category;
        }
    }
    return std::nullopt;
}

}  // namespace sweep
