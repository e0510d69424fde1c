#include <sweep/path_matcher.hpp>
#include <sweep/util/path_utils.hpp>

namespace sweep {

namespace {

constexpr const char* NAME_PLACEHOLDER = "{name}";

std::string normalize_extension(const std::string& ext) {
    if (ext.empty() || ext[0] == '.') return ext;
    return "." + ext;
}

std::string substitute_name(const std::string& tmpl, const std::string& name) {
    std::string result = tmpl;
    const std::string placeholder = NAME_PLACEHOLDER;
    size_t pos = 0;
    while ((pos = result.find(placeholder, pos)) != std::string::npos) {
        result.replace(pos, placeholder.size(), name);
        pos += name.size();
    }
    return result;
}

bool ends_with_icase(const std::string& s, const std::string& suffix) {
    if (suffix.empty() || s.size() < suffix.size()) return false;
    return to_lower(s.substr(s.size() - suffix.size())) == to_lower(suffix);
}

}  // namespace

// =============================================================================
// PatternTable
// =============================================================================

const std::vector<std::string>& PatternTable::general_templates() {
    static const std::vector<std::string> general = {
        "com.*.{name}*",
        "*.{name}.*",
        "{name}*"
    };
    return general;
}

const std::vector<std::string>& PatternTable::lookup(const std::string& clean_name) const {
    auto it = entries_.find(to_lower(clean_name));
    if (it == entries_.end()) {
        return general_templates();
    }
    return it->second;
}

void PatternTable::set(const std::string& clean_name, std::vector<std::string> templates) {
    entries_[to_lower(clean_name)] = std::move(templates);
}

// =============================================================================
// PathMatcher
// =============================================================================

std::string PathMatcher::clean_app_name(const std::string& app_name,
                                        const std::string& bundle_extension) {
    const std::string ext = normalize_extension(bundle_extension);
    if (ends_with_icase(app_name, ext) && app_name.size() > ext.size()) {
        return app_name.substr(0, app_name.size() - ext.size());
    }
    return app_name;
}

PathMatcher::PathMatcher(const std::string& app_name,
                         const PatternTable& patterns,
                         const std::string& bundle_extension)
    : app_name_(app_name) {
    const std::string ext = normalize_extension(bundle_extension);

    clean_name_ = clean_app_name(app_name, ext);
    bundle_name_ = clean_name_ + ext;

    app_lower_ = to_lower(app_name_);
    clean_lower_ = to_lower(clean_name_);
    bundle_lower_ = to_lower(bundle_name_);

    for (const auto& tmpl : patterns.lookup(clean_lower_)) {
        templates_.push_back(substitute_name(tmpl, clean_name_));
    }

    tokens_ = {
        clean_lower_,
        "com." + clean_lower_,
        "org." + clean_lower_,
        clean_lower_ + ".plist"
    };
}

bool PathMatcher::is_bundle_name(const std::string& name) const {
    return !clean_lower_.empty() && to_lower(name) == bundle_lower_;
}

std::optional<MatchTier> PathMatcher::match(const fs::path& path) const {
    // An empty name would match everything
    if (clean_lower_.empty()) return std::nullopt;

    const std::string name = path.filename().string();
    if (name.empty()) return std::nullopt;
    const std::string lower = to_lower(name);

    if (lower == bundle_lower_) {
        return MatchTier::BUNDLE_ANCHOR;
    }
    if (lower.find(app_lower_) != std::string::npos) {
        return MatchTier::STRICT_NAME;
    }
    if (lower.find(clean_lower_) != std::string::npos) {
        return MatchTier::LOOSE_NAME;
    }

    const std::string full = path.string();
    for (const auto& tmpl : templates_) {
        if (glob_match(tmpl, full)) {
            return MatchTier::TEMPLATE;
        }
    }

    // Every token contains the clean name, so a token hit has already
    // matched LOOSE_NAME above. Kept last so TOKEN stays the weakest tier.
    for (const auto& token : tokens_) {
        if (lower.find(token) != std::string::npos) {
            return MatchTier::TOKEN;
        }
    }
    return std::nullopt;
}

}  // namespace sweep
