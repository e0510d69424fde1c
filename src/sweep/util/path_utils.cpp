#include <sweep/util/path_utils.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fnmatch.h>
#include <pwd.h>
#include <unistd.h>

#include <vector>

namespace sweep {

namespace {

// Field of the effective user's passwd entry, or "" if there is none
template <typename Field>
std::string passwd_field(Field field) {
    long hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buffer(hint > 0 ? static_cast<size_t>(hint) : 4096);

    struct passwd pw{};
    struct passwd* found = nullptr;
    int rc = 0;
    while ((rc = ::getpwuid_r(::geteuid(), &pw, buffer.data(), buffer.size(), &found)) == ERANGE) {
        buffer.resize(buffer.size() * 2);
    }
    if (rc != 0 || !found) {
        return std::string();
    }
    const char* value = field(*found);
    return value ? std::string(value) : std::string();
}

// "/a/b/" -> "/a/b"; the root path is left alone
fs::path strip_trailing_separator(const fs::path& p) {
    if (p.has_filename() || p == p.root_path()) {
        return p;
    }
    return p.parent_path();
}

}  // namespace

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

bool glob_match(const std::string& pattern, const std::string& text,
                bool case_insensitive, bool match_segments) {
    int flags = 0;
    if (case_insensitive) flags |= FNM_CASEFOLD;
    if (match_segments) flags |= FNM_PATHNAME;
    return ::fnmatch(pattern.c_str(), text.c_str(), flags) == 0;
}

fs::path home_directory() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return fs::path(home);
    }
    std::string dir = passwd_field([](const struct passwd& pw) { return pw.pw_dir; });
    if (!dir.empty()) {
        return fs::path(dir);
    }
    return fs::path("/");
}

fs::path expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return fs::path(path);
    }
    if (path.size() == 1) {
        return home_directory();
    }
    if (path[1] == '/') {
        return home_directory() / path.substr(2);
    }
    // "~user" forms are not expanded
    return fs::path(path);
}

std::string canonical_key(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = path.is_absolute() ? path : fs::absolute(path, ec);
    if (ec) absolute = path;

    fs::path normal = strip_trailing_separator(absolute.lexically_normal());
    if (normal == normal.root_path() || !normal.has_parent_path()) {
        return normal.string();
    }

    fs::path parent = fs::weakly_canonical(normal.parent_path(), ec);
    if (ec) {
        parent = normal.parent_path();
    }
    return (strip_trailing_separator(parent) / normal.filename()).string();
}

bool is_within(const fs::path& path, const fs::path& ancestor) {
    fs::path p = strip_trailing_separator(path.lexically_normal());
    fs::path a = strip_trailing_separator(ancestor.lexically_normal());

    auto pit = p.begin();
    for (auto ait = a.begin(); ait != a.end(); ++ait, ++pit) {
        if (pit == p.end() || *pit != *ait) {
            return false;
        }
    }
    return true;
}

bool paths_overlap(const fs::path& a, const fs::path& b) {
    return is_within(a, b) || is_within(b, a);
}

std::string format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    char buf[64];
    for (const char* unit : units) {
        if (size < 1024.0) {
            std::snprintf(buf, sizeof(buf), "%.2f %s", size, unit);
            return buf;
        }
        size /= 1024.0;
    }
    std::snprintf(buf, sizeof(buf), "%.2f TB", size);
    return buf;
}

int64_t to_unix_ns(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        tp.time_since_epoch()).count();
}

TimePoint from_unix_ns(int64_t ns) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds(ns)));
}

std::string format_timestamp(TimePoint tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm local{};
    ::localtime_r(&t, &local);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &local);
    return buf;
}

std::string current_user_name() {
    for (const char* var : {"SUDO_USER", "LOGNAME", "USER"}) {
        const char* value = std::getenv(var);
        if (value && value[0] != '\0') {
            return value;
        }
    }
    std::string name = passwd_field([](const struct passwd& pw) { return pw.pw_name; });
    if (!name.empty()) {
        return name;
    }
    return "unknown";
}

}  // namespace sweep
