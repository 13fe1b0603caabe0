#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace modkeeper::modpath {

// Literal prefix that marks a disabled mod folder. Only the leaf name carries it.
inline constexpr std::string_view disabled_prefix = "DISABLED_";

// to_slash converts backslashes to forward slashes and trims a leading slash.
inline std::string to_slash(std::string p) {
    std::replace(p.begin(), p.end(), '\\', '/');
    if (!p.empty() && p[0] == '/') p.erase(0, 1);
    return p;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

inline bool starts_with_ci(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

inline bool ends_with_ci(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && iequals(s.substr(s.size() - suffix.size()), suffix);
}

// trim removes leading and trailing ASCII whitespace.
std::string trim(std::string_view s);

inline bool has_disabled_prefix(std::string_view name) {
    return name.starts_with(disabled_prefix);
}

// strip_disabled_prefix removes one leading DISABLED_ from a leaf name.
// DISABLED_DISABLED_X becomes DISABLED_X, which the catalog refuses to store.
inline std::string strip_disabled_prefix(std::string_view name) {
    if (has_disabled_prefix(name)) name.remove_prefix(disabled_prefix.size());
    return std::string(name);
}

inline std::string disabled_name(std::string_view name) {
    return std::string(disabled_prefix) + std::string(name);
}

// leaf_name returns the last component of a slash separated relative path.
std::string leaf_name(std::string_view rel);

// parent_of returns everything before the last '/', or "" for a single component.
std::string parent_of(std::string_view rel);

// first_component returns the part before the first '/'.
std::string first_component(std::string_view rel);

// canonical_relative_path turns dir (which must lie under base) into the
// form stored in the catalog: relative to base, forward slashes, with any
// DISABLED_ prefix stripped from the leaf. Returns "" when dir is not
// strictly below base.
std::string canonical_relative_path(const std::filesystem::path& base,
                                    const std::filesystem::path& dir);

// join_relative appends a slash separated relative path to base.
std::filesystem::path join_relative(const std::filesystem::path& base, std::string_view rel);

// folder_component makes a display name usable as a single folder name:
// trimmed, with spaces and dots replaced by underscores, path separators
// removed.
std::string folder_component(std::string_view name);

} // namespace modkeeper::modpath
