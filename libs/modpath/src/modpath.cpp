#include "modkeeper/modpath.h"

namespace fs = std::filesystem;

namespace modkeeper::modpath {

std::string trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(start, end - start));
}

std::string leaf_name(std::string_view rel) {
    auto pos = rel.rfind('/');
    return std::string(pos == std::string_view::npos ? rel : rel.substr(pos + 1));
}

std::string parent_of(std::string_view rel) {
    auto pos = rel.rfind('/');
    return pos == std::string_view::npos ? std::string() : std::string(rel.substr(0, pos));
}

std::string first_component(std::string_view rel) {
    auto pos = rel.find('/');
    return std::string(pos == std::string_view::npos ? rel : rel.substr(0, pos));
}

std::string canonical_relative_path(const fs::path& base, const fs::path& dir) {
    fs::path rel = dir.lexically_normal().lexically_relative(base.lexically_normal());
    if (rel.empty() || rel == ".") return {};

    std::string out;
    for (const auto& part : rel) {
        std::string s = part.string();
        if (s.empty() || s == ".") continue;
        if (s == "..") return {};
        if (!out.empty()) out += '/';
        out += s;
    }
    if (out.empty()) return {};

    std::string parent = parent_of(out);
    std::string leaf = strip_disabled_prefix(leaf_name(out));
    if (leaf.empty()) return {};
    return parent.empty() ? leaf : parent + "/" + leaf;
}

fs::path join_relative(const fs::path& base, std::string_view rel) {
    fs::path out = base;
    size_t start = 0;
    while (start <= rel.size()) {
        auto end = rel.find('/', start);
        if (end == std::string_view::npos) end = rel.size();
        if (end > start) out /= std::string(rel.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

std::string folder_component(std::string_view name) {
    std::string out = trim(name);
    for (auto& c : out) {
        if (c == ' ' || c == '.') c = '_';
        else if (c == '/' || c == '\\') c = '_';
    }
    return out;
}

} // namespace modkeeper::modpath
