#include "modkeeper/probe.h"
#include "modkeeper/modpath.h"

#include <algorithm>

namespace fs = std::filesystem;

namespace modkeeper::probe {

static bool is_descriptor(const fs::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) return false;
    return modpath::ends_with_ci(entry.path().filename().string(), descriptor_extension);
}

bool has_marker_file(const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return false;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) return false;
        if (is_descriptor(*it)) return true;
    }
    return false;
}

std::vector<fs::path> descriptor_files(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return out;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (is_descriptor(*it)) out.push_back(it->path());
    }
    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return out;
}

std::optional<std::string> find_preview_image(const fs::path& dir) {
    std::vector<std::string> files;
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return std::nullopt;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (it->is_regular_file(ec) && !ec)
            files.push_back(it->path().filename().string());
    }

    for (const auto& candidate : preview_candidates()) {
        for (const auto& name : files) {
            if (modpath::iequals(name, candidate)) return name;
        }
    }
    return std::nullopt;
}

} // namespace modkeeper::probe
