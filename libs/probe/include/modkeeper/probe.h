#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace modkeeper::probe {

// Extension of the mod descriptor file, matched case-insensitively.
inline constexpr const char* descriptor_extension = ".ini";

// Preview image names in priority order.
inline const std::vector<std::string>& preview_candidates() {
    static const std::vector<std::string> names = {
        "preview.png", "preview.jpg", "icon.png", "icon.jpg", "thumbnail.png", "thumbnail.jpg",
    };
    return names;
}

// has_marker_file reports whether dir directly contains a descriptor file.
// Unreadable or missing directories yield false.
bool has_marker_file(const std::filesystem::path& dir);

// descriptor_files lists the descriptor files directly inside dir, sorted by
// filename.
std::vector<std::filesystem::path> descriptor_files(const std::filesystem::path& dir);

// find_preview_image returns the on-disk filename of the first preview
// candidate (by candidate order) present directly inside dir.
std::optional<std::string> find_preview_image(const std::filesystem::path& dir);

} // namespace modkeeper::probe
