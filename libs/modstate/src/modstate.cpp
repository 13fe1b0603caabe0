#include "modkeeper/modstate.h"
#include "modkeeper/log.h"
#include "modkeeper/modpath.h"

#include <format>

namespace fs = std::filesystem;

namespace modkeeper::modstate {

const char* state_name(ModState state) {
    switch (state) {
        case ModState::Enabled: return "enabled";
        case ModState::Disabled: return "disabled";
        case ModState::Orphaned: return "orphaned";
    }
    return "orphaned";
}

fs::path Resolution::actual_path() const {
    switch (state) {
        case ModState::Enabled: return enabled_path;
        case ModState::Disabled: return disabled_path;
        case ModState::Orphaned: break;
    }
    return {};
}

Resolution resolve(const fs::path& base, const std::string& canonical) {
    std::string rel = modpath::to_slash(canonical);
    std::string leaf = modpath::leaf_name(rel);
    if (leaf.empty())
        throw Error(ErrorKind::InvalidInput, std::format("invalid asset path '{}'", canonical));

    Resolution res;
    res.enabled_path = modpath::join_relative(base, rel);
    res.disabled_path = modpath::join_relative(base, modpath::parent_of(rel)) /
                        modpath::disabled_name(leaf);

    std::error_code ec;
    if (fs::is_directory(res.enabled_path, ec)) {
        res.state = ModState::Enabled;
    } else if (fs::is_directory(res.disabled_path, ec)) {
        res.state = ModState::Disabled;
    } else {
        res.state = ModState::Orphaned;
    }
    return res;
}

std::string on_disk_relative(const std::string& canonical, ModState state) {
    if (state != ModState::Disabled) return canonical;
    std::string parent = modpath::parent_of(canonical);
    std::string leaf = modpath::disabled_name(modpath::leaf_name(canonical));
    return parent.empty() ? leaf : parent + "/" + leaf;
}

Error orphaned_error(const std::string& action, const std::string& canonical, const Resolution& res) {
    return Error(ErrorKind::OrphanedAsset,
                 std::format("Cannot {} mod '{}': folder not found at expected locations "
                             "(checked {} and {}). Did the folder get moved or deleted?",
                             action, canonical, res.enabled_path.string(),
                             res.disabled_path.string()));
}

void move_directory(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (fs::exists(to, ec))
        throw Error(ErrorKind::Conflict,
                    std::format("cannot move {} to {}: destination already exists",
                                from.string(), to.string()));
    fs::rename(from, to, ec);
    if (ec)
        throw Error(ErrorKind::Filesystem,
                    std::format("failed to rename {} to {}: {}", from.string(), to.string(),
                                ec.message()));
    LOGD("modstate: renamed", from.string(), "->", to.string());
}

bool toggle(const fs::path& base, const std::string& canonical) {
    auto res = resolve(base, canonical);
    switch (res.state) {
        case ModState::Enabled:
            move_directory(res.enabled_path, res.disabled_path);
            return false;
        case ModState::Disabled:
            move_directory(res.disabled_path, res.enabled_path);
            return true;
        case ModState::Orphaned:
            break;
    }
    throw orphaned_error("toggle", canonical, res);
}

bool set_enabled(const fs::path& base, const std::string& canonical, bool enabled) {
    auto res = resolve(base, canonical);
    if (res.state == ModState::Orphaned) throw orphaned_error("update", canonical, res);
    if (res.is_enabled() == enabled) return false;
    if (enabled)
        move_directory(res.disabled_path, res.enabled_path);
    else
        move_directory(res.enabled_path, res.disabled_path);
    return true;
}

} // namespace modkeeper::modstate
