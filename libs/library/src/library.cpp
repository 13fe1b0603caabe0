#include "modkeeper/library.h"
#include "modkeeper/classify.h"
#include "modkeeper/error.h"
#include "modkeeper/log.h"
#include "modkeeper/modpath.h"
#include "modkeeper/probe.h"

#include <algorithm>
#include <format>
#include <functional>
#include <unordered_set>

namespace fs = std::filesystem;

namespace modkeeper::library {

using catalog::Asset;
using catalog::Catalog;
using modstate::ModState;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Asset require_asset(const Catalog& cat, int64_t asset_id) {
    auto a = cat.asset(asset_id);
    if (!a) throw Error(ErrorKind::NotFound, std::format("asset {} not found", asset_id));
    return *a;
}

static catalog::Entity require_entity(const Catalog& cat, const std::string& slug) {
    auto e = cat.entity_by_slug(slug);
    if (!e) throw Error(ErrorKind::NotFound, std::format("entity '{}' not found", slug));
    return *e;
}

// Resolves an asset folder, throwing OrphanedAsset when it exists in neither form.
static modstate::Resolution resolve_existing(const fs::path& base, const Asset& a,
                                             const std::string& action) {
    auto res = modstate::resolve(base, a.folder_name);
    if (res.state == ModState::Orphaned) throw modstate::orphaned_error(action, a.folder_name, res);
    return res;
}

static void report(const ScanProgressFunc& progress, ScanProgress p) {
    if (progress) progress(p);
}

static void copy_preview(const fs::path& source, const fs::path& mod_dir) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec))
        throw Error(ErrorKind::NotFound, std::format("image {} not found", source.string()));
    fs::path target = mod_dir / target_image_filename;
    if (fs::exists(target, ec) && fs::equivalent(source, target, ec)) return;
    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec)
        throw Error(ErrorKind::Filesystem,
                    std::format("failed to copy {} to {}: {}", source.string(), target.string(),
                                ec.message()));
}

// ---------------------------------------------------------------------------
// Scan
// ---------------------------------------------------------------------------

std::string ScanResult::summary() const {
    return std::format("Scan complete. Processed {} mod folders. Added {} new mods. "
                       "Pruned {} missing mods. {} errors occurred.",
                       processed, added, pruned, errors.size());
}

// walk_mod_roots visits the tree under base depth first in name order. Every
// directory holding a descriptor is passed to on_root and not descended into.
// Directories that can't be listed are passed to on_error and skipped; the
// rest of the tree is still walked. Symlinked directories are not followed.
template <typename RootFn, typename ErrorFn>
static void walk_mod_roots(const fs::path& base, RootFn&& on_root, ErrorFn&& on_error) {
    std::vector<fs::path> pending{base};
    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        if (dir != base && probe::has_marker_file(dir)) {
            on_root(dir);
            continue;
        }
        std::error_code ec;
        if (dir != base && fs::is_symlink(dir, ec)) continue;

        std::vector<fs::path> children;
        fs::directory_iterator it(dir, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code dec;
            if (it->is_directory(dec) && !dec) children.push_back(it->path());
        }
        if (ec) {
            on_error(dir, ec);
            continue;
        }
        std::sort(children.begin(), children.end(), std::greater<>());
        for (auto& c : children) pending.push_back(std::move(c));
    }
}

int count_mod_roots(const fs::path& base) {
    int total = 0;
    walk_mod_roots(base, [&](const fs::path&) { ++total; }, [](const fs::path&, const std::error_code&) {});
    return total;
}

// True when a catalog folder lies in (or is) a directory the walk could not read.
static bool under_unread(const std::string& folder_name, const std::vector<std::string>& unread) {
    for (const auto& prefix : unread) {
        if (prefix.empty() || folder_name == prefix || folder_name.starts_with(prefix + "/")) return true;
    }
    return false;
}

struct ScanState {
    Catalog& cat;
    const fs::path& base;
    const classify::ClassificationMaps& maps;
    const ScanOptions& opts;
    std::unordered_set<int64_t> found;
    ScanResult result;
};

static void process_mod_root(ScanState& st, const fs::path& dir) {
    auto info = classify::deduce_mod_info(dir, st.base, st.maps, st.opts.fallback_category);
    if (!info)
        throw Error(ErrorKind::InvalidInput, "could not deduce mod info");

    auto eit = st.maps.entity_ids.find(info->entity_slug);
    if (eit == st.maps.entity_ids.end())
        throw Error(ErrorKind::NotFound, std::format("deduced entity '{}' not found", info->entity_slug));

    std::string canonical = modpath::canonical_relative_path(st.base, dir);
    if (canonical.empty())
        throw Error(ErrorKind::InvalidInput, "folder is not below the mods folder");

    if (auto existing = st.cat.find_asset(eit->second, canonical)) {
        st.found.insert(*existing);
        LOGD("scan: exists", canonical);
        return;
    }

    Asset a;
    a.entity_id = eit->second;
    a.name = info->mod_name;
    a.description = info->description;
    a.folder_name = canonical;
    a.image_filename = info->image_filename;
    a.author = info->author;
    a.category_tag = info->mod_type_tag;

    int64_t id = st.cat.insert_asset(a);
    st.found.insert(id);
    ++st.result.added;
    LOGI("scan: added", canonical, "as", info->entity_slug,
         std::format("({})", classify::match_source_name(info->source)));
}

ScanResult scan(Catalog& cat, const ScanOptions& opts, const ScanProgressFunc& progress) {
    // Prepare
    fs::path base = cat.mods_base_path();
    std::error_code ec;
    if (!fs::is_directory(base, ec))
        throw Error(ErrorKind::Filesystem,
                    std::format("Mods directory path is not a valid directory: {}", base.string()));

    auto maps = classify::ClassificationMaps::build(cat);
    if (opts.fallback_category.empty())
        throw Error(ErrorKind::Config, "fallback category is not configured");
    if (!maps.category_ids.contains(opts.fallback_category) ||
        !maps.entity_ids.contains(catalog::other_entity_slug(opts.fallback_category)))
        throw Error(ErrorKind::Config,
                    std::format("fallback category '{}' is not a seeded category", opts.fallback_category));

    std::vector<catalog::Asset> initial = cat.all_assets();

    ScanState st{.cat = cat, .base = base, .maps = maps, .opts = opts, .found = {}, .result = {}};

    // Count
    st.result.total = count_mod_roots(base);
    report(progress, {.phase = "scan", .processed = 0, .total = st.result.total,
                      .current_path = "", .message = "Starting scan..."});

    // Walk
    std::unordered_set<std::string> visited;
    std::vector<std::string> unread; // canonical relative paths the walk could not list
    walk_mod_roots(
        base,
        [&](const fs::path& dir) {
            if (!visited.insert(dir.lexically_normal().string()).second) return;

            ++st.result.processed;
            report(progress, {.phase = "scan", .processed = st.result.processed, .total = st.result.total,
                              .current_path = dir.string(),
                              .message = std::format("Processing: {}", dir.filename().string())});
            try {
                process_mod_root(st, dir);
            } catch (const std::exception& e) {
                LOGE("scan:", dir.string(), e.what());
                st.result.errors.push_back(std::format("{}: {}", dir.string(), e.what()));
            }
        },
        [&](const fs::path& dir, const std::error_code& err) {
            LOGE("scan: cannot read", dir.string(), err.message());
            st.result.errors.push_back(std::format("{}: {}", dir.string(), err.message()));
            unread.push_back(dir == base ? std::string() : modpath::canonical_relative_path(base, dir));
        });

    // Prune
    // Rows below unreadable folders were not looked for, so they are kept.
    std::vector<int64_t> orphans;
    int kept = 0;
    for (const auto& a : initial) {
        if (st.found.contains(a.id)) continue;
        if (under_unread(a.folder_name, unread)) {
            ++kept;
            continue;
        }
        orphans.push_back(a.id);
    }
    if (kept > 0) LOGW("scan: kept", kept, "catalog entries below folders that could not be read");
    const int orphan_count = static_cast<int>(orphans.size());
    report(progress, {.phase = "prune_start", .processed = 0, .total = orphan_count,
                      .current_path = "",
                      .message = std::format("Pruning {} missing mods...", orphan_count)});
    if (!orphans.empty()) {
        try {
            st.result.pruned = cat.delete_assets(orphans);
        } catch (const std::exception& e) {
            report(progress, {.phase = "prune_error", .processed = 0, .total = orphan_count,
                              .current_path = "", .message = e.what()});
            throw;
        }
        LOGI("scan: pruned", st.result.pruned, "assets with no folder on disk");
    }
    report(progress, {.phase = "prune", .processed = st.result.pruned, .total = orphan_count,
                      .current_path = "", .message = ""});
    report(progress, {.phase = "prune_complete", .processed = st.result.pruned, .total = orphan_count,
                      .current_path = "",
                      .message = std::format("Pruned {} missing mods.", st.result.pruned)});

    return st.result;
}

// ---------------------------------------------------------------------------
// Assets
// ---------------------------------------------------------------------------

std::vector<AssetView> list_assets(const Catalog& cat, const std::string& entity_slug) {
    auto entity = require_entity(cat, entity_slug);
    fs::path base = cat.mods_base_path();

    std::vector<AssetView> out;
    for (auto& a : cat.assets_for_entity(entity.id)) {
        auto res = modstate::resolve(base, a.folder_name);
        if (res.state == ModState::Orphaned) {
            LOGW("library: asset", a.id, "folder", a.folder_name, "not found on disk, skipping");
            continue;
        }
        AssetView v;
        v.is_enabled = res.is_enabled();
        v.folder_on_disk = modstate::on_disk_relative(a.folder_name, res.state);
        v.asset = std::move(a);
        out.push_back(std::move(v));
    }
    return out;
}

bool toggle_asset(const Catalog& cat, int64_t asset_id) {
    auto a = require_asset(cat, asset_id);
    fs::path base = cat.mods_base_path();
    bool enabled = modstate::toggle(base, a.folder_name);
    LOGI("library: asset", asset_id, enabled ? "enabled" : "disabled");
    return enabled;
}

Asset relocate_asset(Catalog& cat, int64_t asset_id, const std::string& target_entity_slug) {
    auto a = require_asset(cat, asset_id);
    auto target = require_entity(cat, target_entity_slug);
    fs::path base = cat.mods_base_path();
    auto res = resolve_existing(base, a, "relocate");

    std::string leaf = modpath::leaf_name(a.folder_name);
    std::string dest_rel = std::format("{}/{}/{}", target.category_slug, target.slug, leaf);
    if (dest_rel == a.folder_name) {
        if (a.entity_id != target.id) cat.update_asset_location(a.id, target.id, dest_rel);
        return require_asset(cat, asset_id);
    }

    auto dest = modstate::resolve(base, dest_rel);
    if (dest.state != ModState::Orphaned)
        throw Error(ErrorKind::Conflict,
                    std::format("cannot relocate '{}': {} already exists", a.folder_name,
                                dest.actual_path().string()));

    fs::path from = res.actual_path();
    fs::path to = res.state == ModState::Disabled ? dest.disabled_path : dest.enabled_path;

    std::error_code ec;
    fs::create_directories(to.parent_path(), ec);
    if (ec)
        throw Error(ErrorKind::Filesystem,
                    std::format("failed to create {}: {}", to.parent_path().string(), ec.message()));

    modstate::move_directory(from, to);
    try {
        cat.update_asset_location(a.id, target.id, dest_rel);
    } catch (const std::exception& e) {
        LOGE("library: catalog update failed after moving", from.string(), "to", to.string(),
             "- moving it back:", e.what());
        try {
            modstate::move_directory(to, from);
        } catch (const std::exception& back) {
            LOGE("library: could not move", to.string(), "back to", from.string(), back.what());
        }
        throw;
    }
    LOGI("library: relocated", a.folder_name, "->", dest_rel);
    return require_asset(cat, asset_id);
}

void delete_asset(Catalog& cat, int64_t asset_id) {
    auto a = require_asset(cat, asset_id);
    fs::path base = cat.mods_base_path();
    auto res = resolve_existing(base, a, "delete");

    std::error_code ec;
    fs::remove_all(res.actual_path(), ec);
    if (ec)
        throw Error(ErrorKind::Filesystem,
                    std::format("failed to delete {}: {}", res.actual_path().string(), ec.message()));
    cat.delete_asset(asset_id);
    LOGI("library: deleted asset", asset_id, a.folder_name);
}

Asset update_asset_info(Catalog& cat, int64_t asset_id, const AssetEdit& edit) {
    std::string name = modpath::trim(edit.name);
    if (name.empty()) throw Error(ErrorKind::InvalidInput, "Mod name cannot be empty");

    auto a = require_asset(cat, asset_id);
    fs::path base = cat.mods_base_path();
    auto res = resolve_existing(base, a, "edit");

    catalog::AssetInfo info;
    info.name = name;
    info.description = edit.description;
    info.author = edit.author;
    info.category_tag = edit.category_tag;
    if (edit.image_source) {
        copy_preview(*edit.image_source, res.actual_path());
        info.image_filename = target_image_filename;
    }
    cat.update_asset_info(asset_id, info);
    return require_asset(cat, asset_id);
}

fs::path asset_image_path(const Catalog& cat, int64_t asset_id) {
    auto a = require_asset(cat, asset_id);
    if (!a.image_filename || a.image_filename->empty())
        throw Error(ErrorKind::NotFound, std::format("asset {} has no preview image", asset_id));
    fs::path base = cat.mods_base_path();
    auto res = resolve_existing(base, a, "locate image of");

    fs::path image = res.actual_path() / *a.image_filename;
    std::error_code ec;
    if (!fs::is_regular_file(image, ec))
        throw Error(ErrorKind::NotFound, std::format("image {} not found", image.string()));
    return image;
}

std::vector<modini::Keybind> asset_keybinds(const Catalog& cat, int64_t asset_id) {
    auto a = require_asset(cat, asset_id);
    fs::path base = cat.mods_base_path();
    auto res = resolve_existing(base, a, "read keybinds of");

    std::vector<modini::Keybind> out;
    for (const auto& file : probe::descriptor_files(res.actual_path())) {
        auto binds = modini::keybinds(modini::parse_file(file));
        out.insert(out.end(), binds.begin(), binds.end());
    }
    return out;
}

int64_t import_folder(Catalog& cat, const ImportRequest& req) {
    std::string name = modpath::trim(req.mod_name);
    if (name.empty()) throw Error(ErrorKind::InvalidInput, "Mod name cannot be empty");
    std::string folder = modpath::folder_component(name);
    if (folder.empty())
        throw Error(ErrorKind::InvalidInput,
                    std::format("mod name '{}' does not give a usable folder name", name));
    if (modpath::has_disabled_prefix(folder))
        throw Error(ErrorKind::InvalidInput,
                    std::format("mod name '{}' must not start with {}", name, modpath::disabled_prefix));

    std::error_code ec;
    if (!fs::is_directory(req.source, ec))
        throw Error(ErrorKind::Filesystem, std::format("source folder {} not found", req.source.string()));

    auto entity = require_entity(cat, req.entity_slug);
    fs::path base = cat.mods_base_path();

    std::string canonical = std::format("{}/{}/{}", entity.category_slug, entity.slug, folder);
    auto dest = modstate::resolve(base, canonical);
    if (dest.state != ModState::Orphaned)
        throw Error(ErrorKind::Conflict, std::format("{} already exists", dest.actual_path().string()));
    if (cat.find_asset(entity.id, canonical))
        throw Error(ErrorKind::Conflict, std::format("Database entry already exists for '{}'", canonical));

    fs::create_directories(dest.enabled_path.parent_path(), ec);
    if (ec)
        throw Error(ErrorKind::Filesystem,
                    std::format("failed to create {}: {}", dest.enabled_path.parent_path().string(),
                                ec.message()));

    fs::copy(req.source, dest.enabled_path, fs::copy_options::recursive, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove_all(dest.enabled_path, cleanup);
        throw Error(ErrorKind::Filesystem,
                    std::format("failed to copy {} to {}: {}", req.source.string(),
                                dest.enabled_path.string(), ec.message()));
    }

    try {
        Asset a;
        a.entity_id = entity.id;
        a.name = name;
        a.description = req.description;
        a.folder_name = canonical;
        a.author = req.author;
        a.category_tag = req.category_tag;
        if (req.preview_image) {
            copy_preview(*req.preview_image, dest.enabled_path);
            a.image_filename = target_image_filename;
        } else {
            a.image_filename = probe::find_preview_image(dest.enabled_path);
        }
        int64_t id = cat.insert_asset(a);
        LOGI("library: imported", req.source.string(), "as", canonical);
        return id;
    } catch (const std::exception&) {
        std::error_code cleanup;
        fs::remove_all(dest.enabled_path, cleanup);
        if (cleanup) LOGW("library: could not clean up", dest.enabled_path.string(), cleanup.message());
        throw;
    }
}

// ---------------------------------------------------------------------------
// Presets
// ---------------------------------------------------------------------------

std::vector<catalog::PresetEntry> snapshot_states(const Catalog& cat) {
    fs::path base = cat.mods_base_path();
    std::vector<catalog::PresetEntry> entries;
    for (const auto& a : cat.all_assets()) {
        auto res = modstate::resolve(base, a.folder_name);
        if (res.state == ModState::Orphaned) {
            LOGW("library: asset", a.id, "is orphaned, left out of preset");
            continue;
        }
        entries.push_back({.asset_id = a.id, .is_enabled = res.is_enabled()});
    }
    return entries;
}

int64_t create_preset(Catalog& cat, const std::string& name) {
    return cat.create_preset(name, snapshot_states(cat));
}

int overwrite_preset(Catalog& cat, int64_t preset_id) {
    if (!cat.preset(preset_id))
        throw Error(ErrorKind::NotFound, std::format("preset {} not found", preset_id));
    auto entries = snapshot_states(cat);
    cat.replace_preset_entries(preset_id, entries);
    return static_cast<int>(entries.size());
}

std::string PresetApplyResult::summary() const {
    return std::format("Preset applied. {} mods checked, {} changed, {} errors.",
                       total, changed, errors.size());
}

PresetApplyResult apply_preset(const Catalog& cat, int64_t preset_id, const PresetProgressFunc& progress) {
    auto entries = cat.preset_entries(preset_id);
    fs::path base = cat.mods_base_path();

    PresetApplyResult result;
    result.total = static_cast<int>(entries.size());
    if (progress)
        progress({.phase = "start", .processed = 0, .total = result.total, .current_id = 0,
                  .message = "Applying preset..."});

    int processed = 0;
    for (const auto& e : entries) {
        std::string message;
        try {
            auto a = require_asset(cat, e.asset_id);
            if (modstate::set_enabled(base, a.folder_name, e.is_enabled)) {
                ++result.changed;
                message = std::format("{} {}", e.is_enabled ? "Enabled" : "Disabled", a.name);
            } else {
                ++result.unchanged;
                message = std::format("{} unchanged", a.name);
            }
        } catch (const std::exception& ex) {
            LOGE("preset: asset", e.asset_id, ex.what());
            result.errors.push_back(std::format("asset {}: {}", e.asset_id, ex.what()));
            message = ex.what();
        }
        ++processed;
        if (progress)
            progress({.phase = "progress", .processed = processed, .total = result.total,
                      .current_id = e.asset_id, .message = message});
    }

    if (progress)
        progress({.phase = "complete", .processed = processed, .total = result.total,
                  .current_id = 0, .message = result.summary()});
    return result;
}

// ---------------------------------------------------------------------------
// Dashboard
// ---------------------------------------------------------------------------

DashboardStats dashboard_stats(const Catalog& cat) {
    DashboardStats s;
    fs::path base = cat.mods_base_path();
    for (const auto& a : cat.all_assets()) {
        ++s.total_mods;
        ++s.category_counts[a.category_slug];
        if (a.entity_slug == catalog::other_entity_slug(a.category_slug)) ++s.uncategorized_mods;
        try {
            auto res = modstate::resolve(base, a.folder_name);
            switch (res.state) {
                case ModState::Enabled: ++s.enabled_mods; break;
                case ModState::Disabled: ++s.disabled_mods; break;
                case ModState::Orphaned:
                    s.errors.push_back(modstate::orphaned_error("count", a.folder_name, res).what());
                    break;
            }
        } catch (const std::exception& e) {
            s.errors.push_back(std::format("asset {}: {}", a.id, e.what()));
        }
    }
    return s;
}

} // namespace modkeeper::library
