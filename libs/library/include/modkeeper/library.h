#pragma once

#include "modkeeper/catalog.h"
#include "modkeeper/modini.h"
#include "modkeeper/modstate.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace modkeeper::library {

// Name given to preview images copied in by edit or import.
inline constexpr const char* target_image_filename = "preview.png";

// ---------------------------------------------------------------------------
// Scan / reconcile
// ---------------------------------------------------------------------------

struct ScanOptions {
    // Category whose "Other" entity receives mods with no usable signal.
    // Required; must name an existing category.
    std::string fallback_category;
};

// ScanProgress reports the state of a scan. Phases, in order: "scan" (one
// report before the walk, then one per mod root before its catalog write),
// "prune_start", "prune", "prune_complete"; "prune_error" replaces the last
// two when the bulk delete fails.
struct ScanProgress {
    std::string phase;
    int processed = 0;
    int total = 0;
    std::string current_path;
    std::string message;
};

using ScanProgressFunc = std::function<void(const ScanProgress&)>;

struct ScanResult {
    int total = 0;     // mod roots counted before the walk
    int processed = 0; // mod roots visited
    int added = 0;
    int pruned = 0;
    std::vector<std::string> errors; // one entry per failed mod root

    std::string summary() const;
};

// Scan walks the mods folder, adds newly found mods to the catalog and
// deletes catalog rows whose folder is gone in both forms. Per-folder
// failures are collected in the result; setup failures (mods folder unset
// or missing, bad fallback category) and prune failures are thrown.
ScanResult scan(catalog::Catalog& cat, const ScanOptions& opts,
                const ScanProgressFunc& progress = nullptr);

// count_mod_roots counts directories below base that directly hold a
// descriptor file, without descending into them.
int count_mod_roots(const std::filesystem::path& base);

// ---------------------------------------------------------------------------
// Assets
// ---------------------------------------------------------------------------

// AssetView is an asset together with its on-disk state.
struct AssetView {
    catalog::Asset asset;
    bool is_enabled = false;
    std::string folder_on_disk; // relative, DISABLED_ prefixed when disabled
};

// ListAssets returns the assets of an entity that exist on disk. Orphaned
// rows are skipped with a warning.
std::vector<AssetView> list_assets(const catalog::Catalog& cat, const std::string& entity_slug);

// ToggleAsset flips an asset between enabled and disabled and returns the new
// state. The catalog is not modified.
bool toggle_asset(const catalog::Catalog& cat, int64_t asset_id);

// RelocateAsset moves an asset folder to <category>/<entity>/<leaf> of the
// target entity, keeping its disabled prefix, then updates the catalog. If
// the catalog update fails the folder is moved back.
catalog::Asset relocate_asset(catalog::Catalog& cat, int64_t asset_id,
                              const std::string& target_entity_slug);

// DeleteAsset removes the asset folder (either form) and its catalog row.
void delete_asset(catalog::Catalog& cat, int64_t asset_id);

struct AssetEdit {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> author;
    std::optional<std::string> category_tag;
    std::optional<std::filesystem::path> image_source; // copied in as preview.png
};

catalog::Asset update_asset_info(catalog::Catalog& cat, int64_t asset_id, const AssetEdit& edit);

// AssetImagePath returns the absolute path of the asset's preview image.
std::filesystem::path asset_image_path(const catalog::Catalog& cat, int64_t asset_id);

// AssetKeybinds collects the keybinds of every descriptor in the asset folder.
std::vector<modini::Keybind> asset_keybinds(const catalog::Catalog& cat, int64_t asset_id);

struct ImportRequest {
    std::filesystem::path source; // folder to copy
    std::string entity_slug;
    std::string mod_name;
    std::optional<std::string> description;
    std::optional<std::string> author;
    std::optional<std::string> category_tag;
    std::optional<std::filesystem::path> preview_image;
};

// ImportFolder copies a mod folder into the library layout and catalogs it.
// Returns the new asset id.
int64_t import_folder(catalog::Catalog& cat, const ImportRequest& req);

// ---------------------------------------------------------------------------
// Presets
// ---------------------------------------------------------------------------

// snapshot_states records the current state of every asset found on disk.
std::vector<catalog::PresetEntry> snapshot_states(const catalog::Catalog& cat);

int64_t create_preset(catalog::Catalog& cat, const std::string& name);

// OverwritePreset replaces a preset's entries with the current states.
// Returns the number of entries stored.
int overwrite_preset(catalog::Catalog& cat, int64_t preset_id);

// PresetProgress phases: "start", "progress" (after each asset), "complete".
struct PresetProgress {
    std::string phase;
    int processed = 0;
    int total = 0;
    int64_t current_id = 0;
    std::string message;
};

using PresetProgressFunc = std::function<void(const PresetProgress&)>;

struct PresetApplyResult {
    int total = 0;
    int changed = 0;
    int unchanged = 0;
    std::vector<std::string> errors;

    std::string summary() const;
};

// ApplyPreset renames each listed asset whose state differs from the preset.
// Per-asset failures are collected; the rest still run.
PresetApplyResult apply_preset(const catalog::Catalog& cat, int64_t preset_id,
                               const PresetProgressFunc& progress = nullptr);

// ---------------------------------------------------------------------------
// Dashboard
// ---------------------------------------------------------------------------

struct DashboardStats {
    int total_mods = 0;
    int enabled_mods = 0;
    int disabled_mods = 0;
    int uncategorized_mods = 0;                // assets in an "Other" entity
    std::map<std::string, int> category_counts; // category slug -> assets
    std::vector<std::string> errors;            // orphaned or unreadable rows
};

DashboardStats dashboard_stats(const catalog::Catalog& cat);

} // namespace modkeeper::library
