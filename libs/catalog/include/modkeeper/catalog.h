#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modkeeper::catalog {

// Settings key holding the absolute path of the base mods directory.
inline constexpr const char* mods_folder_key = "mods_folder_path";

// Every category owns one fallback entity with this slug suffix and name.
inline constexpr const char* other_entity_suffix = "-other";
inline constexpr const char* other_entity_name = "Other/Unknown";

inline std::string other_entity_slug(const std::string& category_slug) {
    return category_slug + other_entity_suffix;
}

struct Category {
    int64_t id = 0;
    std::string name;
    std::string slug;
};

struct Entity {
    int64_t id = 0;
    int64_t category_id = 0;
    std::string name;
    std::string slug;
    std::optional<std::string> description;
    std::string details = "{}"; // JSON text
    std::optional<std::string> base_image;
    std::string category_slug;
    int mod_count = 0; // filled by entities_by_category only
};

// Asset is one mod. folder_name is the canonical (enabled-form) path
// relative to the base mods directory, with forward slashes.
struct Asset {
    int64_t id = 0;
    int64_t entity_id = 0;
    std::string name;
    std::optional<std::string> description;
    std::string folder_name;
    std::optional<std::string> image_filename;
    std::optional<std::string> author;
    std::optional<std::string> category_tag;

    // Joined from entities/categories on read; ignored on write.
    std::string entity_slug;
    std::string category_slug;
};

// AssetInfo is the user-editable part of an asset.
struct AssetInfo {
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> author;
    std::optional<std::string> category_tag;
    std::optional<std::string> image_filename; // left unchanged when unset
};

struct Preset {
    int64_t id = 0;
    std::string name;
    bool is_favorite = false;
    int asset_count = 0;
};

struct PresetEntry {
    int64_t asset_id = 0;
    bool is_enabled = false;
};

// ---------------------------------------------------------------------------
// Seed definitions
// ---------------------------------------------------------------------------

struct EntityDefinition {
    std::string name;
    std::string slug;
    std::optional<std::string> description;
    std::string details = "{}";
    std::optional<std::string> base_image;
};

struct CategoryDefinition {
    std::string slug;
    std::string name;
    std::vector<EntityDefinition> entities;
};

using Definitions = std::vector<CategoryDefinition>;

// parse_definitions reads the definitions JSON document
// {"<category_slug>": {"name": ..., "entities": [{"name", "slug", ...}]}}.
// Throws modkeeper::Error (Config) when the document is malformed.
Definitions parse_definitions(const std::string& text);

// load_definitions reads and parses a definitions file.
Definitions load_definitions(const std::filesystem::path& path);

// SeedResult holds counts of rows that seeding actually inserted.
struct SeedResult {
    int categories_added = 0;
    int entities_added = 0;
};

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

// Catalog wraps the SQLite store of categories, entities, assets, presets and
// settings. A single mutex serializes every call; operations that touch
// several rows run inside one transaction. All failures are thrown as
// modkeeper::Error.
class Catalog {
public:
    ~Catalog();
    Catalog(Catalog&& other) noexcept;
    Catalog& operator=(Catalog&& other) noexcept;

    // Open opens or creates the catalog at path (":memory:" is accepted).
    static Catalog open(const std::string& path);

    std::string schema_version() const;

    // Seed merges definitions additively and guarantees an "Other/Unknown"
    // entity for every category. Existing rows are never modified.
    SeedResult seed(const Definitions& defs);

    // Settings
    std::optional<std::string> get_setting(const std::string& key) const;
    void set_setting(const std::string& key, const std::string& value);

    // ModsBasePath returns the mods folder setting. Throws Config when unset.
    std::filesystem::path mods_base_path() const;

    // Categories and entities
    std::vector<Category> categories() const;
    std::optional<Category> category_by_slug(const std::string& slug) const;
    std::vector<Entity> entities() const;
    std::vector<Entity> entities_by_category(const std::string& category_slug) const;
    std::optional<Entity> entity_by_slug(const std::string& slug) const;
    std::optional<Entity> entity_by_id(int64_t id) const;

    // Assets
    std::optional<Asset> asset(int64_t id) const;
    std::vector<Asset> assets_for_entity(int64_t entity_id) const;
    std::vector<Asset> all_assets() const;
    int asset_count() const;
    std::optional<int64_t> find_asset(int64_t entity_id, const std::string& folder_name) const;

    // InsertAsset adds a row and returns its id. A row with the same
    // (entity_id, folder_name) is rejected with Conflict.
    int64_t insert_asset(const Asset& asset);
    void update_asset_info(int64_t id, const AssetInfo& info);
    // UpdateAssetLocation moves a row to another entity/path. Conflict if the
    // destination pair is already taken by another asset.
    void update_asset_location(int64_t id, int64_t entity_id, const std::string& folder_name);
    void delete_asset(int64_t id);
    // DeleteAssets removes every listed id in one statement and returns the
    // number of rows deleted.
    int delete_assets(const std::vector<int64_t>& ids);

    // Presets
    std::vector<Preset> presets() const;
    std::vector<Preset> favorite_presets() const;
    std::optional<Preset> preset(int64_t id) const;
    std::vector<PresetEntry> preset_entries(int64_t preset_id) const;
    int64_t create_preset(const std::string& name, const std::vector<PresetEntry>& entries);
    void replace_preset_entries(int64_t preset_id, const std::vector<PresetEntry>& entries);
    void delete_preset(int64_t preset_id);
    void set_preset_favorite(int64_t preset_id, bool favorite);
    void add_asset_to_presets(int64_t asset_id, bool is_enabled,
                              const std::vector<int64_t>& preset_ids);

private:
    Catalog();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace modkeeper::catalog
