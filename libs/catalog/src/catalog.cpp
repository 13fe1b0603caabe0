#include "modkeeper/catalog.h"
#include "modkeeper/error.h"
#include "modkeeper/log.h"
#include "modkeeper/modpath.h"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <cstring>
#include <ctime>
#include <format>
#include <fstream>
#include <mutex>
#include <sstream>

namespace modkeeper::catalog {

static bool gmtime_utc(std::time_t tt, std::tm& tm_val) {
#if defined(_WIN32)
    return gmtime_s(&tm_val, &tt) == 0;
#else
    return gmtime_r(&tt, &tm_val) != nullptr;
#endif
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

// folder_name carries no UNIQUE constraint: older catalogs hold duplicate
// values, so uniqueness per entity is checked on insert instead.
static constexpr const char* schema_sql = R"SQL(
CREATE TABLE IF NOT EXISTS meta (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS categories (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL UNIQUE,
    slug TEXT NOT NULL UNIQUE
);
CREATE TABLE IF NOT EXISTS entities (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    category_id INTEGER NOT NULL REFERENCES categories(id),
    name TEXT NOT NULL,
    slug TEXT NOT NULL UNIQUE,
    description TEXT,
    details TEXT,
    base_image TEXT
);
CREATE INDEX IF NOT EXISTS idx_entities_category_id ON entities(category_id);
CREATE TABLE IF NOT EXISTS assets (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    entity_id INTEGER NOT NULL REFERENCES entities(id),
    name TEXT NOT NULL,
    description TEXT,
    folder_name TEXT NOT NULL,
    image_filename TEXT,
    author TEXT,
    category_tag TEXT
);
CREATE INDEX IF NOT EXISTS idx_assets_entity_id ON assets(entity_id);
CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY NOT NULL,
    value TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS presets (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL UNIQUE COLLATE NOCASE,
    is_favorite INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS preset_assets (
    preset_id INTEGER NOT NULL REFERENCES presets(id) ON DELETE CASCADE,
    asset_id INTEGER NOT NULL REFERENCES assets(id) ON DELETE CASCADE,
    is_enabled INTEGER NOT NULL,
    PRIMARY KEY (preset_id, asset_id)
);
)SQL";

static constexpr const char* schema_version_value = "1";

// ---------------------------------------------------------------------------
// SQLite helpers
// ---------------------------------------------------------------------------

class SqliteStmt {
public:
    SqliteStmt(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK)
            throw Error(ErrorKind::Catalog,
                        std::format("sqlite3_prepare_v2: {}", sqlite3_errmsg(db)));
    }
    ~SqliteStmt() { if (stmt_) sqlite3_finalize(stmt_); }
    SqliteStmt(const SqliteStmt&) = delete;
    SqliteStmt& operator=(const SqliteStmt&) = delete;


    void reset() { sqlite3_reset(stmt_); sqlite3_clear_bindings(stmt_); }

    void bind_text(int idx, const std::string& v) {
        sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }
    void bind_opt_text(int idx, const std::optional<std::string>& v) {
        if (v) bind_text(idx, *v);
        else sqlite3_bind_null(stmt_, idx);
    }
    void bind_int(int idx, int v) { sqlite3_bind_int(stmt_, idx, v); }
    void bind_int64(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }

    // Step returns true while rows are available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw Error(ErrorKind::Catalog,
                    std::format("sqlite3_step: {}", sqlite3_errmsg(sqlite3_db_handle(stmt_))));
    }

    void exec() { step(); }

    std::string text(int col) const {
        const char* v = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return v ? v : "";
    }
    std::optional<std::string> opt_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    int integer(int col) const { return sqlite3_column_int(stmt_, col); }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw Error(ErrorKind::Catalog, std::format("sqlite3_exec: {}", msg));
    }
}

static sqlite3* open_db_handle(const std::string& path, int flags) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw Error(ErrorKind::Catalog, std::format("sqlite3_open_v2({}): {}", path, msg));
    }
    return db;
}

static bool table_exists(sqlite3* db, const char* table) {
    SqliteStmt stmt(db, "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?1");
    stmt.bind_text(1, table);
    return stmt.step();
}

// Transaction rolls back on destruction unless commit() ran.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec_sql(db_, "BEGIN IMMEDIATE"); }
    ~Transaction() {
        if (done_) return;
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            LOGE("catalog: rollback failed:", err ? err : "unknown error");
            sqlite3_free(err);
        }
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_sql(db_, "COMMIT");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

// ---------------------------------------------------------------------------
// Definitions
// ---------------------------------------------------------------------------

static std::optional<std::string> optional_string(const nlohmann::ordered_json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}

Definitions parse_definitions(const std::string& text) {
    Definitions defs;
    try {
        auto doc = nlohmann::ordered_json::parse(text);
        if (!doc.is_object())
            throw Error(ErrorKind::Config, "definitions: top level must be an object");

        for (const auto& [slug, cat] : doc.items()) {
            CategoryDefinition cd;
            cd.slug = slug;
            cd.name = cat.at("name").get<std::string>();
            if (cat.contains("entities")) {
                for (const auto& e : cat.at("entities")) {
                    EntityDefinition ed;
                    ed.name = e.at("name").get<std::string>();
                    ed.slug = e.at("slug").get<std::string>();
                    ed.description = optional_string(e, "description");
                    ed.base_image = optional_string(e, "base_image");
                    if (e.contains("details") && !e.at("details").is_null()) {
                        const auto& d = e.at("details");
                        ed.details = d.is_string() ? d.get<std::string>() : d.dump();
                    }
                    cd.entities.push_back(std::move(ed));
                }
            }
            defs.push_back(std::move(cd));
        }
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorKind::Config, std::format("definitions: {}", e.what()));
    }
    return defs;
}

Definitions load_definitions(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw Error(ErrorKind::Config, std::format("cannot open definitions file {}", path.string()));
    std::stringstream ss;
    ss << f.rdbuf();
    return parse_definitions(ss.str());
}

// ---------------------------------------------------------------------------
// Catalog::Impl
// ---------------------------------------------------------------------------

struct Catalog::Impl {
    sqlite3* db = nullptr;
    mutable std::mutex mu;

    ~Impl() {
        if (db) sqlite3_close(db);
    }
};

Catalog::Catalog() : impl_(std::make_unique<Impl>()) {}

Catalog::~Catalog() = default;

Catalog::Catalog(Catalog&& other) noexcept = default;
Catalog& Catalog::operator=(Catalog&& other) noexcept = default;

Catalog Catalog::open(const std::string& path) {
    Catalog c;
    c.impl_->db = open_db_handle(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    sqlite3* db = c.impl_->db;

    exec_sql(db, "PRAGMA foreign_keys=ON");
    exec_sql(db, "PRAGMA journal_mode=WAL");
    exec_sql(db, "PRAGMA synchronous=NORMAL");

    if (table_exists(db, "meta")) {
        SqliteStmt stmt(db, "SELECT value FROM meta WHERE key = 'schema_version'");
        if (stmt.step()) {
            std::string ver = stmt.text(0);
            if (ver != schema_version_value)
                throw Error(ErrorKind::Catalog,
                            std::format("catalog: schema version mismatch: expected {}, got {}",
                                        schema_version_value, ver));
        }
    }

    exec_sql(db, schema_sql);

    {
        SqliteStmt stmt(db, "INSERT OR IGNORE INTO meta (key, value) VALUES (?1, ?2)");
        stmt.bind_text(1, "schema_version");
        stmt.bind_text(2, schema_version_value);
        stmt.exec();

        char tbuf[64] = {};
        std::tm tm_val{};
        if (gmtime_utc(std::time(nullptr), tm_val))
            std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%dT%H:%M:%SZ", &tm_val);
        stmt.reset();
        stmt.bind_text(1, "created_at");
        stmt.bind_text(2, tbuf);
        stmt.exec();
    }

    LOGD("catalog: opened", path);
    return c;
}

std::string Catalog::schema_version() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    SqliteStmt stmt(impl_->db, "SELECT value FROM meta WHERE key = 'schema_version'");
    return stmt.step() ? stmt.text(0) : "";
}

// ---------------------------------------------------------------------------
// Seeding
// ---------------------------------------------------------------------------

SeedResult Catalog::seed(const Definitions& defs) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    sqlite3* db = impl_->db;
    SeedResult result;

    Transaction tx(db);
    SqliteStmt cat_insert(db, "INSERT OR IGNORE INTO categories (name, slug) VALUES (?1, ?2)");
    SqliteStmt cat_select(db, "SELECT id FROM categories WHERE slug = ?1");
    SqliteStmt ent_insert(db,
        "INSERT OR IGNORE INTO entities (category_id, name, slug, description, details, base_image) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6)");

    for (const auto& cd : defs) {
        cat_insert.reset();
        cat_insert.bind_text(1, cd.name);
        cat_insert.bind_text(2, cd.slug);
        cat_insert.exec();
        result.categories_added += sqlite3_changes(db);

        cat_select.reset();
        cat_select.bind_text(1, cd.slug);
        if (!cat_select.step()) {
            LOGW("catalog: category", cd.slug, "was not inserted (name", cd.name, "already taken)");
            continue;
        }
        int64_t category_id = cat_select.int64(0);
        cat_select.reset();

        for (const auto& ed : cd.entities) {
            ent_insert.reset();
            ent_insert.bind_int64(1, category_id);
            ent_insert.bind_text(2, ed.name);
            ent_insert.bind_text(3, ed.slug);
            ent_insert.bind_opt_text(4, ed.description);
            ent_insert.bind_text(5, ed.details.empty() ? "{}" : ed.details);
            ent_insert.bind_opt_text(6, ed.base_image);
            ent_insert.exec();
            result.entities_added += sqlite3_changes(db);
        }
    }

    // Covers categories from earlier seeds too.
    {
        SqliteStmt other(db,
            "INSERT OR IGNORE INTO entities (category_id, name, slug, description, details) "
            "SELECT id, ?1, slug || ?2, 'Uncategorized assets.', '{}' FROM categories");
        other.bind_text(1, other_entity_name);
        other.bind_text(2, other_entity_suffix);
        other.exec();
        result.entities_added += sqlite3_changes(db);
    }

    tx.commit();
    return result;
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

std::optional<std::string> Catalog::get_setting(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    SqliteStmt stmt(impl_->db, "SELECT value FROM settings WHERE key = ?1");
    stmt.bind_text(1, key);
    if (stmt.step()) return stmt.text(0);
    return std::nullopt;
}

void Catalog::set_setting(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    SqliteStmt stmt(impl_->db, "INSERT OR REPLACE INTO settings (key, value) VALUES (?1, ?2)");
    stmt.bind_text(1, key);
    stmt.bind_text(2, value);
    stmt.exec();
}

std::filesystem::path Catalog::mods_base_path() const {
    auto value = get_setting(mods_folder_key);
    if (!value || value->empty())
        throw Error(ErrorKind::Config, "Mods folder path not set");
    return std::filesystem::path(*value);
}

// ---------------------------------------------------------------------------
// Categories and entities
// ---------------------------------------------------------------------------

static Category read_category(const SqliteStmt& stmt) {
    return Category{.id = stmt.int64(0), .name = stmt.text(1), .slug = stmt.text(2)};
}

static constexpr const char* entity_columns =
    "e.id, e.category_id, e.name, e.slug, e.description, e.details, e.base_image, c.slug";

static Entity read_entity(const SqliteStmt& stmt) {
    Entity e;
    e.id = stmt.int64(0);
    e.category_id = stmt.int64(1);
    e.name = stmt.text(2);
    e.slug = stmt.text(3);
    e.description = stmt.opt_text(4);
    e.details = stmt.opt_text(5).value_or("{}");
    e.base_image = stmt.opt_text(6);
    e.category_slug = stmt.text(7);
    return e;
}

std::vector<Category> Catalog::categories() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    SqliteStmt stmt(impl_->db, "SELECT id, name, slug FROM categories ORDER BY name");
    std::vector<Category> out;
    while (stmt.step()) out.push_back(read_category(stmt));
    return out;
}

std::optional<Category> Catalog::category_by_slug(const std::string& slug) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    SqliteStmt stmt(impl_->db, "SELECT id, name, slug FROM categories WHERE slug = ?1");
    stmt.bind_text(1, slug);
    if (stmt.step()) return read_category(stmt);
    return std::nullopt;
}

std::vector<Entity> Catalog::entities() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    auto sql = std::format(
        "SELECT {} FROM entities e JOIN categories c ON c.id = e.category_id ORDER BY e.id",
        entity_columns);
    SqliteStmt stmt(impl_->db, sql.c_str());
    std::vector<Entity> out;
    while (stmt.step()) out.push_back(read_entity(stmt));
    return out;
}

std::vector<Entity> Catalog::entities_by_category(const std::string& category_slug) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    {
        SqliteStmt check(impl_->db, "SELECT 1 FROM categories WHERE slug = ?1");
        check.bind_text(1, category_slug);
        if (!check.step())
            throw Error(ErrorKind::NotFound, std::format("category '{}' not found", category_slug));
    }

    auto sql = std::format(
        "SELECT {}, COUNT(a.id) FROM entities e "
        "JOIN categories c ON c.id = e.category_id "
        "LEFT JOIN assets a ON a.entity_id = e.id "
        "WHERE c.slug = ?1 GROUP BY e.id ORDER BY e.name",
        entity_columns);
    SqliteStmt stmt(impl_->db, sql.c_str());
    stmt.bind_text(1, category_slug);
    std::vector<Entity> out;
    while (stmt.step()) {
        Entity e = read_entity(stmt);
        e.mod_count = stmt.integer(8);
        out.push_back(std::move(e));
    }
    return out;
}

std::optional<Entity> Catalog::entity_by_slug(const std::string& slug) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    auto sql = std::format(
        "SELECT {} FROM entities e JOIN categories c ON c.id = e.category_id WHERE e.slug = ?1",
        entity_columns);
    SqliteStmt stmt(impl_->db, sql.c_str());
    stmt.bind_text(1, slug);
    if (stmt.step()) return read_entity(stmt);
    return std::nullopt;
}

std::optional<Entity> Catalog::entity_by_id(int64_t id) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    auto sql = std::format(
        "SELECT {} FROM entities e JOIN categories c ON c.id = e.category_id WHERE e.id = ?1",
        entity_columns);
    SqliteStmt stmt(impl_->db, sql.c_str());
    stmt.bind_int64(1, id);
    if (stmt.step()) return read_entity(stmt);
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Assets
// ---------------------------------------------------------------------------

static constexpr const char* asset_select =
    "SELECT a.id, a.entity_id, a.name, a.description, a.folder_name, a.image_filename, "
    "a.author, a.category_tag, e.slug, c.slug FROM assets a "
    "JOIN entities e ON e.id = a.entity_id "
    "JOIN categories c ON c.id = e.category_id";

static Asset read_asset(const SqliteStmt& stmt) {
    Asset a;
    a.id = stmt.int64(0);
    a.entity_id = stmt.int64(1);
    a.name = stmt.text(2);
    a.description = stmt.opt_text(3);
    a.folder_name = stmt.text(4);
    a.image_filename = stmt.opt_text(5);
    a.author = stmt.opt_text(6);
    a.category_tag = stmt.opt_text(7);
    a.entity_slug = stmt.text(8);
    a.category_slug = stmt.text(9);
    return a;
}

std::optional<Asset> Catalog::asset(int64_t id) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    auto sql = std::format("{} WHERE a.id = ?1", asset_select);
    SqliteStmt stmt(impl_->db, sql.c_str());
    stmt.bind_int64(1, id);
    if (stmt.step()) return read_asset(stmt);
    return std::nullopt;
}

std::vector<Asset> Catalog::assets_for_entity(int64_t entity_id) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    auto sql = std::format("{} WHERE a.entity_id = ?1 ORDER BY a.name, a.id", asset_select);
    SqliteStmt stmt(impl_->db, sql.c_str());
    stmt.bind_int64(1, entity_id);
    std::vector<Asset> out;
    while (stmt.step()) out.push_back(read_asset(stmt));
    return out;
}

std::vector<Asset> Catalog::all_assets() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    auto sql = std::format("{} ORDER BY a.id", asset_select);
    SqliteStmt stmt(impl_->db, sql.c_str());
    std::vector<Asset> out;
    while (stmt.step()) out.push_back(read_asset(stmt));
    return out;
}

int Catalog::asset_count() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    SqliteStmt stmt(impl_->db, "SELECT COUNT(*) FROM assets");
    return stmt.step() ? stmt.integer(0) : 0;
}

static std::optional<int64_t> find_asset_locked(sqlite3* db, int64_t entity_id,
                                                const std::string& folder_name) {
    SqliteStmt stmt(db, "SELECT id FROM assets WHERE entity_id = ?1 AND folder_name = ?2 "
                        "ORDER BY id LIMIT 1");
    stmt.bind_int64(1, entity_id);
    stmt.bind_text(2, folder_name);
    if (stmt.step()) return stmt.int64(0);
    return std::nullopt;
}

std::optional<int64_t> Catalog::find_asset(int64_t entity_id, const std::string& folder_name) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    return find_asset_locked(impl_->db, entity_id, folder_name);
}

// Stored folder names are canonical: the leaf never carries the DISABLED_ prefix.
static void check_canonical(const std::string& folder_name) {
    std::string leaf = modpath::leaf_name(folder_name);
    if (leaf.empty() || modpath::has_disabled_prefix(leaf))
        throw Error(ErrorKind::InvalidInput,
                    std::format("'{}' is not a canonical mod folder name", folder_name));
}

int64_t Catalog::insert_asset(const Asset& asset) {
    check_canonical(asset.folder_name);
    std::lock_guard<std::mutex> lock(impl_->mu);
    sqlite3* db = impl_->db;

    if (find_asset_locked(db, asset.entity_id, asset.folder_name))
        throw Error(ErrorKind::Conflict,
                    std::format("asset '{}' already exists for entity {}",
                                asset.folder_name, asset.entity_id));

    SqliteStmt stmt(db,
        "INSERT INTO assets (entity_id, name, description, folder_name, image_filename, "
        "author, category_tag) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)");
    stmt.bind_int64(1, asset.entity_id);
    stmt.bind_text(2, asset.name);
    stmt.bind_opt_text(3, asset.description);
    stmt.bind_text(4, asset.folder_name);
    stmt.bind_opt_text(5, asset.image_filename);
    stmt.bind_opt_text(6, asset.author);
    stmt.bind_opt_text(7, asset.category_tag);
    stmt.exec();
    return sqlite3_last_insert_rowid(db);
}

void Catalog::update_asset_info(int64_t id, const AssetInfo& info) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    sqlite3* db = impl_->db;
    SqliteStmt stmt(db,
        "UPDATE assets SET name = ?2, description = ?3, author = ?4, category_tag = ?5, "
        "image_filename = CASE WHEN ?6 IS NULL THEN image_filename ELSE ?6 END "
        "WHERE id = ?1");
    stmt.bind_int64(1, id);
    stmt.bind_text(2, info.name);
    stmt.bind_opt_text(3, info.description);
    stmt.bind_opt_text(4, info.author);
    stmt.bind_opt_text(5, info.category_tag);
    stmt.bind_opt_text(6, info.image_filename);
    stmt.exec();
    if (sqlite3_changes(db) == 0)
        throw Error(ErrorKind::NotFound, std::format("asset {} not found", id));
}

void Catalog::update_asset_location(int64_t id, int64_t entity_id, const std::string& folder_name) {
    check_canonical(folder_name);
    std::lock_guard<std::mutex> lock(impl_->mu);
    sqlite3* db = impl_->db;

    Transaction tx(db);
    auto existing = find_asset_locked(db, entity_id, folder_name);
    if (existing && *existing != id)
        throw Error(ErrorKind::Conflict,
                    std::format("asset '{}' already exists for entity {}", folder_name, entity_id));

    SqliteStmt stmt(db, "UPDATE assets SET entity_id = ?2, folder_name = ?3 WHERE id = ?1");
    stmt.bind_int64(1, id);
    stmt.bind_int64(2, entity_id);
    stmt.bind_text(3, folder_name);
    stmt.exec();
    if (sqlite3_changes(db) == 0)
        throw Error(ErrorKind::NotFound, std::format("asset {} not found", id));
    tx.commit();
}

void Catalog::delete_asset(int64_t id) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    SqliteStmt stmt(impl_->db, "DELETE FROM assets WHERE id = ?1");
    stmt.bind_int64(1, id);
    stmt.exec();
    if (sqlite3_changes(impl_->db) == 0)
        throw Error(ErrorKind::NotFound, std::format("asset {} not found", id));
}

int Catalog::delete_assets(const std::vector<int64_t>& ids) {
    if (ids.empty()) return 0;
    std::lock_guard<std::mutex> lock(impl_->mu);
    sqlite3* db = impl_->db;

    Transaction tx(db);
    exec_sql(db, "CREATE TEMP TABLE IF NOT EXISTS doomed_ids (id INTEGER PRIMARY KEY)");
    exec_sql(db, "DELETE FROM doomed_ids");
    {
        SqliteStmt ins(db, "INSERT OR IGNORE INTO doomed_ids (id) VALUES (?1)");
        for (int64_t id : ids) {
            ins.reset();
            ins.bind_int64(1, id);
            ins.exec();
        }
    }
    exec_sql(db, "DELETE FROM assets WHERE id IN (SELECT id FROM doomed_ids)");
    int deleted = sqlite3_changes(db);
    exec_sql(db, "DELETE FROM doomed_ids");
    tx.commit();
    return deleted;
}

// ---------------------------------------------------------------------------
// Presets
// ---------------------------------------------------------------------------

static constexpr const char* preset_select =
    "SELECT p.id, p.name, p.is_favorite, COUNT(pa.asset_id) FROM presets p "
    "LEFT JOIN preset_assets pa ON pa.preset_id = p.id";

static Preset read_preset(const SqliteStmt& stmt) {
    return Preset{
        .id = stmt.int64(0),
        .name = stmt.text(1),
        .is_favorite = stmt.integer(2) != 0,
        .asset_count = stmt.integer(3),
    };
}

static void require_preset(sqlite3* db, int64_t preset_id) {
    SqliteStmt stmt(db, "SELECT 1 FROM presets WHERE id = ?1");
    stmt.bind_int64(1, preset_id);
    if (!stmt.step())
        throw Error(ErrorKind::NotFound, std::format("preset {} not found", preset_id));
}

static void insert_entries(sqlite3* db, int64_t preset_id, const std::vector<PresetEntry>& entries) {
    SqliteStmt stmt(db,
        "INSERT OR REPLACE INTO preset_assets (preset_id, asset_id, is_enabled) VALUES (?1, ?2, ?3)");
    for (const auto& e : entries) {
        stmt.reset();
        stmt.bind_int64(1, preset_id);
        stmt.bind_int64(2, e.asset_id);
        stmt.bind_int(3, e.is_enabled ? 1 : 0);
        stmt.exec();
    }
}

std::vector<Preset> Catalog::presets() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    auto sql = std::format("{} GROUP BY p.id ORDER BY p.is_favorite DESC, p.name COLLATE NOCASE",
                           preset_select);
    SqliteStmt stmt(impl_->db, sql.c_str());
    std::vector<Preset> out;
    while (stmt.step()) out.push_back(read_preset(stmt));
    return out;
}

std::vector<Preset> Catalog::favorite_presets() const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    auto sql = std::format("{} WHERE p.is_favorite = 1 GROUP BY p.id ORDER BY p.name COLLATE NOCASE",
                           preset_select);
    SqliteStmt stmt(impl_->db, sql.c_str());
    std::vector<Preset> out;
    while (stmt.step()) out.push_back(read_preset(stmt));
    return out;
}

std::optional<Preset> Catalog::preset(int64_t id) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    auto sql = std::format("{} WHERE p.id = ?1 GROUP BY p.id", preset_select);
    SqliteStmt stmt(impl_->db, sql.c_str());
    stmt.bind_int64(1, id);
    if (stmt.step()) return read_preset(stmt);
    return std::nullopt;
}

std::vector<PresetEntry> Catalog::preset_entries(int64_t preset_id) const {
    std::lock_guard<std::mutex> lock(impl_->mu);
    require_preset(impl_->db, preset_id);
    SqliteStmt stmt(impl_->db,
        "SELECT asset_id, is_enabled FROM preset_assets WHERE preset_id = ?1 ORDER BY asset_id");
    stmt.bind_int64(1, preset_id);
    std::vector<PresetEntry> out;
    while (stmt.step())
        out.push_back(PresetEntry{.asset_id = stmt.int64(0), .is_enabled = stmt.integer(1) != 0});
    return out;
}

int64_t Catalog::create_preset(const std::string& name, const std::vector<PresetEntry>& entries) {
    std::string trimmed = modpath::trim(name);
    if (trimmed.empty())
        throw Error(ErrorKind::InvalidInput, "preset name cannot be empty");

    std::lock_guard<std::mutex> lock(impl_->mu);
    sqlite3* db = impl_->db;

    Transaction tx(db);
    {
        SqliteStmt check(db, "SELECT 1 FROM presets WHERE name = ?1 COLLATE NOCASE");
        check.bind_text(1, trimmed);
        if (check.step())
            throw Error(ErrorKind::Conflict, std::format("preset '{}' already exists", trimmed));
    }

    SqliteStmt stmt(db, "INSERT INTO presets (name, is_favorite) VALUES (?1, 0)");
    stmt.bind_text(1, trimmed);
    stmt.exec();
    int64_t id = sqlite3_last_insert_rowid(db);

    insert_entries(db, id, entries);
    tx.commit();
    return id;
}

void Catalog::replace_preset_entries(int64_t preset_id, const std::vector<PresetEntry>& entries) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    sqlite3* db = impl_->db;

    Transaction tx(db);
    require_preset(db, preset_id);
    SqliteStmt del(db, "DELETE FROM preset_assets WHERE preset_id = ?1");
    del.bind_int64(1, preset_id);
    del.exec();
    insert_entries(db, preset_id, entries);
    tx.commit();
}

void Catalog::delete_preset(int64_t preset_id) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    SqliteStmt stmt(impl_->db, "DELETE FROM presets WHERE id = ?1");
    stmt.bind_int64(1, preset_id);
    stmt.exec();
    if (sqlite3_changes(impl_->db) == 0)
        throw Error(ErrorKind::NotFound, std::format("preset {} not found", preset_id));
}

void Catalog::set_preset_favorite(int64_t preset_id, bool favorite) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    SqliteStmt stmt(impl_->db, "UPDATE presets SET is_favorite = ?2 WHERE id = ?1");
    stmt.bind_int64(1, preset_id);
    stmt.bind_int(2, favorite ? 1 : 0);
    stmt.exec();
    if (sqlite3_changes(impl_->db) == 0)
        throw Error(ErrorKind::NotFound, std::format("preset {} not found", preset_id));
}

void Catalog::add_asset_to_presets(int64_t asset_id, bool is_enabled,
                                   const std::vector<int64_t>& preset_ids) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    sqlite3* db = impl_->db;

    Transaction tx(db);
    {
        SqliteStmt check(db, "SELECT 1 FROM assets WHERE id = ?1");
        check.bind_int64(1, asset_id);
        if (!check.step())
            throw Error(ErrorKind::NotFound, std::format("asset {} not found", asset_id));
    }
    for (int64_t preset_id : preset_ids) {
        require_preset(db, preset_id);
        insert_entries(db, preset_id, {PresetEntry{.asset_id = asset_id, .is_enabled = is_enabled}});
    }
    tx.commit();
}

} // namespace modkeeper::catalog
