#include "modkeeper/appconfig.h"
#include "modkeeper/catalog.h"
#include "modkeeper/error.h"
#include "modkeeper/library.h"
#include "modkeeper/log.h"
#include "modkeeper/service.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <format>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;
using modkeeper::Error;
using modkeeper::ErrorKind;
using modkeeper::catalog::Catalog;
namespace lib = modkeeper::library;

struct Options {
    std::string mode;
    std::vector<std::string> args;
    std::optional<std::string> name;
    std::optional<std::string> author;
    std::optional<std::string> description;
    std::optional<std::string> tag;
    std::optional<std::string> image;
    bool pretty = false;
};

// ---------------------------------------------------------------------------
// Output helpers
// ---------------------------------------------------------------------------

static json opt(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

static json asset_json(const modkeeper::catalog::Asset& a) {
    return {
        {"id", a.id},
        {"name", a.name},
        {"entity", a.entity_slug},
        {"category", a.category_slug},
        {"folder_name", a.folder_name},
        {"description", opt(a.description)},
        {"author", opt(a.author)},
        {"category_tag", opt(a.category_tag)},
        {"image_filename", opt(a.image_filename)},
    };
}

static void emit(const json& j, bool pretty) {
    if (pretty) std::cout << std::setw(2) << j << '\n';
    else std::cout << j << '\n';
}

// report_error writes the message to stderr and {"error","kind"} JSON to stdout.
static int report_error(const std::string& message, std::optional<ErrorKind> kind, bool pretty) {
    std::cerr << "Error: " << message << '\n';
    json j = {{"error", message}};
    j["kind"] = kind ? json(std::string(modkeeper::error_kind_name(*kind))) : json(nullptr);
    emit(j, pretty);
    return 1;
}

static int64_t parse_id(const std::string& s) {
    int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size())
        throw Error(ErrorKind::InvalidInput, std::format("invalid id '{}'", s));
    return v;
}

static bool parse_flag(const std::string& s) {
    if (s == "1" || s == "true") return true;
    if (s == "0" || s == "false") return false;
    throw Error(ErrorKind::InvalidInput, std::format("expected 0 or 1, got '{}'", s));
}

static void require_args(const Options& opts, size_t n, const char* usage) {
    if (opts.args.size() < n)
        throw Error(ErrorKind::InvalidInput, std::format("usage: modkeeper {} {}", opts.mode, usage));
}

static void stderr_notification(const modkeeper::service::Notification& n) {
    namespace topic = modkeeper::service::topic;
    if (n.topic == topic::scan_progress || n.topic == topic::preset_apply_progress) {
        int width = static_cast<int>(std::to_string(n.total).size());
        std::cerr << std::format("\r[{:>{}}/{:d}] {}\033[K", n.processed, width, n.total, n.message);
    } else if (n.topic == topic::prune_progress) {
        return;
    } else {
        std::cerr << "\n" << n.message << "\n";
    }
}

// ---------------------------------------------------------------------------
// Modes
// ---------------------------------------------------------------------------

static void do_init(Catalog& cat, const modkeeper::appconfig::AppConfig& cfg) {
    if (cfg.definitions_path.empty())
        throw Error(ErrorKind::Config, "no definitions file. Use -definitions or set definitions_path in config.");
    auto result = cat.seed(modkeeper::catalog::load_definitions(cfg.definitions_path));
    std::cerr << std::format("Seeded {} categories, {} entities\n", result.categories_added,
                             result.entities_added);
}

// Forwards notifications to stderr and remembers the first failure.
struct ProgressSink {
    std::string failure;

    modkeeper::service::NotifyFunc func() {
        return [this](const modkeeper::service::Notification& n) {
            namespace topic = modkeeper::service::topic;
            if (failure.empty() && (n.topic == topic::scan_error || n.topic == topic::prune_error ||
                                    n.topic == topic::preset_apply_error))
                failure = n.message;
            stderr_notification(n);
        };
    }

    void rethrow() const {
        if (!failure.empty()) throw std::runtime_error(failure);
    }
};

static void do_scan(const std::shared_ptr<Catalog>& cat, const modkeeper::appconfig::AppConfig& cfg) {
    ProgressSink sink;
    {
        modkeeper::service::LibraryService service(cat, sink.func());
        service.start_scan({.fallback_category = cfg.fallback_category});
        service.wait();
    }
    sink.rethrow();
}

static void do_preset_apply(const std::shared_ptr<Catalog>& cat, int64_t preset_id) {
    ProgressSink sink;
    {
        modkeeper::service::LibraryService service(cat, sink.func());
        service.start_preset_apply(preset_id);
        service.wait();
    }
    sink.rethrow();
}

static void do_categories(const Catalog& cat, bool pretty) {
    json arr = json::array();
    for (const auto& c : cat.categories()) {
        arr.push_back({{"id", c.id}, {"name", c.name}, {"slug", c.slug}});
    }
    emit(arr, pretty);
}

static void do_entities(const Catalog& cat, const std::string& category, bool pretty) {
    json arr = json::array();
    for (const auto& e : cat.entities_by_category(category)) {
        json details = json::parse(e.details, nullptr, false);
        if (details.is_discarded()) details = e.details;
        arr.push_back({
            {"id", e.id},
            {"name", e.name},
            {"slug", e.slug},
            {"description", opt(e.description)},
            {"details", details},
            {"base_image", opt(e.base_image)},
            {"mod_count", e.mod_count},
        });
    }
    emit(arr, pretty);
}

static void do_list(const Catalog& cat, const std::string& entity, bool pretty) {
    json arr = json::array();
    for (const auto& v : lib::list_assets(cat, entity)) {
        json j = asset_json(v.asset);
        j["is_enabled"] = v.is_enabled;
        j["folder_on_disk"] = v.folder_on_disk;
        arr.push_back(std::move(j));
    }
    emit(arr, pretty);
}

static void do_edit(Catalog& cat, const Options& opts) {
    int64_t id = parse_id(opts.args[0]);
    auto current = cat.asset(id);
    if (!current) throw Error(ErrorKind::NotFound, std::format("asset {} not found", id));

    // Unspecified fields keep their current values.
    lib::AssetEdit edit{
        .name = opts.name.value_or(current->name),
        .description = opts.description ? opts.description : current->description,
        .author = opts.author ? opts.author : current->author,
        .category_tag = opts.tag ? opts.tag : current->category_tag,
        .image_source = opts.image ? std::optional<fs::path>(*opts.image) : std::nullopt,
    };
    emit(asset_json(lib::update_asset_info(cat, id, edit)), opts.pretty);
}

static void do_import(Catalog& cat, const Options& opts) {
    lib::ImportRequest req{
        .source = opts.args[0],
        .entity_slug = opts.args[1],
        .mod_name = opts.args[2],
        .description = opts.description,
        .author = opts.author,
        .category_tag = opts.tag,
        .preview_image = opts.image ? std::optional<fs::path>(*opts.image) : std::nullopt,
    };
    int64_t id = lib::import_folder(cat, req);
    auto a = cat.asset(id);
    if (!a) throw Error(ErrorKind::Catalog, std::format("imported asset {} not readable", id));
    emit(asset_json(*a), opts.pretty);
}

static void do_presets(const Catalog& cat, bool pretty) {
    json arr = json::array();
    for (const auto& p : cat.presets()) {
        arr.push_back({{"id", p.id}, {"name", p.name}, {"is_favorite", p.is_favorite},
                       {"asset_count", p.asset_count}});
    }
    emit(arr, pretty);
}

static void do_stats(const Catalog& cat, bool pretty) {
    auto s = lib::dashboard_stats(cat);
    json counts = json::object();
    for (const auto& [slug, n] : s.category_counts) counts[slug] = n;
    emit({
        {"total_mods", s.total_mods},
        {"enabled_mods", s.enabled_mods},
        {"disabled_mods", s.disabled_mods},
        {"uncategorized_mods", s.uncategorized_mods},
        {"category_counts", counts},
        {"errors", s.errors},
    }, pretty);
}

static void run(const Options& opts, const modkeeper::appconfig::AppConfig& cfg) {
    if (cfg.db_path.empty())
        throw Error(ErrorKind::Config, "no catalog path. Use -db or set db_path in config.");

    auto cat = std::make_shared<Catalog>(Catalog::open(cfg.db_path));
    if (!cfg.mods_dir.empty()) {
        cat->set_setting(modkeeper::catalog::mods_folder_key, fs::absolute(cfg.mods_dir).string());
    }

    const std::string& m = opts.mode;
    if (m == "-init") {
        do_init(*cat, cfg);
    } else if (m == "-scan") {
        do_scan(cat, cfg);
    } else if (m == "-categories") {
        do_categories(*cat, opts.pretty);
    } else if (m == "-entities") {
        require_args(opts, 1, "<category>");
        do_entities(*cat, opts.args[0], opts.pretty);
    } else if (m == "-list") {
        require_args(opts, 1, "<entity>");
        do_list(*cat, opts.args[0], opts.pretty);
    } else if (m == "-toggle") {
        require_args(opts, 1, "<asset_id>");
        bool enabled = lib::toggle_asset(*cat, parse_id(opts.args[0]));
        emit({{"id", parse_id(opts.args[0])}, {"is_enabled", enabled}}, opts.pretty);
    } else if (m == "-relocate") {
        require_args(opts, 2, "<asset_id> <entity>");
        emit(asset_json(lib::relocate_asset(*cat, parse_id(opts.args[0]), opts.args[1])), opts.pretty);
    } else if (m == "-delete") {
        require_args(opts, 1, "<asset_id>");
        lib::delete_asset(*cat, parse_id(opts.args[0]));
        std::cerr << "Deleted asset " << opts.args[0] << "\n";
    } else if (m == "-edit") {
        require_args(opts, 1, "<asset_id> [-name ...] [-author ...] [-description ...] [-tag ...] [-image ...]");
        do_edit(*cat, opts);
    } else if (m == "-image-path") {
        require_args(opts, 1, "<asset_id>");
        std::cout << lib::asset_image_path(*cat, parse_id(opts.args[0])).string() << '\n';
    } else if (m == "-keybinds") {
        require_args(opts, 1, "<asset_id>");
        json arr = json::array();
        for (const auto& k : lib::asset_keybinds(*cat, parse_id(opts.args[0]))) {
            arr.push_back({{"title", k.title}, {"key", k.key}});
        }
        emit(arr, opts.pretty);
    } else if (m == "-import") {
        require_args(opts, 3, "<dir> <entity> <name>");
        do_import(*cat, opts);
    } else if (m == "-presets") {
        do_presets(*cat, opts.pretty);
    } else if (m == "-preset-create") {
        require_args(opts, 1, "<name>");
        int64_t id = lib::create_preset(*cat, opts.args[0]);
        emit({{"id", id}, {"name", opts.args[0]}}, opts.pretty);
    } else if (m == "-preset-overwrite") {
        require_args(opts, 1, "<preset_id>");
        int n = lib::overwrite_preset(*cat, parse_id(opts.args[0]));
        std::cerr << std::format("Stored {} entries\n", n);
    } else if (m == "-preset-apply") {
        require_args(opts, 1, "<preset_id>");
        do_preset_apply(cat, parse_id(opts.args[0]));
    } else if (m == "-preset-delete") {
        require_args(opts, 1, "<preset_id>");
        cat->delete_preset(parse_id(opts.args[0]));
    } else if (m == "-preset-favorite") {
        require_args(opts, 2, "<preset_id> <0|1>");
        cat->set_preset_favorite(parse_id(opts.args[0]), parse_flag(opts.args[1]));
    } else if (m == "-preset-add") {
        require_args(opts, 3, "<asset_id> <0|1> <preset_id>...");
        std::vector<int64_t> presets;
        for (size_t i = 2; i < opts.args.size(); i++) presets.push_back(parse_id(opts.args[i]));
        cat->add_asset_to_presets(parse_id(opts.args[0]), parse_flag(opts.args[1]), presets);
    } else if (m == "-stats") {
        do_stats(*cat, opts.pretty);
    } else if (m == "-get") {
        require_args(opts, 1, "<key>");
        auto v = cat->get_setting(opts.args[0]);
        if (!v) throw Error(ErrorKind::NotFound, std::format("setting '{}' not set", opts.args[0]));
        std::cout << *v << '\n';
    } else if (m == "-set") {
        require_args(opts, 2, "<key> <value>");
        cat->set_setting(opts.args[0], opts.args[1]);
    } else {
        throw Error(ErrorKind::InvalidInput, std::format("unknown mode '{}'", m));
    }
}

static void print_usage() {
    std::cerr << "Usage: modkeeper [flags] <mode> [args]\n\n"
              << "Mod library manager: scans a mods folder into a catalog and\n"
              << "enables, disables and organizes mods on disk.\n\n"
              << "Modes:\n"
              << "  -init                          Create catalog and seed categories/entities\n"
              << "  -scan                          Reconcile catalog with the mods folder\n"
              << "  -categories                    List categories\n"
              << "  -entities <category>           List entities of a category\n"
              << "  -list <entity>                 List mods of an entity with their state\n"
              << "  -toggle <id>                   Enable or disable a mod\n"
              << "  -relocate <id> <entity>        Move a mod to another entity\n"
              << "  -delete <id>                   Delete a mod folder and its entry\n"
              << "  -edit <id>                     Edit mod info (-name, -author, -description, -tag, -image)\n"
              << "  -image-path <id>               Print the path of a mod's preview image\n"
              << "  -keybinds <id>                 List keybinds declared by a mod\n"
              << "  -import <dir> <entity> <name>  Copy a folder into the library\n"
              << "  -presets                       List presets\n"
              << "  -preset-create <name>          Save current states as a preset\n"
              << "  -preset-overwrite <id>         Replace a preset with current states\n"
              << "  -preset-apply <id>             Apply a preset\n"
              << "  -preset-delete <id>            Delete a preset\n"
              << "  -preset-favorite <id> <0|1>    Mark or unmark a preset as favorite\n"
              << "  -preset-add <id> <0|1> <preset>...  Add a mod to presets\n"
              << "  -stats                         Show library statistics\n"
              << "  -get <key> / -set <key> <val>  Read or write a catalog setting\n\n"
              << "Flags:\n"
              << "  -config <path>       Config file (JSON)\n"
              << "  -db <path>           Catalog database path\n"
              << "  -mods <dir>          Mods folder (stored in the catalog)\n"
              << "  -definitions <path>  Seed definitions (JSON)\n"
              << "  -fallback <slug>     Category for mods that can't be classified\n"
              << "  -v, -vv              Verbose / debug logging\n"
              << "  --pretty             Pretty-print JSON output\n";
}

static bool is_mode(const char* arg) {
    static const char* modes[] = {
        "-init", "-scan", "-categories", "-entities", "-list", "-toggle", "-relocate",
        "-delete", "-edit", "-image-path", "-keybinds", "-import", "-presets",
        "-preset-create", "-preset-overwrite", "-preset-apply", "-preset-delete",
        "-preset-favorite", "-preset-add", "-stats", "-get", "-set",
    };
    for (const char* m : modes) {
        if (std::strcmp(arg, m) == 0) return true;
    }
    return false;
}

int main(int argc, char* argv[]) {
    Options opts;
    std::string config_flag;
    std::string db_flag;
    std::string mods_flag;
    std::string definitions_flag;
    std::string fallback_flag;
    int verbosity = 0;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-config") == 0 && i + 1 < argc) config_flag = argv[++i];
        else if (std::strcmp(argv[i], "-db") == 0 && i + 1 < argc) db_flag = argv[++i];
        else if (std::strcmp(argv[i], "-mods") == 0 && i + 1 < argc) mods_flag = argv[++i];
        else if (std::strcmp(argv[i], "-definitions") == 0 && i + 1 < argc) definitions_flag = argv[++i];
        else if (std::strcmp(argv[i], "-fallback") == 0 && i + 1 < argc) fallback_flag = argv[++i];
        else if (std::strcmp(argv[i], "-name") == 0 && i + 1 < argc) opts.name = argv[++i];
        else if (std::strcmp(argv[i], "-author") == 0 && i + 1 < argc) opts.author = argv[++i];
        else if (std::strcmp(argv[i], "-description") == 0 && i + 1 < argc) opts.description = argv[++i];
        else if (std::strcmp(argv[i], "-tag") == 0 && i + 1 < argc) opts.tag = argv[++i];
        else if (std::strcmp(argv[i], "-image") == 0 && i + 1 < argc) opts.image = argv[++i];
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(verbosity + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--pretty") == 0) opts.pretty = true;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else if (opts.mode.empty() && is_mode(argv[i])) {
            opts.mode = argv[i];
        } else {
            opts.args.push_back(argv[i]);
        }
    }

    if (opts.mode.empty()) {
        print_usage();
        return 2;
    }

    // Load config, then override with flags
    auto cfg = config_flag.empty() ? modkeeper::appconfig::load_config()
                                   : modkeeper::appconfig::load_config(config_flag);
    if (!db_flag.empty()) cfg.db_path = db_flag;
    if (!mods_flag.empty()) cfg.mods_dir = mods_flag;
    if (!definitions_flag.empty()) cfg.definitions_path = definitions_flag;
    if (!fallback_flag.empty()) cfg.fallback_category = fallback_flag;
    modkeeper::log::set_verbosity(std::max(cfg.verbosity, verbosity));

    try {
        run(opts, cfg);
    } catch (const Error& e) {
        return report_error(e.what(), e.kind(), opts.pretty);
    } catch (const std::exception& e) {
        return report_error(e.what(), std::nullopt, opts.pretty);
    }
    return 0;
}
