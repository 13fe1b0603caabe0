#include "modkeeper/appconfig.h"
#include "modkeeper/error.h"
#include "modkeeper/log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace modkeeper::appconfig {

static fs::path exe_dir() {
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) return p.parent_path();
    return fs::current_path();
}

std::string config_path() {
    const char* env = std::getenv("MODKEEPER_CONFIG");
    if (env && *env) return env;

    auto beside = exe_dir() / "config.json";
    std::error_code ec;
    if (fs::exists(beside, ec)) return beside.string();

    // Fallback to ~/.config/modkeeper/config.json
    const char* home = std::getenv("HOME");
    if (home) {
        auto dir = fs::path(home) / ".config" / "modkeeper";
        return (dir / "config.json").string();
    }
    return beside.string();
}

static void to_json(json& j, const AppConfig& c) {
    j = json{
        {"db_path", c.db_path},
        {"mods_dir", c.mods_dir},
        {"definitions_path", c.definitions_path},
        {"fallback_category", c.fallback_category},
        {"verbosity", c.verbosity},
    };
}

static void from_json(const json& j, AppConfig& c) {
    if (j.contains("db_path")) j.at("db_path").get_to(c.db_path);
    if (j.contains("mods_dir")) j.at("mods_dir").get_to(c.mods_dir);
    if (j.contains("definitions_path")) j.at("definitions_path").get_to(c.definitions_path);
    if (j.contains("fallback_category")) j.at("fallback_category").get_to(c.fallback_category);
    if (j.contains("verbosity")) c.verbosity = std::clamp(j.at("verbosity").get<int>(), 0, 2);
}

AppConfig load_config() {
    return load_config(config_path());
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.is_open()) return cfg;

    try {
        json j = json::parse(f);
        if (!j.is_object()) {
            LOGW("Config", path, "is not a JSON object, using defaults");
            return cfg;
        }
        from_json(j, cfg);
    } catch (const json::exception& e) {
        LOGW("Config parse error:", e.what());
        return AppConfig{};
    }
    return cfg;
}

void save_config(const AppConfig& cfg) {
    save_config(cfg, config_path());
}

void save_config(const AppConfig& cfg, const std::string& path) {
    json j;
    to_json(j, cfg);

    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    std::ofstream f(path);
    if (!f.is_open()) throw Error(ErrorKind::Config, "cannot write config file " + path);
    f << j.dump(2) << "\n";
}

} // namespace modkeeper::appconfig
