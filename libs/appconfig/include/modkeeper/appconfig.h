#pragma once

#include <string>

namespace modkeeper::appconfig {

struct AppConfig {
    std::string db_path = "modkeeper.db";
    std::string mods_dir;          // stored into the catalog when set
    std::string definitions_path;  // seed definitions JSON
    std::string fallback_category; // category whose "Other" entity takes unclassified mods
    int verbosity = 0;             // 0..2
};

// Returns the path to the config JSON file: $MODKEEPER_CONFIG, else
// config.json next to the executable if present, else
// ~/.config/modkeeper/config.json.
std::string config_path();

// Load config from config_path(). Returns defaults if the file doesn't exist.
AppConfig load_config();
AppConfig load_config(const std::string& path);

// Save config to disk. Throws ErrorKind::Config when the file can't be written.
void save_config(const AppConfig& cfg);
void save_config(const AppConfig& cfg, const std::string& path);

} // namespace modkeeper::appconfig
