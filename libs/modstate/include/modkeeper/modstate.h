#pragma once

#include "modkeeper/error.h"

#include <filesystem>
#include <string>

namespace modkeeper::modstate {

enum class ModState { Enabled, Disabled, Orphaned };

const char* state_name(ModState state);

// Resolution is where a canonical path lives on disk right now.
struct Resolution {
    ModState state = ModState::Orphaned;
    std::filesystem::path enabled_path;  // base/R
    std::filesystem::path disabled_path; // base/parent(R)/DISABLED_leaf(R)

    bool is_enabled() const { return state == ModState::Enabled; }

    // actual_path is the existing folder. Empty when orphaned.
    std::filesystem::path actual_path() const;
};

// resolve checks the enabled form first, so a folder present in both forms
// resolves to Enabled. Throws InvalidInput for an empty canonical path.
Resolution resolve(const std::filesystem::path& base, const std::string& canonical);

// on_disk_relative returns the relative folder for a given state, i.e. the
// canonical path with DISABLED_ on its leaf when disabled.
std::string on_disk_relative(const std::string& canonical, ModState state);

// orphaned_error builds the error for an operation whose folder is missing in
// both forms. The message names both checked paths.
Error orphaned_error(const std::string& action, const std::string& canonical, const Resolution& res);

// move_directory renames from to to. Conflict when to already exists,
// Filesystem when the rename fails.
void move_directory(const std::filesystem::path& from, const std::filesystem::path& to);

// toggle flips the on-disk state and returns the new enabled flag.
bool toggle(const std::filesystem::path& base, const std::string& canonical);

// set_enabled renames only when the current state differs; returns whether a
// rename happened.
bool set_enabled(const std::filesystem::path& base, const std::string& canonical, bool enabled);

} // namespace modkeeper::modstate
