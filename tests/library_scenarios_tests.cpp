#include "modkeeper/catalog.h"
#include "modkeeper/library.h"
#include "modkeeper/modpath.h"
#include "modkeeper/modstate.h"
#include "modkeeper/service.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace lib = modkeeper::library;
using modkeeper::catalog::Catalog;
using modkeeper::modstate::ModState;

namespace {

fs::path test_tmp_dir() {
    auto dir = fs::temp_directory_path() / "modkeeper-scenario-tests" /
               (std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + "-" +
                std::to_string(std::rand()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_text_file(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    ASSERT_TRUE(out.is_open());
    out << text;
}

// Library backed by a catalog file and the bundled definitions.
class Library {
public:
    Library() : root_(test_tmp_dir()), base_(root_ / "BaseMods") {
        fs::create_directories(base_);
        cat_ = std::make_shared<Catalog>(Catalog::open((root_ / "catalog.db").string()));
        cat_->seed(modkeeper::catalog::load_definitions(fs::path(MODKEEPER_SOURCE_DIR) / "data/base_entities.json"));
        cat_->set_setting(modkeeper::catalog::mods_folder_key, base_.string());
    }

    ~Library() {
        cat_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path add_mod(const std::string& rel, const std::string& ini = "[Mod]\n") {
        write_text_file(base_ / rel / "mod.ini", ini);
        return base_ / rel;
    }

    lib::ScanResult scan() { return lib::scan(*cat_, {.fallback_category = "environment"}); }

    int64_t id_of(const std::string& folder) const {
        for (const auto& a : cat_->all_assets()) {
            if (a.folder_name == folder) return a.id;
        }
        ADD_FAILURE() << "no asset for " << folder;
        return 0;
    }

    ModState state_of(int64_t id) const {
        auto a = cat_->asset(id);
        EXPECT_TRUE(a.has_value());
        return modkeeper::modstate::resolve(base_, a->folder_name).state;
    }

    void expect_canonical_paths() const {
        for (const auto& a : cat_->all_assets()) {
            EXPECT_FALSE(modkeeper::modpath::has_disabled_prefix(modkeeper::modpath::leaf_name(a.folder_name)))
                << a.folder_name;
        }
    }

    Catalog& cat() { return *cat_; }
    std::shared_ptr<Catalog> shared() { return cat_; }
    const fs::path& base() const { return base_; }

private:
    fs::path root_;
    fs::path base_;
    std::shared_ptr<Catalog> cat_;
};

}  // namespace

TEST(LibraryScenarioTests, BundledDefinitionsSeedOtherEntities) {
    Library l;
    for (const auto& c : l.cat().categories()) {
        EXPECT_TRUE(l.cat().entity_by_slug(modkeeper::catalog::other_entity_slug(c.slug)).has_value())
            << c.slug;
    }
}

TEST(LibraryScenarioTests, SecondScanWithoutChangesAddsAndPrunesNothing) {
    Library l;
    l.add_mod("characters/aria/Cloak");
    l.add_mod("characters/Borin/DISABLED_Beard");
    l.add_mod("weapons/longsword/Glow", "[Info]\nTarget=recurve-bow\n");
    l.add_mod("loose/Stuff");

    auto first = l.scan();
    EXPECT_EQ(first.added, 4);
    EXPECT_TRUE(first.errors.empty());

    auto second = l.scan();
    EXPECT_EQ(second.processed, 4);
    EXPECT_EQ(second.added, 0);
    EXPECT_EQ(second.pruned, 0);
    l.expect_canonical_paths();
}

TEST(LibraryScenarioTests, PruneRemovesExactlyTheDeletedFolders) {
    Library l;
    std::vector<std::string> folders;
    for (int i = 0; i < 6; i++) {
        folders.push_back("characters/kestrel/Mod" + std::to_string(i));
        l.add_mod(folders.back());
    }
    l.scan();
    int64_t kept = l.id_of(folders[0]);

    fs::remove_all(l.base() / folders[1]);
    fs::remove_all(l.base() / folders[4]);
    auto result = l.scan();
    EXPECT_EQ(result.pruned, 2);
    EXPECT_EQ(l.cat().asset_count(), 4);
    EXPECT_TRUE(l.cat().asset(kept).has_value());
}

TEST(LibraryScenarioTests, UnrecognizedModUnderCharactersGoesToCharactersOther) {
    Library l;
    l.add_mod("Characters/RandomName123", "[TextureOverrideBody]\nhash = 1234abcd\n");
    l.scan();
    auto a = l.cat().asset(l.id_of("Characters/RandomName123"));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->entity_slug, "characters-other");
}

TEST(LibraryScenarioTests, PresetRestoresMixedStates) {
    Library l;
    l.add_mod("characters/aria/A");
    l.add_mod("characters/aria/DISABLED_B");
    l.scan();
    int64_t a = l.id_of("characters/aria/A");
    int64_t b = l.id_of("characters/aria/B");

    int64_t preset = lib::create_preset(l.cat(), "Mixed");
    lib::toggle_asset(l.cat(), a);
    lib::toggle_asset(l.cat(), b);
    EXPECT_EQ(l.state_of(a), ModState::Disabled);
    EXPECT_EQ(l.state_of(b), ModState::Enabled);

    auto result = lib::apply_preset(l.cat(), preset);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(l.state_of(a), ModState::Enabled);
    EXPECT_EQ(l.state_of(b), ModState::Disabled);
}

TEST(LibraryScenarioTests, RelocatedDisabledModStaysDisabled) {
    Library l;
    l.add_mod("characters/aria/DISABLED_Cloak");
    l.scan();
    int64_t id = l.id_of("characters/aria/Cloak");

    auto moved = lib::relocate_asset(l.cat(), id, "merchant");
    EXPECT_EQ(moved.folder_name, "npcs/merchant/Cloak");
    EXPECT_EQ(l.state_of(id), ModState::Disabled);
    EXPECT_TRUE(fs::is_directory(l.base() / "npcs/merchant/DISABLED_Cloak"));
    l.expect_canonical_paths();

    // The next scan sees the moved folder as the same asset.
    auto result = l.scan();
    EXPECT_EQ(result.added, 0);
    EXPECT_EQ(result.pruned, 0);
}

TEST(LibraryScenarioTests, ToggleTwiceRestoresOriginalPath) {
    Library l;
    auto dir = l.add_mod("weapons/longsword/Flame");
    l.scan();
    int64_t id = l.id_of("weapons/longsword/Flame");

    EXPECT_FALSE(lib::toggle_asset(l.cat(), id));
    l.expect_canonical_paths();
    EXPECT_TRUE(lib::toggle_asset(l.cat(), id));
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_FALSE(fs::exists(dir.parent_path() / "DISABLED_Flame"));
}

TEST(LibraryScenarioTests, DeletedAssetLeavesPresets) {
    Library l;
    l.add_mod("characters/aria/A");
    l.add_mod("characters/aria/B");
    l.scan();
    int64_t preset = lib::create_preset(l.cat(), "Both");

    fs::remove_all(l.base() / "characters/aria/B");
    l.scan();
    auto entries = l.cat().preset_entries(preset);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].asset_id, l.id_of("characters/aria/A"));
}

TEST(LibraryScenarioTests, CatalogFileSurvivesReopen) {
    Library l;
    l.add_mod("characters/aria/A");
    l.scan();
    auto again = Catalog::open((l.base().parent_path() / "catalog.db").string());
    EXPECT_EQ(again.asset_count(), 1);
    EXPECT_EQ(again.mods_base_path(), l.base());
}

TEST(LibraryScenarioTests, BackgroundScanMatchesDirectScan) {
    Library l;
    l.add_mod("characters/aria/A");
    l.add_mod("npcs/guard/Helmet");
    {
        modkeeper::service::LibraryService service(l.shared());
        service.start_scan({.fallback_category = "environment"});
    }
    EXPECT_EQ(l.cat().asset_count(), 2);
    EXPECT_EQ(l.cat().asset(l.id_of("npcs/guard/Helmet"))->entity_slug, "guard");
}
