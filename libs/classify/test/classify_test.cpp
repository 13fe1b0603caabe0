#include "modkeeper/classify.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using modkeeper::catalog::Category;
using modkeeper::catalog::Entity;
using modkeeper::classify::ClassificationMaps;
using modkeeper::classify::MatchSource;

namespace {

ClassificationMaps sample_maps() {
    std::vector<Category> cats = {
        {.id = 1, .name = "Playable Characters", .slug = "characters"},
        {.id = 2, .name = "Weapons", .slug = "weapons"},
        {.id = 3, .name = "User Interface", .slug = "ui"},
    };
    std::vector<Entity> ents;
    auto ent = [&](int64_t id, int64_t cat, const char* name, const char* slug) {
        Entity e;
        e.id = id;
        e.category_id = cat;
        e.name = name;
        e.slug = slug;
        ents.push_back(e);
    };
    ent(10, 1, "Hero A", "hero-a");
    ent(11, 1, "Hero B", "hero-b");
    ent(12, 2, "Sword", "sword");
    ent(13, 1, "Other/Unknown", "characters-other");
    ent(14, 2, "Other/Unknown", "weapons-other");
    ent(15, 3, "Other/Unknown", "ui-other");
    return ClassificationMaps::from(cats, ents);
}

fs::path make_base(const std::string& name) {
    auto dir = fs::temp_directory_path() / "modkeeper-classify-tests" /
               (name + "-" + std::to_string(std::rand())) / "BaseMods";
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& p, const std::string& text) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p);
    out << text;
}

}  // namespace

TEST(ClassifyTest, MapsMatchSlugExactlyAndNamesCaseInsensitively) {
    auto maps = sample_maps();
    EXPECT_EQ(maps.match_entity("hero-a").value_or(""), "hero-a");
    EXPECT_EQ(maps.match_entity("HERO a").value_or(""), "hero-a");
    EXPECT_FALSE(maps.match_entity("HERO-A").has_value());
    EXPECT_EQ(maps.match_category("weapons").value_or(""), "weapons");
    EXPECT_EQ(maps.match_category("playable characters").value_or(""), "characters");
    EXPECT_FALSE(maps.match_category("Characters").has_value());
    EXPECT_FALSE(maps.match_entity("").has_value());
    EXPECT_FALSE(maps.entity_names.contains("other/unknown"));
}

TEST(ClassifyTest, FuzzyMatchChecksSlugsBeforeNamesAndBothDirections) {
    auto maps = sample_maps();
    EXPECT_EQ(modkeeper::classify::fuzzy_category_match("Characters", maps).value_or(""), "characters");
    EXPECT_EQ(modkeeper::classify::fuzzy_category_match("weap", maps).value_or(""), "weapons");
    EXPECT_EQ(modkeeper::classify::fuzzy_category_match("WeaponsPack", maps).value_or(""), "weapons");
    EXPECT_EQ(modkeeper::classify::fuzzy_category_match("user", maps).value_or(""), "ui");
    EXPECT_FALSE(modkeeper::classify::fuzzy_category_match("zzz", maps).has_value());
    EXPECT_FALSE(modkeeper::classify::fuzzy_category_match("", maps).has_value());
}

TEST(ClassifyTest, CleanModNameStripsMarkers) {
    using modkeeper::classify::clean_mod_name;
    EXPECT_EQ(clean_mod_name("Red Cape_v1.2.3", "f"), "Red Cape");
    EXPECT_EQ(clean_mod_name("DISABLED_Red Cape", "f"), "Red Cape");
    EXPECT_EQ(clean_mod_name("Red Cape (Disabled)", "f"), "Red Cape");
    EXPECT_EQ(clean_mod_name("Red_disabled", "f"), "Red");
    EXPECT_EQ(clean_mod_name("DISABLED_", "DISABLED_"), "DISABLED_");
}

TEST(ClassifyTest, AncestryEntityWinsOverDescriptorHint) {
    auto base = make_base("ancestry");
    auto mod = base / "stuff" / "Hero A" / "deep" / "Cape";
    write_file(mod / "mod.ini", "[Mod]\nName=Cape_v2\nTarget=hero-b\nAuthor=Me\n");
    write_file(mod / "preview.jpg", "img");

    auto info = modkeeper::classify::deduce_mod_info(mod, base, sample_maps(), "ui");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->entity_slug, "hero-a");
    EXPECT_EQ(info->source, MatchSource::Ancestry);
    EXPECT_EQ(info->mod_name, "Cape");
    EXPECT_EQ(info->author.value_or(""), "Me");
    EXPECT_EQ(info->image_filename.value_or(""), "preview.jpg");
}

TEST(ClassifyTest, DescriptorHintResolvesEntity) {
    auto base = make_base("hint");
    auto mod = base / "misc" / "Blade";
    write_file(mod / "blade.ini", "[Info]\nCharacter=sword\nType=Skin\n");

    auto info = modkeeper::classify::deduce_mod_info(mod, base, sample_maps(), "ui");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->entity_slug, "sword");
    EXPECT_EQ(info->source, MatchSource::Descriptor);
    EXPECT_EQ(info->mod_type_tag.value_or(""), "Skin");
    EXPECT_EQ(info->mod_name, "Blade");
}

TEST(ClassifyTest, UnknownEntityHintIsWarnedOnce) {
    auto base = make_base("unknownhint");
    write_file(base / "misc" / "First" / "a.ini", "[Mod]\nTarget=ghost-of-nobody\n");
    write_file(base / "misc" / "Second" / "b.ini", "[Mod]\nTarget=ghost-of-nobody\n");

    testing::internal::CaptureStderr();
    auto first = modkeeper::classify::deduce_mod_info(base / "misc" / "First", base, sample_maps(), "ui");
    auto second = modkeeper::classify::deduce_mod_info(base / "misc" / "Second", base, sample_maps(), "ui");
    std::string err = testing::internal::GetCapturedStderr();

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->entity_slug, "ui-other");
    size_t pos = err.find("names unknown entity ghost-of-nobody");
    ASSERT_NE(pos, std::string::npos);
    EXPECT_EQ(err.find("names unknown entity ghost-of-nobody", pos + 1), std::string::npos);
}

TEST(ClassifyTest, CategoryOnlyGoesToOtherEntity) {
    auto base = make_base("category");
    auto mod = base / "Weapons" / "Unknown Gun";
    write_file(mod / "gun.ini", "[Mod]\nName=Gun\n");

    auto info = modkeeper::classify::deduce_mod_info(mod, base, sample_maps(), "ui");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->entity_slug, "weapons-other");
    EXPECT_EQ(info->source, MatchSource::CategoryOther);
}

TEST(ClassifyTest, TypeHintResolvesCategory) {
    auto base = make_base("typehint");
    auto mod = base / "loose" / "Thing";
    write_file(mod / "thing.ini", "[General]\nCategory=User Interface\n");

    auto info = modkeeper::classify::deduce_mod_info(mod, base, sample_maps(), "weapons");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->entity_slug, "ui-other");
}

TEST(ClassifyTest, FuzzyFallbackOnTopLevelFolder) {
    auto base = make_base("fuzzy");
    auto mod = base / "Characters" / "RandomName123";
    write_file(mod / "random.ini", "[TextureOverrideBody]\nhash = 1234abcd\n");

    auto info = modkeeper::classify::deduce_mod_info(mod, base, sample_maps(), "ui");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->entity_slug, "characters-other");
    EXPECT_EQ(info->source, MatchSource::Fuzzy);
    EXPECT_EQ(info->mod_name, "RandomName123");
}

TEST(ClassifyTest, DisabledTopLevelModClassifiesLikeEnabled) {
    auto base = make_base("toplevel");
    write_file(base / "Characters_Pack" / "pack.ini", "[Mod]\n");
    write_file(base / "DISABLED_Weapons_Pack" / "pack.ini", "[Mod]\n");

    auto enabled = modkeeper::classify::deduce_mod_info(base / "Characters_Pack", base, sample_maps(), "ui");
    ASSERT_TRUE(enabled.has_value());
    EXPECT_EQ(enabled->entity_slug, "characters-other");

    auto disabled = modkeeper::classify::deduce_mod_info(base / "DISABLED_Weapons_Pack", base, sample_maps(), "ui");
    ASSERT_TRUE(disabled.has_value());
    EXPECT_EQ(disabled->entity_slug, "weapons-other");
    EXPECT_EQ(disabled->source, MatchSource::Fuzzy);
    EXPECT_EQ(disabled->mod_name, "Weapons_Pack");
}

TEST(ClassifyTest, ConfiguredFallbackWhenNothingMatches) {
    auto base = make_base("fallback");
    auto mod = base / "zzz" / "DISABLED_Mystery";
    write_file(mod / "m.ini", "");

    auto info = modkeeper::classify::deduce_mod_info(mod, base, sample_maps(), "weapons");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->entity_slug, "weapons-other");
    EXPECT_EQ(info->source, MatchSource::Fallback);
    EXPECT_EQ(info->mod_name, "Mystery");
}

TEST(ClassifyTest, BaseRootItselfIsNotAnAncestor) {
    auto base = make_base("root") / "Hero A";
    fs::create_directories(base);
    auto mod = base / "Cape";
    write_file(mod / "m.ini", "");

    auto info = modkeeper::classify::deduce_mod_info(mod, base, sample_maps(), "weapons");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->entity_slug, "weapons-other");
}
