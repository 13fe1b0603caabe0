#include "modkeeper/modpath.h"

#include <gtest/gtest.h>

namespace mp = modkeeper::modpath;
namespace fs = std::filesystem;

TEST(ModpathTest, CaseInsensitiveHelpers) {
    EXPECT_TRUE(mp::iequals("Characters", "characters"));
    EXPECT_FALSE(mp::iequals("Characters", "character"));
    EXPECT_TRUE(mp::starts_with_ci("CHARACTERS-ext", "characters"));
    EXPECT_TRUE(mp::ends_with_ci("mod.INI", ".ini"));
    EXPECT_FALSE(mp::ends_with_ci("ini", ".ini"));
}

TEST(ModpathTest, DisabledPrefixIsLiteralAndStrippedOnce) {
    EXPECT_TRUE(mp::has_disabled_prefix("DISABLED_Cape"));
    EXPECT_FALSE(mp::has_disabled_prefix("disabled_Cape"));
    EXPECT_EQ(mp::strip_disabled_prefix("DISABLED_Cape"), "Cape");
    EXPECT_EQ(mp::strip_disabled_prefix("DISABLED_DISABLED_Cape"), "DISABLED_Cape");
    EXPECT_EQ(mp::strip_disabled_prefix("Cape"), "Cape");
    EXPECT_EQ(mp::disabled_name("Cape"), "DISABLED_Cape");
}

TEST(ModpathTest, RelativeComponents) {
    EXPECT_EQ(mp::leaf_name("chars/hero/Cape"), "Cape");
    EXPECT_EQ(mp::leaf_name("Cape"), "Cape");
    EXPECT_EQ(mp::parent_of("chars/hero/Cape"), "chars/hero");
    EXPECT_EQ(mp::parent_of("Cape"), "");
    EXPECT_EQ(mp::first_component("chars/hero/Cape"), "chars");
    EXPECT_EQ(mp::to_slash("\\chars\\hero"), "chars/hero");
}

TEST(ModpathTest, CanonicalRelativePathStripsLeafPrefixOnly) {
    fs::path base = "/mods";
    EXPECT_EQ(mp::canonical_relative_path(base, "/mods/chars/hero/Cape"), "chars/hero/Cape");
    EXPECT_EQ(mp::canonical_relative_path(base, "/mods/chars/hero/DISABLED_Cape"), "chars/hero/Cape");
    EXPECT_EQ(mp::canonical_relative_path(base, "/mods/DISABLED_chars/Cape"), "DISABLED_chars/Cape");
    EXPECT_EQ(mp::canonical_relative_path(base, "/mods"), "");
    EXPECT_EQ(mp::canonical_relative_path(base, "/elsewhere/Cape"), "");
}

TEST(ModpathTest, JoinRelativeAndFolderComponent) {
    EXPECT_EQ(mp::join_relative("/mods", "a/b/c"), fs::path("/mods") / "a" / "b" / "c");
    EXPECT_EQ(mp::folder_component("  Red Cape v1.2 "), "Red_Cape_v1_2");
    EXPECT_EQ(mp::trim("\t x \n"), "x");
}
