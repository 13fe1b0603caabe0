#include "modkeeper/modstate.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
namespace ms = modkeeper::modstate;
using modkeeper::Error;
using modkeeper::ErrorKind;

namespace {

fs::path make_base(const std::string& name) {
    auto dir = fs::temp_directory_path() / "modkeeper-modstate-tests" /
               (name + "-" + std::to_string(std::rand()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

}  // namespace

TEST(ModstateTest, CandidatePathsKeepParentAndPrefixLeafOnly) {
    auto base = make_base("paths");
    auto res = ms::resolve(base, "chars/hero/Cape");
    EXPECT_EQ(res.enabled_path, base / "chars" / "hero" / "Cape");
    EXPECT_EQ(res.disabled_path, base / "chars" / "hero" / "DISABLED_Cape");
    EXPECT_EQ(res.state, ms::ModState::Orphaned);
    EXPECT_TRUE(res.actual_path().empty());

    auto top = ms::resolve(base, "Cape");
    EXPECT_EQ(top.disabled_path, base / "DISABLED_Cape");
}

TEST(ModstateTest, ResolvesEachStateAndPrefersEnabled) {
    auto base = make_base("states");
    fs::create_directories(base / "a" / "DISABLED_Cape");
    EXPECT_EQ(ms::resolve(base, "a/Cape").state, ms::ModState::Disabled);

    fs::create_directories(base / "a" / "Cape");
    auto both = ms::resolve(base, "a/Cape");
    EXPECT_EQ(both.state, ms::ModState::Enabled);
    EXPECT_EQ(both.actual_path(), base / "a" / "Cape");
}

TEST(ModstateTest, PlainFileDoesNotCountAsMod) {
    auto base = make_base("file");
    fs::create_directories(base / "a");
    { std::ofstream(base / "a" / "Cape") << "x"; }
    EXPECT_EQ(ms::resolve(base, "a/Cape").state, ms::ModState::Orphaned);
}

TEST(ModstateTest, ToggleRoundTripRestoresPath) {
    auto base = make_base("toggle");
    fs::create_directories(base / "a" / "Cape");

    EXPECT_FALSE(ms::toggle(base, "a/Cape"));
    EXPECT_FALSE(fs::exists(base / "a" / "Cape"));
    EXPECT_TRUE(fs::is_directory(base / "a" / "DISABLED_Cape"));

    EXPECT_TRUE(ms::toggle(base, "a/Cape"));
    EXPECT_TRUE(fs::is_directory(base / "a" / "Cape"));
    EXPECT_FALSE(fs::exists(base / "a" / "DISABLED_Cape"));
}

TEST(ModstateTest, ToggleOrphanNamesBothPaths) {
    auto base = make_base("orphan");
    try {
        ms::toggle(base, "a/Gone");
        FAIL() << "expected modkeeper::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::OrphanedAsset);
        std::string msg = e.what();
        EXPECT_NE(msg.find((base / "a" / "Gone").string()), std::string::npos);
        EXPECT_NE(msg.find((base / "a" / "DISABLED_Gone").string()), std::string::npos);
    }
}

TEST(ModstateTest, SetEnabledOnlyRenamesOnChange) {
    auto base = make_base("set");
    fs::create_directories(base / "Cape");
    EXPECT_FALSE(ms::set_enabled(base, "Cape", true));
    EXPECT_TRUE(ms::set_enabled(base, "Cape", false));
    EXPECT_TRUE(fs::is_directory(base / "DISABLED_Cape"));
    EXPECT_FALSE(ms::set_enabled(base, "Cape", false));
}

TEST(ModstateTest, MoveIntoExistingDestinationIsConflict) {
    auto base = make_base("conflict");
    fs::create_directories(base / "x");
    fs::create_directories(base / "y");
    try {
        ms::move_directory(base / "x", base / "y");
        FAIL() << "expected modkeeper::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Conflict);
    }
    EXPECT_TRUE(fs::is_directory(base / "x"));
}

TEST(ModstateTest, OnDiskRelative) {
    EXPECT_EQ(ms::on_disk_relative("a/b/Cape", ms::ModState::Disabled), "a/b/DISABLED_Cape");
    EXPECT_EQ(ms::on_disk_relative("Cape", ms::ModState::Disabled), "DISABLED_Cape");
    EXPECT_EQ(ms::on_disk_relative("a/Cape", ms::ModState::Enabled), "a/Cape");
}

TEST(ModstateTest, EmptyPathIsInvalidInput) {
    try {
        ms::resolve("/tmp", "");
        FAIL() << "expected modkeeper::Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidInput);
    }
}
