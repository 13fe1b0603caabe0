#include "modkeeper/probe.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

fs::path make_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / "modkeeper-probe-tests" /
               (name + "-" + std::to_string(std::rand()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void touch(const fs::path& p) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p);
    out << "x";
}

}  // namespace

TEST(ProbeTest, MarkerFileIsMatchedCaseInsensitively) {
    auto dir = make_dir("marker");
    touch(dir / "readme.txt");
    EXPECT_FALSE(modkeeper::probe::has_marker_file(dir));
    touch(dir / "Mod.INI");
    EXPECT_TRUE(modkeeper::probe::has_marker_file(dir));
}

TEST(ProbeTest, MarkerFileIsNotSearchedRecursively) {
    auto dir = make_dir("nested");
    touch(dir / "sub" / "mod.ini");
    EXPECT_FALSE(modkeeper::probe::has_marker_file(dir));
    EXPECT_TRUE(modkeeper::probe::has_marker_file(dir / "sub"));
}

TEST(ProbeTest, DirectoryNamedLikeDescriptorDoesNotCount) {
    auto dir = make_dir("dirini");
    fs::create_directories(dir / "folder.ini");
    EXPECT_FALSE(modkeeper::probe::has_marker_file(dir));
}

TEST(ProbeTest, MissingDirectoryIsNotAnError) {
    EXPECT_FALSE(modkeeper::probe::has_marker_file("/nonexistent/modkeeper/probe"));
    EXPECT_FALSE(modkeeper::probe::find_preview_image("/nonexistent/modkeeper/probe").has_value());
}

TEST(ProbeTest, PreviewImageFollowsCandidateOrder) {
    auto dir = make_dir("preview");
    touch(dir / "thumbnail.png");
    touch(dir / "Icon.jpg");
    auto found = modkeeper::probe::find_preview_image(dir);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "Icon.jpg");

    touch(dir / "icon.png");
    found = modkeeper::probe::find_preview_image(dir);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "icon.png");
}

TEST(ProbeTest, DescriptorFilesAreSortedByName) {
    auto dir = make_dir("sorted");
    touch(dir / "b.ini");
    touch(dir / "a.ini");
    touch(dir / "c.txt");
    auto files = modkeeper::probe::descriptor_files(dir);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename(), "a.ini");
    EXPECT_EQ(files[1].filename(), "b.ini");
}
