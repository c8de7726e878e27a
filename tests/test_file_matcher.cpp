#include "deps/file_matcher.hpp"
#include "test_util.hpp"

#include <algorithm>

TEST(GlobMatchTest, SingleStarStaysInsideSegment) {
    EXPECT_TRUE(glob_match("*.png", "hero.png"));
    EXPECT_FALSE(glob_match("*.png", "Sprites/hero.png"));
    EXPECT_TRUE(glob_match("Sprites/*.png", "Sprites/hero.png"));
    EXPECT_TRUE(glob_match("Sprites/h?ro.png", "Sprites/hero.png"));
    EXPECT_FALSE(glob_match("Sprites?hero.png", "Sprites/hero.png"));
}

TEST(GlobMatchTest, DoubleStarCrossesSegments) {
    EXPECT_TRUE(glob_match("**.*", "Assets/Sprites/hero.png"));
    EXPECT_TRUE(glob_match("**.*", "readme.txt"));
    EXPECT_FALSE(glob_match("**.*", "Makefile"));
    EXPECT_TRUE(glob_match("Library/**.*", "Library/cache/a.bin"));
    EXPECT_FALSE(glob_match("Library/**.*", "Assets/Library/a.bin"));
}

TEST(GlobMatchTest, DoubleStarSlashMatchesZeroOrMoreFolders) {
    EXPECT_TRUE(glob_match("**/*.meta", "a.png.meta"));
    EXPECT_TRUE(glob_match("**/*.meta", "Sprites/Heroes/a.png.meta"));
    EXPECT_TRUE(glob_match("**/.*", ".git"));
    EXPECT_TRUE(glob_match("**/.*", "Assets/.hidden"));
    EXPECT_FALSE(glob_match("**/.*", "Assets/visible.txt"));
}

TEST(GlobMatchTest, CaseInsensitive) {
    EXPECT_TRUE(glob_match("assets/*.PNG", "Assets/hero.png"));
}

class FileMatcherTest : public ProjectTest {};

TEST_F(FileMatcherTest, DefaultPatternsSkipLibraryAndHiddenFiles) {
    write("Assets/Player.prefab", "p");
    write("Assets/Player.prefab.meta", "m");
    write("Assets/.DS_Store", "x");
    write(".git/config", "x");
    write("Library/ArtifactDB.bin", "x");
    write("ProjectSettings/Tags.asset", "t");

    FileMatcher matcher;
    matcher.add_includes({"**.*"});
    matcher.add_excludes({"Library/**.*", "**/.*"});

    auto files = matcher.match(root_.string());
    std::vector<std::string> expected = {
        abs("Assets/Player.prefab"),
        abs("Assets/Player.prefab.meta"),
        abs("ProjectSettings/Tags.asset"),
    };
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(files, expected);
}

TEST_F(FileMatcherTest, ExcludedFolderHidesEverythingBelowIt) {
    write("Assets/Editor/Tool.cs", "t");
    write("Assets/Runtime/Game.cs", "g");

    FileMatcher matcher;
    matcher.add_include("**/*.cs");
    matcher.add_exclude("Assets/Editor");

    auto files = matcher.match(root_.string());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0], abs("Assets/Runtime/Game.cs"));
}

TEST_F(FileMatcherTest, MissingRootYieldsNothing) {
    FileMatcher matcher;
    matcher.add_include("**.*");
    EXPECT_TRUE(matcher.match((root_ / "missing").string()).empty());
}

TEST_F(FileMatcherTest, NoIncludeMatchesNothing) {
    write("Assets/a.txt", "a");
    FileMatcher matcher;
    EXPECT_TRUE(matcher.match(root_.string()).empty());
}
