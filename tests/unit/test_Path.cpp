#include <gtest/gtest.h>
#include "fs/model/Path.hpp"

using namespace ds::fs::model;

TEST(PathTest, ChildOfRootIsBareName) {
    EXPECT_EQ(child("", "a"), "a");
    EXPECT_EQ(child("a", "b"), "a/b");
    EXPECT_EQ(child("a/b", "c.txt"), "a/b/c.txt");
}

TEST(PathTest, JoinResolvesRelativeAgainstRoot) {
    EXPECT_EQ(join("/sdcard", ""), "/sdcard");
    EXPECT_EQ(join("/sdcard", "a/b"), "/sdcard/a/b");
    EXPECT_EQ(join("/sdcard/", "a"), "/sdcard/a");
    EXPECT_EQ(join("/", "a"), "/a");
}

TEST(PathTest, IsUnderRequiresComponentBoundary) {
    EXPECT_TRUE(isUnder("a/b", "a"));
    EXPECT_TRUE(isUnder("a/b/c", "a"));
    EXPECT_FALSE(isUnder("a", "a"));
    EXPECT_FALSE(isUnder("ab/c", "a"));
    EXPECT_FALSE(isUnder("a-b", "a"));
}

TEST(PathTest, EverythingButTheRootIsUnderTheRoot) {
    EXPECT_TRUE(isUnder("a", ""));
    EXPECT_TRUE(isUnder("a/b", ""));
    EXPECT_FALSE(isUnder("", ""));
}

TEST(PathTest, Normalize) {
    EXPECT_EQ(normalize("/a//b/./c/"), "/a/b/c");
    EXPECT_EQ(normalize("/a/b/../c"), "/a/c");
    EXPECT_EQ(normalize("a/../.."), "..");
    EXPECT_EQ(normalize("/.."), "/");
    EXPECT_EQ(normalize(""), ".");
    EXPECT_EQ(normalize("./"), ".");
}

TEST(PathTest, BasenameIgnoresTrailingSlashes) {
    EXPECT_EQ(ds::fs::model::basename("/a/b/"), "b");
    EXPECT_EQ(ds::fs::model::basename("/a/b"), "b");
    EXPECT_EQ(ds::fs::model::basename("b"), "b");
    EXPECT_EQ(ds::fs::model::basename("/"), "");
}

TEST(PathTest, StripTrailingSlashesKeepsRoot) {
    EXPECT_EQ(stripTrailingSlashes("/a/b//"), "/a/b");
    EXPECT_EQ(stripTrailingSlashes("/"), "/");
    EXPECT_EQ(stripTrailingSlashes("a"), "a");
}

TEST(PathTest, Trim) {
    EXPECT_EQ(trim("  x y \r\n"), "x y");
    EXPECT_EQ(trim(" \t"), "");
}
