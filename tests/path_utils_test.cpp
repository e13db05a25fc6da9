#include <gtest/gtest.h>
#include "../common/config.hpp"
#include "../common/path_utils.hpp"

TEST(PathUtilsTest, ValidPathsAreAbsolute) {
    EXPECT_TRUE(PathUtils::isValidPath("/"));
    EXPECT_TRUE(PathUtils::isValidPath("/data/movies/a.mkv"));
    EXPECT_FALSE(PathUtils::isValidPath(""));
    EXPECT_FALSE(PathUtils::isValidPath("data/movies"));
    EXPECT_FALSE(PathUtils::isValidPath("./a"));
}

TEST(PathUtilsTest, NulBytesAndOverlongPathsAreInvalid) {
    EXPECT_FALSE(PathUtils::isValidPath(std::string("/a\0b", 4)));
    EXPECT_FALSE(PathUtils::isValidPath("/" + std::string(Config::MAX_PATH_LENGTH, 'x')));
}

TEST(PathUtilsTest, NormalizeDropsRedundantParts) {
    EXPECT_EQ(PathUtils::normalize("/a//b/./c/"), "/a/b/c");
    EXPECT_EQ(PathUtils::normalize("/a/b/../c"), "/a/c");
    EXPECT_EQ(PathUtils::normalize("/"), "/");
}

TEST(PathUtilsTest, PathEqualsIgnoresFormatting) {
    EXPECT_TRUE(PathUtils::pathEquals("/a/b", "/a/b/"));
    EXPECT_TRUE(PathUtils::pathEquals("/a/b", "/a/./b"));
    EXPECT_FALSE(PathUtils::pathEquals("/a/b", "/a/B"));
    EXPECT_TRUE(PathUtils::pathEquals("/a/b", "/A/B", false));
}

TEST(PathUtilsTest, ParentPathIsComponentWise) {
    EXPECT_TRUE(PathUtils::isParentPath("/a", "/a/b"));
    EXPECT_TRUE(PathUtils::isParentPath("/a/", "/a/b/c"));
    EXPECT_TRUE(PathUtils::isParentPath("/", "/a"));
    EXPECT_FALSE(PathUtils::isParentPath("/a/b", "/a/bc"));
    EXPECT_FALSE(PathUtils::isParentPath("/a", "/a"));
    EXPECT_FALSE(PathUtils::isParentPath("/a/b", "/a"));
    EXPECT_FALSE(PathUtils::isParentPath("/A", "/a/b"));
    EXPECT_TRUE(PathUtils::isParentPath("/A", "/a/b", false));
}

TEST(PathUtilsTest, CombineAppendsName) {
    EXPECT_EQ(PathUtils::combine("/dst", "a.txt"), "/dst/a.txt");
    EXPECT_EQ(PathUtils::combine("/dst/", "sub"), "/dst/sub");
}
