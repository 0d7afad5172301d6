#include <gtest/gtest.h>
#include "drive/util/path.hpp"

#include <string>
#include <vector>

using namespace dt::drive::util;

using Parts = std::vector<std::string>;

TEST(PathUtilTest, SplitDropsEmptySegments) {
    EXPECT_EQ(splitPath("/a//b/"), (Parts{"a", "b"}));
    EXPECT_EQ(splitPath("a/b"), (Parts{"a", "b"}));
    EXPECT_EQ(splitPath("a\\b"), (Parts{"a", "b"}));
}

TEST(PathUtilTest, SplitOfRootIsEmpty) {
    EXPECT_TRUE(splitPath("").empty());
    EXPECT_TRUE(splitPath("/").empty());
    EXPECT_TRUE(splitPath("///").empty());
}

TEST(PathUtilTest, SplitKeepsDotsAndSpaces) {
    EXPECT_EQ(splitPath("/My Folder/./x.txt"), (Parts{"My Folder", ".", "x.txt"}));
}

TEST(PathUtilTest, JoinParts) {
    const Parts parts{"Folder1", "", "File1"};
    EXPECT_EQ(joinPath(parts), "Folder1/File1");
    EXPECT_EQ(joinPath(Parts{}), "");
}

TEST(PathUtilTest, JoinBaseAndChild) {
    EXPECT_EQ(joinPath("", "File1"), "File1");
    EXPECT_EQ(joinPath("Folder1", ""), "Folder1");
    EXPECT_EQ(joinPath("/Folder1/", "/Folder2/File1"), "Folder1/Folder2/File1");
}

TEST(PathUtilTest, SanitizeReplacesSeparatorsAndQuotes) {
    EXPECT_EQ(sanitizeName("a/b"), "a-b");
    EXPECT_EQ(sanitizeName("a\\b"), "a-b");
    EXPECT_EQ(sanitizeName("it's"), "it-s");
    EXPECT_EQ(sanitizeName("plain name.txt"), "plain name.txt");
}
