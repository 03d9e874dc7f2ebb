//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/utils/path_utils.hpp"

using namespace dsv::path_utils;
namespace fs = std::filesystem;

TEST(PathUtilsTest, NormalizeIsAbsoluteAndLexical) {
    const auto normalized = normalize("a/./b/../c/");
    EXPECT_TRUE(normalized.is_absolute());
    EXPECT_EQ(normalized.filename(), "c");
    EXPECT_EQ(normalized.parent_path().filename(), "a");
}

TEST(PathUtilsTest, NormalizeDropsTrailingSeparator) {
    EXPECT_EQ(normalize("/repo/packages/"), fs::path("/repo/packages"));
    EXPECT_EQ(normalize("/"), fs::path("/"));
}

TEST(PathUtilsTest, RelativeGenericUsesForwardSlashes) {
    EXPECT_EQ(relative_generic("/repo/src/app/index.js", "/repo"), "src/app/index.js");
    EXPECT_EQ(relative_generic("/repo/package.json", "/repo"), "package.json");
}

TEST(PathUtilsTest, IsWithin) {
    EXPECT_TRUE(is_within("/repo/packages/ui", "/repo"));
    EXPECT_TRUE(is_within("/repo", "/repo"));
    EXPECT_TRUE(is_within("/repo/packages/../src", "/repo/src"));
    EXPECT_FALSE(is_within("/repository", "/repo"));
    EXPECT_FALSE(is_within("/repo", "/repo/packages"));
}

TEST(PathUtilsTest, OverlapsInEitherDirection) {
    EXPECT_TRUE(overlaps("/repo", "/repo/packages/ui"));
    EXPECT_TRUE(overlaps("/repo/packages/ui", "/repo"));
    EXPECT_FALSE(overlaps("/repo/packages/ui", "/repo/packages/api"));
}
