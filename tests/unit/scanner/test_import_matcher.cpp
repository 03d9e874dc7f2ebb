//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/scanner/import_matcher.hpp"

using namespace dsv::scanner;

TEST(ImportMatcherTest, UnscopedName) {
    EXPECT_EQ(unscoped_name("@babel/core"), "core");
    EXPECT_EQ(unscoped_name("react"), "react");
    EXPECT_EQ(unscoped_name("@scope"), "@scope");
    EXPECT_EQ(unscoped_name("@scope/"), "");
}

TEST(ImportMatcherTest, TypesBasePackage) {
    EXPECT_TRUE(is_types_package("@types/node"));
    EXPECT_FALSE(is_types_package("@types/"));
    EXPECT_FALSE(is_types_package("types"));

    EXPECT_EQ(types_base_package("@types/node"), "node");
    EXPECT_EQ(types_base_package("@types/babel__core"), "@babel/core");
    EXPECT_EQ(types_base_package("lodash"), "lodash");
}

TEST(ImportMatcherTest, ExactAndSubpath) {
    EXPECT_TRUE(matches_dependency("lodash", "lodash"));
    EXPECT_TRUE(matches_dependency("lodash/fp", "lodash"));
    EXPECT_TRUE(matches_dependency("@babel/core/lib/config", "@babel/core"));
    EXPECT_FALSE(matches_dependency("lodash-es", "lodash"));
    EXPECT_FALSE(matches_dependency("lodash.debounce", "lodash"));
    EXPECT_FALSE(matches_dependency("./lodash", "lodash"));
}

TEST(ImportMatcherTest, TypeDefinitionPackages) {
    EXPECT_TRUE(matches_dependency("node", "@types/node"));
    EXPECT_TRUE(matches_dependency("react/jsx-runtime", "@types/react"));
    EXPECT_TRUE(matches_dependency("@babel/core", "@types/babel__core"));
    EXPECT_FALSE(matches_dependency("fs", "@types/node"));
}

TEST(ImportMatcherTest, ScopedAndUnscopedForms) {
    EXPECT_TRUE(matches_dependency("utils/helpers", "@acme/utils"));
    EXPECT_FALSE(matches_dependency("@acme/web", "@acme/utils"));
}

TEST(ImportMatcherTest, EmptyInputsNeverMatch) {
    EXPECT_FALSE(matches_dependency("", "lodash"));
    EXPECT_FALSE(matches_dependency("lodash", ""));
    EXPECT_FALSE(matches_dependency("web", "@scope/"));
}
