//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/utils/json_utils.hpp"
#include "test_project.hpp"

using namespace dsv;
using namespace dsv::json_utils;

TEST(JsonUtilsTest, ParseValidDocument) {
    const auto result = parse(R"({"name": "fixture", "private": true})");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()["name"], "fixture");
}

TEST(JsonUtilsTest, ParseInvalidDocumentIsParseError) {
    const auto result = parse(R"({"name": )");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST(JsonUtilsTest, CommentsOnlyWhenAllowed) {
    constexpr std::string_view content = R"({
        // strict checks
        "compilerOptions": { /* inline */ "strict": true }
    })";
    EXPECT_TRUE(parse(content).is_err());

    const auto result = parse(content, true);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value()["compilerOptions"]["strict"].get<bool>());
}

TEST(JsonUtilsTest, ReadFile) {
    fixtures::TempProject project;
    const auto file = project.write("tsconfig.json", R"({"compilerOptions": {"types": ["node"]}})");

    const auto result = read_file(file);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(string_array(result.value()["compilerOptions"], "types"), (std::vector<std::string>{"node"}));

    const auto missing = read_file(project.path("absent.json"));
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);

    const auto broken = read_file(project.write("broken.json", "{"));
    ASSERT_TRUE(broken.is_err());
    EXPECT_EQ(broken.error().code(), ErrorCode::ParseError);
}

TEST(JsonUtilsTest, GetOrFallsBackOnMissingOrMistyped) {
    const json obj = {{"name", "fixture"}, {"version", 3}};
    EXPECT_EQ(get_or<std::string>(obj, "name", "x"), "fixture");
    EXPECT_EQ(get_or<std::string>(obj, "version", "x"), "x");
    EXPECT_EQ(get_or<std::string>(obj, "missing", "x"), "x");
    EXPECT_EQ(get_or<int>(json::array(), "version", 7), 7);
}

TEST(JsonUtilsTest, StringMembers) {
    const json obj = {{"scripts", {{"build", "tsc"}, {"odd", 42}}}, {"list", {1, 2}}};
    const auto members = string_members(obj, "scripts");
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members.at("build"), "tsc");
    EXPECT_EQ(members.at("odd"), "");
    EXPECT_TRUE(string_members(obj, "list").empty());
    EXPECT_TRUE(string_members(obj, "missing").empty());
}

TEST(JsonUtilsTest, StringArraySkipsNonStrings) {
    const json obj = {{"types", {"node", 1, "jest", nullptr}}};
    EXPECT_EQ(string_array(obj, "types"), (std::vector<std::string>{"node", "jest"}));
    EXPECT_TRUE(string_array(json("text"), "types").empty());
}

TEST(JsonUtilsTest, ContainsTextSearchesValuesNotKeys) {
    const json doc = {
        {"plugins", {"babel-plugin-macros", {"module-resolver", {{"root", "./src"}}}}},
        {"jest-key", 1},
    };
    EXPECT_TRUE(contains_text(doc, "babel-plugin"));
    EXPECT_TRUE(contains_text(doc, "./src"));
    EXPECT_FALSE(contains_text(doc, "jest-key"));
    EXPECT_FALSE(contains_text(json(42), "42"));
}
