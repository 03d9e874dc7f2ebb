//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/utils/glob.hpp"

using namespace dsv;

namespace {
    GlobPattern compile(const std::string& pattern) {
        auto result = GlobPattern::compile(pattern);
        EXPECT_TRUE(result.is_ok()) << pattern;
        return std::move(result).value();
    }
}

TEST(GlobTest, SingleComponentPatternMatchesAnyDepth) {
    const auto dist = compile("dist");
    EXPECT_TRUE(dist.matches("dist/bundle.js"));
    EXPECT_TRUE(dist.matches("packages/web/dist/index.js"));
    EXPECT_FALSE(dist.matches("distribution/index.js"));
}

TEST(GlobTest, StarStaysInsideComponent) {
    const auto spec = compile("*.spec.js");
    EXPECT_TRUE(spec.matches("src/app.spec.js"));
    EXPECT_TRUE(spec.matches("app.spec.js"));
    EXPECT_FALSE(spec.matches("src/app.js"));
}

TEST(GlobTest, DoubleStarCrossesDirectories) {
    const auto stories = compile("src/**/*.stories.tsx");
    EXPECT_TRUE(stories.matches("src/Button.stories.tsx"));
    EXPECT_TRUE(stories.matches("src/components/forms/Input.stories.tsx"));
    EXPECT_FALSE(stories.matches("lib/Button.stories.tsx"));
}

TEST(GlobTest, InnerSlashMatchesDirectoryPrefix) {
    const auto generated = compile("src/generated");
    EXPECT_TRUE(generated.matches("src/generated/api.ts"));
    EXPECT_FALSE(generated.matches("lib/src/generated/api.ts"));
}

TEST(GlobTest, LeadingSlashAnchorsAtRoot) {
    const auto build = compile("/build");
    EXPECT_TRUE(build.matches("build/out.js"));
    EXPECT_FALSE(build.matches("tools/build/out.js"));
}

TEST(GlobTest, TrailingSlashIgnored) {
    const auto coverage = compile("coverage/");
    EXPECT_TRUE(coverage.matches("coverage/lcov.info"));
}

TEST(GlobTest, QuestionMarkMatchesOneCharacter) {
    const auto p = compile("file?.js");
    EXPECT_TRUE(p.matches("file1.js"));
    EXPECT_FALSE(p.matches("file12.js"));
}

TEST(GlobTest, RejectsCommentsNegationsAndBlank) {
    EXPECT_TRUE(GlobPattern::compile("").is_err());
    EXPECT_TRUE(GlobPattern::compile("   ").is_err());
    EXPECT_TRUE(GlobPattern::compile("# comment").is_err());
    EXPECT_TRUE(GlobPattern::compile("!keep.js").is_err());
}

TEST(GlobTest, RegexMetacharactersAreLiteral) {
    const auto p = compile("a+b(c).js");
    EXPECT_TRUE(p.matches("a+b(c).js"));
    EXPECT_FALSE(p.matches("aab(c).js"));
}

TEST(GlobSetTest, AnyPatternExcludes) {
    GlobSet set;
    EXPECT_TRUE(set.empty());
    ASSERT_TRUE(set.add("dist").is_ok());
    ASSERT_TRUE(set.add("*.min.js").is_ok());
    EXPECT_EQ(set.size(), 2u);

    EXPECT_TRUE(set.matches("dist/app.js"));
    EXPECT_TRUE(set.matches("vendor/jquery.min.js"));
    EXPECT_FALSE(set.matches("src/app.js"));
}

TEST(GlobSetTest, InvalidPatternLeavesSetUnchanged) {
    GlobSet set;
    EXPECT_TRUE(set.add("!negated").is_err());
    EXPECT_TRUE(set.empty());
}
