//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/locator/source_locator.hpp"
#include "dsv/utils/path_utils.hpp"
#include "test_project.hpp"

#include <algorithm>

using namespace dsv;
using namespace dsv::locator;

class SourceLocatorTest : public ::testing::Test {
protected:
    [[nodiscard]] std::vector<std::string> relative_files(const LocatorOptions& options = {},
                                                          Diagnostics* diagnostics = nullptr) const {
        auto result = find_source_files(project.root(), options, diagnostics);
        EXPECT_TRUE(result.is_ok());
        std::vector<std::string> out;
        if (result.is_ok()) {
            for (const auto& file : result.value()) {
                out.push_back(path_utils::relative_generic(file, path_utils::normalize(project.root())));
            }
        }
        return out;
    }

    static bool contains(const std::vector<std::string>& files, const std::string& name) {
        return std::ranges::find(files, name) != files.end();
    }

    fixtures::TempProject project;
};

TEST_F(SourceLocatorTest, SkipsInstalledAndGeneratedDirectories) {
    project.write("src/index.js", "require('a');");
    project.write("node_modules/a/index.js", "");
    project.write("packages/web/node_modules/b/index.js", "");
    project.write("dist/bundle.js", "");
    project.write("coverage/lcov.info", "");
    project.write(".git/HEAD", "ref: refs/heads/main");

    const auto files = relative_files();
    EXPECT_EQ(files, (std::vector<std::string>{"src/index.js"}));
}

TEST_F(SourceLocatorTest, SkipsLockLogAndBinaryFiles) {
    project.write("package.json", "{}");
    project.write("package-lock.json", "{}");
    project.write("yarn.lock", "");
    project.write("npm-debug.log", "");
    project.write("logo.png", std::string("\x89PNG\0\0\0", 7));

    const auto files = relative_files();
    EXPECT_EQ(files, (std::vector<std::string>{"package.json"}));
}

TEST_F(SourceLocatorTest, ResultIsSorted) {
    project.write("z.js", "");
    project.write("a.js", "");
    project.write("m/b.js", "");

    const auto files = relative_files();
    EXPECT_TRUE(std::ranges::is_sorted(files));
    EXPECT_EQ(files.size(), 3u);
}

TEST_F(SourceLocatorTest, AppliesIgnorePatterns) {
    project.write("src/app.js", "");
    project.write("src/app.test.js", "");
    project.write("storybook/main.js", "");

    LocatorOptions options;
    options.ignore_patterns = {"*.test.js", "storybook"};

    const auto files = relative_files(options);
    EXPECT_EQ(files, (std::vector<std::string>{"src/app.js"}));
}

TEST_F(SourceLocatorTest, HonoursGitignoreUnlessDisabled) {
    project.write(".gitignore", "# build output\ntmp\n!keep.js\n");
    project.write("tmp/cache.js", "");
    project.write("src/a.js", "");

    const auto with = relative_files();
    EXPECT_FALSE(contains(with, "tmp/cache.js"));
    EXPECT_TRUE(contains(with, "src/a.js"));

    LocatorOptions options;
    options.use_gitignore = false;
    const auto without = relative_files(options);
    EXPECT_TRUE(contains(without, "tmp/cache.js"));
}

TEST_F(SourceLocatorTest, ReadGitignoreDropsCommentsAndNegations) {
    project.write(".gitignore", "# c\n\n  dist  \n!important\n*.tmp\n");
    EXPECT_EQ(read_gitignore(project.root()), (std::vector<std::string>{"dist", "*.tmp"}));
    EXPECT_TRUE(read_gitignore(project.path("missing")).empty());
}

TEST_F(SourceLocatorTest, InvalidPatternIsReportedNotFatal) {
    project.write("a.js", "");
    LocatorOptions options;
    options.ignore_patterns = {"!bad"};

    Diagnostics diagnostics;
    const auto files = relative_files(options, &diagnostics);
    EXPECT_EQ(files.size(), 1u);
    EXPECT_EQ(diagnostics.size(), 1u);
}

TEST_F(SourceLocatorTest, MissingRootIsNotFound) {
    auto result = find_source_files(project.path("absent"), {});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);

    const auto file = project.write("file.txt", "x");
    auto not_dir = find_source_files(file, {});
    ASSERT_TRUE(not_dir.is_err());
    EXPECT_EQ(not_dir.error().code(), ErrorCode::InvalidArgument);
}

TEST(SourceLocatorNamesTest, LockAndLogFiles) {
    EXPECT_TRUE(is_lock_file("yarn.lock"));
    EXPECT_TRUE(is_lock_file("pnpm-lock.yaml"));
    EXPECT_FALSE(is_lock_file("lockfile.js"));
    EXPECT_TRUE(is_log_file("lerna-debug.log"));
    EXPECT_FALSE(is_log_file("logger.js"));
}
