//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/analysis/analysis_engine.hpp"
#include "dsv/utils/path_utils.hpp"
#include "test_project.hpp"

using namespace dsv;
using namespace dsv::analysis;

class WorkspaceWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        project.manifest({{"lodash", "^4.17.21"}, {"unused-pkg", "^1.0.0"}}, json::object(),
                         {{"workspaces", {"packages/*"}}});
        project.write_json("packages/ui/package.json",
                           {{"name", "ui"}, {"version", "1.0.0"}, {"dependencies", {{"left-pad", "^1.3.0"}}}});
        project.write("packages/ui/src/index.js", "const _ = require('lodash');\n");
        project.write_json("sandbox/package.json",
                           {{"name", "sandbox"}, {"version", "0.0.1"}, {"dependencies", {{"left-pad", "^1.3.0"}}}});
        project.write("sandbox/main.js", "module.exports = 1;\n");
    }

    fixtures::TempProject project;
};

TEST_F(WorkspaceWorkflowTest, MemberIsAnalyzedFromTheWorkspaceRoot) {
    const auto result = analyze_project(project.path("packages/ui"));
    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    const auto& report = result.value();

    const auto root = path_utils::normalize(project.root());
    EXPECT_EQ(report.project_root, root);
    ASSERT_TRUE(report.workspace_manifest.has_value());
    EXPECT_EQ(*report.workspace_manifest, root / "package.json");

    EXPECT_EQ(report.records.size(), 2u);
    EXPECT_FALSE(report.records.contains("left-pad"));
    EXPECT_EQ(report.records.at("lodash").used_in_files,
              (std::set<std::string>{"packages/ui/src/index.js"}));
    EXPECT_EQ(report.unused, (std::vector<std::string>{"unused-pkg"}));
}

TEST_F(WorkspaceWorkflowTest, NonMemberKeepsItsOwnManifest) {
    const auto result = analyze_project(project.path("sandbox"));
    ASSERT_TRUE(result.is_ok());
    const auto& report = result.value();

    EXPECT_FALSE(report.workspace_manifest.has_value());
    EXPECT_EQ(report.project_root, path_utils::normalize(project.path("sandbox")));
    EXPECT_EQ(report.unused, (std::vector<std::string>{"left-pad"}));
}

TEST_F(WorkspaceWorkflowTest, RootAnalysisHasNoAdoptedWorkspace) {
    const auto result = analyze_project(project.root());
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().workspace_manifest.has_value());
    EXPECT_EQ(result.value().unused, (std::vector<std::string>{"unused-pkg"}));
}
