//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/graph/installed_packages.hpp"
#include "test_project.hpp"

using namespace dsv;
using namespace dsv::graph;

class InstalledPackagesTest : public ::testing::Test {
protected:
    void SetUp() override {
        project.install("express", {{"body-parser", "^1.0.0"}, {"debug", "2.6.9"}});
        project.install("body-parser", {{"debug", "2.6.9"}}, {{"typescript", "*"}});
        project.install("debug");
        project.install("@babel/core", {{"@babel/parser", "^7.0.0"}});
        project.write_json("node_modules/@babel/parser/package.json", {
            {"name", "@babel/parser"},
            {"optionalDependencies", {{"fsevents", "^2.0.0"}}},
            {"devDependencies", {{"jest", "^29.0.0"}}}
        });
        project.write("node_modules/.bin/tsc", "#!/bin/sh\n");
        project.write("node_modules/.package-lock.json", "{}");
    }

    [[nodiscard]] fs::path node_modules() const { return project.path("node_modules"); }

    fixtures::TempProject project;
};

TEST_F(InstalledPackagesTest, ListsPlainAndScopedPackages) {
    const auto packages = list_installed_packages(node_modules());

    std::vector<std::string> names;
    for (const auto& package : packages) {
        names.push_back(package.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"@babel/core", "@babel/parser", "body-parser", "debug", "express"}));
    EXPECT_EQ(packages.front().directory, node_modules() / "@babel" / "core");
}

TEST_F(InstalledPackagesTest, MissingDirectoryIsEmpty) {
    EXPECT_TRUE(list_installed_packages(project.path("absent")).empty());
    EXPECT_TRUE(build_installed_graph(project.path("absent")).empty());
}

TEST_F(InstalledPackagesTest, ReadsRequirementSections) {
    const auto requirements = read_package_requirements(node_modules() / "@babel/parser/package.json");
    ASSERT_TRUE(requirements.is_ok()) << requirements.error().to_string();
    EXPECT_EQ(requirements.value(), (std::set<std::string>{"fsevents"}));

    const auto with_peers = read_package_requirements(node_modules() / "body-parser/package.json");
    ASSERT_TRUE(with_peers.is_ok());
    EXPECT_EQ(with_peers.value(), (std::set<std::string>{"debug", "typescript"}));
}

TEST_F(InstalledPackagesTest, MalformedManifestIsParseError) {
    project.write("node_modules/broken/package.json", "[1, 2]");
    const auto result = read_package_requirements(node_modules() / "broken/package.json");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
}

TEST_F(InstalledPackagesTest, BuildsGraphAndReportsBrokenPackages) {
    project.write("node_modules/broken/package.json", "");
    project.write("node_modules/no-manifest/index.js", "");

    Diagnostics diagnostics;
    const auto graph = build_installed_graph(node_modules(), &diagnostics);

    EXPECT_EQ(graph.size(), 5u);
    EXPECT_FALSE(graph.contains("broken"));
    EXPECT_FALSE(graph.contains("no-manifest"));
    EXPECT_EQ(graph.at("express"), (std::set<std::string>{"body-parser", "debug"}));
    EXPECT_TRUE(graph.at("debug").empty());
    EXPECT_EQ(diagnostics.size(), 1u);
}

TEST_F(InstalledPackagesTest, GraphIsCachedPerDirectory) {
    cache::AnalysisCaches caches;
    const auto first = cached_installed_graph(caches, node_modules());
    const auto second = cached_installed_graph(caches, node_modules());

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(caches.graphs.stats().hits, 1u);
}
