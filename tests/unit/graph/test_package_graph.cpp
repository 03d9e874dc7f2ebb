//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/graph/package_graph.hpp"

using namespace dsv;
using namespace dsv::graph;

TEST(PackageGraphTest, BuildsReverseIndex) {
    const DependencyGraph adjacency = {
        {"express", {"body-parser", "debug"}},
        {"body-parser", {"debug"}},
        {"debug", {"ms"}},
    };
    const PackageGraph graph(adjacency);

    EXPECT_EQ(graph.package_count(), 4u);
    EXPECT_EQ(graph.edge_count(), 4u);
    EXPECT_TRUE(graph.has_package("ms"));
    EXPECT_TRUE(graph.requires_package("express", "debug"));
    EXPECT_FALSE(graph.requires_package("debug", "express"));
    EXPECT_EQ(graph.requirers("debug"), (std::set<std::string>{"body-parser", "express"}));
    EXPECT_TRUE(graph.requirers("express").empty());
    EXPECT_TRUE(graph.requirements("unknown").empty());
}

TEST(PackageGraphTest, DuplicateEdgesCountOnce) {
    PackageGraph graph;
    graph.add_requirement("a", "b");
    graph.add_requirement("a", "b");
    graph.add_package("a");

    EXPECT_EQ(graph.edge_count(), 1u);
    EXPECT_EQ(graph.package_count(), 2u);
}

TEST(TopLevelRequirersTest, FollowsTransitiveChains) {
    PackageGraph graph;
    graph.add_requirement("A", "B");
    graph.add_requirement("B", "C");

    const std::set<std::string> top_level = {"A", "C"};
    EXPECT_EQ(top_level_requirers(graph, "C", top_level), (std::set<std::string>{"A"}));
    EXPECT_TRUE(top_level_requirers(graph, "A", top_level).empty());
}

TEST(TopLevelRequirersTest, StopsAtTopLevelPackages) {
    PackageGraph graph;
    graph.add_requirement("app-kit", "webpack");
    graph.add_requirement("webpack", "terser");
    graph.add_requirement("tooling", "app-kit");

    const std::set<std::string> top_level = {"webpack", "terser", "tooling"};
    EXPECT_EQ(top_level_requirers(graph, "terser", top_level), (std::set<std::string>{"webpack"}));
    EXPECT_EQ(top_level_requirers(graph, "webpack", top_level), (std::set<std::string>{"tooling"}));
}

TEST(TopLevelRequirersTest, CyclesTerminate) {
    PackageGraph graph;
    graph.add_requirement("x", "y");
    graph.add_requirement("y", "z");
    graph.add_requirement("z", "x");
    graph.add_requirement("root", "x");

    const std::set<std::string> top_level = {"root", "z"};
    EXPECT_EQ(top_level_requirers(graph, "z", top_level), (std::set<std::string>{"root"}));
}

TEST(TopLevelRequirersTest, TargetNeverReportsItself) {
    PackageGraph graph;
    graph.add_requirement("self", "self");
    EXPECT_TRUE(top_level_requirers(graph, "self", {"self"}).empty());
}
