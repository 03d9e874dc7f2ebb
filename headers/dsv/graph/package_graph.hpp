//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_PACKAGE_GRAPH_HPP
#define DEPSIEVE_PACKAGE_GRAPH_HPP

/**
 * @file package_graph.hpp
 * @brief Requirement graph over installed packages.
 *
 * An edge A -> B means package A requires package B. The graph keeps a
 * reverse index so "who requires B" is answered without a scan.
 */

#include "dsv/types.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace dsv::graph {

    class PackageGraph {
    public:
        PackageGraph() = default;

        /**
         * Builds the graph and its reverse index from an adjacency map.
         */
        explicit PackageGraph(const DependencyGraph& adjacency);

        void add_package(const std::string& name);

        /**
         * Adds the edge @p from -> @p to. Both ends become packages.
         */
        void add_requirement(const std::string& from, const std::string& to);

        [[nodiscard]] bool has_package(const std::string& name) const;

        [[nodiscard]] bool requires_package(const std::string& from, const std::string& to) const;

        /**
         * Packages @p name requires. Empty for unknown names.
         */
        [[nodiscard]] const std::set<std::string>& requirements(const std::string& name) const;

        /**
         * Packages that require @p name. Empty for unknown names.
         */
        [[nodiscard]] const std::set<std::string>& requirers(const std::string& name) const;

        [[nodiscard]] std::size_t package_count() const noexcept { return adjacency_.size(); }
        [[nodiscard]] std::size_t edge_count() const noexcept { return edge_count_; }

        [[nodiscard]] const DependencyGraph& adjacency() const noexcept { return adjacency_; }

    private:
        DependencyGraph adjacency_;
        std::map<std::string, std::set<std::string>> reverse_;
        std::size_t edge_count_ = 0;
    };

    /**
     * Top-level packages that require @p target directly or through
     * packages that are not top-level.
     *
     * Breadth-first over reverse edges with a visited set, so cycles end.
     * A top-level package reached on the way is recorded and not expanded.
     * @p target itself is never part of the result.
     */
    [[nodiscard]] std::set<std::string> top_level_requirers(
        const PackageGraph& graph,
        const std::string& target,
        const std::set<std::string>& top_level
    );

}  // namespace dsv::graph

#endif //DEPSIEVE_PACKAGE_GRAPH_HPP
