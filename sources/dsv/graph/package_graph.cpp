//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/graph/package_graph.hpp"

#include <queue>

namespace dsv::graph {

    namespace {
        const std::set<std::string> EMPTY_SET;
    }

    PackageGraph::PackageGraph(const DependencyGraph& adjacency) {
        for (const auto& [name, requirements] : adjacency) {
            add_package(name);
            for (const auto& required : requirements) {
                add_requirement(name, required);
            }
        }
    }

    void PackageGraph::add_package(const std::string& name) {
        adjacency_.try_emplace(name);
    }

    void PackageGraph::add_requirement(const std::string& from, const std::string& to) {
        add_package(from);
        add_package(to);
        if (adjacency_[from].insert(to).second) {
            reverse_[to].insert(from);
            ++edge_count_;
        }
    }

    bool PackageGraph::has_package(const std::string& name) const {
        return adjacency_.contains(name);
    }

    bool PackageGraph::requires_package(const std::string& from, const std::string& to) const {
        const auto it = adjacency_.find(from);
        return it != adjacency_.end() && it->second.contains(to);
    }

    const std::set<std::string>& PackageGraph::requirements(const std::string& name) const {
        const auto it = adjacency_.find(name);
        return it != adjacency_.end() ? it->second : EMPTY_SET;
    }

    const std::set<std::string>& PackageGraph::requirers(const std::string& name) const {
        const auto it = reverse_.find(name);
        return it != reverse_.end() ? it->second : EMPTY_SET;
    }

    std::set<std::string> top_level_requirers(
        const PackageGraph& graph,
        const std::string& target,
        const std::set<std::string>& top_level
    ) {
        std::set<std::string> found;
        std::set<std::string> visited = {target};
        std::queue<std::string> queue;

        for (const auto& requirer : graph.requirers(target)) {
            if (visited.insert(requirer).second) {
                queue.push(requirer);
            }
        }

        while (!queue.empty()) {
            const std::string current = std::move(queue.front());
            queue.pop();

            if (top_level.contains(current)) {
                found.insert(current);
                continue;
            }

            for (const auto& requirer : graph.requirers(current)) {
                if (visited.insert(requirer).second) {
                    queue.push(requirer);
                }
            }
        }

        return found;
    }

}  // namespace dsv::graph
