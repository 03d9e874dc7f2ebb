//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_INSTALLED_PACKAGES_HPP
#define DEPSIEVE_INSTALLED_PACKAGES_HPP

/**
 * @file installed_packages.hpp
 * @brief Reads the packages installed under node_modules.
 *
 * Installed manifests are only scanned for the keys of their requirement
 * sections, so they are read with simdjson's on-demand API instead of
 * being materialized as DOM trees.
 */

#include "dsv/cache/analysis_caches.hpp"
#include "dsv/diagnostics.hpp"
#include "dsv/result.hpp"
#include "dsv/error.hpp"
#include "dsv/types.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace dsv::graph {

    struct InstalledPackage {
        std::string name;       ///< `lodash` or `@scope/name`
        fs::path directory;
    };

    /**
     * Lists package directories (and directory symlinks) directly under
     * @p node_modules and one level below each `@scope` directory.
     * Hidden entries such as `.bin` are skipped. Sorted by name.
     */
    [[nodiscard]] std::vector<InstalledPackage> list_installed_packages(
        const fs::path& node_modules,
        Diagnostics* diagnostics = nullptr
    );

    /**
     * Keys of dependencies, peerDependencies and optionalDependencies in the
     * manifest at @p manifest_path.
     */
    [[nodiscard]] Result<std::set<std::string>, Error> read_package_requirements(const fs::path& manifest_path);

    /**
     * Builds the installed package -> required names adjacency.
     * Packages without a readable manifest are reported and left out.
     */
    [[nodiscard]] DependencyGraph build_installed_graph(
        const fs::path& node_modules,
        Diagnostics* diagnostics = nullptr
    );

    /**
     * build_installed_graph() memoized in @p caches by node_modules path.
     */
    [[nodiscard]] std::shared_ptr<const DependencyGraph> cached_installed_graph(
        cache::AnalysisCaches& caches,
        const fs::path& node_modules,
        Diagnostics* diagnostics = nullptr
    );

}  // namespace dsv::graph

#endif //DEPSIEVE_INSTALLED_PACKAGES_HPP
