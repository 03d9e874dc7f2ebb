//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_WORKSPACE_RESOLVER_HPP
#define DEPSIEVE_WORKSPACE_RESOLVER_HPP

/**
 * @file workspace_resolver.hpp
 * @brief Locates the manifest and the effective analysis root.
 *
 * A package inside a monorepo is analyzed from the workspace root when an
 * ancestor manifest lists it among its workspaces. Otherwise the nearest
 * manifest's directory is the root.
 */

#include "dsv/types.hpp"
#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dsv::manifest {

    namespace fs = std::filesystem;

    struct AnalysisRoot {
        fs::path root;                          ///< Directory analyzed
        fs::path manifest_path;                 ///< Manifest whose dependencies are analyzed
        fs::path package_manifest_path;         ///< Nearest manifest to the start directory
        std::optional<WorkspaceInfo> workspace; ///< Set when a workspace root was adopted
    };

    /**
     * Walks from @p start_directory upward to the first package.json.
     *
     * @return NotFound when no directory up to the file system root has one.
     */
    [[nodiscard]] Result<fs::path, Error> find_manifest(const fs::path& start_directory);

    /**
     * Expands workspace globs to existing directories under @p root_directory.
     * node_modules is never descended into. Result is sorted.
     */
    [[nodiscard]] std::vector<fs::path> expand_workspace_patterns(
        const fs::path& root_directory,
        const std::vector<std::string>& patterns
    );

    /**
     * Reads the workspace declaration of @p manifest_path.
     *
     * @return nullopt when the manifest is unreadable or declares no workspaces.
     */
    [[nodiscard]] std::optional<WorkspaceInfo> read_workspace_info(const fs::path& manifest_path);

    /**
     * True when @p package_directory belongs to @p workspace: it lies inside
     * (or contains) one of the expanded package directories, or the literal
     * prefix of one of the patterns.
     */
    [[nodiscard]] bool is_workspace_member(
        const WorkspaceInfo& workspace,
        const fs::path& package_directory
    );

    /**
     * Determines which manifest and directory a run analyzes.
     *
     * Ancestors of the nearest manifest are checked nearest first; the first
     * one declaring workspaces that include the package wins.
     *
     * @return NotFound when there is no manifest at all.
     */
    [[nodiscard]] Result<AnalysisRoot, Error> resolve_analysis_root(const fs::path& start_directory);

}  // namespace dsv::manifest

#endif //DEPSIEVE_WORKSPACE_RESOLVER_HPP
