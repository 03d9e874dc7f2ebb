//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_PROJECT_LOADER_HPP
#define DEPSIEVE_PROJECT_LOADER_HPP

/**
 * @file project_loader.hpp
 * @brief Builds the ProjectContext for a resolved analysis root.
 *
 * Configuration files found among the candidate files are parsed once here
 * and stored by relative path, so the scanner never re-reads them.
 */

#include "dsv/manifest/workspace_resolver.hpp"
#include "dsv/diagnostics.hpp"
#include "dsv/types.hpp"
#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace dsv::manifest {

    namespace fs = std::filesystem;

    /**
     * A file is treated as configuration when its name contains "config",
     * starts with '.', is package.json, or has a ".config"/".rc" segment.
     */
    [[nodiscard]] bool is_config_file(std::string_view filename);

    /**
     * Parses configuration text according to its extension.
     *
     * JSON and unknown extensions are parsed as JSON with comments allowed;
     * script and YAML files, and anything that fails to parse, are kept as
     * an opaque JSON string holding the raw text.
     */
    [[nodiscard]] json parse_config_content(const fs::path& path, std::string_view content);

    /**
     * Reads compilerOptions.types and compilerOptions.typeRoots from
     * <root>/tsconfig.json. Missing or malformed files yield an empty config.
     */
    [[nodiscard]] TypeConfig read_type_config(const fs::path& root, Diagnostics* diagnostics = nullptr);

    /**
     * Loads the manifest, scripts, configurations and tsconfig settings.
     *
     * @param root Resolved analysis root.
     * @param files Candidate files from the locator (absolute paths).
     * @param diagnostics Receives unreadable-config errors. May be null.
     * @return Manifest load errors are propagated; config errors are not.
     */
    [[nodiscard]] Result<ProjectContext, Error> load_project_context(
        const AnalysisRoot& root,
        const std::vector<fs::path>& files,
        Diagnostics* diagnostics = nullptr
    );

}  // namespace dsv::manifest

#endif //DEPSIEVE_PROJECT_LOADER_HPP
