//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_SOURCE_LOCATOR_HPP
#define DEPSIEVE_SOURCE_LOCATOR_HPP

/**
 * @file source_locator.hpp
 * @brief Enumerates the files a project's dependency usage is searched in.
 *
 * Installed packages, build output, coverage reports and VCS metadata are
 * skipped at any depth. Lock files, log files and binary files never reach
 * the scanner. Unreadable directories are skipped without failing the walk.
 */

#include "dsv/diagnostics.hpp"
#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dsv::locator {

    namespace fs = std::filesystem;

    struct LocatorOptions {
        std::vector<std::string> ignore_patterns;   ///< Extra globs, relative to the root
        bool use_gitignore = true;                  ///< Honour plain lines of <root>/.gitignore
        bool skip_binary = true;
    };

    /**
     * Directory names excluded wherever they appear.
     */
    [[nodiscard]] const std::vector<std::string>& excluded_directories();

    [[nodiscard]] bool is_lock_file(std::string_view filename);
    [[nodiscard]] bool is_log_file(std::string_view filename);

    /**
     * Reads the non-comment, non-negated patterns of <root>/.gitignore.
     * A missing file yields an empty list.
     */
    [[nodiscard]] std::vector<std::string> read_gitignore(const fs::path& root);

    /**
     * Lists candidate files under @p root, sorted by path.
     *
     * @param root Directory to walk.
     * @param options Ignore patterns and filters.
     * @param diagnostics Receives skipped-file and invalid-pattern errors. May be null.
     * @return Absolute file paths, or NotFound/InvalidArgument when @p root
     *         is missing or not a directory.
     */
    [[nodiscard]] Result<std::vector<fs::path>, Error> find_source_files(
        const fs::path& root,
        const LocatorOptions& options,
        Diagnostics* diagnostics = nullptr
    );

}  // namespace dsv::locator

#endif //DEPSIEVE_SOURCE_LOCATOR_HPP
