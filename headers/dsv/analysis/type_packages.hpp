//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_TYPE_PACKAGES_HPP
#define DEPSIEVE_TYPE_PACKAGES_HPP

/**
 * @file type_packages.hpp
 * @brief Helpers for the `@types/` usage rules.
 *
 * A type-definition package is kept when:
 * - the package it describes is declared, or installed and referenced
 *   by a source file (required by that package);
 * - a TypeScript source references it or the package it describes
 *   (used in that file);
 * - tsconfig.json lists it under compilerOptions.types or a typeRoots
 *   entry names it, and the project has TypeScript sources (required by
 *   typescript);
 * - it is `@types/node` and the project has TypeScript sources (required
 *   by typescript).
 */

#include "dsv/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace dsv::analysis {

    inline constexpr auto TYPESCRIPT_PACKAGE = "typescript";

    [[nodiscard]] bool has_typescript_sources(const std::vector<fs::path>& files);

    [[nodiscard]] std::vector<fs::path> typescript_sources(const std::vector<fs::path>& files);

    /**
     * True when @p base is listed in compilerOptions.types or contained
     * in a compilerOptions.typeRoots entry.
     */
    [[nodiscard]] bool tsconfig_mentions(const TypeConfig& config, std::string_view base);

}  // namespace dsv::analysis

#endif //DEPSIEVE_TYPE_PACKAGES_HPP
