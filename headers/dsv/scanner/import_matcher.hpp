//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_IMPORT_MATCHER_HPP
#define DEPSIEVE_IMPORT_MATCHER_HPP

/**
 * @file import_matcher.hpp
 * @brief Decides whether a module specifier refers to a dependency.
 */

#include <string>
#include <string_view>

namespace dsv::scanner {

    /**
     * Part of a scoped name after the first '/'; the name itself otherwise.
     * A scoped name with nothing after the slash yields an empty view.
     */
    [[nodiscard]] std::string_view unscoped_name(std::string_view name) noexcept;

    /**
     * Maps a type-definition package to the package it describes:
     * `@types/node` -> `node`, `@types/babel__core` -> `@babel/core`.
     * Returns @p name unchanged when it is not under `@types/`.
     */
    [[nodiscard]] std::string types_base_package(std::string_view name);

    [[nodiscard]] inline bool is_types_package(const std::string_view name) noexcept {
        return name.starts_with("@types/") && name.size() > 7;
    }

    /**
     * True when @p source (a module specifier) refers to @p dependency.
     *
     * Accepts the exact name, a subpath of it, the unscoped form of either
     * side, and for `@types/x` the package x and its subpaths.
     */
    [[nodiscard]] bool matches_dependency(std::string_view source, std::string_view dependency);

}  // namespace dsv::scanner

#endif //DEPSIEVE_IMPORT_MATCHER_HPP
