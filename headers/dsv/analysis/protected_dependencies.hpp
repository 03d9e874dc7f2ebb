//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_PROTECTED_DEPENDENCIES_HPP
#define DEPSIEVE_PROTECTED_DEPENDENCIES_HPP

/**
 * @file protected_dependencies.hpp
 * @brief Packages that are kept even when no usage was found.
 *
 * Runtimes, build tools, framework cores, test runners and similar packages
 * are routinely driven by tooling rather than imported. An unused protected
 * package is reported separately and only proposed for removal in
 * aggressive mode.
 *
 * An entry protects a name when it is equal to it, when it contains '*'
 * and matches it as a glob, or when both are scoped with the same scope.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dsv::analysis {

    struct ProtectedCategory {
        std::string name;               ///< e.g. "build tools"
        std::vector<std::string> entries;
    };

    [[nodiscard]] const std::vector<ProtectedCategory>& protected_catalogue();

    [[nodiscard]] bool is_protected(std::string_view dependency);

    /**
     * Category of the first exact or glob entry matching @p dependency.
     * Scope-only matches have no reason.
     */
    [[nodiscard]] std::optional<std::string> protection_reason(std::string_view dependency);

}  // namespace dsv::analysis

#endif //DEPSIEVE_PROTECTED_DEPENDENCIES_HPP
