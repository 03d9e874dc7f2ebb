//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_CLOSURE_HPP
#define DEPSIEVE_CLOSURE_HPP

#include "dsv/types.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace dsv::analysis {

    /**
     * Names with no file usage and no requiring package.
     */
    [[nodiscard]] std::set<std::string> initial_unused(const std::map<std::string, DependencyRecord>& records);

    /**
     * Grows @p initial to a fixed point: a dependency without file usage
     * whose every requirer is already unused becomes unused as well.
     *
     * The result does not depend on iteration order, and applying the
     * closure to its own output returns the same set. Names absent from
     * @p records are never added.
     *
     * @return The closed set, ordered with string_utils::package_name_less.
     */
    [[nodiscard]] std::vector<std::string> finalize_unused(
        const std::set<std::string>& initial,
        const std::map<std::string, DependencyRecord>& records
    );

}  // namespace dsv::analysis

#endif //DEPSIEVE_CLOSURE_HPP
