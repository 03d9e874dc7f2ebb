//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_FRAMEWORKS_HPP
#define DEPSIEVE_FRAMEWORKS_HPP

#include "dsv/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dsv::analysis {

    /**
     * A framework whose tooling packages are never imported by application
     * code but are required by the framework's build.
     */
    struct FrameworkRule {
        std::string name;
        std::string core_package;
        std::vector<std::string> tooling_prefixes;

        /**
         * True when @p dependency equals or starts with a tooling prefix.
         */
        [[nodiscard]] bool is_tooling(std::string_view dependency) const;
    };

    /**
     * Angular, React and Vue, in detection order.
     */
    [[nodiscard]] const std::vector<FrameworkRule>& framework_rules();

    /**
     * First framework whose core package the manifest lists under
     * dependencies or devDependencies.
     */
    [[nodiscard]] std::optional<FrameworkRule> detect_framework(const json& manifest);

}  // namespace dsv::analysis

#endif //DEPSIEVE_FRAMEWORKS_HPP
