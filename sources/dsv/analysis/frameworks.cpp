//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/analysis/frameworks.hpp"

#include <algorithm>

namespace dsv::analysis {

    bool FrameworkRule::is_tooling(const std::string_view dependency) const {
        return std::ranges::any_of(tooling_prefixes, [&](const std::string& prefix) {
            return dependency.starts_with(prefix);
        });
    }

    const std::vector<FrameworkRule>& framework_rules() {
        static const std::vector<FrameworkRule> rules = {
            {"angular", "@angular/core", {
                "@angular-builders/",
                "@angular-devkit/",
                "@angular/cli",
                "@webcomponents/custom-elements",
            }},
            {"react", "react", {
                "react-scripts",
                "@testing-library/react",
                "react-app-rewired",
            }},
            {"vue", "vue", {
                "@vue/cli-service",
                "@vue/cli-plugin-",
            }},
        };
        return rules;
    }

    std::optional<FrameworkRule> detect_framework(const json& manifest) {
        if (!manifest.is_object()) {
            return std::nullopt;
        }

        const auto declares = [&](const char* section, const std::string& name) {
            const auto it = manifest.find(section);
            return it != manifest.end() && it->is_object() && it->contains(name);
        };

        for (const auto& rule : framework_rules()) {
            if (declares("dependencies", rule.core_package) ||
                declares("devDependencies", rule.core_package)) {
                return rule;
            }
        }
        return std::nullopt;
    }

}  // namespace dsv::analysis
