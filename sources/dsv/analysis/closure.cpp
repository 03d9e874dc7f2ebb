//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/analysis/closure.hpp"
#include "dsv/utils/string_utils.hpp"

#include <algorithm>

namespace dsv::analysis {

    std::set<std::string> initial_unused(const std::map<std::string, DependencyRecord>& records) {
        std::set<std::string> unused;
        for (const auto& [name, record] : records) {
            if (!record.is_used()) {
                unused.insert(name);
            }
        }
        return unused;
    }

    std::vector<std::string> finalize_unused(
        const std::set<std::string>& initial,
        const std::map<std::string, DependencyRecord>& records
    ) {
        std::set<std::string> unused = initial;

        bool changed = true;
        while (changed) {
            changed = false;
            for (const auto& [name, record] : records) {
                if (unused.contains(name) || !record.used_in_files.empty()) {
                    continue;
                }
                const bool all_requirers_unused = std::ranges::all_of(
                    record.required_by_packages,
                    [&](const std::string& requirer) { return unused.contains(requirer); }
                );
                if (all_requirers_unused) {
                    unused.insert(name);
                    changed = true;
                }
            }
        }

        std::vector<std::string> ordered(unused.begin(), unused.end());
        std::ranges::sort(ordered, [](const std::string& a, const std::string& b) {
            return string_utils::package_name_less(a, b);
        });
        return ordered;
    }

}  // namespace dsv::analysis
