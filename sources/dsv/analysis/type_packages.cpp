//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/analysis/type_packages.hpp"
#include "dsv/utils/file_utils.hpp"

#include <algorithm>
#include <iterator>

namespace dsv::analysis {

    bool has_typescript_sources(const std::vector<fs::path>& files) {
        return std::ranges::any_of(files, [](const fs::path& file) {
            return file_utils::is_typescript_source(file);
        });
    }

    std::vector<fs::path> typescript_sources(const std::vector<fs::path>& files) {
        std::vector<fs::path> out;
        std::ranges::copy_if(files, std::back_inserter(out), [](const fs::path& file) {
            return file_utils::is_typescript_source(file);
        });
        return out;
    }

    bool tsconfig_mentions(const TypeConfig& config, const std::string_view base) {
        if (base.empty()) {
            return false;
        }
        if (std::ranges::find(config.types, base) != config.types.end()) {
            return true;
        }
        return std::ranges::any_of(config.type_roots, [&](const std::string& root) {
            return root.find(base) != std::string::npos;
        });
    }

}  // namespace dsv::analysis
