//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/scanner/import_matcher.hpp"

namespace dsv::scanner {

    namespace {

        bool is_same_or_subpath(const std::string_view source, const std::string_view name) {
            if (name.empty()) {
                return false;
            }
            if (source == name) {
                return true;
            }
            return source.size() > name.size() &&
                   source.starts_with(name) &&
                   source[name.size()] == '/';
        }

    }  // namespace

    std::string_view unscoped_name(const std::string_view name) noexcept {
        if (!name.starts_with('@')) {
            return name;
        }
        const auto slash = name.find('/');
        if (slash == std::string_view::npos) {
            return name;
        }
        return name.substr(slash + 1);
    }

    std::string types_base_package(const std::string_view name) {
        if (!is_types_package(name)) {
            return std::string(name);
        }
        const std::string_view base = name.substr(7);
        if (const auto sep = base.find("__"); sep != std::string_view::npos && sep > 0) {
            std::string scoped = "@";
            scoped.append(base.substr(0, sep));
            scoped += '/';
            scoped.append(base.substr(sep + 2));
            return scoped;
        }
        return std::string(base);
    }

    bool matches_dependency(const std::string_view source, const std::string_view dependency) {
        if (source.empty() || dependency.empty()) {
            return false;
        }

        if (is_same_or_subpath(source, dependency)) {
            return true;
        }

        if (is_types_package(dependency)) {
            const std::string base = types_base_package(dependency);
            if (is_same_or_subpath(source, base)) {
                return true;
            }
        }

        // Only compare unscoped forms when at least one side is scoped,
        // otherwise this repeats the checks above.
        if (!source.starts_with('@') && !dependency.starts_with('@')) {
            return false;
        }
        const std::string_view src = unscoped_name(source);
        const std::string_view dep = unscoped_name(dependency);
        return is_same_or_subpath(src, dep);
    }

}  // namespace dsv::scanner
