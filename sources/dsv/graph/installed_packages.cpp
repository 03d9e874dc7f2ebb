//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/graph/installed_packages.hpp"
#include "dsv/manifest/package_manifest.hpp"
#include "dsv/utils/string_utils.hpp"

#include <simdjson.h>

#include <algorithm>
#include <array>

namespace dsv::graph {

    namespace {

        constexpr std::array<const char*, 3> REQUIREMENT_SECTIONS = {
            "dependencies",
            "peerDependencies",
            "optionalDependencies",
        };

        /**
         * is_directory() follows symlinks, which is what linked workspaces need.
         */
        bool is_package_directory(const fs::directory_entry& entry) {
            std::error_code ec;
            const std::string name = entry.path().filename().string();
            return !name.empty() && name.front() != '.' && entry.is_directory(ec);
        }

        void list_directory(
            const fs::path& dir,
            const std::string& scope,
            std::vector<InstalledPackage>& out,
            Diagnostics* diagnostics
        ) {
            std::error_code ec;
            fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                if (diagnostics) {
                    diagnostics->report(Error::io_error("Cannot list installed packages", dir.string() + ": " + ec.message()));
                }
                return;
            }

            const auto visit = [&](const fs::directory_entry& entry) {
                if (!is_package_directory(entry)) {
                    return;
                }

                const std::string name = entry.path().filename().string();
                if (scope.empty() && name.starts_with('@')) {
                    list_directory(entry.path(), name, out, diagnostics);
                    return;
                }

                out.push_back(InstalledPackage{
                    scope.empty() ? name : scope + "/" + name,
                    entry.path()
                });
            };

            while (it != fs::directory_iterator()) {
                visit(*it);
                it.increment(ec);
                if (ec) {
                    if (diagnostics) {
                        diagnostics->report(Error::io_error("Error while listing installed packages", dir.string() + ": " + ec.message()));
                    }
                    break;
                }
            }
        }

    }  // namespace

    std::vector<InstalledPackage> list_installed_packages(const fs::path& node_modules, Diagnostics* diagnostics) {
        std::vector<InstalledPackage> packages;

        if (std::error_code ec; !fs::is_directory(node_modules, ec)) {
            return packages;
        }

        list_directory(node_modules, "", packages, diagnostics);

        std::ranges::sort(packages, [](const InstalledPackage& a, const InstalledPackage& b) {
            return string_utils::package_name_less(a.name, b.name);
        });
        return packages;
    }

    Result<std::set<std::string>, Error> read_package_requirements(const fs::path& manifest_path) {
        std::set<std::string> requirements;

        try {
            const simdjson::padded_string json = simdjson::padded_string::load(manifest_path.string());
            simdjson::ondemand::parser parser;
            simdjson::ondemand::document doc = parser.iterate(json);
            simdjson::ondemand::object root = doc.get_object();

            for (const char* section : REQUIREMENT_SECTIONS) {
                auto field = root.find_field_unordered(section);
                if (field.error() == simdjson::NO_SUCH_FIELD) {
                    continue;
                }
                if (field.error() != simdjson::SUCCESS) {
                    throw simdjson::simdjson_error(field.error());
                }
                simdjson::ondemand::object deps;
                if (field.get_object().get(deps) != simdjson::SUCCESS) {
                    continue;
                }
                for (auto entry : deps) {
                    const std::string_view key = entry.unescaped_key();
                    requirements.emplace(key);
                }
            }
        } catch (const simdjson::simdjson_error& e) {
            return Result<std::set<std::string>, Error>::failure(
                Error::parse_error("Malformed installed package manifest", manifest_path.string() + ": " + e.what())
            );
        }

        return Result<std::set<std::string>, Error>::success(std::move(requirements));
    }

    DependencyGraph build_installed_graph(const fs::path& node_modules, Diagnostics* diagnostics) {
        DependencyGraph graph;

        for (const auto& package : list_installed_packages(node_modules, diagnostics)) {
            const fs::path manifest_path = package.directory / manifest::MANIFEST_FILENAME;
            if (std::error_code ec; !fs::is_regular_file(manifest_path, ec)) {
                continue;
            }

            auto requirements = read_package_requirements(manifest_path);
            if (requirements.is_err()) {
                if (diagnostics) {
                    diagnostics->report(requirements.error());
                }
                continue;
            }
            graph[package.name] = std::move(requirements).value();
        }

        return graph;
    }

    std::shared_ptr<const DependencyGraph> cached_installed_graph(
        cache::AnalysisCaches& caches,
        const fs::path& node_modules,
        Diagnostics* diagnostics
    ) {
        const std::string key = node_modules.generic_string();
        if (auto hit = caches.graphs.get(key)) {
            return *hit;
        }

        auto graph = std::make_shared<const DependencyGraph>(build_installed_graph(node_modules, diagnostics));
        caches.graphs.put(key, graph);
        return graph;
    }

}  // namespace dsv::graph
