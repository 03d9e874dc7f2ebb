//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/manifest/package_manifest.hpp"
#include "dsv/utils/json_utils.hpp"
#include "dsv/utils/string_utils.hpp"

#include <algorithm>
#include <set>

namespace dsv::manifest {

    Result<PackageManifest, Error> PackageManifest::load(const fs::path& path) {
        auto doc = json_utils::read_file(path);
        if (doc.is_err()) {
            return Result<PackageManifest, Error>::failure(doc.error());
        }
        if (!doc.value().is_object()) {
            return Result<PackageManifest, Error>::failure(
                Error::parse_error("Manifest is not a JSON object", path.string())
            );
        }
        return Result<PackageManifest, Error>::success(PackageManifest(path, std::move(doc).value()));
    }

    Result<PackageManifest, Error> PackageManifest::parse(const std::string_view content, fs::path path) {
        auto doc = json_utils::parse(content);
        if (doc.is_err()) {
            return Result<PackageManifest, Error>::failure(doc.error().with_context(path.string()));
        }
        if (!doc.value().is_object()) {
            return Result<PackageManifest, Error>::failure(
                Error::parse_error("Manifest is not a JSON object", path.string())
            );
        }
        return Result<PackageManifest, Error>::success(PackageManifest(std::move(path), std::move(doc).value()));
    }

    std::string PackageManifest::name() const {
        return json_utils::get_or<std::string>(doc_, "name", "");
    }

    std::vector<DeclaredDependency> PackageManifest::section(const DependencyKind kind) const {
        std::vector<DeclaredDependency> out;
        for (auto& [name, range] : json_utils::string_members(doc_, to_string(kind))) {
            out.push_back(DeclaredDependency{name, std::move(range), kind});
        }
        return out;
    }

    std::vector<DeclaredDependency> PackageManifest::dependencies() const {
        std::vector<DeclaredDependency> out;
        std::set<std::string> seen;

        for (const auto kind : {DependencyKind::Production, DependencyKind::Development,
                                DependencyKind::Peer, DependencyKind::Optional}) {
            for (auto& dep : section(kind)) {
                if (seen.insert(dep.name).second) {
                    out.push_back(std::move(dep));
                }
            }
        }

        std::ranges::sort(out, [](const DeclaredDependency& a, const DeclaredDependency& b) {
            return string_utils::package_name_less(a.name, b.name);
        });
        return out;
    }

    std::map<std::string, std::string> PackageManifest::scripts() const {
        return json_utils::string_members(doc_, "scripts");
    }

    std::optional<std::vector<std::string>> PackageManifest::workspace_patterns() const {
        const auto it = doc_.find("workspaces");
        if (it == doc_.end()) {
            return std::nullopt;
        }
        if (it->is_array()) {
            std::vector<std::string> patterns;
            for (const auto& entry : *it) {
                if (entry.is_string()) {
                    patterns.push_back(entry.get<std::string>());
                }
            }
            return patterns;
        }
        if (it->is_object()) {
            return json_utils::string_array(*it, "packages");
        }
        return std::nullopt;
    }

}  // namespace dsv::manifest
