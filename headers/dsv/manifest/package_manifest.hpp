//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_PACKAGE_MANIFEST_HPP
#define DEPSIEVE_PACKAGE_MANIFEST_HPP

/**
 * @file package_manifest.hpp
 * @brief Typed access to a package.json document.
 */

#include "dsv/types.hpp"
#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dsv::manifest {

    namespace fs = std::filesystem;

    inline constexpr auto MANIFEST_FILENAME = "package.json";

    class PackageManifest {
    public:
        /**
         * Reads and parses @p path.
         *
         * @return NotFound if the file is missing, ParseError if it is not a
         *         JSON object.
         */
        [[nodiscard]] static Result<PackageManifest, Error> load(const fs::path& path);

        [[nodiscard]] static Result<PackageManifest, Error> parse(std::string_view content, fs::path path);

        [[nodiscard]] const fs::path& path() const noexcept { return path_; }
        [[nodiscard]] fs::path directory() const { return path_.parent_path(); }
        [[nodiscard]] const json& raw() const noexcept { return doc_; }

        [[nodiscard]] std::string name() const;

        /**
         * Entries of one dependency section, in key order.
         */
        [[nodiscard]] std::vector<DeclaredDependency> section(DependencyKind kind) const;

        /**
         * Union of all four dependency sections.
         *
         * A name declared in several sections is reported once, with the
         * first section in Production, Development, Peer, Optional order.
         * Sorted with string_utils::package_name_less.
         */
        [[nodiscard]] std::vector<DeclaredDependency> dependencies() const;

        [[nodiscard]] std::map<std::string, std::string> scripts() const;

        /**
         * Workspace globs, from either `"workspaces": [...]` or
         * `"workspaces": {"packages": [...]}`. nullopt when absent.
         */
        [[nodiscard]] std::optional<std::vector<std::string>> workspace_patterns() const;

    private:
        PackageManifest(fs::path path, json doc)
            : path_(std::move(path))
            , doc_(std::move(doc)) {}

        fs::path path_;
        json doc_;
    };

}  // namespace dsv::manifest

#endif //DEPSIEVE_PACKAGE_MANIFEST_HPP
