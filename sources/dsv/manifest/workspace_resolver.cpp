//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/manifest/workspace_resolver.hpp"
#include "dsv/manifest/package_manifest.hpp"
#include "dsv/utils/glob.hpp"
#include "dsv/utils/path_utils.hpp"

#include <algorithm>
#include <regex>

namespace dsv::manifest {

    namespace {

        std::string clean_pattern(std::string pattern) {
            if (pattern.starts_with("./")) {
                pattern.erase(0, 2);
            }
            while (pattern.size() > 1 && pattern.ends_with('/')) {
                pattern.pop_back();
            }
            return pattern;
        }

        /**
         * Leading part of a glob before its first wildcard, without a
         * trailing separator. "packages/*" -> "packages".
         */
        std::string literal_prefix(const std::string& pattern) {
            const auto wildcard = pattern.find_first_of("*?[{");
            std::string prefix = pattern.substr(0, wildcard);
            while (!prefix.empty() && prefix.ends_with('/')) {
                prefix.pop_back();
            }
            return prefix;
        }

    }  // namespace

    Result<fs::path, Error> find_manifest(const fs::path& start_directory) {
        fs::path current = path_utils::normalize(start_directory);

        while (true) {
            const fs::path candidate = current / MANIFEST_FILENAME;
            if (std::error_code ec; fs::is_regular_file(candidate, ec)) {
                return Result<fs::path, Error>::success(candidate);
            }
            const fs::path parent = current.parent_path();
            if (parent == current || parent.empty()) {
                break;
            }
            current = parent;
        }

        return Result<fs::path, Error>::failure(
            Error::not_found("No package.json found", start_directory.string())
        );
    }

    std::vector<fs::path> expand_workspace_patterns(
        const fs::path& root_directory,
        const std::vector<std::string>& patterns
    ) {
        std::vector<std::regex> matchers;
        for (const auto& raw : patterns) {
            const std::string pattern = clean_pattern(raw);
            if (pattern.empty() || pattern.starts_with('!')) {
                continue;
            }
            try {
                matchers.emplace_back("^" + glob_to_regex(pattern) + "$", std::regex::ECMAScript);
            } catch (const std::regex_error&) {
                continue;
            }
        }

        std::vector<fs::path> packages;
        if (matchers.empty()) {
            return packages;
        }

        std::error_code ec;
        fs::recursive_directory_iterator it(
            root_directory, fs::directory_options::skip_permission_denied, ec
        );
        if (ec) {
            return packages;
        }

        while (it != fs::recursive_directory_iterator()) {
            const auto& entry = *it;
            std::error_code type_ec;
            if (entry.is_directory(type_ec)) {
                const auto name = entry.path().filename().string();
                if (name == "node_modules" || name == ".git") {
                    it.disable_recursion_pending();
                } else {
                    const auto relative = path_utils::relative_generic(entry.path(), root_directory);
                    const bool matched = std::ranges::any_of(matchers, [&](const std::regex& rx) {
                        return std::regex_match(relative, rx);
                    });
                    if (matched) {
                        packages.push_back(entry.path());
                    }
                }
            }
            it.increment(ec);
            if (ec) {
                break;
            }
        }

        std::ranges::sort(packages);
        return packages;
    }

    std::optional<WorkspaceInfo> read_workspace_info(const fs::path& manifest_path) {
        auto manifest = PackageManifest::load(manifest_path);
        if (manifest.is_err()) {
            return std::nullopt;
        }

        auto patterns = manifest.value().workspace_patterns();
        if (!patterns) {
            return std::nullopt;
        }

        WorkspaceInfo info;
        info.root = manifest_path;
        info.packages = expand_workspace_patterns(manifest_path.parent_path(), *patterns);
        info.patterns = std::move(*patterns);
        return info;
    }

    bool is_workspace_member(const WorkspaceInfo& workspace, const fs::path& package_directory) {
        for (const auto& package : workspace.packages) {
            if (path_utils::overlaps(package_directory, package)) {
                return true;
            }
        }

        const fs::path root_directory = workspace.root.parent_path();
        for (const auto& raw : workspace.patterns) {
            const std::string pattern = clean_pattern(raw);
            if (pattern.empty() || pattern.starts_with('!')) {
                continue;
            }
            if (const auto prefix = literal_prefix(pattern); !prefix.empty()) {
                if (path_utils::overlaps(package_directory, root_directory / prefix)) {
                    return true;
                }
            }
        }
        return false;
    }

    Result<AnalysisRoot, Error> resolve_analysis_root(const fs::path& start_directory) {
        auto found = find_manifest(start_directory);
        if (found.is_err()) {
            return Result<AnalysisRoot, Error>::failure(found.error());
        }

        AnalysisRoot result;
        result.package_manifest_path = found.value();
        result.manifest_path = found.value();
        result.root = found.value().parent_path();

        const fs::path package_directory = result.root;
        fs::path current = package_directory;

        while (true) {
            const fs::path parent = current.parent_path();
            if (parent == current || parent.empty()) {
                break;
            }
            current = parent;

            const fs::path candidate = current / MANIFEST_FILENAME;
            if (std::error_code ec; !fs::is_regular_file(candidate, ec)) {
                continue;
            }

            auto workspace = read_workspace_info(candidate);
            if (!workspace) {
                continue;
            }
            if (is_workspace_member(*workspace, package_directory)) {
                result.root = current;
                result.manifest_path = candidate;
                result.workspace = std::move(workspace);
                break;
            }
        }

        return Result<AnalysisRoot, Error>::success(std::move(result));
    }

}  // namespace dsv::manifest
