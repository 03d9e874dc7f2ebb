//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/locator/source_locator.hpp"
#include "dsv/utils/file_utils.hpp"
#include "dsv/utils/glob.hpp"
#include "dsv/utils/path_utils.hpp"
#include "dsv/utils/string_utils.hpp"

#include <algorithm>

namespace dsv::locator {

    const std::vector<std::string>& excluded_directories() {
        static const std::vector<std::string> dirs = {
            "node_modules",
            "dist",
            "build",
            "coverage",
            ".git",
            ".svn",
            ".hg",
        };
        return dirs;
    }

    bool is_lock_file(const std::string_view filename) {
        return filename.ends_with(".lock") ||
               filename == "package-lock.json" ||
               filename == "npm-shrinkwrap.json" ||
               filename == "pnpm-lock.yaml";
    }

    bool is_log_file(const std::string_view filename) {
        return filename.ends_with(".log");
    }

    std::vector<std::string> read_gitignore(const fs::path& root) {
        std::vector<std::string> patterns;

        const fs::path gitignore = root / ".gitignore";
        if (std::error_code ec; !fs::is_regular_file(gitignore, ec)) {
            return patterns;
        }

        auto lines = file_utils::read_lines(gitignore);
        if (lines.is_err()) {
            return patterns;
        }

        for (const auto& raw : lines.value()) {
            const auto line = string_utils::trim(raw);
            if (line.empty() || line.starts_with('#') || line.starts_with('!')) {
                continue;
            }
            patterns.emplace_back(line);
        }
        return patterns;
    }

    namespace {

        bool is_excluded_directory(const std::string& name) {
            const auto& dirs = excluded_directories();
            return std::ranges::find(dirs, name) != dirs.end();
        }

    }  // namespace

    Result<std::vector<fs::path>, Error> find_source_files(
        const fs::path& root,
        const LocatorOptions& options,
        Diagnostics* diagnostics
    ) {
        std::error_code ec;
        if (!fs::exists(root, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::not_found("Project root not found", root.string())
            );
        }
        if (!fs::is_directory(root, ec)) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::invalid_argument("Project root is not a directory", root.string())
            );
        }

        const fs::path base = path_utils::normalize(root);

        GlobSet ignores;
        std::vector<std::string> patterns = options.ignore_patterns;
        if (options.use_gitignore) {
            auto from_gitignore = read_gitignore(base);
            patterns.insert(patterns.end(), from_gitignore.begin(), from_gitignore.end());
        }
        for (const auto& pattern : patterns) {
            if (auto added = ignores.add(pattern); added.is_err() && diagnostics) {
                diagnostics->report(added.error());
            }
        }

        std::vector<fs::path> files;

        fs::recursive_directory_iterator it(
            base, fs::directory_options::skip_permission_denied, ec
        );
        if (ec) {
            return Result<std::vector<fs::path>, Error>::failure(
                Error::io_error("Failed to read project root", base.string())
            );
        }

        auto visit = [&](const fs::directory_entry& entry) {
            const std::string name = entry.path().filename().string();
            const std::string relative = path_utils::relative_generic(entry.path(), base);

            std::error_code type_ec;
            if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
                if (is_excluded_directory(name) || ignores.matches(relative)) {
                    it.disable_recursion_pending();
                }
                return;
            }

            if (!entry.is_regular_file(type_ec)) {
                return;
            }
            if (is_lock_file(name) || is_log_file(name) || ignores.matches(relative)) {
                return;
            }

            if (options.skip_binary) {
                auto binary = file_utils::is_binary_file(entry.path());
                if (binary.is_err()) {
                    if (diagnostics) {
                        diagnostics->report(binary.error());
                    }
                    return;
                }
                if (binary.value()) {
                    return;
                }
            }

            files.push_back(entry.path());
        };

        while (it != fs::recursive_directory_iterator()) {
            visit(*it);
            it.increment(ec);
            if (ec) {
                if (diagnostics) {
                    diagnostics->report(Error::io_error("Directory walk stopped early", ec.message()));
                }
                break;
            }
        }

        std::ranges::sort(files);
        return Result<std::vector<fs::path>, Error>::success(std::move(files));
    }

}  // namespace dsv::locator
