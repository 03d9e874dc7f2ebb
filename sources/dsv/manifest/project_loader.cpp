//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/manifest/project_loader.hpp"
#include "dsv/manifest/package_manifest.hpp"
#include "dsv/utils/file_utils.hpp"
#include "dsv/utils/json_utils.hpp"
#include "dsv/utils/path_utils.hpp"

#include <regex>

namespace dsv::manifest {

    bool is_config_file(const std::string_view filename) {
        static const std::regex config_segment(R"(\.(config|rc)(\.|\b))", std::regex::ECMAScript);

        if (filename.empty()) {
            return false;
        }
        if (filename == MANIFEST_FILENAME || filename.starts_with('.') ||
            filename.find("config") != std::string_view::npos) {
            return true;
        }
        return std::regex_search(filename.begin(), filename.end(), config_segment);
    }

    json parse_config_content(const fs::path& path, const std::string_view content) {
        const std::string ext = path.extension().string();

        if (ext == ".js" || ext == ".cjs" || ext == ".mjs" || ext == ".ts" ||
            ext == ".cts" || ext == ".mts" || ext == ".yaml" || ext == ".yml") {
            return json(std::string(content));
        }

        if (auto parsed = json_utils::parse(content, true); parsed.is_ok()) {
            return std::move(parsed).value();
        }
        return json(std::string(content));
    }

    TypeConfig read_type_config(const fs::path& root, Diagnostics* diagnostics) {
        TypeConfig config;

        const fs::path tsconfig = root / "tsconfig.json";
        if (std::error_code ec; !fs::is_regular_file(tsconfig, ec)) {
            return config;
        }

        auto doc = json_utils::read_file(tsconfig, true);
        if (doc.is_err()) {
            if (diagnostics) {
                diagnostics->report(doc.error());
            }
            return config;
        }

        const json& data = doc.value();
        if (!data.is_object()) {
            return config;
        }
        const auto options = data.find("compilerOptions");
        if (options == data.end() || !options->is_object()) {
            return config;
        }

        config.types = json_utils::string_array(*options, "types");
        config.type_roots = json_utils::string_array(*options, "typeRoots");
        return config;
    }

    Result<ProjectContext, Error> load_project_context(
        const AnalysisRoot& root,
        const std::vector<fs::path>& files,
        Diagnostics* diagnostics
    ) {
        auto manifest = PackageManifest::load(root.manifest_path);
        if (manifest.is_err()) {
            return Result<ProjectContext, Error>::failure(manifest.error());
        }

        ProjectContext context;
        context.project_root = root.root;
        context.manifest_path = root.manifest_path;
        context.manifest = manifest.value().raw();
        context.declared = manifest.value().dependencies();
        context.scripts = manifest.value().scripts();
        context.type_config = read_type_config(root.root, diagnostics);

        for (const auto& file : files) {
            const auto filename = file.filename().string();
            if (!is_config_file(filename)) {
                continue;
            }

            const auto relative = path_utils::relative_generic(file, root.root);
            if (relative == MANIFEST_FILENAME) {
                continue;
            }

            auto content = file_utils::read_file(file);
            if (content.is_err()) {
                if (diagnostics) {
                    diagnostics->report(content.error());
                }
                continue;
            }
            context.configs.emplace(relative, parse_config_content(file, content.value()));
        }

        context.configs[MANIFEST_FILENAME] = context.manifest;
        return Result<ProjectContext, Error>::success(std::move(context));
    }

}  // namespace dsv::manifest
