//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/scanner/usage_scanner.hpp"
#include "dsv/manifest/package_manifest.hpp"
#include "dsv/patterns/pattern_matcher.hpp"
#include "dsv/scanner/import_matcher.hpp"
#include "dsv/scanner/reference_extractor.hpp"
#include "dsv/utils/file_utils.hpp"
#include "dsv/utils/json_utils.hpp"
#include "dsv/utils/path_utils.hpp"
#include "dsv/utils/string_utils.hpp"

#include <algorithm>

namespace dsv::scanner {

    namespace {

        /**
         * Any spelling of @p dependency that a matching reference must
         * contain literally.
         */
        bool passes_literal_precheck(const std::string& dependency, const std::string_view content) {
            if (content.find(dependency) != std::string_view::npos) {
                return true;
            }
            if (is_types_package(dependency) &&
                content.find(types_base_package(dependency)) != std::string_view::npos) {
                return true;
            }
            if (const auto unscoped = unscoped_name(dependency);
                unscoped != dependency && !unscoped.empty() &&
                content.find(unscoped) != std::string_view::npos) {
                return true;
            }
            return false;
        }

    }  // namespace

    UsageScanner::UsageScanner(
        const ProjectContext& context,
        cache::AnalysisCaches& caches,
        Diagnostics* diagnostics
    )
        : context_(context)
        , caches_(caches)
        , diagnostics_(diagnostics) {}

    bool UsageScanner::is_used_in_file(const std::string& dependency, const fs::path& file) {
        const std::string key = cache::cache_key({dependency, file.generic_string()});
        if (const auto hit = caches_.usage.get(key)) {
            return *hit;
        }

        const bool used = scan(dependency, file);
        caches_.usage.put(key, used);
        return used;
    }

    bool UsageScanner::scan(const std::string& dependency, const fs::path& file) {
        if (file.filename() == manifest::MANIFEST_FILENAME &&
            json_utils::contains_text(context_.manifest, dependency)) {
            return true;
        }

        if (matches_configuration(dependency, file)) {
            return true;
        }

        if (is_used_by_scripts(dependency)) {
            return true;
        }

        return matches_content(dependency, file);
    }

    bool UsageScanner::matches_configuration(const std::string& dependency, const fs::path& file) const {
        const std::string relative = path_utils::relative_generic(file, context_.project_root);
        const auto it = context_.configs.find(relative);
        if (it == context_.configs.end()) {
            return false;
        }
        if (it->second.is_string()) {
            return string_utils::contains(it->second.get_ref<const std::string&>(), dependency);
        }
        return json_utils::contains_text(it->second, dependency);
    }

    bool UsageScanner::is_used_by_scripts(const std::string& dependency) const {
        return std::ranges::any_of(context_.scripts, [&](const auto& entry) {
            const auto tokens = string_utils::split_whitespace(entry.second);
            return std::ranges::find(tokens, std::string_view(dependency)) != tokens.end();
        });
    }

    bool UsageScanner::matches_content(const std::string& dependency, const fs::path& file) {
        const auto content = content_of(file);
        if (!content) {
            return false;
        }

        if (!passes_literal_precheck(dependency, *content)) {
            return false;
        }

        if (patterns::matches_dynamic_import(dependency, *content)) {
            return true;
        }

        if (const auto parsed = references_of(file); parsed && parsed->ok()) {
            const bool referenced = std::ranges::any_of(parsed->references, [&](const Reference& ref) {
                return matches_dependency(ref.source, dependency);
            });
            if (referenced) {
                return true;
            }
        }

        // Reached after a parse failure as well as after a parse without a match.
        if (patterns::raw_content_family(dependency).has_value()) {
            return patterns::matches_raw_content(dependency, *content);
        }
        return false;
    }

    std::shared_ptr<const std::string> UsageScanner::content_of(const fs::path& file) {
        const std::string key = file.generic_string();
        if (auto hit = caches_.files.get(key)) {
            return *hit;
        }

        std::shared_ptr<const std::string> content;
        if (auto text = file_utils::read_file(file); text.is_err()) {
            if (diagnostics_) {
                diagnostics_->report(text.error());
            }
        } else if (!file_utils::is_binary_content(text.value())) {
            content = std::make_shared<const std::string>(std::move(text).value());
        }

        caches_.files.put(key, content);
        return content;
    }

    std::shared_ptr<const cache::ParsedFile> UsageScanner::references_of(const fs::path& file) {
        const std::string key = file.generic_string();
        if (auto hit = caches_.references.get(key)) {
            return *hit;
        }

        const auto content = content_of(file);
        if (!content) {
            return nullptr;
        }

        auto parsed = std::make_shared<cache::ParsedFile>();
        if (auto refs = extract_references(*content, file); refs.is_ok()) {
            parsed->references = std::move(refs).value();
        } else {
            parsed->parse_error = refs.error();
            if (diagnostics_) {
                diagnostics_->report(refs.error());
            }
        }

        std::shared_ptr<const cache::ParsedFile> shared = std::move(parsed);
        caches_.references.put(key, shared);
        return shared;
    }

}  // namespace dsv::scanner
