//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_USAGE_SCANNER_HPP
#define DEPSIEVE_USAGE_SCANNER_HPP

/**
 * @file usage_scanner.hpp
 * @brief Per-file dependency usage detection.
 *
 * The scanner answers one question: does this file reference this
 * dependency? Cheap checks run first (manifest text, parsed configuration,
 * script tokens, a literal pre-check) before the file is parsed. Files
 * that fail to parse, and files whose references do not match, fall back
 * to a word-bounded regex for tool families that are commonly named only in
 * configuration code.
 *
 * Every answer, file content and parse result is cached in the run's
 * AnalysisCaches. Read and parse failures are reported to Diagnostics and
 * count as "not used".
 */

#include "dsv/cache/analysis_caches.hpp"
#include "dsv/diagnostics.hpp"
#include "dsv/types.hpp"

#include <memory>
#include <string>

namespace dsv::scanner {

    class UsageScanner {
    public:
        UsageScanner(const ProjectContext& context, cache::AnalysisCaches& caches, Diagnostics* diagnostics = nullptr);

        /**
         * True when @p file (absolute) references @p dependency.
         * Never throws; errors degrade to false.
         */
        [[nodiscard]] bool is_used_in_file(const std::string& dependency, const fs::path& file);

        /**
         * True when some manifest script has @p dependency as a
         * whitespace-delimited token.
         */
        [[nodiscard]] bool is_used_by_scripts(const std::string& dependency) const;

        /**
         * Cached file text. nullptr for unreadable or binary files.
         */
        [[nodiscard]] std::shared_ptr<const std::string> content_of(const fs::path& file);

        /**
         * Cached references of @p file. nullptr when the file has no content.
         */
        [[nodiscard]] std::shared_ptr<const cache::ParsedFile> references_of(const fs::path& file);

        [[nodiscard]] const ProjectContext& context() const noexcept { return context_; }

    private:
        bool scan(const std::string& dependency, const fs::path& file);
        bool matches_configuration(const std::string& dependency, const fs::path& file) const;
        bool matches_content(const std::string& dependency, const fs::path& file);

        const ProjectContext& context_;
        cache::AnalysisCaches& caches_;
        Diagnostics* diagnostics_;
    };

}  // namespace dsv::scanner

#endif //DEPSIEVE_USAGE_SCANNER_HPP
