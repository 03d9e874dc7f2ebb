//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_ANALYSIS_CACHES_HPP
#define DEPSIEVE_ANALYSIS_CACHES_HPP

/**
 * @file analysis_caches.hpp
 * @brief The set of caches owned by one analysis run.
 */

#include "dsv/cache/lru_cache.hpp"
#include "dsv/patterns/pattern_matcher.hpp"
#include "dsv/scanner/reference_extractor.hpp"
#include "dsv/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dsv::cache {

    /**
     * Outcome of parsing one file. Failures are cached too so a broken file
     * is parsed once per run.
     */
    struct ParsedFile {
        std::vector<scanner::Reference> references;
        std::optional<Error> parse_error;

        [[nodiscard]] bool ok() const noexcept { return !parse_error.has_value(); }
    };

    struct AnalysisCaches {
        explicit AnalysisCaches(const CacheSettings& settings = {})
            : usage(settings.usage_entries, settings.usage_ttl)
            , records(settings.record_entries, settings.record_ttl)
            , files(settings.file_entries, settings.file_ttl)
            , references(settings.reference_entries, settings.reference_ttl)
            , patterns(settings.pattern_entries, settings.pattern_ttl)
            , graphs(settings.graph_entries, settings.graph_ttl) {}

        /// (dependency, absolute file) -> used
        LruCache<bool> usage;
        /// (project root, dependency) -> finished record
        LruCache<DependencyRecord> records;
        /// absolute file -> content; nullptr for unreadable or binary files
        LruCache<std::shared_ptr<const std::string>> files;
        /// absolute file -> parsed references
        LruCache<std::shared_ptr<const ParsedFile>> references;
        patterns::PatternCache patterns;
        /// node_modules directory -> installed graph
        LruCache<std::shared_ptr<const DependencyGraph>> graphs;

        void clear_all() {
            usage.clear();
            records.clear();
            files.clear();
            references.clear();
            patterns.clear();
            graphs.clear();
        }

        [[nodiscard]] std::map<std::string, CacheStats> stats() const {
            return {
                {"usage", usage.stats()},
                {"records", records.stats()},
                {"files", files.stats()},
                {"references", references.stats()},
                {"patterns", patterns.stats()},
                {"graphs", graphs.stats()},
            };
        }
    };

}  // namespace dsv::cache

#endif //DEPSIEVE_ANALYSIS_CACHES_HPP
