//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_REPORT_HPP
#define DEPSIEVE_REPORT_HPP

/**
 * @file report.hpp
 * @brief Outcome of an analysis run and its JSON rendering.
 */

#include "dsv/cache/batch_scheduler.hpp"
#include "dsv/cache/lru_cache.hpp"
#include "dsv/cache/performance_monitor.hpp"
#include "dsv/error.hpp"
#include "dsv/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dsv::analysis {

    struct RunStatistics {
        std::size_t files_scanned = 0;
        std::size_t dependencies = 0;
        std::size_t installed_packages = 0;
        std::size_t batch_size = 0;
        cache::BatchStats batches;
        std::map<std::string, cache::CacheStats> caches;
        std::map<std::string, cache::PhaseTiming> phases;
        Duration analysis_duration = Duration::zero();
    };

    struct AnalysisReport {
        fs::path project_root;
        fs::path manifest_path;
        std::optional<fs::path> workspace_manifest;     ///< Set when a workspace root was adopted

        std::vector<DeclaredDependency> declared;
        std::map<std::string, DependencyRecord> records;

        /// Removal candidates after the closure, safe and protected filtering
        std::vector<std::string> unused;
        /// Unused but protected; only listed in `unused` in aggressive mode
        std::vector<std::string> protected_unused;
        /// Unused but safe-listed by the user
        std::vector<std::string> safe_unused;

        RunStatistics stats;
        std::vector<Error> diagnostics;

        [[nodiscard]] bool has_findings() const noexcept {
            return !unused.empty() || !protected_unused.empty() || !safe_unused.empty();
        }
    };

    struct UnusedPartition {
        std::vector<std::string> unused;
        std::vector<std::string> protected_unused;
        std::vector<std::string> safe_unused;
    };

    /**
     * Splits the closed unused set. Safe-listed names always go to
     * safe_unused; protected names go to protected_unused unless
     * @p aggressive. Input order is kept.
     */
    [[nodiscard]] UnusedPartition partition_unused(
        const std::vector<std::string>& closed_unused,
        const std::vector<std::string>& safe_dependencies,
        bool aggressive
    );

    [[nodiscard]] json to_json(const DependencyRecord& record);

    /**
     * @param include_stats Adds cache, batch and timing statistics.
     */
    [[nodiscard]] json to_json(const AnalysisReport& report, bool include_stats = false);

}  // namespace dsv::analysis

#endif //DEPSIEVE_REPORT_HPP
