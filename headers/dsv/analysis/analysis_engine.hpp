//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_ANALYSIS_ENGINE_HPP
#define DEPSIEVE_ANALYSIS_ENGINE_HPP

/**
 * @file analysis_engine.hpp
 * @brief Orchestrates a complete unused-dependency analysis.
 *
 * Pipeline of analyze():
 *
 *   1. Resolve the analysis root (nearest manifest, or the workspace root
 *      that owns it).
 *   2. Locate candidate files.
 *   3. Load the project context (manifest, scripts, configs, tsconfig).
 *   4. Read the installed package graph from node_modules.
 *   5. Build one DependencyRecord per declared dependency.
 *   6. Attribute leftover tool packages to used packages of the same
 *      naming family.
 *   7. Close the unused set over the requirement relation.
 *   8. Split the result into removable, protected and safe-listed names.
 *
 * Only a missing manifest (or an unusable root directory) fails the run.
 * Everything else is recorded in the report's diagnostics.
 *
 * The caches live as long as the analyzer, so analyzing the same project
 * again is mostly cache hits.
 */

#include "dsv/analysis/report.hpp"
#include "dsv/cache/analysis_caches.hpp"
#include "dsv/cache/memory_monitor.hpp"
#include "dsv/cache/performance_monitor.hpp"
#include "dsv/diagnostics.hpp"
#include "dsv/result.hpp"
#include "dsv/error.hpp"
#include "dsv/types.hpp"
#include "dsv/utils/parallel.hpp"

#include <memory>

namespace dsv::analysis {

    class DependencyAnalyzer {
    public:
        explicit DependencyAnalyzer(AnalysisOptions options = {});

        DependencyAnalyzer(const DependencyAnalyzer&) = delete;
        DependencyAnalyzer& operator=(const DependencyAnalyzer&) = delete;

        /**
         * Analyzes the project containing @p start_directory.
         *
         * @return NotFound when no package.json exists at or above
         *         @p start_directory.
         */
        [[nodiscard]] Result<AnalysisReport, Error> analyze(const fs::path& start_directory);

        [[nodiscard]] const AnalysisOptions& options() const noexcept { return options_; }

        [[nodiscard]] cache::AnalysisCaches& caches() noexcept { return caches_; }

        /**
         * Replaces the resident-size sampler used for memory pressure checks.
         */
        void set_memory_sampler(cache::MemoryMonitor::Sampler sampler);

    private:
        class Run;

        AnalysisOptions options_;
        cache::AnalysisCaches caches_;
        cache::PerformanceMonitor performance_;
        std::unique_ptr<cache::MemoryMonitor> memory_;
        std::unique_ptr<parallel::ThreadPool> pool_;
    };

    /**
     * Convenience wrapper: one analyzer, one run.
     */
    [[nodiscard]] Result<AnalysisReport, Error> analyze_project(
        const fs::path& start_directory,
        const AnalysisOptions& options = {}
    );

}  // namespace dsv::analysis

#endif //DEPSIEVE_ANALYSIS_ENGINE_HPP
