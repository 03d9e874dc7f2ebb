//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/analysis/analysis_engine.hpp"
#include "dsv/analysis/closure.hpp"
#include "dsv/analysis/frameworks.hpp"
#include "dsv/analysis/type_packages.hpp"
#include "dsv/cache/batch_scheduler.hpp"
#include "dsv/graph/installed_packages.hpp"
#include "dsv/graph/package_graph.hpp"
#include "dsv/locator/source_locator.hpp"
#include "dsv/manifest/package_manifest.hpp"
#include "dsv/manifest/project_loader.hpp"
#include "dsv/manifest/workspace_resolver.hpp"
#include "dsv/patterns/pattern_matcher.hpp"
#include "dsv/scanner/import_matcher.hpp"
#include "dsv/scanner/usage_scanner.hpp"
#include "dsv/utils/path_utils.hpp"

#include <algorithm>
#include <chrono>

namespace dsv::analysis {

    // ============================================================================
    // Run
    // ============================================================================

    /**
     * State of one analyze() call. Holds the per-run project view and the
     * scanner; shares caches, pool and monitors with the analyzer.
     */
    class DependencyAnalyzer::Run {
    public:
        Run(
            cache::AnalysisCaches& caches,
            cache::BatchScheduler& scheduler,
            Diagnostics& diagnostics,
            ProjectContext& context,
            const std::vector<fs::path>& files
        )
            : caches_(caches)
            , scheduler_(scheduler)
            , diagnostics_(diagnostics)
            , context_(context)
            , files_(files)
            , typescript_files_(typescript_sources(files))
            , scanner_(context, caches, &diagnostics)
            , graph_(context.dependency_graph)
            , framework_(detect_framework(context.manifest)) {
            for (const auto& dep : context.declared) {
                top_level_.insert(dep.name);
            }
        }

        DependencyRecord analyze_dependency(const std::string& name) {
            const std::string key = cache::cache_key({context_.project_root.generic_string(), name});
            if (auto hit = caches_.records.get(key)) {
                return std::move(*hit);
            }

            DependencyRecord record;
            record.name = name;
            record.state = DependencyState::Pending;

            if (framework_ && name != framework_->core_package && framework_->is_tooling(name)) {
                record.required_by_packages.insert(framework_->core_package);
            } else if (scanner::is_types_package(name)) {
                analyze_types_package(record);
            } else {
                analyze_regular_package(record);
            }

            record.state = record.is_used() ? DependencyState::Used : DependencyState::UnusedCandidate;
            caches_.records.put(key, record);
            return record;
        }

        /**
         * Attributes unused packages to a used package of the same naming
         * family, e.g. `webpack-cli` to a used `webpack`.
         */
        void attribute_by_naming(std::map<std::string, DependencyRecord>& records) {
            std::vector<std::string> anchors;
            for (const auto& [name, record] : records) {
                if (!record.used_in_files.empty()) {
                    anchors.push_back(name);
                }
            }

            for (auto& [name, record] : records) {
                if (record.is_used()) {
                    continue;
                }
                for (const auto& anchor : anchors) {
                    auto family = patterns::cached_pattern_family(caches_.patterns, anchor);
                    if (family.is_err()) {
                        diagnostics_.report(family.error());
                        continue;
                    }
                    if (family.value()->matches(name)) {
                        record.required_by_packages.insert(anchor);
                    }
                }
                if (record.is_used()) {
                    record.state = DependencyState::Used;
                }
            }
        }

        [[nodiscard]] std::size_t installed_packages() const noexcept {
            return graph_.package_count();
        }

    private:
        void analyze_regular_package(DependencyRecord& record) {
            record.state = DependencyState::ScanningFiles;

            // Script usage does not depend on the file, so it is attributed
            // to the manifest instead of to every file.
            if (scanner_.is_used_by_scripts(record.name)) {
                record.used_in_files.insert(manifest::MANIFEST_FILENAME);
            } else {
                record.used_in_files = files_using(files_, [&](const fs::path& file) {
                    return scanner_.is_used_in_file(record.name, file);
                });
            }

            if (record.used_in_files.empty()) {
                for (const auto& sub : graph_.requirements(record.name)) {
                    if (any_file_uses(files_, sub)) {
                        record.has_sub_dependency_usage = true;
                        break;
                    }
                }
            }

            record.required_by_packages = graph::top_level_requirers(graph_, record.name, top_level_);
        }

        void analyze_types_package(DependencyRecord& record) {
            const std::string base = scanner::types_base_package(record.name);
            const bool has_typescript = !typescript_files_.empty();

            if (base == "node" && has_typescript) {
                record.required_by_packages.insert(TYPESCRIPT_PACKAGE);
                return;
            }

            record.state = DependencyState::ScanningFiles;

            if (top_level_.contains(base)) {
                record.required_by_packages.insert(base);
            } else if (graph_.has_package(base) && any_file_uses(files_, base)) {
                record.required_by_packages.insert(base);
            }

            record.used_in_files = files_using(typescript_files_, [&](const fs::path& file) {
                return scanner_.is_used_in_file(record.name, file) || scanner_.is_used_in_file(base, file);
            });

            if (has_typescript && tsconfig_mentions(context_.type_config, base)) {
                record.required_by_packages.insert(TYPESCRIPT_PACKAGE);
            }

            // Installed packages may declare the definitions as peers.
            if (!record.is_used()) {
                record.required_by_packages = graph::top_level_requirers(graph_, record.name, top_level_);
            }
        }

        template<typename Predicate>
        std::set<std::string> files_using(const std::vector<fs::path>& files, Predicate&& predicate) {
            const auto hits = scheduler_.map(files, std::forward<Predicate>(predicate));

            std::set<std::string> used;
            for (std::size_t i = 0; i < files.size(); ++i) {
                if (hits[i]) {
                    used.insert(path_utils::relative_generic(files[i], context_.project_root));
                }
            }
            return used;
        }

        bool any_file_uses(const std::vector<fs::path>& files, const std::string& dependency) {
            const auto hits = scheduler_.map(files, [&](const fs::path& file) {
                return scanner_.is_used_in_file(dependency, file);
            });
            return std::ranges::any_of(hits, [](const bool hit) { return hit; });
        }

        cache::AnalysisCaches& caches_;
        cache::BatchScheduler& scheduler_;
        Diagnostics& diagnostics_;
        ProjectContext& context_;
        const std::vector<fs::path>& files_;
        std::vector<fs::path> typescript_files_;
        scanner::UsageScanner scanner_;
        graph::PackageGraph graph_;
        std::set<std::string> top_level_;
        std::optional<FrameworkRule> framework_;
    };

    // ============================================================================
    // DependencyAnalyzer
    // ============================================================================

    DependencyAnalyzer::DependencyAnalyzer(AnalysisOptions options)
        : options_(std::move(options))
        , caches_(options_.cache)
        , memory_(std::make_unique<cache::MemoryMonitor>(
              options_.performance.memory_threshold_bytes,
              options_.performance.memory_cooldown))
        , pool_(std::make_unique<parallel::ThreadPool>(
              static_cast<unsigned int>(options_.performance.jobs))) {}

    void DependencyAnalyzer::set_memory_sampler(cache::MemoryMonitor::Sampler sampler) {
        memory_ = std::make_unique<cache::MemoryMonitor>(
            options_.performance.memory_threshold_bytes,
            options_.performance.memory_cooldown,
            std::move(sampler)
        );
    }

    Result<AnalysisReport, Error> DependencyAnalyzer::analyze(const fs::path& start_directory) {
        const auto started = std::chrono::steady_clock::now();
        performance_.clear();
        Diagnostics diagnostics;

        manifest::AnalysisRoot root;
        {
            cache::ScopedTimer timer(performance_, "resolve");
            auto resolved = manifest::resolve_analysis_root(start_directory);
            if (resolved.is_err()) {
                return Result<AnalysisReport, Error>::failure(resolved.error());
            }
            root = std::move(resolved).value();
        }

        std::vector<fs::path> files;
        {
            cache::ScopedTimer timer(performance_, "locate");
            locator::LocatorOptions locator_options;
            locator_options.ignore_patterns = options_.ignore_patterns;
            locator_options.use_gitignore = options_.use_gitignore;

            auto located = locator::find_source_files(root.root, locator_options, &diagnostics);
            if (located.is_err()) {
                return Result<AnalysisReport, Error>::failure(located.error());
            }
            files = std::move(located).value();
        }

        ProjectContext context;
        {
            cache::ScopedTimer timer(performance_, "context");
            auto loaded = manifest::load_project_context(root, files, &diagnostics);
            if (loaded.is_err()) {
                return Result<AnalysisReport, Error>::failure(loaded.error());
            }
            context = std::move(loaded).value();
        }

        {
            cache::ScopedTimer timer(performance_, "graph");
            const auto installed = graph::cached_installed_graph(
                caches_, context.project_root / "node_modules", &diagnostics
            );
            context.dependency_graph = *installed;
        }

        cache::BatchScheduler scheduler(options_.performance, *pool_, *memory_);
        scheduler.on_memory_pressure([this] {
            caches_.clear_all();
        });

        Run run(caches_, scheduler, diagnostics, context, files);

        AnalysisReport report;
        report.project_root = context.project_root;
        report.manifest_path = context.manifest_path;
        if (root.workspace.has_value()) {
            report.workspace_manifest = root.workspace->root;
        }
        report.declared = context.declared;

        {
            cache::ScopedTimer timer(performance_, "dependencies");
            for (const auto& dep : context.declared) {
                report.records[dep.name] = run.analyze_dependency(dep.name);
            }
            run.attribute_by_naming(report.records);
        }

        {
            cache::ScopedTimer timer(performance_, "closure");
            const auto closed = finalize_unused(initial_unused(report.records), report.records);
            auto [unused, protected_unused, safe_unused] =
                partition_unused(closed, options_.safe_dependencies, options_.aggressive);
            report.unused = std::move(unused);
            report.protected_unused = std::move(protected_unused);
            report.safe_unused = std::move(safe_unused);
        }

        report.stats.files_scanned = files.size();
        report.stats.dependencies = context.declared.size();
        report.stats.installed_packages = run.installed_packages();
        report.stats.batch_size = scheduler.batch_size();
        report.stats.batches = scheduler.stats();
        report.stats.caches = caches_.stats();
        report.stats.phases = performance_.snapshot();
        report.stats.analysis_duration =
            std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
        report.diagnostics = diagnostics.snapshot();

        return Result<AnalysisReport, Error>::success(std::move(report));
    }

    Result<AnalysisReport, Error> analyze_project(const fs::path& start_directory, const AnalysisOptions& options) {
        DependencyAnalyzer analyzer(options);
        return analyzer.analyze(start_directory);
    }

}  // namespace dsv::analysis
