//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_TYPES_HPP
#define DEPSIEVE_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures shared by the analysis modules.
 *
 * - Declared dependencies as read from the manifest
 * - DependencyRecord: the evidence gathered for one dependency
 * - ProjectContext: everything known about the project being analyzed
 * - AnalysisOptions: tuning knobs for a run
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace dsv {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    using Duration = std::chrono::nanoseconds;

    // ============================================================================
    // Declared Dependencies
    // ============================================================================

    /**
     * Manifest section a dependency was declared in.
     */
    enum class DependencyKind {
        Production,     // dependencies
        Development,    // devDependencies
        Peer,           // peerDependencies
        Optional        // optionalDependencies
    };

    inline const char* to_string(const DependencyKind kind) noexcept {
        switch (kind) {
            case DependencyKind::Production:  return "dependencies";
            case DependencyKind::Development: return "devDependencies";
            case DependencyKind::Peer:        return "peerDependencies";
            case DependencyKind::Optional:    return "optionalDependencies";
        }
        return "dependencies";
    }

    struct DeclaredDependency {
        std::string name;
        std::string version_range;
        DependencyKind kind = DependencyKind::Production;
    };

    // ============================================================================
    // Per-Dependency Evidence
    // ============================================================================

    /**
     * Lifecycle of one dependency inside a run.
     *
     * Pending -> ScanningFiles -> Used | UnusedCandidate. A dependency that
     * a framework or type-definition rule resolves skips ScanningFiles.
     */
    enum class DependencyState {
        Pending,
        ScanningFiles,
        Used,
        UnusedCandidate
    };

    inline const char* to_string(const DependencyState state) noexcept {
        switch (state) {
            case DependencyState::Pending:         return "pending";
            case DependencyState::ScanningFiles:   return "scanning";
            case DependencyState::Used:            return "used";
            case DependencyState::UnusedCandidate: return "unused";
        }
        return "pending";
    }

    /**
     * Evidence collected for a single declared dependency.
     *
     * A record with any file usage or any requiring package is never
     * reported unused.
     */
    struct DependencyRecord {
        std::string name;
        std::set<std::string> used_in_files;
        std::set<std::string> required_by_packages;
        bool has_sub_dependency_usage = false;
        DependencyState state = DependencyState::Pending;

        [[nodiscard]] bool is_used() const noexcept {
            return !used_in_files.empty() || !required_by_packages.empty();
        }
    };

    /**
     * Installed package name -> names it requires.
     */
    using DependencyGraph = std::map<std::string, std::set<std::string>>;

    // ============================================================================
    // Project Context
    // ============================================================================

    /**
     * The subset of tsconfig.json compilerOptions that affects @types usage.
     */
    struct TypeConfig {
        std::vector<std::string> types;
        std::vector<std::string> type_roots;
    };

    /**
     * Read-only view of the project under analysis.
     *
     * Built once per run by manifest::load_project_context(). Only
     * dependency_graph is filled in afterwards, by the graph builder.
     */
    struct ProjectContext {
        fs::path project_root;
        fs::path manifest_path;
        json manifest = json::object();
        std::vector<DeclaredDependency> declared;
        std::map<std::string, std::string> scripts;
        /// Relative path -> parsed value. Opaque configs are stored as a JSON string.
        std::map<std::string, json> configs;
        TypeConfig type_config;
        DependencyGraph dependency_graph;

        [[nodiscard]] bool declares(const std::string& name) const {
            for (const auto& dep : declared) {
                if (dep.name == name) {
                    return true;
                }
            }
            return false;
        }
    };

    /**
     * Workspace (monorepo) description from a root manifest.
     */
    struct WorkspaceInfo {
        fs::path root;                  ///< Path of the manifest declaring the workspaces
        std::vector<std::string> patterns;
        std::vector<fs::path> packages; ///< Expanded package directories
    };

    // ============================================================================
    // Options
    // ============================================================================

    struct CacheSettings {
        std::size_t usage_entries = 2000;
        std::chrono::seconds usage_ttl{300};
        std::size_t record_entries = 2000;
        std::chrono::seconds record_ttl{300};
        std::size_t file_entries = 500;
        std::chrono::seconds file_ttl{60};
        std::size_t reference_entries = 500;
        std::chrono::seconds reference_ttl{300};
        std::size_t pattern_entries = 500;
        std::chrono::seconds pattern_ttl{300};
        std::size_t graph_entries = 100;
        std::chrono::seconds graph_ttl{600};
    };

    struct PerformanceSettings {
        std::size_t jobs = 0;               ///< 0 means auto-detect
        std::size_t max_in_flight = 10;
        std::size_t min_batch_size = 20;
        std::size_t max_batch_size = 200;
        std::size_t bytes_per_batch_slot = 25ull * 1024 * 1024;
        std::size_t memory_threshold_bytes = 512ull * 1024 * 1024;
        std::chrono::seconds memory_cooldown{30};
        std::size_t fixed_batch_size = 0;   ///< Non-zero overrides adaptive sizing
    };

    struct AnalysisOptions {
        std::vector<std::string> ignore_patterns;
        std::vector<std::string> safe_dependencies;
        bool aggressive = false;
        bool use_gitignore = true;
        PerformanceSettings performance;
        CacheSettings cache;
    };

}  // namespace dsv

#endif //DEPSIEVE_TYPES_HPP
