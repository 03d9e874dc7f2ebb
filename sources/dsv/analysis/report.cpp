//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/analysis/report.hpp"
#include "dsv/analysis/protected_dependencies.hpp"

#include <algorithm>
#include <chrono>

namespace dsv::analysis {

    namespace {

        double to_ms(const Duration d) {
            return std::chrono::duration<double, std::milli>(d).count();
        }

        json stats_to_json(const RunStatistics& stats) {
            json j;
            j["files_scanned"] = stats.files_scanned;
            j["dependencies"] = stats.dependencies;
            j["installed_packages"] = stats.installed_packages;
            j["batch_size"] = stats.batch_size;
            j["batches"] = {
                {"count", stats.batches.batches},
                {"items", stats.batches.items},
                {"memory_pressure_events", stats.batches.pressure_events},
            };

            json caches = json::object();
            for (const auto& [name, c] : stats.caches) {
                caches[name] = {
                    {"hits", c.hits},
                    {"misses", c.misses},
                    {"evictions", c.evictions},
                    {"expirations", c.expirations},
                    {"size", c.size},
                    {"capacity", c.capacity},
                    {"hit_rate", c.hit_rate()},
                };
            }
            j["caches"] = std::move(caches);

            json phases = json::object();
            for (const auto& [name, timing] : stats.phases) {
                phases[name] = {
                    {"calls", timing.calls},
                    {"total_ms", to_ms(timing.total)},
                    {"max_ms", to_ms(timing.max)},
                };
            }
            j["phases"] = std::move(phases);
            j["analysis_ms"] = to_ms(stats.analysis_duration);
            return j;
        }

        json entries_with_reason(const std::vector<std::string>& names) {
            json arr = json::array();
            for (const auto& name : names) {
                json entry = {{"name", name}};
                if (const auto reason = protection_reason(name)) {
                    entry["reason"] = *reason;
                }
                arr.push_back(std::move(entry));
            }
            return arr;
        }

    }  // namespace

    UnusedPartition partition_unused(
        const std::vector<std::string>& closed_unused,
        const std::vector<std::string>& safe_dependencies,
        const bool aggressive
    ) {
        UnusedPartition partition;
        for (const auto& name : closed_unused) {
            if (std::ranges::find(safe_dependencies, name) != safe_dependencies.end()) {
                partition.safe_unused.push_back(name);
            } else if (!aggressive && is_protected(name)) {
                partition.protected_unused.push_back(name);
            } else {
                partition.unused.push_back(name);
            }
        }
        return partition;
    }

    json to_json(const DependencyRecord& record) {
        json j;
        j["name"] = record.name;
        j["state"] = to_string(record.state);
        j["used_in_files"] = record.used_in_files;
        j["required_by"] = record.required_by_packages;
        j["has_sub_dependency_usage"] = record.has_sub_dependency_usage;
        return j;
    }

    json to_json(const AnalysisReport& report, const bool include_stats) {
        json j;
        j["project_root"] = report.project_root.generic_string();
        j["manifest"] = report.manifest_path.generic_string();
        if (report.workspace_manifest.has_value()) {
            j["workspace_manifest"] = report.workspace_manifest->generic_string();
        }

        j["unused"] = report.unused;
        j["protected"] = entries_with_reason(report.protected_unused);
        j["safe"] = report.safe_unused;

        json deps = json::array();
        for (const auto& declared : report.declared) {
            const auto it = report.records.find(declared.name);
            if (it == report.records.end()) {
                continue;
            }
            json entry = to_json(it->second);
            entry["section"] = to_string(declared.kind);
            entry["version"] = declared.version_range;
            deps.push_back(std::move(entry));
        }
        j["dependencies"] = std::move(deps);

        json diagnostics = json::array();
        for (const auto& error : report.diagnostics) {
            diagnostics.push_back(error.to_string());
        }
        j["diagnostics"] = std::move(diagnostics);

        if (include_stats) {
            j["stats"] = stats_to_json(report.stats);
        }
        return j;
    }

}  // namespace dsv::analysis
