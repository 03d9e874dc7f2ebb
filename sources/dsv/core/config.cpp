//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/core/config.hpp"
#include "dsv/utils/file_utils.hpp"
#include "dsv/utils/string_utils.hpp"

#include <toml++/toml.h>
#include <sstream>

namespace dsv::core {

    namespace {

        void read_strings(const toml::node_view<toml::node> node, std::vector<std::string>& out) {
            if (!node || !node.is_array()) {
                return;
            }
            out.clear();
            for (auto& item : *node.as_array()) {
                if (auto s = item.value<std::string>()) {
                    out.push_back(std::move(*s));
                }
            }
        }

        void read_int(const toml::node_view<toml::node> node, std::int64_t& out) {
            if (node) {
                out = node.value_or(out);
            }
        }

        std::string quoted_list(const std::vector<std::string>& values) {
            std::ostringstream ss;
            ss << "[";
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0) ss << ", ";
                ss << "\"" << values[i] << "\"";
            }
            ss << "]";
            return ss.str();
        }

    }  // namespace

    Result<Config> Config::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config>::failure(
                Error::not_found("Configuration file not found", path.string())
            );
        }

        auto config = load_from_string(content.value());
        if (config.is_err()) {
            return Result<Config>::failure(config.error().with_context(path.string()));
        }
        return config;
    }

    Result<Config> Config::load_from_string(const std::string& content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            if (auto* scan_table = tbl["scan"].as_table()) {
                auto& scan = *scan_table;
                read_strings(scan["ignore"], config.scan.ignore);
                read_strings(scan["safe"], config.scan.safe);
                if (scan["aggressive"])
                    config.scan.aggressive = scan["aggressive"].value_or(false);
                if (scan["gitignore"])
                    config.scan.use_gitignore = scan["gitignore"].value_or(true);
            }

            if (auto* perf_table = tbl["performance"].as_table()) {
                auto& perf = *perf_table;
                read_int(perf["jobs"], config.performance.jobs);
                read_int(perf["max_in_flight"], config.performance.max_in_flight);
                read_int(perf["min_batch_size"], config.performance.min_batch_size);
                read_int(perf["max_batch_size"], config.performance.max_batch_size);
                read_int(perf["memory_threshold_mb"], config.performance.memory_threshold_mb);
                read_int(perf["memory_cooldown_s"], config.performance.memory_cooldown_s);
            }

            if (auto* cache_table = tbl["cache"].as_table()) {
                auto& cache = *cache_table;
                read_int(cache["usage_entries"], config.cache.usage_entries);
                read_int(cache["usage_ttl_s"], config.cache.usage_ttl_s);
                read_int(cache["file_entries"], config.cache.file_entries);
                read_int(cache["file_ttl_s"], config.cache.file_ttl_s);
            }

            if (auto validation = config.validate(); validation.is_err()) {
                return Result<Config>::failure(validation.error());
            }

            return Result<Config>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description()))
            );
        }
    }

    std::optional<fs::path> Config::find_in(const fs::path& directory) {
        const fs::path candidate = directory / CONFIG_FILENAME;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
        return std::nullopt;
    }

    Result<void> Config::validate() const {
        std::vector<std::string> errors;

        if (performance.jobs < 0) {
            errors.emplace_back("jobs must be non-negative");
        }
        if (performance.max_in_flight <= 0) {
            errors.emplace_back("max_in_flight must be positive");
        }
        if (performance.min_batch_size <= 0) {
            errors.emplace_back("min_batch_size must be positive");
        }
        if (performance.max_batch_size < performance.min_batch_size) {
            errors.emplace_back("max_batch_size must not be below min_batch_size");
        }
        if (performance.memory_threshold_mb <= 0) {
            errors.emplace_back("memory_threshold_mb must be positive");
        }
        if (performance.memory_cooldown_s < 0) {
            errors.emplace_back("memory_cooldown_s must be non-negative");
        }
        if (cache.usage_entries <= 0 || cache.file_entries <= 0) {
            errors.emplace_back("cache entry limits must be positive");
        }
        if (cache.usage_ttl_s < 0 || cache.file_ttl_s < 0) {
            errors.emplace_back("cache TTLs must be non-negative");
        }

        if (!errors.empty()) {
            return Result<void>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  "))
            );
        }

        return Result<void>::success();
    }

    void Config::apply_to(AnalysisOptions& options) const {
        options.ignore_patterns = scan.ignore;
        options.safe_dependencies = scan.safe;
        options.aggressive = scan.aggressive;
        options.use_gitignore = scan.use_gitignore;

        auto& perf = options.performance;
        perf.jobs = static_cast<std::size_t>(performance.jobs);
        perf.max_in_flight = static_cast<std::size_t>(performance.max_in_flight);
        perf.min_batch_size = static_cast<std::size_t>(performance.min_batch_size);
        perf.max_batch_size = static_cast<std::size_t>(performance.max_batch_size);
        perf.memory_threshold_bytes = static_cast<std::size_t>(performance.memory_threshold_mb) * 1024 * 1024;
        perf.memory_cooldown = std::chrono::seconds(performance.memory_cooldown_s);

        options.cache.usage_entries = static_cast<std::size_t>(cache.usage_entries);
        options.cache.usage_ttl = std::chrono::seconds(cache.usage_ttl_s);
        options.cache.file_entries = static_cast<std::size_t>(cache.file_entries);
        options.cache.file_ttl = std::chrono::seconds(cache.file_ttl_s);
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[scan]\n";
        ss << "ignore = " << quoted_list(scan.ignore) << "\n";
        ss << "safe = " << quoted_list(scan.safe) << "\n";
        ss << "aggressive = " << (scan.aggressive ? "true" : "false") << "\n";
        ss << "gitignore = " << (scan.use_gitignore ? "true" : "false") << "\n\n";

        ss << "[performance]\n";
        ss << "jobs = " << performance.jobs << "\n";
        ss << "max_in_flight = " << performance.max_in_flight << "\n";
        ss << "min_batch_size = " << performance.min_batch_size << "\n";
        ss << "max_batch_size = " << performance.max_batch_size << "\n";
        ss << "memory_threshold_mb = " << performance.memory_threshold_mb << "\n";
        ss << "memory_cooldown_s = " << performance.memory_cooldown_s << "\n\n";

        ss << "[cache]\n";
        ss << "usage_entries = " << cache.usage_entries << "\n";
        ss << "usage_ttl_s = " << cache.usage_ttl_s << "\n";
        ss << "file_entries = " << cache.file_entries << "\n";
        ss << "file_ttl_s = " << cache.file_ttl_s << "\n";

        return ss.str();
    }

}  // namespace dsv::core
