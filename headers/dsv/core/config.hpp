//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_CONFIG_HPP
#define DEPSIEVE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief The optional `.depsieve.toml` project configuration.
 *
 * @code
 *     [scan]
 *     ignore = ["dist/**", "storybook/**"]
 *     safe = ["husky"]
 *     aggressive = false
 *     gitignore = true
 *
 *     [performance]
 *     jobs = 8
 *     max_in_flight = 10
 *     min_batch_size = 20
 *     max_batch_size = 200
 *     memory_threshold_mb = 512
 *     memory_cooldown_s = 30
 *
 *     [cache]
 *     usage_entries = 2000
 *     usage_ttl_s = 300
 *     file_entries = 500
 *     file_ttl_s = 60
 * @endcode
 *
 * Missing keys keep the AnalysisOptions defaults. Command line flags are
 * applied after the file and win.
 */

#include "dsv/result.hpp"
#include "dsv/error.hpp"
#include "dsv/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dsv::core {

    inline constexpr const char* CONFIG_FILENAME = ".depsieve.toml";

    struct ScanConfig {
        std::vector<std::string> ignore;
        std::vector<std::string> safe;
        bool aggressive = false;
        bool use_gitignore = true;
    };

    struct PerformanceConfig {
        std::int64_t jobs = 0;
        std::int64_t max_in_flight = 10;
        std::int64_t min_batch_size = 20;
        std::int64_t max_batch_size = 200;
        std::int64_t memory_threshold_mb = 512;
        std::int64_t memory_cooldown_s = 30;
    };

    struct CacheConfig {
        std::int64_t usage_entries = 2000;
        std::int64_t usage_ttl_s = 300;
        std::int64_t file_entries = 500;
        std::int64_t file_ttl_s = 60;
    };

    class Config {
    public:
        Config() = default;

        ScanConfig scan;
        PerformanceConfig performance;
        CacheConfig cache;

        /**
         * Load configuration from a file.
         *
         * @param path Path of a `.depsieve.toml` file.
         * @return The parsed config, NotFound if the file is missing, or
         *         ConfigError when it does not parse or validate.
         */
        static Result<Config> load_from_file(const fs::path& path);

        /**
         * Load configuration from TOML text.
         */
        static Result<Config> load_from_string(const std::string& content);

        /**
         * `.depsieve.toml` in @p directory, if present.
         */
        static std::optional<fs::path> find_in(const fs::path& directory);

        [[nodiscard]] Result<void> validate() const;

        /**
         * Copies every setting into @p options.
         */
        void apply_to(AnalysisOptions& options) const;

        /**
         * Serialize back to TOML.
         */
        [[nodiscard]] std::string to_string() const;
    };

}  // namespace dsv::core

#endif //DEPSIEVE_CONFIG_HPP
