//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_PATTERN_MATCHER_HPP
#define DEPSIEVE_PATTERN_MATCHER_HPP

/**
 * @file pattern_matcher.hpp
 * @brief Regular-expression families derived from a package name.
 *
 * A family describes the names that commonly travel together with a
 * package: scoped variants (`@types/x`), configuration and plugin packages
 * (`x-config`, `x-plugin`), tool splits (`x-cli`, `core-x`) and framework
 * bindings (`x-react`, `x-loader`). The family is a pure function of the
 * name, so it is cached per name for the lifetime of a run.
 */

#include "dsv/cache/lru_cache.hpp"
#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace dsv::patterns {

    enum class PatternKind {
        Exact,
        ScopedPrefix,
        Suffix,
        Combined,
        Framework
    };

    inline const char* to_string(const PatternKind kind) noexcept {
        switch (kind) {
            case PatternKind::Exact:        return "exact";
            case PatternKind::ScopedPrefix: return "prefix";
            case PatternKind::Suffix:       return "suffix";
            case PatternKind::Combined:     return "combined";
            case PatternKind::Framework:    return "framework";
        }
        return "exact";
    }

    struct CompiledPattern {
        PatternKind kind = PatternKind::Exact;
        std::string source;     ///< ECMAScript source, kept for diagnostics and tests
        std::regex regex;
    };

    class PatternFamily {
    public:
        PatternFamily(std::string dependency, std::vector<CompiledPattern> patterns)
            : dependency_(std::move(dependency))
            , patterns_(std::move(patterns)) {}

        [[nodiscard]] const std::string& dependency() const noexcept { return dependency_; }
        [[nodiscard]] const std::vector<CompiledPattern>& patterns() const noexcept { return patterns_; }

        /**
         * True when @p candidate matches any pattern of the family in full.
         */
        [[nodiscard]] bool matches(std::string_view candidate) const;

    private:
        std::string dependency_;
        std::vector<CompiledPattern> patterns_;
    };

    using PatternCache = cache::LruCache<std::shared_ptr<const PatternFamily>>;

    /**
     * Escapes ECMAScript regex metacharacters.
     */
    [[nodiscard]] std::string escape_regex(std::string_view text);

    /**
     * Escapes @p name and lets '/', '@' and '-' stand in for one another.
     */
    [[nodiscard]] std::string separator_tolerant(std::string_view name);

    /**
     * Builds the pattern family of @p dependency.
     */
    [[nodiscard]] Result<PatternFamily, Error> generate_pattern_family(const std::string& dependency);

    /**
     * Cached generate_pattern_family(). Errors are not cached.
     */
    [[nodiscard]] Result<std::shared_ptr<const PatternFamily>, Error> cached_pattern_family(
        PatternCache& cache,
        const std::string& dependency
    );

    // ============================================================================
    // Raw Content Fallback
    // ============================================================================

    /**
     * Name of the tool family whose packages are often referenced only as
     * plain words in configuration code, or nullopt.
     *
     * A name qualifies when it starts with the family base and matches one
     * of the family globs (`webpack-*`, `webpack.*`, `babel.*`, `eslint.*`,
     * `jest.*`, ...). Bare tool names such as `webpack` or `jest` do not
     * qualify.
     */
    [[nodiscard]] std::optional<std::string> raw_content_family(std::string_view dependency);

    /**
     * Case-insensitive, word-bounded search for @p dependency in @p content
     * with '/', '@' and '-' interchangeable.
     */
    [[nodiscard]] bool matches_raw_content(const std::string& dependency, std::string_view content);

    /**
     * Detects `import('dep')` (any quote, any spacing, case-insensitive,
     * '/', '@' and '-' interchangeable) anywhere in @p content.
     */
    [[nodiscard]] bool matches_dynamic_import(const std::string& dependency, std::string_view content);

}  // namespace dsv::patterns

#endif //DEPSIEVE_PATTERN_MATCHER_HPP
