//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_GLOB_HPP
#define DEPSIEVE_GLOB_HPP

/**
 * @file glob.hpp
 * @brief Gitignore-flavoured glob matching on '/'-separated relative paths.
 *
 * Supported syntax:
 * - `*` any run of characters except '/'
 * - `**` any run of characters including '/'
 * - `?` one character except '/'
 * - a leading '/' anchors the pattern at the root
 * - a trailing '/' is accepted and ignored
 *
 * A pattern without an inner '/' matches any single path component, so
 * "dist" excludes "dist/x.js" and "pkg/dist/y.js". A pattern with an inner
 * '/' matches the whole relative path or one of its directory prefixes.
 */

#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace dsv {

    /**
     * Translates glob syntax to an ECMAScript regex body (no anchors).
     */
    [[nodiscard]] std::string glob_to_regex(std::string_view glob);

    class GlobPattern {
    public:
        /**
         * Compiles @p pattern. Empty or comment patterns are rejected.
         */
        [[nodiscard]] static Result<GlobPattern, Error> compile(std::string_view pattern);

        /**
         * @param relative_path Path relative to the scan root, '/'-separated.
         */
        [[nodiscard]] bool matches(std::string_view relative_path) const;

        [[nodiscard]] const std::string& source() const noexcept { return source_; }

    private:
        GlobPattern(std::string source, std::regex rx, bool component_match)
            : source_(std::move(source))
            , regex_(std::move(rx))
            , component_match_(component_match) {}

        std::string source_;
        std::regex regex_;
        bool component_match_;
    };

    /**
     * A set of compiled patterns; a path is excluded if any one matches.
     */
    class GlobSet {
    public:
        /**
         * Adds a pattern. Invalid patterns are returned as an error and
         * leave the set unchanged.
         */
        Result<void, Error> add(std::string_view pattern);

        [[nodiscard]] bool matches(std::string_view relative_path) const;
        [[nodiscard]] bool empty() const noexcept { return patterns_.empty(); }
        [[nodiscard]] std::size_t size() const noexcept { return patterns_.size(); }

    private:
        std::vector<GlobPattern> patterns_;
    };

}  // namespace dsv

#endif //DEPSIEVE_GLOB_HPP
