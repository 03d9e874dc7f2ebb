//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_PATH_UTILS_HPP
#define DEPSIEVE_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Path normalization and containment helpers.
 */

#include <filesystem>
#include <string>

namespace dsv::path_utils {

    namespace fs = std::filesystem;

    /**
     * Lexically normalizes a path and makes it absolute, without touching
     * the file system beyond the current directory lookup.
     */
    inline fs::path normalize(const fs::path& path) {
        std::error_code ec;
        fs::path absolute = path.is_absolute() ? path : fs::absolute(path, ec);
        if (ec) {
            absolute = path;
        }
        fs::path result = absolute.lexically_normal();
        if (result.has_filename() || result == result.root_path()) {
            return result;
        }
        // "a/b/" normalizes to "a/b/" with an empty filename; drop the separator.
        return result.parent_path();
    }

    /**
     * Path of @p path relative to @p base using '/' separators.
     * Returns the generic form of @p path when it is not under @p base.
     */
    inline std::string relative_generic(const fs::path& path, const fs::path& base) {
        const fs::path rel = path.lexically_relative(base);
        if (rel.empty()) {
            return path.generic_string();
        }
        return rel.generic_string();
    }

    /**
     * True when @p path equals @p base or lies beneath it (lexical check).
     */
    inline bool is_within(const fs::path& path, const fs::path& base) {
        const fs::path p = normalize(path);
        const fs::path b = normalize(base);
        auto pi = p.begin();
        for (auto bi = b.begin(); bi != b.end(); ++bi, ++pi) {
            if (pi == p.end() || *pi != *bi) {
                return false;
            }
        }
        return true;
    }

    /**
     * Containment in either direction.
     */
    inline bool overlaps(const fs::path& a, const fs::path& b) {
        return is_within(a, b) || is_within(b, a);
    }

}  // namespace dsv::path_utils

#endif //DEPSIEVE_PATH_UTILS_HPP
