//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_STRING_UTILS_HPP
#define DEPSIEVE_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers used across the scanner and the report.
 */

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace dsv::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits on a single character. Empty fields are kept.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> parts;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);
        while (end != std::string_view::npos) {
            parts.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }
        parts.push_back(s.substr(start));
        return parts;
    }

    /**
     * Splits on runs of whitespace. No empty tokens are produced.
     */
    inline std::vector<std::string_view> split_whitespace(std::string_view s) {
        std::vector<std::string_view> tokens;
        std::size_t i = 0;
        while (i < s.size()) {
            while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
                ++i;
            }
            const std::size_t start = i;
            while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) {
                ++i;
            }
            if (i > start) {
                tokens.push_back(s.substr(start, i - start));
            }
        }
        return tokens;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::string out;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                out += delimiter;
            }
            out += part;
            first = false;
        }
        return out;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string out(s);
        std::ranges::transform(out, out.begin(), [](const unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return out;
    }

    inline std::string replace_all(std::string_view s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return std::string(s);
        }
        std::string out;
        std::size_t pos = 0;
        std::size_t found;
        while ((found = s.find(from, pos)) != std::string_view::npos) {
            out.append(s.substr(pos, found - pos));
            out.append(to);
            pos = found + from.size();
        }
        out.append(s.substr(pos));
        return out;
    }

    /**
     * Orders package names ignoring a leading '@' and letter case, so that
     * "@babel/core" sorts next to "babel-loader". Ties fall back to the raw
     * names to keep the order total.
     */
    inline bool package_name_less(const std::string_view a, const std::string_view b) {
        const auto strip = [](std::string_view s) {
            return s.starts_with('@') ? s.substr(1) : s;
        };
        const std::string la = to_lower(strip(a));
        const std::string lb = to_lower(strip(b));
        if (la != lb) {
            return la < lb;
        }
        return a < b;
    }

    inline std::string format_bytes(const std::size_t bytes) {
        constexpr std::size_t KB = 1024;
        constexpr std::size_t MB = KB * 1024;
        constexpr std::size_t GB = MB * 1024;

        char buffer[32];
        if (bytes >= GB) {
            std::snprintf(buffer, sizeof(buffer), "%.2f GB", static_cast<double>(bytes) / GB);
        } else if (bytes >= MB) {
            std::snprintf(buffer, sizeof(buffer), "%.2f MB", static_cast<double>(bytes) / MB);
        } else if (bytes >= KB) {
            std::snprintf(buffer, sizeof(buffer), "%.2f KB", static_cast<double>(bytes) / KB);
        } else {
            std::snprintf(buffer, sizeof(buffer), "%zu B", bytes);
        }
        return buffer;
    }

}  // namespace dsv::string_utils

#endif //DEPSIEVE_STRING_UTILS_HPP
