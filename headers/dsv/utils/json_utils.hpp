//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_JSON_UTILS_HPP
#define DEPSIEVE_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief nlohmann/json helpers for manifests and configuration files.
 */

#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dsv::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses a JSON document.
     *
     * @param content Text to parse.
     * @param allow_comments Accept // and block comments (tsconfig style).
     */
    inline Result<json, Error> parse(std::string_view content, const bool allow_comments = false) {
        try {
            return Result<json, Error>::success(
                json::parse(content.begin(), content.end(), nullptr, true, allow_comments)
            );
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    inline Result<json, Error> read_file(const fs::path& path, const bool allow_comments = false) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<json, Error>::failure(
                Error::not_found("JSON file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<json, Error>::failure(
                Error::io_error("Failed to open JSON file", path.string())
            );
        }

        try {
            return Result<json, Error>::success(
                json::parse(file, nullptr, true, allow_comments)
            );
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", path.string() + ": " + e.what())
            );
        }
    }

    template<typename T>
    T get_or(const json& obj, const std::string& key, const T& default_value) {
        if (!obj.is_object()) {
            return default_value;
        }
        if (const auto it = obj.find(key); it != obj.end()) {
            try {
                return it->template get<T>();
            } catch (const json::type_error&) {
                return default_value;
            }
        }
        return default_value;
    }

    /**
     * Collects the string-valued members of obj[key].
     *
     * A missing or non-object section yields an empty map; non-string
     * values map to an empty string.
     */
    inline std::map<std::string, std::string> string_members(const json& obj, const std::string& key) {
        std::map<std::string, std::string> out;
        if (!obj.is_object()) {
            return out;
        }
        const auto it = obj.find(key);
        if (it == obj.end() || !it->is_object()) {
            return out;
        }
        for (const auto& [name, value] : it->items()) {
            out.emplace(name, value.is_string() ? value.get<std::string>() : std::string{});
        }
        return out;
    }

    /**
     * Collects obj[key] as a list of strings. Non-string entries are skipped.
     */
    inline std::vector<std::string> string_array(const json& obj, const std::string& key) {
        std::vector<std::string> out;
        if (!obj.is_object()) {
            return out;
        }
        const auto it = obj.find(key);
        if (it == obj.end() || !it->is_array()) {
            return out;
        }
        for (const auto& value : *it) {
            if (value.is_string()) {
                out.push_back(value.get<std::string>());
            }
        }
        return out;
    }

    /**
     * True when any string value reachable from @p value (object values,
     * array elements, or the value itself) contains @p needle.
     */
    inline bool contains_text(const json& value, const std::string_view needle) {
        if (value.is_string()) {
            return value.get_ref<const std::string&>().find(needle) != std::string::npos;
        }
        if (value.is_object() || value.is_array()) {
            for (const auto& child : value) {
                if (contains_text(child, needle)) {
                    return true;
                }
            }
        }
        return false;
    }

}  // namespace dsv::json_utils

#endif //DEPSIEVE_JSON_UTILS_HPP
