//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_FILE_UTILS_HPP
#define DEPSIEVE_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File reading and classification helpers.
 *
 * All operations report failures through Result<T, Error>.
 */

#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace dsv::file_utils {

    namespace fs = std::filesystem;

    /**
     * Number of leading bytes inspected by the binary heuristic.
     */
    inline constexpr std::size_t BINARY_PROBE_SIZE = 8000;

    /**
     * Reads an entire file into a string.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * Reads a file line by line. Trailing '\r' is stripped.
     */
    inline Result<std::vector<std::string>, Error> read_lines(const fs::path& path) {
        std::ifstream file(path);
        if (!file) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(std::move(line));
        }

        if (file.bad()) {
            return Result<std::vector<std::string>, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::vector<std::string>, Error>::success(std::move(lines));
    }

    /**
     * Heuristic binary detection over a content prefix.
     *
     * Binary when the prefix contains a NUL byte, or when more than 30% of
     * its bytes are control characters other than tab, CR, LF, FF and ESC.
     */
    inline bool is_binary_content(std::string_view content) noexcept {
        const std::string_view probe = content.substr(0, std::min(content.size(), BINARY_PROBE_SIZE));
        if (probe.empty()) {
            return false;
        }

        std::size_t suspicious = 0;
        for (const char ch : probe) {
            const auto c = static_cast<unsigned char>(ch);
            if (c == 0) {
                return true;
            }
            if (c < 0x20 && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != 0x1b) {
                ++suspicious;
            }
        }
        return suspicious * 10 > probe.size() * 3;
    }

    /**
     * Reads the first block of @p path and applies is_binary_content().
     */
    inline Result<bool, Error> is_binary_file(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<bool, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::array<char, BINARY_PROBE_SIZE> buffer{};
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (file.bad()) {
            return Result<bool, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        const auto count = static_cast<std::size_t>(file.gcount());
        return Result<bool, Error>::success(
            is_binary_content(std::string_view(buffer.data(), count))
        );
    }

    /**
     * ECMAScript-family source extensions understood by the scanner.
     */
    inline bool is_script_source(const fs::path& path) {
        const auto ext = path.extension().string();
        return ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs" ||
               ext == ".ts" || ext == ".tsx" || ext == ".mts" || ext == ".cts";
    }

    inline bool is_typescript_source(const fs::path& path) {
        const auto ext = path.extension().string();
        return ext == ".ts" || ext == ".tsx" || ext == ".mts" || ext == ".cts";
    }

}  // namespace dsv::file_utils

#endif //DEPSIEVE_FILE_UTILS_HPP
