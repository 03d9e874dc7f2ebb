//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/utils/glob.hpp"
#include "dsv/utils/string_utils.hpp"

#include <cctype>

namespace dsv {

    std::string glob_to_regex(const std::string_view glob) {
        std::string rx;
        rx.reserve(glob.size() * 2);

        for (std::size_t i = 0; i < glob.size(); ++i) {
            const char c = glob[i];
            switch (c) {
            case '*':
                if (i + 1 < glob.size() && glob[i + 1] == '*') {
                    ++i;
                    if (i + 1 < glob.size() && glob[i + 1] == '/') {
                        ++i;
                        rx += "(?:.*/)?";
                    } else {
                        rx += ".*";
                    }
                } else {
                    rx += "[^/]*";
                }
                break;
            case '?':
                rx += "[^/]";
                break;
            case '/':
                rx += "/";
                break;
            default:
                if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
                    rx += c;
                } else {
                    rx += "\\";
                    rx += c;
                }
            }
        }
        return rx;
    }

    Result<GlobPattern, Error> GlobPattern::compile(const std::string_view pattern) {
        std::string_view body = string_utils::trim(pattern);
        if (body.empty() || body.starts_with('#') || body.starts_with('!')) {
            return Result<GlobPattern, Error>::failure(
                Error::invalid_argument("Unsupported ignore pattern", std::string(pattern))
            );
        }

        while (body.size() > 1 && body.ends_with('/')) {
            body.remove_suffix(1);
        }

        bool anchored = false;
        if (body.starts_with('/')) {
            anchored = true;
            body.remove_prefix(1);
        }
        if (body.starts_with("./")) {
            anchored = true;
            body.remove_prefix(2);
        }
        if (body.empty()) {
            return Result<GlobPattern, Error>::failure(
                Error::invalid_argument("Empty ignore pattern", std::string(pattern))
            );
        }

        const bool component_match = !anchored && body.find('/') == std::string_view::npos;
        std::string rx = "^" + glob_to_regex(body);
        rx += component_match ? "$" : "(?:/.*)?$";

        try {
            return Result<GlobPattern, Error>::success(
                GlobPattern(std::string(pattern), std::regex(rx, std::regex::ECMAScript), component_match)
            );
        } catch (const std::regex_error& e) {
            return Result<GlobPattern, Error>::failure(
                Error::parse_error("Invalid ignore pattern", std::string(pattern) + ": " + e.what())
            );
        }
    }

    bool GlobPattern::matches(const std::string_view relative_path) const {
        if (!component_match_) {
            return std::regex_match(relative_path.begin(), relative_path.end(), regex_);
        }
        for (const auto component : string_utils::split(relative_path, '/')) {
            if (!component.empty() && std::regex_match(component.begin(), component.end(), regex_)) {
                return true;
            }
        }
        return false;
    }

    Result<void, Error> GlobSet::add(const std::string_view pattern) {
        auto compiled = GlobPattern::compile(pattern);
        if (compiled.is_err()) {
            return Result<void, Error>::failure(compiled.error());
        }
        patterns_.push_back(std::move(compiled).value());
        return Result<void, Error>::success();
    }

    bool GlobSet::matches(const std::string_view relative_path) const {
        for (const auto& pattern : patterns_) {
            if (pattern.matches(relative_path)) {
                return true;
            }
        }
        return false;
    }

}  // namespace dsv
