//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/patterns/pattern_matcher.hpp"
#include "dsv/utils/glob.hpp"

#include <algorithm>
#include <cctype>

namespace dsv::patterns {

    namespace {

        struct PatternSource {
            PatternKind kind;
            std::string source;
            bool icase = false;
        };

        struct SuffixGroup {
            std::vector<std::string> suffixes;
        };

        const std::vector<std::string>& scoped_prefixes() {
            static const std::vector<std::string> prefixes = {
                "@",
                "@types/",
                "@storybook/",
                "@testing-library/",
            };
            return prefixes;
        }

        const std::vector<SuffixGroup>& suffix_groups() {
            static const std::vector<SuffixGroup> groups = {
                {{"config", "rc", "settings", "configuration", "setup", "options"}},
                {{"plugin", "plugins", "extension", "extensions", "addon", "addons"}},
                {{"preset", "presets", "recommended", "standard", "defaults"}},
            };
            return groups;
        }

        const std::vector<std::string>& tool_parts() {
            static const std::vector<std::string> parts = {
                "cli", "core", "utils", "tools", "helper", "helpers",
            };
            return parts;
        }

        /**
         * A family applies to a name that starts with `base` and matches
         * one of the globs.
         */
        struct RawFamily {
            const char* name;
            std::string base;
            std::vector<std::regex> globs;
        };

        RawFamily raw_family(const char* name, std::string base, const std::vector<std::string_view>& globs) {
            RawFamily family{name, std::move(base), {}};
            for (const auto glob : globs) {
                family.globs.emplace_back(glob_to_regex(glob), std::regex::ECMAScript);
            }
            return family;
        }

        const std::vector<RawFamily>& raw_families() {
            static const std::vector<RawFamily> families = {
                raw_family("webpack", "webpack", {"webpack.*", "webpack-*"}),
                raw_family("babel", "babel", {"babel.*", "@babel/*"}),
                raw_family("eslint", "eslint", {"eslint.*", "@eslint/*"}),
                raw_family("jest", "jest", {"jest.*", "@jest/*"}),
                raw_family("typescript", "typescript", {"ts-*", "@typescript-*"}),
                raw_family("bundler", "bundler",
                    {"rollup.*", "rollup-*", "esbuild.*", "@esbuild/*", "vite.*", "@vitejs/*"}),
            };
            return families;
        }

        bool is_word_char(const char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        std::regex make_regex(const std::string& source, const bool icase = false) {
            auto flags = std::regex::ECMAScript;
            if (icase) {
                flags |= std::regex::icase;
            }
            return std::regex(source, flags);
        }

    }  // namespace

    bool PatternFamily::matches(const std::string_view candidate) const {
        return std::ranges::any_of(patterns_, [&](const CompiledPattern& p) {
            return std::regex_match(candidate.begin(), candidate.end(), p.regex);
        });
    }

    std::string escape_regex(const std::string_view text) {
        static constexpr std::string_view metachars = R"($()*+.?[\]^{|})";
        std::string out;
        out.reserve(text.size() * 2);
        for (const char c : text) {
            if (metachars.find(c) != std::string_view::npos) {
                out += '\\';
            }
            out += c;
        }
        return out;
    }

    std::string separator_tolerant(const std::string_view name) {
        std::string out;
        out.reserve(name.size() * 3);
        for (const char c : name) {
            if (c == '/' || c == '@' || c == '-') {
                out += "[/@-]";
            } else {
                out += escape_regex(std::string_view(&c, 1));
            }
        }
        return out;
    }

    Result<PatternFamily, Error> generate_pattern_family(const std::string& dependency) {
        if (dependency.empty()) {
            return Result<PatternFamily, Error>::failure(
                Error::invalid_argument("Empty dependency name")
            );
        }

        const std::string dep = escape_regex(dependency);
        std::vector<PatternSource> sources;

        sources.push_back({PatternKind::Exact, "^" + dep + "$"});

        for (const auto& prefix : scoped_prefixes()) {
            sources.push_back({PatternKind::ScopedPrefix, "^" + escape_regex(prefix) + dep + "(/.*)?$"});
        }

        for (const auto& group : suffix_groups()) {
            for (const auto& suffix : group.suffixes) {
                sources.push_back({PatternKind::Suffix, "^" + dep + "[-./]" + suffix + "$"});
                sources.push_back({PatternKind::Suffix, "^" + dep + "[-./]" + suffix + "s$"});
            }
        }

        for (const auto& part : tool_parts()) {
            sources.push_back({PatternKind::Combined, "^" + dep + "[-./]" + part + "$"});
            sources.push_back({PatternKind::Combined, "^" + part + "[-./]" + dep + "$"});
        }

        sources.push_back({PatternKind::Framework,
            "^" + dep + "[/-](react|vue|svelte|angular|node)$", true});
        sources.push_back({PatternKind::Framework,
            "^" + dep + "[/-](loader|parser|transformer|formatter|linter|compiler)s?$", true});

        std::vector<CompiledPattern> compiled;
        compiled.reserve(sources.size());
        try {
            for (auto& src : sources) {
                std::regex rx = make_regex(src.source, src.icase);
                compiled.push_back(CompiledPattern{src.kind, std::move(src.source), std::move(rx)});
            }
        } catch (const std::regex_error& e) {
            return Result<PatternFamily, Error>::failure(
                Error::internal_error("Failed to compile dependency pattern", dependency + ": " + e.what())
            );
        }

        return Result<PatternFamily, Error>::success(PatternFamily(dependency, std::move(compiled)));
    }

    Result<std::shared_ptr<const PatternFamily>, Error> cached_pattern_family(
        PatternCache& cache,
        const std::string& dependency
    ) {
        using R = Result<std::shared_ptr<const PatternFamily>, Error>;

        if (auto hit = cache.get(dependency)) {
            return R::success(std::move(*hit));
        }

        auto family = generate_pattern_family(dependency);
        if (family.is_err()) {
            return R::failure(family.error());
        }

        auto shared = std::make_shared<const PatternFamily>(std::move(family).value());
        cache.put(dependency, shared);
        return R::success(std::move(shared));
    }

    std::optional<std::string> raw_content_family(const std::string_view dependency) {
        for (const auto& family : raw_families()) {
            if (!dependency.starts_with(family.base)) {
                continue;
            }
            const bool listed = std::ranges::any_of(family.globs, [&](const std::regex& rx) {
                return std::regex_match(dependency.begin(), dependency.end(), rx);
            });
            if (listed) {
                return std::string(family.name);
            }
        }
        return std::nullopt;
    }

    bool matches_raw_content(const std::string& dependency, const std::string_view content) {
        if (dependency.empty()) {
            return false;
        }

        std::string source;
        if (is_word_char(dependency.front())) {
            source += "\\b";
        }
        source += separator_tolerant(dependency);
        if (is_word_char(dependency.back())) {
            source += "\\b";
        }

        try {
            const std::regex rx = make_regex(source, true);
            return std::regex_search(content.begin(), content.end(), rx);
        } catch (const std::regex_error&) {
            return false;
        }
    }

    bool matches_dynamic_import(const std::string& dependency, const std::string_view content) {
        if (dependency.empty()) {
            return false;
        }

        const std::string source =
            R"(import\s*\(\s*['"])" + separator_tolerant(dependency) + R"(['"]\s*\))";

        try {
            const std::regex rx = make_regex(source, true);
            return std::regex_search(content.begin(), content.end(), rx);
        } catch (const std::regex_error&) {
            return false;
        }
    }

}  // namespace dsv::patterns
