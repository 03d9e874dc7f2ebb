//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/analysis/protected_dependencies.hpp"

namespace dsv::analysis {

    namespace {

        /**
         * '*' matches any run of characters, everything else is literal.
         */
        bool wildcard_match(const std::string_view pattern, const std::string_view text) {
            std::size_t p = 0;
            std::size_t t = 0;
            std::size_t star = std::string_view::npos;
            std::size_t resume = 0;

            while (t < text.size()) {
                if (p < pattern.size() && pattern[p] == '*') {
                    star = p++;
                    resume = t;
                } else if (p < pattern.size() && pattern[p] == text[t]) {
                    ++p;
                    ++t;
                } else if (star != std::string_view::npos) {
                    p = star + 1;
                    t = ++resume;
                } else {
                    return false;
                }
            }
            while (p < pattern.size() && pattern[p] == '*') {
                ++p;
            }
            return p == pattern.size();
        }

        std::string_view scope_of(const std::string_view name) {
            return name.substr(0, name.find('/'));
        }

        bool entry_matches(const std::string_view entry, const std::string_view dependency) {
            if (entry == dependency) {
                return true;
            }
            if (entry.find('*') != std::string_view::npos) {
                return wildcard_match(entry, dependency);
            }
            return false;
        }

    }  // namespace

    const std::vector<ProtectedCategory>& protected_catalogue() {
        static const std::vector<ProtectedCategory> catalogue = {
            {"core runtime", {
                "node", "npm", "yarn", "pnpm", "npx", "nvm", "nodemon", "ts-node", "tsx",
                "esbuild", "swc",
            }},
            {"build tools", {
                "typescript", "webpack", "vite", "rollup", "esbuild", "swc", "babel",
                "@babel/core", "@babel/cli", "@babel/preset-env", "@babel/preset-typescript",
                "@babel/preset-react", "tsc", "tsc-alias",
            }},
            {"framework core", {
                "react", "react-dom", "vue", "@vue/runtime-core", "@angular/core",
                "@angular/common", "@angular/platform-browser", "next", "nuxt", "svelte",
                "solid-js", "preact", "inferno",
            }},
            {"testing", {
                "jest", "vitest", "mocha", "chai", "sinon", "cypress", "playwright",
                "@testing-library/react", "@testing-library/vue", "@testing-library/jest-dom",
                "enzyme", "karma", "ava", "tap",
            }},
            {"code quality", {
                "eslint", "@eslint/js", "prettier", "stylelint", "husky", "lint-staged",
                "commitlint", "semantic-release", "conventional-changelog", "standard", "xo",
            }},
            {"dev server", {
                "webpack-dev-server", "vite", "rollup-plugin-serve", "live-server",
                "browser-sync", "concurrently", "cross-env", "dotenv", "dotenv-expand",
            }},
            {"package management", {
                "webpack-cli", "webpack-merge", "webpack-bundle-analyzer", "vite-plugin-*",
                "rollup-plugin-*", "esbuild-plugin-*", "parcel-bundler", "metro", "fusebox",
            }},
            {"type definitions", {
                "@types/node", "@types/react", "@types/react-dom", "@types/vue",
                "@types/angular", "@types/jest", "@types/mocha", "@types/chai",
                "@types/sinon", "@types/cypress",
            }},
            {"configuration", {
                "tsconfig-paths", "tsconfig-paths-webpack-plugin", "dotenv-webpack",
                "webpack-define-plugin", "vite-plugin-env", "rollup-plugin-replace",
                "esbuild-define",
            }},
            {"styling", {
                "css-loader", "style-loader", "sass-loader", "less-loader", "postcss-loader",
                "autoprefixer", "tailwindcss", "styled-components", "emotion", "linaria",
            }},
            {"asset handling", {
                "file-loader", "url-loader", "raw-loader", "html-webpack-plugin",
                "copy-webpack-plugin", "vite-plugin-static-copy", "rollup-plugin-copy",
            }},
            {"dev utilities", {
                "rimraf", "del", "glob", "chalk", "ora", "cli-progress", "commander",
                "yargs", "inquirer", "enquirer",
            }},
            {"security", {
                "helmet", "cors", "express-rate-limit", "express-validator", "joi", "yup",
                "zod", "ajv", "json-schema",
            }},
            {"database", {
                "mongoose", "sequelize", "prisma", "typeorm", "knex", "bookshelf",
                "objection", "drizzle-orm",
            }},
            {"http api", {
                "express", "koa", "fastify", "hapi", "axios", "fetch", "node-fetch", "got",
                "request", "superagent",
            }},
            {"state management", {
                "redux", "mobx", "zustand", "recoil", "jotai", "valtio", "pinia", "vuex",
                "ngrx", "akita",
            }},
            {"routing", {
                "react-router", "vue-router", "@angular/router", "next/router",
                "nuxt/router", "svelte-routing", "solid-router",
            }},
            {"i18n", {
                "react-i18next", "vue-i18n", "ngx-translate", "next-i18next", "nuxt-i18n",
                "i18next", "intl",
            }},
        };
        return catalogue;
    }

    bool is_protected(const std::string_view dependency) {
        if (dependency.empty()) {
            return false;
        }

        for (const auto& category : protected_catalogue()) {
            for (const auto& entry : category.entries) {
                if (entry_matches(entry, dependency)) {
                    return true;
                }
                if (entry.starts_with('@') && dependency.starts_with('@') &&
                    scope_of(entry) == scope_of(dependency)) {
                    return true;
                }
            }
        }
        return false;
    }

    std::optional<std::string> protection_reason(const std::string_view dependency) {
        for (const auto& category : protected_catalogue()) {
            for (const auto& entry : category.entries) {
                if (entry_matches(entry, dependency)) {
                    return category.name;
                }
            }
        }
        return std::nullopt;
    }

}  // namespace dsv::analysis
