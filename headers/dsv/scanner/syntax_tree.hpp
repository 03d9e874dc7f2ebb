//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_SYNTAX_TREE_HPP
#define DEPSIEVE_SYNTAX_TREE_HPP

/**
 * @file syntax_tree.hpp
 * @brief tree-sitter parse of a JavaScript or TypeScript source file.
 *
 * JavaScript files (including JSX) use the tree-sitter-javascript grammar,
 * `.ts`/`.mts`/`.cts` files the TypeScript grammar and `.tsx` files the TSX
 * grammar. A tree that contains an ERROR or MISSING node is rejected, so a
 * SyntaxTree is always a complete parse.
 */

#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <tree_sitter/api.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace dsv::scanner {

    enum class SourceDialect {
        JavaScript,     ///< ES2023 with JSX
        TypeScript,
        Tsx
    };

    inline const char* to_string(const SourceDialect dialect) noexcept {
        switch (dialect) {
            case SourceDialect::JavaScript: return "javascript";
            case SourceDialect::TypeScript: return "typescript";
            case SourceDialect::Tsx:        return "tsx";
        }
        return "javascript";
    }

    /**
     * Grammar for a file extension (with the leading dot). Unknown
     * extensions parse as JavaScript.
     */
    [[nodiscard]] SourceDialect dialect_for(std::string_view extension) noexcept;

    class SyntaxTree {
    public:
        /**
         * Parses @p content with the grammar for @p dialect. A leading UTF-8
         * byte order mark is skipped.
         *
         * @return ParseError naming the first line with a syntax error.
         */
        [[nodiscard]] static Result<SyntaxTree, Error> parse(std::string_view content, SourceDialect dialect);

        [[nodiscard]] TSNode root() const noexcept;

        /// Source text covered by @p node
        [[nodiscard]] std::string_view text(TSNode node) const noexcept;

        /// 1-based line on which @p node starts
        [[nodiscard]] static std::size_t line_of(TSNode node) noexcept;

        [[nodiscard]] SourceDialect dialect() const noexcept { return dialect_; }

    private:
        struct TreeDeleter {
            void operator()(TSTree* tree) const noexcept { ts_tree_delete(tree); }
        };

        SyntaxTree(std::string source, std::unique_ptr<TSTree, TreeDeleter> tree, SourceDialect dialect);

        std::string source_;
        std::unique_ptr<TSTree, TreeDeleter> tree_;
        SourceDialect dialect_;
    };

}  // namespace dsv::scanner

#endif //DEPSIEVE_SYNTAX_TREE_HPP
