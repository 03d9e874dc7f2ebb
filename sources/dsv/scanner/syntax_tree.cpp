//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/scanner/syntax_tree.hpp"

#include <tree_sitter/tree-sitter-javascript.h>
#include <tree_sitter/tree-sitter-typescript.h>
#include <tree_sitter/tree-sitter-tsx.h>

#include <cstdint>
#include <limits>
#include <optional>

namespace dsv::scanner {

    namespace {

        constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

        struct ParserDeleter {
            void operator()(TSParser* parser) const noexcept { ts_parser_delete(parser); }
        };

        const TSLanguage* language_for(const SourceDialect dialect) {
            switch (dialect) {
                case SourceDialect::TypeScript: return tree_sitter_typescript();
                case SourceDialect::Tsx:        return tree_sitter_tsx();
                case SourceDialect::JavaScript: break;
            }
            return tree_sitter_javascript();
        }

        /**
         * First ERROR or MISSING node in document order. Only subtrees that
         * report an error are entered.
         */
        TSNode first_error(const TSNode root) {
            TSNode node = root;
            for (;;) {
                if (ts_node_is_error(node) || ts_node_is_missing(node)) {
                    return node;
                }
                bool descended = false;
                const std::uint32_t count = ts_node_child_count(node);
                for (std::uint32_t i = 0; i < count; ++i) {
                    if (const TSNode child = ts_node_child(node, i); ts_node_has_error(child)) {
                        node = child;
                        descended = true;
                        break;
                    }
                }
                if (!descended) {
                    return node;
                }
            }
        }

        bool is_declaration_like(const std::string_view type) {
            return type == "function_expression" || type == "function" || type == "generator_function"
                || type == "class";
        }

        /**
         * An expression statement may not begin with `function`, `async
         * function` or `class`. The grammars accept these as expressions, so
         * the leftmost chain of every expression statement is checked.
         */
        std::optional<TSNode> anonymous_declaration(const TSNode root) {
            TSTreeCursor cursor = ts_tree_cursor_new(root);
            std::optional<TSNode> found;
            bool done = false;
            while (!done && !found) {
                const TSNode node = ts_tree_cursor_current_node(&cursor);
                if (std::string_view(ts_node_type(node)) == "expression_statement") {
                    for (TSNode left = ts_node_child(node, 0); !ts_node_is_null(left); left = ts_node_child(left, 0)) {
                        if (ts_node_is_named(left) && is_declaration_like(ts_node_type(left))) {
                            found = left;
                            break;
                        }
                    }
                }
                if (ts_tree_cursor_goto_first_child(&cursor)) {
                    continue;
                }
                while (!ts_tree_cursor_goto_next_sibling(&cursor)) {
                    if (!ts_tree_cursor_goto_parent(&cursor)) {
                        done = true;
                        break;
                    }
                }
            }
            ts_tree_cursor_delete(&cursor);
            return found;
        }

    }  // namespace

    SourceDialect dialect_for(const std::string_view extension) noexcept {
        if (extension == ".ts" || extension == ".mts" || extension == ".cts") {
            return SourceDialect::TypeScript;
        }
        if (extension == ".tsx") {
            return SourceDialect::Tsx;
        }
        return SourceDialect::JavaScript;
    }

    SyntaxTree::SyntaxTree(std::string source, std::unique_ptr<TSTree, TreeDeleter> tree, const SourceDialect dialect)
        : source_(std::move(source))
        , tree_(std::move(tree))
        , dialect_(dialect) {}

    Result<SyntaxTree, Error> SyntaxTree::parse(std::string_view content, const SourceDialect dialect) {
        if (content.starts_with(kByteOrderMark)) {
            content.remove_prefix(kByteOrderMark.size());
        }
        if (content.size() > std::numeric_limits<std::uint32_t>::max()) {
            return Result<SyntaxTree, Error>::failure(
                Error::parse_error("File too large to parse")
            );
        }

        const std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
        if (!parser || !ts_parser_set_language(parser.get(), language_for(dialect))) {
            return Result<SyntaxTree, Error>::failure(
                Error::internal_error("Incompatible tree-sitter grammar", to_string(dialect))
            );
        }

        std::string source(content);
        std::unique_ptr<TSTree, TreeDeleter> tree(ts_parser_parse_string(
            parser.get(), nullptr, source.data(), static_cast<std::uint32_t>(source.size())
        ));
        if (!tree) {
            return Result<SyntaxTree, Error>::failure(
                Error::parse_error("Parser produced no tree", to_string(dialect))
            );
        }

        if (const TSNode root = ts_tree_root_node(tree.get()); ts_node_has_error(root)) {
            const TSNode bad = first_error(root);
            const char* what = ts_node_is_missing(bad) ? "Missing token" : "Syntax error";
            return Result<SyntaxTree, Error>::failure(
                Error::parse_error(
                    std::string(what) + " at line " + std::to_string(line_of(bad)),
                    to_string(dialect)
                )
            );
        }

        if (const auto bad = anonymous_declaration(ts_tree_root_node(tree.get()))) {
            return Result<SyntaxTree, Error>::failure(
                Error::parse_error(
                    "Function or class expression used as a statement at line " + std::to_string(line_of(*bad)),
                    to_string(dialect)
                )
            );
        }

        return Result<SyntaxTree, Error>::success(SyntaxTree(std::move(source), std::move(tree), dialect));
    }

    TSNode SyntaxTree::root() const noexcept {
        return ts_tree_root_node(tree_.get());
    }

    std::string_view SyntaxTree::text(const TSNode node) const noexcept {
        const std::uint32_t start = ts_node_start_byte(node);
        const std::uint32_t end = ts_node_end_byte(node);
        if (start >= end || end > source_.size()) {
            return {};
        }
        return std::string_view(source_).substr(start, end - start);
    }

    std::size_t SyntaxTree::line_of(const TSNode node) noexcept {
        return static_cast<std::size_t>(ts_node_start_point(node).row) + 1;
    }

}  // namespace dsv::scanner
