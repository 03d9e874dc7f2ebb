//
// Created by gregorian-rayne on 10/19/26.
//

#include "dsv/scanner/reference_extractor.hpp"

#include <cstdint>
#include <optional>
#include <regex>

namespace dsv::scanner {

    namespace {

        bool is_type(const TSNode node, const std::string_view type) {
            return !ts_node_is_null(node) && type == ts_node_type(node);
        }

        TSNode field(const TSNode node, const std::string_view name) {
            return ts_node_child_by_field_name(node, name.data(), static_cast<std::uint32_t>(name.size()));
        }

        /**
         * Body of a quoted literal with backslash escapes resolved. Module
         * specifiers never need more than single-character escapes.
         */
        std::string unquote(std::string_view quoted) {
            if (quoted.size() < 2) {
                return {};
            }
            quoted = quoted.substr(1, quoted.size() - 2);

            std::string out;
            out.reserve(quoted.size());
            for (std::size_t i = 0; i < quoted.size(); ++i) {
                if (quoted[i] != '\\' || i + 1 == quoted.size()) {
                    out += quoted[i];
                    continue;
                }
                switch (const char c = quoted[++i]) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case 'r': out += '\r'; break;
                    case '\n': break;
                    default: out += c; break;
                }
            }
            return out;
        }

        bool is_type_context(const std::string_view type) {
            return type == "type_annotation" || type == "type_query" || type == "type_alias_declaration"
                || type == "type_arguments" || type == "generic_type" || type == "lookup_type"
                || type == "nested_type_identifier" || type == "union_type" || type == "intersection_type"
                || type == "array_type" || type == "parenthesized_type";
        }

        bool ends_scope(const std::string_view type) {
            return type == "program" || type == "statement_block" || type == "method_definition"
                || type.ends_with("_statement") || type.ends_with("function")
                || type.ends_with("function_declaration");
        }

        /**
         * True when @p node sits in a type, as in `x: import('m').T` or
         * `typeof import('m')`.
         */
        bool in_type_position(const TSNode node) {
            for (TSNode p = ts_node_parent(node); !ts_node_is_null(p); p = ts_node_parent(p)) {
                const std::string_view type = ts_node_type(p);
                if (is_type_context(type)) {
                    return true;
                }
                if (ends_scope(type)) {
                    return false;
                }
            }
            return false;
        }

        // /// <reference types="m" />
        const std::regex& reference_types_directive() {
            static const std::regex rx(
                R"(^///\s*<reference\s+types\s*=\s*["']([^"']+)["'][^>]*/?>)",
                std::regex::ECMAScript
            );
            return rx;
        }

        class Collector {
        public:
            explicit Collector(const SyntaxTree& tree)
                : tree_(tree) {}

            std::vector<Reference> run() {
                const TSNode root = tree_.root();
                leading_directives(root);

                // Pre-order walk; document order keeps references sorted by position.
                TSTreeCursor cursor = ts_tree_cursor_new(root);
                bool done = false;
                while (!done) {
                    if (visit(ts_tree_cursor_current_node(&cursor)) && ts_tree_cursor_goto_first_child(&cursor)) {
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
                return std::move(refs_);
            }

        private:
            /**
             * Literal value of a specifier node: a string, or a template
             * without substitutions.
             */
            [[nodiscard]] std::optional<std::string> literal(const TSNode node) const {
                if (is_type(node, "string")) {
                    return unquote(tree_.text(node));
                }
                if (is_type(node, "template_string")) {
                    const std::uint32_t count = ts_node_named_child_count(node);
                    for (std::uint32_t i = 0; i < count; ++i) {
                        if (is_type(ts_node_named_child(node, i), "template_substitution")) {
                            return std::nullopt;
                        }
                    }
                    return unquote(tree_.text(node));
                }
                return std::nullopt;
            }

            void add(const ReferenceKind kind, const TSNode specifier) {
                if (auto value = literal(specifier)) {
                    refs_.push_back(Reference{kind, std::move(*value), SyntaxTree::line_of(specifier)});
                }
            }

            /// First argument of a call, skipping comments
            [[nodiscard]] static TSNode first_argument(const TSNode call) {
                const TSNode args = field(call, "arguments");
                if (ts_node_is_null(args)) {
                    return args;
                }
                const std::uint32_t count = ts_node_named_child_count(args);
                for (std::uint32_t i = 0; i < count; ++i) {
                    if (const TSNode arg = ts_node_named_child(args, i); !is_type(arg, "comment")) {
                        return arg;
                    }
                }
                return TSNode{};
            }

            [[nodiscard]] static TSNode first_string(const TSNode node) {
                if (is_type(node, "string")) {
                    return node;
                }
                const std::uint32_t count = ts_node_named_child_count(node);
                for (std::uint32_t i = 0; i < count; ++i) {
                    if (const TSNode found = first_string(ts_node_named_child(node, i)); !ts_node_is_null(found)) {
                        return found;
                    }
                }
                return TSNode{};
            }

            [[nodiscard]] static bool has_keyword(const TSNode node, const std::string_view keyword) {
                const std::uint32_t count = ts_node_child_count(node);
                for (std::uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_child(node, i);
                    if (!ts_node_is_named(child) && keyword == ts_node_type(child)) {
                        return true;
                    }
                }
                return false;
            }

            /**
             * Triple-slash directives only count before the first statement.
             */
            void leading_directives(const TSNode root) {
                const std::uint32_t count = ts_node_named_child_count(root);
                for (std::uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(root, i);
                    if (is_type(child, "hash_bang_line")) {
                        continue;
                    }
                    if (!is_type(child, "comment")) {
                        break;
                    }
                    const std::string text(tree_.text(child));
                    if (std::smatch m; std::regex_search(text, m, reference_types_directive())) {
                        refs_.push_back(Reference{ReferenceKind::ReferenceTypes, m[1].str(), SyntaxTree::line_of(child)});
                    }
                }
            }

            void on_call(const TSNode call) {
                const TSNode callee = field(call, "function");
                if (ts_node_is_null(callee)) {
                    return;
                }
                const std::string_view type = ts_node_type(callee);

                if (type == "import") {
                    add(in_type_position(call) ? ReferenceKind::ImportType : ReferenceKind::DynamicImport,
                        first_argument(call));
                } else if (type == "identifier" && tree_.text(callee) == "require") {
                    add(ReferenceKind::Require, first_argument(call));
                } else if (type == "member_expression") {
                    const TSNode object = field(callee, "object");
                    const TSNode property = field(callee, "property");
                    if (is_type(object, "identifier") && tree_.text(object) == "require"
                        && !ts_node_is_null(property) && tree_.text(property) == "resolve") {
                        add(ReferenceKind::RequireResolve, first_argument(call));
                    }
                }
            }

            /**
             * Records the reference @p node makes, if any.
             *
             * @return Whether the walk should enter @p node's children.
             */
            bool visit(const TSNode node) {
                const std::string_view type = ts_node_type(node);

                if (type == "import_statement") {
                    if (const TSNode source = field(node, "source"); !ts_node_is_null(source)) {
                        const bool type_only = has_keyword(node, "type") || has_keyword(node, "typeof");
                        add(type_only ? ReferenceKind::TypeImport : ReferenceKind::Import, source);
                    }
                } else if (type == "export_statement") {
                    if (const TSNode source = field(node, "source"); !ts_node_is_null(source)) {
                        add(ReferenceKind::ExportFrom, source);
                    }
                } else if (type == "import_require_clause") {
                    const TSNode source = field(node, "source");
                    add(ReferenceKind::ExternalModuleReference, ts_node_is_null(source) ? first_string(node) : source);
                    return false;
                } else if (type == "import_type") {
                    add(ReferenceKind::ImportType, first_string(node));
                    return false;
                } else if (type == "call_expression") {
                    on_call(node);
                } else if (type == "comment" || type == "string") {
                    return false;
                }
                return true;
            }

            const SyntaxTree& tree_;
            std::vector<Reference> refs_;
        };

    }  // namespace

    std::vector<Reference> collect_references(const SyntaxTree& tree) {
        Collector collector(tree);
        return collector.run();
    }

    Result<std::vector<Reference>, Error> extract_references(
        const std::string_view content,
        const std::filesystem::path& path
    ) {
        auto tree = SyntaxTree::parse(content, dialect_for(path.extension().string()));
        if (tree.is_err()) {
            return Result<std::vector<Reference>, Error>::failure(
                tree.error().with_context(path.string())
            );
        }
        return Result<std::vector<Reference>, Error>::success(collect_references(tree.value()));
    }

}  // namespace dsv::scanner
