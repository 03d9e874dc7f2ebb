//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/scanner/syntax_tree.hpp"

#include <string>

using namespace dsv;
using namespace dsv::scanner;

TEST(SyntaxTreeTest, DialectFollowsExtension) {
    EXPECT_EQ(dialect_for(".js"), SourceDialect::JavaScript);
    EXPECT_EQ(dialect_for(".jsx"), SourceDialect::JavaScript);
    EXPECT_EQ(dialect_for(".mjs"), SourceDialect::JavaScript);
    EXPECT_EQ(dialect_for(".ts"), SourceDialect::TypeScript);
    EXPECT_EQ(dialect_for(".cts"), SourceDialect::TypeScript);
    EXPECT_EQ(dialect_for(".tsx"), SourceDialect::Tsx);
    EXPECT_EQ(dialect_for(".vue"), SourceDialect::JavaScript);
}

TEST(SyntaxTreeTest, ParsesModernSyntax) {
    const std::string source =
        "#!/usr/bin/env node\n"
        "@sealed class Store { #count = 0; static items = []; }\n"
        "export * as helpers from './helpers';\n"
        "const here = import.meta.url;\n"
        "const lazy = () => import('./lazy');\n"
        "const view = <div className=\"x\">{here}</div>;\n";
    const auto tree = SyntaxTree::parse(source, SourceDialect::JavaScript);
    ASSERT_TRUE(tree.is_ok()) << tree.error().to_string();
    EXPECT_STREQ(ts_node_type(tree.value().root()), "program");
}

TEST(SyntaxTreeTest, TypeScriptNeedsItsGrammar) {
    const std::string source = "interface Props { size?: number }\nconst p = <Props>{};\n";
    EXPECT_TRUE(SyntaxTree::parse(source, SourceDialect::TypeScript).is_ok());
    EXPECT_TRUE(SyntaxTree::parse(source, SourceDialect::JavaScript).is_err());
}

TEST(SyntaxTreeTest, TsxAcceptsTypedComponents) {
    const auto tree = SyntaxTree::parse(
        "type P = { label: string };\nexport const B = (p: P) => <button>{p.label}</button>;\n",
        SourceDialect::Tsx);
    EXPECT_TRUE(tree.is_ok());
}

TEST(SyntaxTreeTest, ErrorNamesTheLine) {
    const auto tree = SyntaxTree::parse("const a = 1;\nconst b = 2;\nconst const c = 3;\n", SourceDialect::JavaScript);
    ASSERT_TRUE(tree.is_err());
    EXPECT_EQ(tree.error().code(), ErrorCode::ParseError);
    EXPECT_NE(tree.error().message().find("line 3"), std::string::npos) << tree.error().message();
}

TEST(SyntaxTreeTest, MissingTokenIsAnError) {
    EXPECT_TRUE(SyntaxTree::parse("const _ = require('lodash'\n", SourceDialect::JavaScript).is_err());
}

TEST(SyntaxTreeTest, ByteOrderMarkIsSkipped) {
    const auto tree = SyntaxTree::parse("\xEF\xBB\xBFimport x from 'x';\n", SourceDialect::JavaScript);
    ASSERT_TRUE(tree.is_ok());
    const TSNode first = ts_node_named_child(tree.value().root(), 0);
    EXPECT_EQ(tree.value().text(first), "import x from 'x';");
    EXPECT_EQ(SyntaxTree::line_of(first), 1u);
}

TEST(SyntaxTreeTest, FunctionExpressionCannotStartAStatement) {
    EXPECT_TRUE(SyntaxTree::parse("function () {}\n", SourceDialect::JavaScript).is_err());
    EXPECT_TRUE(SyntaxTree::parse("class {}\n", SourceDialect::JavaScript).is_err());
    EXPECT_TRUE(SyntaxTree::parse("(function () {})();\n", SourceDialect::JavaScript).is_ok());
    EXPECT_TRUE(SyntaxTree::parse("function named() {}\n", SourceDialect::JavaScript).is_ok());
    EXPECT_TRUE(SyntaxTree::parse("export default function () {}\n", SourceDialect::JavaScript).is_ok());
}
