//
// Created by gregorian-rayne on 10/19/26.
//

#include <gtest/gtest.h>
#include "dsv/scanner/reference_extractor.hpp"

using namespace dsv;
using namespace dsv::scanner;

namespace {

    std::vector<Reference> refs(const std::string_view source, const std::string& file = "index.js") {
        auto result = extract_references(source, file);
        EXPECT_TRUE(result.is_ok()) << (result.is_err() ? result.error().to_string() : "");
        return result.is_ok() ? std::move(result).value() : std::vector<Reference>{};
    }

    void expect_single(const std::vector<Reference>& found, const ReferenceKind kind, const std::string& source) {
        ASSERT_EQ(found.size(), 1u);
        EXPECT_EQ(found[0].kind, kind) << to_string(found[0].kind);
        EXPECT_EQ(found[0].source, source);
    }

}  // namespace

TEST(ReferenceExtractorTest, StaticImports) {
    const auto found = refs(
        "import React from 'react';\n"
        "import './styles.css';\n"
        "import * as path from \"path\";\n"
        "import def, {\n  named,\n  other as alias\n} from 'multi-line';\n");
    ASSERT_EQ(found.size(), 4u);
    EXPECT_EQ(found[0].source, "react");
    EXPECT_EQ(found[1].source, "./styles.css");
    EXPECT_EQ(found[2].source, "path");
    EXPECT_EQ(found[3].source, "multi-line");
    EXPECT_EQ(found[3].line, 7u);
    for (const auto& ref : found) {
        EXPECT_EQ(ref.kind, ReferenceKind::Import);
    }
}

TEST(ReferenceExtractorTest, TypeOnlyImports) {
    expect_single(refs("import type { Props } from '@acme/types';", "a.ts"),
                  ReferenceKind::TypeImport, "@acme/types");
    expect_single(refs("import type from 'type-lib';"), ReferenceKind::Import, "type-lib");
}

TEST(ReferenceExtractorTest, ReExports) {
    const auto found = refs(
        "export * from './local';\n"
        "export { helper } from \"helper-lib\";\n"
        "export type { Shape } from 'shapes';\n"
        "export { internal };\n"
        "export const value = 1;\n", "mod.ts");
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].source, "./local");
    EXPECT_EQ(found[1].source, "helper-lib");
    EXPECT_EQ(found[2].source, "shapes");
    for (const auto& ref : found) {
        EXPECT_EQ(ref.kind, ReferenceKind::ExportFrom);
    }
}

TEST(ReferenceExtractorTest, RequireForms) {
    const auto found = refs(
        "const fs = require('fs');\n"
        "const pkg = require.resolve('lodash/package.json');\n"
        "const tpl = require(`template-lib`);\n"
        "loader.require('not-a-module');\n"
        "const dyn = require(`./${name}`);\n");
    ASSERT_EQ(found.size(), 3u);
    EXPECT_EQ(found[0].kind, ReferenceKind::Require);
    EXPECT_EQ(found[0].source, "fs");
    EXPECT_EQ(found[1].kind, ReferenceKind::RequireResolve);
    EXPECT_EQ(found[1].source, "lodash/package.json");
    EXPECT_EQ(found[2].source, "template-lib");
}

TEST(ReferenceExtractorTest, DynamicAndTypeImports) {
    expect_single(refs("const chart = await import('chart.js');"),
                  ReferenceKind::DynamicImport, "chart.js");
    expect_single(refs("let opts: import('config-types').Options;", "a.ts"),
                  ReferenceKind::ImportType, "config-types");
    expect_single(refs("type M = typeof import('runtime-lib');", "a.ts"),
                  ReferenceKind::ImportType, "runtime-lib");
}

TEST(ReferenceExtractorTest, ImportEqualsRequire) {
    expect_single(refs("import fs = require('fs-extra');", "a.ts"),
                  ReferenceKind::ExternalModuleReference, "fs-extra");
}

TEST(ReferenceExtractorTest, ReferenceTypesDirective) {
    expect_single(refs("/// <reference types=\"node\" />\nexport {};", "env.d.ts"),
                  ReferenceKind::ReferenceTypes, "node");
}

TEST(ReferenceExtractorTest, IgnoresNonReferences) {
    EXPECT_TRUE(refs("const url = import.meta.url;").empty());
    EXPECT_TRUE(refs("// require('commented')\n/* import 'also' */").empty());
    EXPECT_TRUE(refs("const s = \"require('inside-string')\";").empty());
    EXPECT_TRUE(refs("require(moduleName);").empty());
}

TEST(ReferenceExtractorTest, JsxFileReferences) {
    const auto found = refs(
        "import { Button } from '@ui/kit';\n"
        "export default () => <Button onClick={() => require('analytics')}>Go</Button>;\n",
        "App.jsx");
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].source, "@ui/kit");
    EXPECT_EQ(found[1].source, "analytics");
}

TEST(ReferenceExtractorTest, ParseFailureNamesTheFile) {
    const auto result = extract_references("import { broken from 'x'", "src/broken.js");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    ASSERT_TRUE(result.error().has_context());
    EXPECT_NE(result.error().context()->find("src/broken.js"), std::string::npos);
}

TEST(ReferenceExtractorTest, BalancedSyntaxErrorsAreParseFailures) {
    for (const std::string_view source : {
             "const _ = require('lodash');\nconst const x = 1;",
             "import _ from 'lodash';\nconst x = ;",
             "import _ from 'lodash';\nif (x) else {}",
         }) {
        const auto result = extract_references(source, "src/invalid.js");
        ASSERT_TRUE(result.is_err()) << source;
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }
}

TEST(ReferenceExtractorTest, TemplateSubstitutionsAreStillSearched) {
    expect_single(refs("const banner = `${require('chalk').bold('hi')}`;"),
                  ReferenceKind::Require, "chalk");
}

TEST(ReferenceExtractorTest, DirectivesAfterCodeAreIgnored) {
    EXPECT_TRUE(refs("export {};\n/// <reference types=\"node\" />\n", "late.d.ts").empty());
}
