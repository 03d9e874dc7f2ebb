//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_REFERENCE_EXTRACTOR_HPP
#define DEPSIEVE_REFERENCE_EXTRACTOR_HPP

/**
 * @file reference_extractor.hpp
 * @brief Module references found in a parsed source file.
 */

#include "dsv/scanner/syntax_tree.hpp"
#include "dsv/result.hpp"
#include "dsv/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dsv::scanner {

    enum class ReferenceKind {
        Import,                     ///< import x from 'm' / import 'm'
        TypeImport,                 ///< import type { T } from 'm'
        ExportFrom,                 ///< export { x } from 'm' / export * from 'm'
        Require,                    ///< require('m')
        RequireResolve,             ///< require.resolve('m')
        DynamicImport,              ///< import('m')
        ImportType,                 ///< typeof import('m') / x: import('m').T
        ExternalModuleReference,    ///< import x = require('m')
        ReferenceTypes              ///< /// <reference types="m" />
    };

    inline const char* to_string(const ReferenceKind kind) noexcept {
        switch (kind) {
            case ReferenceKind::Import:                  return "import";
            case ReferenceKind::TypeImport:              return "import-type";
            case ReferenceKind::ExportFrom:              return "export-from";
            case ReferenceKind::Require:                 return "require";
            case ReferenceKind::RequireResolve:          return "require-resolve";
            case ReferenceKind::DynamicImport:           return "dynamic-import";
            case ReferenceKind::ImportType:              return "import-type-expression";
            case ReferenceKind::ExternalModuleReference: return "import-equals";
            case ReferenceKind::ReferenceTypes:          return "reference-types";
        }
        return "import";
    }

    struct Reference {
        ReferenceKind kind = ReferenceKind::Import;
        std::string source;     ///< Module specifier as written
        std::size_t line = 0;
    };

    /**
     * Collects references from an already parsed file, in source order.
     * Only string literals (and templates without substitutions) count as
     * module specifiers.
     */
    [[nodiscard]] std::vector<Reference> collect_references(const SyntaxTree& tree);

    /**
     * Parses @p content with the grammar chosen from @p path's extension and
     * collects its references. Fails with ParseError, naming @p path, when
     * the file has a syntax error.
     */
    [[nodiscard]] Result<std::vector<Reference>, Error> extract_references(
        std::string_view content,
        const std::filesystem::path& path
    );

}  // namespace dsv::scanner

#endif //DEPSIEVE_REFERENCE_EXTRACTOR_HPP
