#ifndef RKG_FRONTEND_TYPESCRIPT_FRONTEND_HPP
#define RKG_FRONTEND_TYPESCRIPT_FRONTEND_HPP

/**
 * @file typescript_frontend.hpp
 * @brief tree-sitter based front end for TypeScript and JavaScript.
 *
 * .ts files use the TypeScript grammar, .tsx/.js/.jsx the TSX grammar.
 * Each parse() call owns its own TSParser, so concurrent calls are safe.
 * tree-sitter recovers from syntax errors, so a file with errors still
 * yields a tree; only unreadable files and a failed parser setup produce
 * errors.
 */

#include "rkg/frontend/frontend.hpp"

namespace rkg::frontend {

    class TypeScriptFrontend : public IParserFrontend {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "tree-sitter-typescript"; }

        [[nodiscard]] bool supports(const std::string& path) const override;

        [[nodiscard]] Result<ParsedFile, Error> parse(
            const fs::path& root,
            const std::string& path
        ) const override;

        /**
         * Parses in-memory source as if it were the file at path.
         */
        [[nodiscard]] Result<ParsedFile, Error> parse_source(
            const std::string& path,
            std::string source
        ) const;
    };

}  // namespace rkg::frontend

#endif  // RKG_FRONTEND_TYPESCRIPT_FRONTEND_HPP
