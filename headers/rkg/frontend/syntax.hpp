#ifndef RKG_FRONTEND_SYNTAX_HPP
#define RKG_FRONTEND_SYNTAX_HPP

/**
 * @file syntax.hpp
 * @brief Language-neutral syntax tree produced by parser front ends.
 *
 * A front end turns one source file into a ParsedFile: the source text,
 * a tree of SyntaxNodes whose byte spans index into that text, and the
 * file's import and export declarations. The symbol extractor only reads
 * this model, so any parser able to fill it can feed the graph builder.
 *
 * Only declarations carry names, parameters and heritage. Statement and
 * expression nodes exist so that decision points can be counted.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rkg::frontend {

    enum class SyntaxKind {
        SourceFile,
        FunctionDeclaration,
        ClassDeclaration,
        MethodDeclaration,
        PropertyDeclaration,
        Constructor,
        InterfaceDeclaration,
        TypeAliasDeclaration,
        EnumDeclaration,
        VariableStatement,
        VariableDeclaration,
        Block,
        IfStatement,
        ConditionalExpression,
        ForStatement,
        ForInStatement,
        ForOfStatement,
        WhileStatement,
        DoStatement,
        SwitchStatement,
        CaseClause,
        DefaultClause,
        CatchClause,
        ConditionalType,
        BinaryExpression,
        CallExpression,
        Identifier,
        ReturnStatement,
        ExpressionStatement,
        ArrowFunction,
        Other
    };

    [[nodiscard]] const char* to_string(SyntaxKind kind) noexcept;

    /**
     * One node of the syntax tree.
     *
     * begin/end are byte offsets into ParsedFile::source, end exclusive.
     * Lines are 1-based.
     */
    struct SyntaxNode {
        SyntaxKind kind = SyntaxKind::Other;
        std::size_t begin = 0;
        std::size_t end = 0;
        std::size_t line_start = 1;
        std::size_t line_end = 1;

        std::optional<std::string> name;

        bool exported = false;
        bool default_export = false;
        bool is_async = false;
        bool is_generator = false;
        bool is_abstract = false;

        // Declarations only.
        std::vector<std::string> parameters;
        std::optional<std::string> return_type;  ///< Set only when written in the source
        std::optional<std::string> extends;
        std::vector<std::string> implements;
        std::vector<std::string> jsdoc;          ///< Description text of each doc comment

        std::string op;  ///< Operator token of a BinaryExpression

        std::vector<SyntaxNode> children;

        /**
         * Depth-first visit of every descendant, excluding this node.
         */
        template<typename F>
        void for_each_descendant(F&& visit) const {
            for (const auto& child : children) {
                visit(child);
                child.for_each_descendant(visit);
            }
        }
    };

    struct ImportSpecifier {
        std::string name;
        std::optional<std::string> alias;
    };

    /**
     * One `import ... from "specifier"` statement.
     */
    struct ImportDeclaration {
        std::string module_specifier;
        std::optional<std::string> default_import;
        std::optional<std::string> namespace_import;
        std::vector<ImportSpecifier> named_imports;
        bool type_only = false;
        std::size_t line = 0;
    };

    /**
     * One `export { a, b } [from "specifier"]` statement.
     */
    struct ExportDeclaration {
        std::vector<std::string> named_exports;
        std::optional<std::string> module_specifier;
    };

    struct ParsedFile {
        std::string path;    ///< Root-relative, forward slashes
        std::string source;
        std::size_t end_line = 1;
        SyntaxNode root;

        std::vector<ImportDeclaration> imports;
        std::vector<ExportDeclaration> exports;
        std::size_t export_assignment_count = 0;  ///< `export default <expr>` statements

        /**
         * Source slice covered by node, or empty when the span is invalid.
         */
        [[nodiscard]] std::string_view text(const SyntaxNode& node) const noexcept {
            if (node.end <= node.begin || node.end > source.size()) {
                return {};
            }
            return std::string_view(source).substr(node.begin, node.end - node.begin);
        }
    };

}  // namespace rkg::frontend

#endif  // RKG_FRONTEND_SYNTAX_HPP
