#ifndef RKG_ANALYZERS_SYMBOL_EXTRACTOR_HPP
#define RKG_ANALYZERS_SYMBOL_EXTRACTOR_HPP

/**
 * @file symbol_extractor.hpp
 * @brief Turns one parsed file into graph nodes.
 *
 * Produces a file node plus one node per top-level function, class, class
 * method, interface, type alias, enum and exported variable. Import and
 * export statements are collected alongside for the relationship resolver.
 *
 * Node ids are "path:kind:name:line"; the file node id is the path itself.
 * Methods are named "Class.method" and are exported exactly when their
 * class is.
 *
 * Return types come only from explicit annotations recorded by the front
 * end. No type inference happens here.
 */

#include "rkg/frontend/syntax.hpp"
#include "rkg/graph/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rkg::analyzers {

    /**
     * One import statement of a file.
     *
     * target_path is empty until the relationship resolver maps the
     * specifier onto a scanned file.
     */
    struct ImportInfo {
        std::string source_path;
        std::string specifier;
        std::string target_path;
        std::vector<std::string> symbols;  ///< "name", "* as ns" or "name as alias"
        bool is_default = false;
        bool is_namespace = false;
        bool is_type_only = false;
        std::size_t line = 0;

        bool operator==(const ImportInfo&) const = default;
    };

    struct ExportInfo {
        std::string name;
        bool is_default = false;
        bool is_re_export = false;
        std::optional<std::string> original_source;

        bool operator==(const ExportInfo&) const = default;
    };

    struct ExtractionResult {
        graph::GraphNode file_node;
        std::vector<graph::GraphNode> symbol_nodes;
        std::vector<ImportInfo> imports;
        std::vector<ExportInfo> exports;
    };

    /**
     * Cyclomatic complexity of node: 1 plus one per descendant branch
     * (if, ternary, for, for-in, for-of, while, do, case, catch,
     * conditional type) plus one per binary expression whose text contains
     * "&&", "||" or "??". Nested logical expressions each count.
     */
    [[nodiscard]] int calculate_complexity(
        const frontend::ParsedFile& file,
        const frontend::SyntaxNode& node
    );

    /**
     * "typescript" for .ts, "tsx" for .tsx, "jsx" for .jsx, otherwise
     * "javascript".
     */
    [[nodiscard]] std::string detect_language(std::string_view path);

    [[nodiscard]] std::string make_node_id(
        const std::string& path,
        graph::NodeKind kind,
        const std::string& name,
        std::size_t line
    );

    [[nodiscard]] std::vector<ImportInfo> analyze_imports(const frontend::ParsedFile& file);

    [[nodiscard]] std::vector<ExportInfo> analyze_exports(const frontend::ParsedFile& file);

    /**
     * Extracts nodes, imports and exports from one file.
     *
     * The file node's complexity is the sum of its symbols' complexities.
     */
    [[nodiscard]] ExtractionResult extract_symbols(const frontend::ParsedFile& file);

}  // namespace rkg::analyzers

#endif  // RKG_ANALYZERS_SYMBOL_EXTRACTOR_HPP
