#ifndef RKG_ANALYZERS_RELATIONSHIP_RESOLVER_HPP
#define RKG_ANALYZERS_RELATIONSHIP_RESOLVER_HPP

/**
 * @file relationship_resolver.hpp
 * @brief Resolves import statements into edges between scanned files.
 *
 * Only relative specifiers can resolve. Package imports and aliases that
 * do not land on a scanned file are dropped silently. All maps are
 * ordered, so resolving the same input twice gives identical output.
 */

#include "rkg/analyzers/symbol_extractor.hpp"
#include "rkg/graph/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rkg::analyzers {

    using DependencyMap = std::map<std::string, std::set<std::string>>;

    struct ResolutionResult {
        std::vector<graph::GraphEdge> edges;
        std::vector<ImportInfo> resolved;  ///< Imports that landed, target_path set
        DependencyMap dependencies;        ///< file -> files it imports
        DependencyMap dependents;          ///< file -> files importing it
    };

    /**
     * Maps a module specifier onto a scanned file.
     *
     * Relative specifiers are joined with the importer's directory and
     * normalized. Extensionless results try .ts, .tsx, .js, .jsx and then
     * the same as /index files. A .js specifier also matches a .ts or
     * .tsx file of the same stem.
     *
     * @return The scanned path, or nullopt when nothing matches.
     */
    [[nodiscard]] std::optional<std::string> resolve_import_target(
        const std::string& importer,
        const std::string& specifier,
        const std::set<std::string>& known_files
    );

    /**
     * Resolves every import. Edge ids are "import-N" numbered from
     * first_edge_index in input order.
     */
    [[nodiscard]] ResolutionResult resolve(
        const std::vector<ImportInfo>& imports,
        const std::set<std::string>& known_files,
        std::size_t first_edge_index = 0
    );

    /**
     * How tightly two files are bound, in [0, 1].
     *
     * 0.3 per import direction, plus 0.05 per shared dependency (at most
     * 0.2) and 0.05 per shared importer (at most 0.2).
     */
    [[nodiscard]] double coupling_score(
        const std::string& a,
        const std::string& b,
        const DependencyMap& dependencies,
        const DependencyMap& dependents
    );

    struct FileRelationships {
        std::string path;
        std::vector<std::string> imports;     ///< Resolved targets, sorted
        std::vector<std::string> imported_by; ///< Sorted
        std::vector<std::string> exports;     ///< Exported names, in order
    };

    [[nodiscard]] FileRelationships file_relationships(
        const std::string& path,
        const std::vector<ImportInfo>& imports,
        const std::vector<ExportInfo>& exports,
        const DependencyMap& dependents
    );

}  // namespace rkg::analyzers

#endif  // RKG_ANALYZERS_RELATIONSHIP_RESOLVER_HPP
