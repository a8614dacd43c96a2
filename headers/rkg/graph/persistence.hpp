#ifndef RKG_GRAPH_PERSISTENCE_HPP
#define RKG_GRAPH_PERSISTENCE_HPP

/**
 * @file persistence.hpp
 * @brief Reads and writes the graph artifact.
 *
 * Layout under <root>/<storage dir>:
 *   graph.json     {version, metadata, nodes: {id: node}, edges: [edge]}
 *   metadata.json  copy of the metadata for quick status checks
 *
 * JSON keys are camelCase. Optional node fields are omitted when absent.
 */

#include "rkg/error.hpp"
#include "rkg/graph/knowledge_graph.hpp"
#include "rkg/result.hpp"
#include "rkg/types.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace rkg::graph {

    inline constexpr std::string_view DEFAULT_STORAGE_DIR = ".rkg";
    inline constexpr std::string_view GRAPH_FILE = "graph.json";
    inline constexpr std::string_view METADATA_FILE = "metadata.json";

    [[nodiscard]] fs::path storage_path(const fs::path& root, std::string_view directory = DEFAULT_STORAGE_DIR);
    [[nodiscard]] fs::path graph_path(const fs::path& root, std::string_view directory = DEFAULT_STORAGE_DIR);
    [[nodiscard]] fs::path metadata_path(const fs::path& root, std::string_view directory = DEFAULT_STORAGE_DIR);

    [[nodiscard]] nlohmann::json serialize_node(const GraphNode& node);
    [[nodiscard]] Result<GraphNode, Error> deserialize_node(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json serialize_edge(const GraphEdge& edge);
    [[nodiscard]] Result<GraphEdge, Error> deserialize_edge(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json serialize_metadata(const GraphMetadata& metadata);
    [[nodiscard]] GraphMetadata deserialize_metadata(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json serialize_graph(const KnowledgeGraph& graph);
    [[nodiscard]] Result<KnowledgeGraph, Error> deserialize_graph(const nlohmann::json& j);

    /**
     * Writes graph.json and metadata.json, creating the directory.
     */
    [[nodiscard]] Result<void, Error> save_graph(
        const KnowledgeGraph& graph,
        const fs::path& root,
        std::string_view directory = DEFAULT_STORAGE_DIR
    );

    /**
     * @return The graph, NotFound when missing, ParseError when corrupt.
     */
    [[nodiscard]] Result<KnowledgeGraph, Error> load_graph(
        const fs::path& root,
        std::string_view directory = DEFAULT_STORAGE_DIR
    );

    [[nodiscard]] Result<GraphMetadata, Error> load_metadata(
        const fs::path& root,
        std::string_view directory = DEFAULT_STORAGE_DIR
    );

    [[nodiscard]] bool graph_exists(const fs::path& root, std::string_view directory = DEFAULT_STORAGE_DIR);

    /**
     * True when the graph no longer reflects the sources: metadata is
     * missing or unreadable, the source files cannot be listed, or any
     * source file was modified after metadata.scanned_at.
     */
    [[nodiscard]] bool is_graph_stale(const fs::path& root, std::string_view directory = DEFAULT_STORAGE_DIR);

    /**
     * Removes both graph artifacts. Missing files are not an error.
     */
    [[nodiscard]] Result<void, Error> delete_graph(
        const fs::path& root,
        std::string_view directory = DEFAULT_STORAGE_DIR
    );

}  // namespace rkg::graph

#endif  // RKG_GRAPH_PERSISTENCE_HPP
