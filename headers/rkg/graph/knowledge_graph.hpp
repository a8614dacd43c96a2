#ifndef RKG_GRAPH_KNOWLEDGE_GRAPH_HPP
#define RKG_GRAPH_KNOWLEDGE_GRAPH_HPP

/**
 * @file knowledge_graph.hpp
 * @brief Immutable snapshot of a scanned repository.
 *
 * A KnowledgeGraph is built wholesale by the GraphBuilder (or loaded from
 * disk) and never mutated afterwards. Lookup indices are computed once in
 * the constructor. A rescan produces a new snapshot.
 */

#include "rkg/graph/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace rkg::graph {

    class KnowledgeGraph {
    public:
        /**
         * Empty graph with default metadata.
         */
        KnowledgeGraph();

        KnowledgeGraph(
            std::string version,
            GraphMetadata metadata,
            std::map<std::string, GraphNode> nodes,
            std::vector<GraphEdge> edges
        );

        [[nodiscard]] const std::string& version() const noexcept { return version_; }
        [[nodiscard]] const GraphMetadata& metadata() const noexcept { return metadata_; }

        /**
         * Node by id, or nullptr.
         */
        [[nodiscard]] const GraphNode* node(const std::string& id) const;

        /**
         * All nodes keyed by id, in id order.
         */
        [[nodiscard]] const std::map<std::string, GraphNode>& nodes() const noexcept { return nodes_; }

        [[nodiscard]] const std::vector<GraphEdge>& edges() const noexcept { return edges_; }

        [[nodiscard]] std::vector<const GraphEdge*> edges_of_kind(EdgeKind kind) const;

        /**
         * The file node and every symbol declared in path, in id order.
         */
        [[nodiscard]] std::vector<const GraphNode*> nodes_in_file(const std::string& path) const;

        /**
         * Files importing the given file, sorted and distinct.
         */
        [[nodiscard]] std::vector<std::string> dependents_of(const std::string& file) const;

        /**
         * Files the given file imports, sorted and distinct.
         */
        [[nodiscard]] std::vector<std::string> dependencies_of(const std::string& file) const;

        /**
         * Number of imports edges whose target is id.
         */
        [[nodiscard]] std::size_t incoming_import_count(const std::string& id) const;

        [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
        [[nodiscard]] std::size_t edge_count() const noexcept { return edges_.size(); }
        [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    private:
        std::string version_;
        GraphMetadata metadata_;
        std::map<std::string, GraphNode> nodes_;
        std::vector<GraphEdge> edges_;

        std::map<std::string, std::vector<std::string>> ids_by_file_;
        std::map<std::string, std::vector<std::string>> dependents_;
        std::map<std::string, std::vector<std::string>> dependencies_;
        std::map<std::string, std::size_t> incoming_imports_;
    };

    /**
     * Summary counts over a graph.
     */
    struct GraphStats {
        GraphMetadata metadata;
        std::map<std::string, std::size_t> nodes_by_kind;
        std::map<std::string, std::size_t> edges_by_kind;
        double average_complexity = 0.0;  ///< Rounded to 2 decimals
        int max_complexity = 0;
    };

    /**
     * Counts nodes and edges by kind and summarizes every node that has a
     * complexity (file nodes included).
     */
    [[nodiscard]] GraphStats graph_stats(const KnowledgeGraph& graph);

}  // namespace rkg::graph

#endif  // RKG_GRAPH_KNOWLEDGE_GRAPH_HPP
