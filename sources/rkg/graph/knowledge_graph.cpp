#include "rkg/graph/knowledge_graph.hpp"
#include "rkg/version.hpp"

#include <algorithm>
#include <cmath>
#include <ranges>
#include <set>

namespace rkg::graph {

    namespace {

        std::vector<std::string> to_sorted_vector(const std::set<std::string>& values) {
            return {values.begin(), values.end()};
        }

    }  // namespace

    // ============================================================================
    // KnowledgeGraph
    // ============================================================================

    KnowledgeGraph::KnowledgeGraph()
        : version_(VERSION_STRING) {}

    KnowledgeGraph::KnowledgeGraph(
        std::string version,
        GraphMetadata metadata,
        std::map<std::string, GraphNode> nodes,
        std::vector<GraphEdge> edges
    )
        : version_(std::move(version))
        , metadata_(std::move(metadata))
        , nodes_(std::move(nodes))
        , edges_(std::move(edges)) {

        for (const auto& [id, node] : nodes_) {
            ids_by_file_[node.file_path()].push_back(id);
        }

        std::map<std::string, std::set<std::string>> dependents;
        std::map<std::string, std::set<std::string>> dependencies;
        for (const auto& edge : edges_) {
            if (edge.kind != EdgeKind::Imports) {
                continue;
            }
            dependents[edge.target].insert(edge.source);
            dependencies[edge.source].insert(edge.target);
            ++incoming_imports_[edge.target];
        }
        for (const auto& [file, set] : dependents) {
            dependents_[file] = to_sorted_vector(set);
        }
        for (const auto& [file, set] : dependencies) {
            dependencies_[file] = to_sorted_vector(set);
        }
    }

    const GraphNode* KnowledgeGraph::node(const std::string& id) const {
        const auto it = nodes_.find(id);
        return it == nodes_.end() ? nullptr : &it->second;
    }

    std::vector<const GraphEdge*> KnowledgeGraph::edges_of_kind(const EdgeKind kind) const {
        std::vector<const GraphEdge*> result;
        for (const auto& edge : edges_) {
            if (edge.kind == kind) {
                result.push_back(&edge);
            }
        }
        return result;
    }

    std::vector<const GraphNode*> KnowledgeGraph::nodes_in_file(const std::string& path) const {
        std::vector<const GraphNode*> result;
        if (const auto it = ids_by_file_.find(path); it != ids_by_file_.end()) {
            result.reserve(it->second.size());
            for (const auto& id : it->second) {
                result.push_back(&nodes_.at(id));
            }
        }
        return result;
    }

    std::vector<std::string> KnowledgeGraph::dependents_of(const std::string& file) const {
        const auto it = dependents_.find(file);
        return it == dependents_.end() ? std::vector<std::string>{} : it->second;
    }

    std::vector<std::string> KnowledgeGraph::dependencies_of(const std::string& file) const {
        const auto it = dependencies_.find(file);
        return it == dependencies_.end() ? std::vector<std::string>{} : it->second;
    }

    std::size_t KnowledgeGraph::incoming_import_count(const std::string& id) const {
        const auto it = incoming_imports_.find(id);
        return it == incoming_imports_.end() ? 0 : it->second;
    }

    // ============================================================================
    // Statistics
    // ============================================================================

    GraphStats graph_stats(const KnowledgeGraph& graph) {
        GraphStats stats;
        stats.metadata = graph.metadata();

        long long total = 0;
        std::size_t counted = 0;

        for (const auto& node : graph.nodes() | std::views::values) {
            ++stats.nodes_by_kind[to_string(node.kind())];
            if (node.common.complexity.has_value()) {
                total += *node.common.complexity;
                ++counted;
                stats.max_complexity = std::max(stats.max_complexity, *node.common.complexity);
            }
        }

        for (const auto& edge : graph.edges()) {
            ++stats.edges_by_kind[to_string(edge.kind)];
        }

        if (counted > 0) {
            const double average = static_cast<double>(total) / static_cast<double>(counted);
            stats.average_complexity = std::round(average * 100.0) / 100.0;
        }

        return stats;
    }

}  // namespace rkg::graph
