#ifndef RKG_ANALYZERS_COMPLEXITY_HPP
#define RKG_ANALYZERS_COMPLEXITY_HPP

/**
 * @file complexity.hpp
 * @brief Complexity queries over a built graph.
 *
 * Pure read-only analyses used by report generators. None of them touch
 * the file system.
 */

#include "rkg/graph/knowledge_graph.hpp"

#include <map>
#include <string>
#include <vector>

namespace rkg::analyzers {

    namespace thresholds {
        constexpr int LOW = 5;
        constexpr int MEDIUM = 10;
        constexpr int HIGH = 20;
    }

    enum class ComplexityCategory {
        Low,
        Medium,
        High,
        VeryHigh
    };

    /**
     * "low", "medium", "high" or "veryHigh".
     */
    [[nodiscard]] const char* to_string(ComplexityCategory category) noexcept;

    /**
     * Low up to 5, medium up to 10, high up to 20, very high above.
     */
    [[nodiscard]] ComplexityCategory complexity_category(int complexity) noexcept;

    struct ComplexityHotspot {
        std::string id;
        std::string file_path;
        std::string name;
        graph::NodeKind kind = graph::NodeKind::Function;
        int complexity = 0;
        std::size_t line_start = 0;
        std::size_t line_end = 0;
    };

    struct HotspotOptions {
        std::size_t limit = 10;
        int threshold = thresholds::MEDIUM;
        bool include_files = false;
    };

    /**
     * Nodes at or above the threshold, most complex first. Ties keep id
     * order.
     */
    [[nodiscard]] std::vector<ComplexityHotspot> find_complexity_hotspots(
        const graph::KnowledgeGraph& graph,
        const HotspotOptions& options = {}
    );

    struct ComplexityDistribution {
        std::size_t low = 0;
        std::size_t medium = 0;
        std::size_t high = 0;
        std::size_t very_high = 0;
    };

    struct ComplexityReport {
        double average_complexity = 0.0;  ///< Rounded to 2 decimals
        int max_complexity = 0;
        int total_complexity = 0;
        std::vector<ComplexityHotspot> hotspots;  ///< Top 20
        ComplexityDistribution distribution;
    };

    /**
     * Summary over every non-file node that has a complexity.
     */
    [[nodiscard]] ComplexityReport complexity_report(const graph::KnowledgeGraph& graph);

    struct DirectoryComplexity {
        int total_complexity = 0;
        std::size_t file_count = 0;
        double average_complexity = 0.0;
    };

    /**
     * Sums file complexities per directory. Top-level files go under ".".
     */
    [[nodiscard]] std::map<std::string, DirectoryComplexity> complexity_by_directory(
        const graph::KnowledgeGraph& graph
    );

    struct ComplexityComparison {
        std::vector<ComplexityHotspot> improved;
        std::vector<ComplexityHotspot> worsened;
        std::size_t unchanged = 0;
    };

    /**
     * Compares nodes present in both snapshots. Entries carry the value
     * from after.
     */
    [[nodiscard]] ComplexityComparison compare_complexity(
        const graph::KnowledgeGraph& before,
        const graph::KnowledgeGraph& after
    );

    enum class RefactoringPriority {
        High,
        Medium,
        Low
    };

    struct RefactoringTarget {
        ComplexityHotspot node;
        std::string reason;
        RefactoringPriority priority = RefactoringPriority::Medium;
    };

    [[nodiscard]] std::vector<RefactoringTarget> suggest_refactoring_targets(
        const graph::KnowledgeGraph& graph
    );

}  // namespace rkg::analyzers

#endif  // RKG_ANALYZERS_COMPLEXITY_HPP
