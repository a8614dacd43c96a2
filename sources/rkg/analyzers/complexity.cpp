#include "rkg/analyzers/complexity.hpp"
#include "rkg/utils/path_utils.hpp"

#include <algorithm>
#include <cmath>

namespace rkg::analyzers {

    namespace {

        ComplexityHotspot to_hotspot(const graph::GraphNode& node) {
            ComplexityHotspot hotspot;
            hotspot.id = node.id();
            hotspot.file_path = node.file_path();
            hotspot.name = node.name();
            hotspot.kind = node.kind();
            hotspot.complexity = node.common.complexity.value_or(0);
            hotspot.line_start = node.common.line_start;
            hotspot.line_end = node.common.line_end;
            return hotspot;
        }

        double round2(const double value) {
            return std::round(value * 100.0) / 100.0;
        }

    }  // namespace

    const char* to_string(const ComplexityCategory category) noexcept {
        switch (category) {
            case ComplexityCategory::Low: return "low";
            case ComplexityCategory::Medium: return "medium";
            case ComplexityCategory::High: return "high";
            case ComplexityCategory::VeryHigh: return "veryHigh";
        }
        return "low";
    }

    ComplexityCategory complexity_category(const int complexity) noexcept {
        if (complexity <= thresholds::LOW) return ComplexityCategory::Low;
        if (complexity <= thresholds::MEDIUM) return ComplexityCategory::Medium;
        if (complexity <= thresholds::HIGH) return ComplexityCategory::High;
        return ComplexityCategory::VeryHigh;
    }

    // =========================================================================
    // Hotspots and report
    // =========================================================================

    std::vector<ComplexityHotspot> find_complexity_hotspots(
        const graph::KnowledgeGraph& graph,
        const HotspotOptions& options
    ) {
        std::vector<ComplexityHotspot> hotspots;

        for (const auto& [id, node] : graph.nodes()) {
            const int complexity = node.common.complexity.value_or(0);
            if (complexity == 0 || complexity < options.threshold) {
                continue;
            }
            if (node.kind() == graph::NodeKind::File && !options.include_files) {
                continue;
            }
            hotspots.push_back(to_hotspot(node));
        }

        std::ranges::stable_sort(hotspots, [](const auto& a, const auto& b) {
            return a.complexity > b.complexity;
        });

        if (hotspots.size() > options.limit) {
            hotspots.resize(options.limit);
        }
        return hotspots;
    }

    ComplexityReport complexity_report(const graph::KnowledgeGraph& graph) {
        ComplexityReport report;
        std::size_t counted = 0;

        for (const auto& [id, node] : graph.nodes()) {
            if (node.kind() == graph::NodeKind::File || !node.common.complexity) {
                continue;
            }
            const int complexity = *node.common.complexity;
            ++counted;
            report.total_complexity += complexity;
            report.max_complexity = std::max(report.max_complexity, complexity);

            switch (complexity_category(complexity)) {
                case ComplexityCategory::Low: ++report.distribution.low; break;
                case ComplexityCategory::Medium: ++report.distribution.medium; break;
                case ComplexityCategory::High: ++report.distribution.high; break;
                case ComplexityCategory::VeryHigh: ++report.distribution.very_high; break;
            }
        }

        if (counted == 0) {
            return report;
        }

        report.average_complexity = round2(
            static_cast<double>(report.total_complexity) / static_cast<double>(counted));
        report.hotspots = find_complexity_hotspots(graph, {.limit = 20});
        return report;
    }

    std::map<std::string, DirectoryComplexity> complexity_by_directory(const graph::KnowledgeGraph& graph) {
        std::map<std::string, DirectoryComplexity> result;

        for (const auto& [id, node] : graph.nodes()) {
            if (node.kind() != graph::NodeKind::File || node.common.complexity.value_or(0) == 0) {
                continue;
            }
            auto dir = path_utils::dirname(node.file_path());
            if (dir.empty()) {
                dir = ".";
            }
            auto& stats = result[dir];
            stats.total_complexity += *node.common.complexity;
            ++stats.file_count;
        }

        for (auto& [dir, stats] : result) {
            stats.average_complexity = round2(
                static_cast<double>(stats.total_complexity) / static_cast<double>(stats.file_count));
        }
        return result;
    }

    ComplexityComparison compare_complexity(
        const graph::KnowledgeGraph& before,
        const graph::KnowledgeGraph& after
    ) {
        ComplexityComparison comparison;

        for (const auto& [id, after_node] : after.nodes()) {
            const auto* before_node = before.node(id);
            if (before_node == nullptr) {
                continue;
            }
            const int old_value = before_node->common.complexity.value_or(0);
            const int new_value = after_node.common.complexity.value_or(0);
            if (old_value == 0 || new_value == 0) {
                continue;
            }

            if (new_value > old_value) {
                comparison.worsened.push_back(to_hotspot(after_node));
            } else if (new_value < old_value) {
                comparison.improved.push_back(to_hotspot(after_node));
            } else {
                ++comparison.unchanged;
            }
        }
        return comparison;
    }

    // =========================================================================
    // Refactoring suggestions
    // =========================================================================

    std::vector<RefactoringTarget> suggest_refactoring_targets(const graph::KnowledgeGraph& graph) {
        std::vector<RefactoringTarget> targets;

        for (const auto& [id, node] : graph.nodes()) {
            if (node.kind() == graph::NodeKind::File) {
                continue;
            }
            const int complexity = node.common.complexity.value_or(0);
            if (complexity == 0) {
                continue;
            }

            const auto value = std::to_string(complexity);
            if (complexity > thresholds::HIGH) {
                targets.push_back({
                    to_hotspot(node),
                    "Cyclomatic complexity of " + value + " is very high. Consider breaking into smaller functions.",
                    RefactoringPriority::High
                });
            } else if (complexity > thresholds::MEDIUM) {
                targets.push_back({
                    to_hotspot(node),
                    "Cyclomatic complexity of " + value + " is above recommended threshold.",
                    RefactoringPriority::Medium
                });
            }

            const auto span = node.common.line_end > node.common.line_start
                ? node.common.line_end - node.common.line_start
                : 0;
            if (span > 50 && complexity > thresholds::LOW) {
                targets.push_back({
                    to_hotspot(node),
                    "Function spans " + std::to_string(span) + " lines. Consider extracting helper functions.",
                    RefactoringPriority::Medium
                });
            }
        }

        std::ranges::stable_sort(targets, [](const auto& a, const auto& b) {
            return static_cast<int>(a.priority) < static_cast<int>(b.priority);
        });
        return targets;
    }

}  // namespace rkg::analyzers
