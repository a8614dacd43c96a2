#ifndef RKG_GRAPH_GRAPH_BUILDER_HPP
#define RKG_GRAPH_GRAPH_BUILDER_HPP

/**
 * @file graph_builder.hpp
 * @brief Scans a repository into a KnowledgeGraph.
 *
 * Phases run in a fixed order: discover, extract, resolve imports,
 * enrich with history (optional), finalize metadata. Failures are
 * recorded on the BuildResult instead of aborting the scan.
 *
 * Extraction of each file runs on its own thread raced against the
 * earlier of the per-file and the whole-scan deadline. A file that loses
 * the race is abandoned: its thread finishes in the background and its
 * output is discarded. No new files start once the scan deadline passes.
 */

#include "rkg/analyzers/history_enricher.hpp"
#include "rkg/frontend/frontend.hpp"
#include "rkg/graph/knowledge_graph.hpp"
#include "rkg/graph/scan_cache.hpp"
#include "rkg/types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rkg::graph {

    enum class DiagnosticSeverity {
        Error,
        Warning
    };

    enum class DiagnosticScope {
        File,  ///< One file failed; the rest of the scan continued
        Scan   ///< Affects the whole scan
    };

    struct BuildDiagnostic {
        DiagnosticSeverity severity = DiagnosticSeverity::Error;
        DiagnosticScope scope = DiagnosticScope::File;
        std::string file;  ///< Relative path, or the root for scan diagnostics
        std::string message;
    };

    /**
     * Progress callback: phase name, completed, total, current file (may be
     * empty). Phases are "Initializing", "Found files", "Analyzing AST",
     * "Analyzing git history" and "Complete". Always called on the thread
     * running build().
     */
    using BuildProgressCallback = std::function<void(
        std::string_view phase,
        std::size_t completed,
        std::size_t total,
        const std::string& current_file
    )>;

    struct BuildOptions {
        bool include_history = true;
        Duration timeout = std::chrono::minutes(5);
        Duration file_timeout = std::chrono::seconds(10);
        std::size_t workers = 1;  ///< Files extracted concurrently

        std::vector<std::string> patterns;  ///< Extensions, empty for the defaults
        std::vector<std::string> excludes;  ///< Path substrings to skip

        /**
         * Explicit root-relative file list. Skips discovery when set.
         */
        std::optional<std::vector<std::string>> files;

        analyzers::HistoryOptions history;
        BuildProgressCallback on_progress;
    };

    struct BuildResult {
        KnowledgeGraph graph;
        std::vector<BuildDiagnostic> errors;
        std::vector<BuildDiagnostic> warnings;

        [[nodiscard]] bool has_scan_errors() const;
    };

    class GraphBuilder {
    public:
        /**
         * @param frontends Parsers to use, selected per file.
         * @param history History source, or nullptr to never collect history.
         */
        GraphBuilder(
            frontend::FrontendRegistry frontends,
            std::shared_ptr<const analyzers::IHistoryProvider> history
        );

        /**
         * Builds a fresh snapshot of root.
         *
         * @param cache Session cache to fill with per-file stats. The
         *              builder uses a private one when nullptr.
         */
        [[nodiscard]] BuildResult build(
            const fs::path& root,
            const BuildOptions& options,
            ScanCache* cache = nullptr
        ) const;

        /**
         * Rebuilds after changes to changed_files.
         *
         * Currently a full rebuild. existing and changed_files are accepted
         * so callers do not change when partial updates land.
         */
        [[nodiscard]] BuildResult update_incremental(
            const KnowledgeGraph& existing,
            const std::vector<std::string>& changed_files,
            const fs::path& root,
            const BuildOptions& options,
            ScanCache* cache = nullptr
        ) const;

    private:
        frontend::FrontendRegistry frontends_;
        std::shared_ptr<const analyzers::IHistoryProvider> history_;
    };

    /**
     * Builds with the compiled-in front ends and git history.
     */
    [[nodiscard]] BuildResult build_graph(const fs::path& root, const BuildOptions& options = {});

}  // namespace rkg::graph

#endif  // RKG_GRAPH_GRAPH_BUILDER_HPP
