#include "rkg/graph/graph_builder.hpp"
#include "rkg/analyzers/relationship_resolver.hpp"
#include "rkg/analyzers/symbol_extractor.hpp"
#include "rkg/frontend/discovery.hpp"
#include "rkg/git/git_integration.hpp"
#include "rkg/logging.hpp"
#include "rkg/version.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <set>
#include <system_error>
#include <thread>

namespace rkg::graph {

    namespace {

        constexpr auto PARSE_FAILURE_MESSAGE = "Analysis timeout or parse error";

        /**
         * What one extraction task hands back.
         */
        struct FileOutcome {
            std::optional<analyzers::ExtractionResult> extraction;
            FileStats stats;
            std::string error;
            std::string detail;
        };

        struct PendingFile {
            std::string path;
            std::future<FileOutcome> future;
            SteadyClock::time_point started;
        };

        /**
         * Starts extraction of one file on a detached thread.
         *
         * The thread owns everything it touches, so it may outlive the
         * build when abandoned. It must not log.
         */
        std::future<FileOutcome> launch_extraction(
            std::shared_ptr<frontend::IParserFrontend> parser,
            fs::path root,
            std::string path
        ) {
            std::promise<FileOutcome> promise;
            auto future = promise.get_future();

            std::thread([parser = std::move(parser), root = std::move(root), path = std::move(path),
                         promise = std::move(promise)]() mutable {
                FileOutcome outcome;
                try {
                    auto parsed = parser->parse(root, path);
                    if (parsed.is_err()) {
                        outcome.error = PARSE_FAILURE_MESSAGE;
                        outcome.detail = parsed.error().to_string();
                    } else {
                        const auto& file = parsed.value();
                        outcome.stats = {file.source.size(), file.end_line};
                        outcome.extraction = analyzers::extract_symbols(file);
                    }
                } catch (const std::exception& e) {
                    outcome.extraction.reset();
                    outcome.error = e.what();
                } catch (...) {
                    outcome.extraction.reset();
                    outcome.error = "Unknown exception during extraction";
                }
                promise.set_value(std::move(outcome));
            }).detach();

            return future;
        }

        std::string timeout_seconds(const Duration timeout) {
            const auto seconds = static_cast<long long>(
                std::llround(static_cast<double>(timeout.count()) / 1000.0));
            return std::to_string(seconds);
        }

        void report(
            const BuildOptions& options,
            const std::string_view phase,
            const std::size_t completed,
            const std::size_t total,
            const std::string& file = {}
        ) {
            if (options.on_progress) {
                options.on_progress(phase, completed, total, file);
            }
        }

        BuildDiagnostic file_error(std::string file, std::string message) {
            return {DiagnosticSeverity::Error, DiagnosticScope::File, std::move(file), std::move(message)};
        }

        BuildDiagnostic scan_error(const fs::path& root, std::string message) {
            return {DiagnosticSeverity::Error, DiagnosticScope::Scan, root.string(), std::move(message)};
        }

        GraphMetadata empty_metadata(const fs::path& root, const SteadyClock::time_point start) {
            GraphMetadata metadata;
            metadata.scanned_at = format_timestamp(std::chrono::system_clock::now());
            metadata.scan_duration_ms = std::chrono::duration_cast<Duration>(SteadyClock::now() - start).count();
            metadata.root_dir = fs::absolute(root).lexically_normal().string();
            return metadata;
        }

    }  // namespace

    bool BuildResult::has_scan_errors() const {
        return std::ranges::any_of(errors, [](const BuildDiagnostic& d) {
            return d.scope == DiagnosticScope::Scan;
        });
    }

    GraphBuilder::GraphBuilder(
        frontend::FrontendRegistry frontends,
        std::shared_ptr<const analyzers::IHistoryProvider> history
    )
        : frontends_(std::move(frontends))
        , history_(std::move(history)) {}

    BuildResult GraphBuilder::build(
        const fs::path& root,
        const BuildOptions& options,
        ScanCache* cache
    ) const {
        const auto start = SteadyClock::now();
        const auto scan_deadline = start + options.timeout;
        auto log = logging::logger();

        ScanCache local_cache;
        ScanCache& stats_cache = cache != nullptr ? *cache : local_cache;

        BuildResult result;

        // =====================================================================
        // Discover
        // =====================================================================

        report(options, "Initializing", 0, 1);

        std::vector<std::string> files;
        if (options.files) {
            files = *options.files;
        } else {
            auto discovered = frontend::discover_source_files(root, options.patterns, options.excludes);
            if (discovered.is_err()) {
                log->error("File discovery failed: {}", discovered.error().to_string());
                result.graph = KnowledgeGraph(VERSION_STRING, empty_metadata(root, start), {}, {});
                result.errors.push_back(scan_error(root, discovered.error().message()));
                return result;
            }
            files = std::move(discovered.value());
        }

        if (files.empty()) {
            log->error("No source files found under {}", root.string());
            result.graph = KnowledgeGraph(VERSION_STRING, empty_metadata(root, start), {}, {});
            result.errors.push_back(scan_error(root, "No source files found"));
            return result;
        }

        log->info("Scanning {} files under {}", files.size(), root.string());
        report(options, "Found files", files.size(), files.size());

        // =====================================================================
        // Extract
        // =====================================================================

        std::map<std::string, GraphNode> nodes;
        std::vector<GraphEdge> edges;
        std::vector<analyzers::ImportInfo> imports;
        std::vector<std::string> extracted;
        std::map<std::string, std::size_t> languages;
        std::size_t total_lines = 0;

        const std::size_t workers = std::max<std::size_t>(1, options.workers);
        bool scan_timed_out = false;
        std::size_t processed = 0;

        const auto merge = [&](const std::string& path, analyzers::ExtractionResult extraction) {
            const auto& file_node = extraction.file_node;
            if (const auto* details = file_node.as<FileDetails>()) {
                ++languages[details->language];
                total_lines += details->line_count;
            }

            const auto file_id = file_node.id();
            nodes.insert_or_assign(file_id, std::move(extraction.file_node));

            for (auto& symbol : extraction.symbol_nodes) {
                GraphEdge contains;
                contains.id = "contains-" + std::to_string(edges.size());
                contains.source = file_id;
                contains.target = symbol.id();
                contains.kind = EdgeKind::Contains;
                edges.push_back(std::move(contains));

                auto id = symbol.id();
                nodes.insert_or_assign(std::move(id), std::move(symbol));
            }

            imports.insert(imports.end(),
                           std::make_move_iterator(extraction.imports.begin()),
                           std::make_move_iterator(extraction.imports.end()));
            extracted.push_back(path);
        };

        for (std::size_t batch_start = 0; batch_start < files.size() && !scan_timed_out; batch_start += workers) {
            if (SteadyClock::now() > scan_deadline) {
                scan_timed_out = true;
                break;
            }

            const auto batch_end = std::min(batch_start + workers, files.size());
            std::vector<PendingFile> pending;

            for (std::size_t i = batch_start; i < batch_end; ++i) {
                const auto& path = files[i];
                // Thread creation throws std::system_error when the process is out of threads
                try {
                    auto parser = frontends_.find_frontend_for(path);
                    if (!parser) {
                        log->warn("No parser front end for {}", path);
                        result.errors.push_back(file_error(path, "No parser front end supports this file"));
                        continue;
                    }
                    pending.push_back({path, launch_extraction(std::move(parser), root, path), SteadyClock::now()});
                } catch (const std::exception& e) {
                    log->error("Could not start extraction of {}: {}", path, e.what());
                    result.errors.push_back(file_error(path, std::string("Could not start extraction: ") + e.what()));
                    report(options, "Analyzing AST", ++processed, files.size(), path);
                }
            }

            for (auto& task : pending) {
                const auto file_deadline = task.started + options.file_timeout;
                const auto deadline = std::min(file_deadline, scan_deadline);

                if (task.future.wait_until(deadline) != std::future_status::ready) {
                    if (scan_deadline < file_deadline) {
                        // Abandoned because the scan ran out; not this file's fault
                        scan_timed_out = true;
                        continue;
                    }
                    log->warn("Extraction of {} exceeded {}ms, abandoned", task.path, options.file_timeout.count());
                    result.errors.push_back(file_error(task.path, PARSE_FAILURE_MESSAGE));
                    report(options, "Analyzing AST", ++processed, files.size(), task.path);
                    continue;
                }

                auto outcome = task.future.get();
                if (!outcome.extraction) {
                    log->warn("Failed to analyze {}: {}", task.path,
                              outcome.detail.empty() ? outcome.error : outcome.detail);
                    result.errors.push_back(file_error(task.path, outcome.error));
                } else {
                    stats_cache.record(task.path, outcome.stats);
                    merge(task.path, std::move(*outcome.extraction));
                }
                report(options, "Analyzing AST", ++processed, files.size(), task.path);
            }
        }

        if (scan_timed_out) {
            const auto message = "Scan timeout exceeded (" + timeout_seconds(options.timeout) +
                                 "s). Partial results returned.";
            log->error("{} {} of {} files analyzed", message, extracted.size(), files.size());
            result.errors.push_back(scan_error(root, message));
        }

        // =====================================================================
        // Resolve
        // =====================================================================

        const std::set<std::string> known_files(extracted.begin(), extracted.end());
        auto resolution = analyzers::resolve(imports, known_files);
        log->debug("Resolved {} of {} imports", resolution.edges.size(), imports.size());

        edges.insert(edges.end(),
                     std::make_move_iterator(resolution.edges.begin()),
                     std::make_move_iterator(resolution.edges.end()));

        for (const auto& [file, deps] : resolution.dependencies) {
            if (auto it = nodes.find(file); it != nodes.end()) {
                if (auto* details = it->second.as<FileDetails>()) {
                    details->import_count = deps.size();
                }
            }
        }

        // =====================================================================
        // Enrich
        // =====================================================================

        if (options.include_history && history_) {
            report(options, "Analyzing git history", 0, 1);

            const analyzers::HistoryEnricher enricher(*history_, options.history);
            const auto history = enricher.enrich(root, extracted, [&](std::size_t completed, std::size_t total) {
                report(options, "Analyzing git history", completed, total);
            });

            for (const auto& [path, file_history] : history.histories) {
                auto it = nodes.find(path);
                if (it == nodes.end()) {
                    continue;
                }
                auto& common = it->second.common;
                common.last_modified = file_history.last_modified;
                common.modification_count = file_history.commit_count;

                std::vector<std::string> names;
                names.reserve(file_history.contributors.size());
                for (const auto& contributor : file_history.contributors) {
                    names.push_back(contributor.name);
                }
                common.contributors = std::move(names);
            }

            if (!history.is_repository) {
                log->warn("Not a git repository, history skipped: {}", root.string());
                result.warnings.push_back({
                    DiagnosticSeverity::Warning,
                    DiagnosticScope::Scan,
                    root.string(),
                    "Not a git repository. Git history analysis skipped."
                });
            }
        }

        // =====================================================================
        // Finalize
        // =====================================================================

        auto metadata = empty_metadata(root, start);
        metadata.file_count = extracted.size();
        metadata.total_lines = total_lines;
        metadata.languages = std::move(languages);
        metadata.node_count = nodes.size();
        metadata.edge_count = edges.size();

        log->info("Scan complete: {} files, {} nodes, {} edges in {}ms ({} errors, {} warnings)",
                  metadata.file_count, metadata.node_count, metadata.edge_count,
                  metadata.scan_duration_ms, result.errors.size(), result.warnings.size());

        result.graph = KnowledgeGraph(VERSION_STRING, std::move(metadata), std::move(nodes), std::move(edges));
        report(options, "Complete", 1, 1);
        return result;
    }

    BuildResult GraphBuilder::update_incremental(
        const KnowledgeGraph& existing,
        const std::vector<std::string>& changed_files,
        const fs::path& root,
        const BuildOptions& options,
        ScanCache* cache
    ) const {
        logging::logger()->info(
            "Incremental update of {} changed files over {} nodes, performing full rebuild",
            changed_files.size(), existing.node_count());
        return build(root, options, cache);
    }

    BuildResult build_graph(const fs::path& root, const BuildOptions& options) {
        const GraphBuilder builder(
            frontend::default_frontends(),
            std::make_shared<git::GitHistoryProvider>()
        );
        return builder.build(root, options);
    }

}  // namespace rkg::graph
