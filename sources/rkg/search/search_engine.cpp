#include "rkg/search/search_engine.hpp"
#include "rkg/logging.hpp"
#include "rkg/utils/path_utils.hpp"
#include "rkg/utils/string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace rkg::search {

    namespace {

        constexpr std::size_t CONTEXT_LIMIT = 100;
        constexpr std::size_t SUGGESTION_LIMIT = 3;
        constexpr std::size_t BROAD_RESULT_COUNT = 50;

        using SynonymTable = std::vector<std::pair<std::string_view, std::vector<std::string_view>>>;

        const SynonymTable& synonyms() {
            static const SynonymTable table = {
                {"user", {"user", "auth", "account", "profile", "member"}},
                {"auth", {"auth", "authentication", "login", "session", "token", "jwt", "oauth"}},
                {"login", {"login", "signin", "sign-in", "authenticate", "auth"}},
                {"session", {"session", "cookie", "token", "auth"}},

                {"api", {"api", "route", "handler", "endpoint", "controller", "rest"}},
                {"endpoint", {"endpoint", "route", "handler", "api", "controller"}},
                {"handler", {"handler", "controller", "route", "endpoint", "action"}},
                {"route", {"route", "router", "path", "endpoint", "api"}},

                {"database", {"db", "database", "model", "schema", "entity", "repository", "store"}},
                {"model", {"model", "schema", "entity", "type", "interface", "dto"}},
                {"schema", {"schema", "model", "entity", "definition", "type"}},
                {"entity", {"entity", "model", "record", "row", "document"}},

                {"data", {"data", "store", "state", "cache", "storage"}},
                {"store", {"store", "state", "storage", "cache", "repository"}},
                {"cache", {"cache", "memo", "store", "buffer"}},

                {"component", {"component", "widget", "element", "ui", "view"}},
                {"ui", {"ui", "component", "view", "interface", "display"}},
                {"view", {"view", "page", "screen", "template", "component"}},
                {"page", {"page", "view", "screen", "route"}},

                {"test", {"test", "spec", "mock", "fixture", "assert"}},
                {"mock", {"mock", "stub", "fake", "spy", "test"}},

                {"util", {"util", "utils", "helper", "helpers", "common", "shared"}},
                {"helper", {"helper", "helpers", "util", "utils", "tool"}},

                {"config", {"config", "configuration", "settings", "options", "env"}},
                {"settings", {"settings", "config", "preferences", "options"}},

                {"type", {"type", "types", "interface", "interfaces", "definition"}},
                {"interface", {"interface", "interfaces", "type", "types", "contract"}},

                {"error", {"error", "exception", "throw", "catch", "handle"}},
                {"exception", {"exception", "error", "throw", "catch"}},

                {"hook", {"hook", "hooks", "event", "listener", "callback"}},
                {"event", {"event", "listener", "handler", "emit", "subscribe"}},

                {"service", {"service", "provider", "manager", "controller"}},
                {"provider", {"provider", "service", "factory", "builder"}},

                {"state", {"state", "store", "redux", "context", "atom"}},

                {"graph", {"graph", "node", "edge", "tree", "network"}},
                {"analysis", {"analysis", "analyzer", "parse", "inspect", "examine"}},
            };
            return table;
        }

        bool is_query_separator(const char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v' ||
                   c == ',' || c == '.' || c == '_' || c == '-' || c == '/';
        }

        struct Score {
            int value = 0;
            std::string reason;
        };

        Score score_node(
            const graph::GraphNode& node,
            const std::vector<std::string>& keywords,
            const graph::KnowledgeGraph& graph
        ) {
            const auto name = string_utils::to_lower(node.name());
            const auto path = string_utils::to_lower(node.file_path());

            Score score;
            std::vector<std::string> reasons;

            for (const auto& keyword : keywords) {
                if (name == keyword) {
                    score.value = std::max(score.value, 100);
                    reasons.push_back("Exact name match: \"" + keyword + "\"");
                } else if (string_utils::starts_with(name, keyword)) {
                    score.value = std::max(score.value, 85);
                    reasons.push_back("Name starts with: \"" + keyword + "\"");
                } else if (string_utils::ends_with(name, keyword)) {
                    score.value = std::max(score.value, 80);
                    reasons.push_back("Name ends with: \"" + keyword + "\"");
                } else if (string_utils::contains(name, keyword)) {
                    score.value = std::max(score.value, 70);
                    reasons.push_back("Name contains: \"" + keyword + "\"");
                } else if (string_utils::contains(path, keyword)) {
                    score.value = std::max(score.value, 50);
                    reasons.push_back("Path contains: \"" + keyword + "\"");
                }
            }

            if (score.value > 0) {
                if (node.common.exported) {
                    score.value = std::min(100, score.value + 5);
                    reasons.emplace_back("Exported symbol");
                }

                const auto imported_by = graph.incoming_import_count(node.id());
                if (imported_by > 3) {
                    score.value = std::min(100, score.value + 10);
                    reasons.push_back("Used by " + std::to_string(imported_by) + " files");
                } else if (imported_by > 0) {
                    score.value = std::min(100, score.value + 5);
                }
            }

            score.reason = reasons.empty() ? "Related match" : reasons.front();
            return score;
        }

        SearchResult make_result(const graph::GraphNode& node, const int relevance, std::string reason) {
            SearchResult result;
            result.id = node.id();
            result.file = node.file_path();
            result.kind = node.kind();
            result.name = node.name();
            result.relevance = relevance;
            result.context = node_context(node);
            result.line = node.common.line_start;
            result.match_reason = std::move(reason);
            return result;
        }

        void sort_results(std::vector<SearchResult>& results) {
            std::ranges::sort(results, [](const SearchResult& a, const SearchResult& b) {
                if (a.relevance != b.relevance) {
                    return a.relevance > b.relevance;
                }
                if (a.name != b.name) {
                    return a.name < b.name;
                }
                return a.id < b.id;
            });
        }

        int to_relevance(const double similarity) {
            return static_cast<int>(std::lround(similarity * 100.0));
        }

        std::vector<SearchResult> semantic_results(
            const std::string_view query,
            const graph::KnowledgeGraph& graph,
            const EmbeddingIndex& index,
            const std::size_t limit
        ) {
            std::vector<SearchResult> results;
            for (const auto& hit : search_index(query, index, limit * 2)) {
                const auto* node = graph.node(hit.chunk->id);
                if (node == nullptr) {
                    continue;
                }
                const int relevance = to_relevance(hit.similarity);
                auto result = make_result(*node, relevance,
                                          "Semantic similarity: " + std::to_string(relevance) + "%");
                result.similarity = hit.similarity;
                results.push_back(std::move(result));
            }
            return results;
        }

        std::vector<SearchResult> hybrid_results(
            const std::string_view query,
            const graph::KnowledgeGraph& graph,
            const EmbeddingIndex& index,
            const std::size_t limit
        ) {
            std::map<std::string, SearchResult> merged;
            for (auto& result : search_keywords(query, graph)) {
                auto key = result.id;
                merged.emplace(std::move(key), std::move(result));
            }

            for (const auto& hit : search_index(query, index, limit * 2)) {
                const int semantic = to_relevance(hit.similarity);

                if (auto it = merged.find(hit.chunk->id); it != merged.end()) {
                    auto& existing = it->second;
                    existing.relevance = std::min(100, std::max(existing.relevance, semantic) + 10);
                    existing.match_reason += " + Semantic match";
                    existing.similarity = hit.similarity;
                    continue;
                }

                const auto* node = graph.node(hit.chunk->id);
                if (node == nullptr) {
                    continue;
                }
                auto result = make_result(*node, semantic,
                                          "Semantic similarity: " + std::to_string(semantic) + "%");
                result.similarity = hit.similarity;
                merged.emplace(hit.chunk->id, std::move(result));
            }

            std::vector<SearchResult> results;
            results.reserve(merged.size());
            for (auto& [id, result] : merged) {
                results.push_back(std::move(result));
            }
            return results;
        }

    }  // namespace

    const char* to_string(const SearchMode mode) noexcept {
        switch (mode) {
            case SearchMode::Keyword: return "keyword";
            case SearchMode::Semantic: return "semantic";
            case SearchMode::Hybrid: return "hybrid";
        }
        return "keyword";
    }

    std::optional<SearchMode> parse_search_mode(const std::string_view text) noexcept {
        if (text == "keyword") return SearchMode::Keyword;
        if (text == "semantic") return SearchMode::Semantic;
        if (text == "hybrid") return SearchMode::Hybrid;
        return std::nullopt;
    }

    // =========================================================================
    // Query parsing and context
    // =========================================================================

    std::vector<std::string> parse_query(const std::string_view query) {
        const auto normalized = string_utils::to_lower(string_utils::trim(query));

        std::vector<std::string> expanded;
        std::set<std::string> seen;
        const auto add = [&](const std::string_view word) {
            if (seen.emplace(word).second) {
                expanded.emplace_back(word);
            }
        };

        for (const auto& word : string_utils::split_if(normalized, is_query_separator)) {
            if (word.size() <= 1) {
                continue;
            }
            add(word);

            for (const auto& [key, related] : synonyms()) {
                const bool is_key = key == word;
                const bool is_member = std::ranges::find(related, std::string_view(word)) != related.end();
                if (is_key || is_member) {
                    for (const auto synonym : related) {
                        add(synonym);
                    }
                }
            }
        }

        return expanded;
    }

    std::string node_context(const graph::GraphNode& node) {
        if (const auto& doc = node.common.documentation; doc && !doc->empty()) {
            if (doc->size() > CONTEXT_LIMIT) {
                return doc->substr(0, CONTEXT_LIMIT) + "...";
            }
            return *doc;
        }

        const auto& name = node.name();
        switch (node.kind()) {
            case graph::NodeKind::Function: {
                const auto* fn = node.as<graph::FunctionDetails>();
                std::string text = fn->is_async ? "async " : "";
                text += name + "(" + string_utils::join(fn->parameters, ", ") + ")";
                if (fn->return_type) {
                    text += ": " + *fn->return_type;
                }
                return text;
            }
            case graph::NodeKind::Class: {
                const auto* cls = node.as<graph::ClassDetails>();
                std::string text = "class " + name;
                if (cls->extends) {
                    text += " extends " + *cls->extends;
                }
                if (cls->member_count > 0) {
                    text += " (" + std::to_string(cls->member_count) + " members)";
                }
                return text;
            }
            case graph::NodeKind::Interface:
            case graph::NodeKind::TypeAlias:
                return std::string(graph::to_string(node.kind())) + " " + name + " definition";
            case graph::NodeKind::Enum:
                return "enum " + name;
            case graph::NodeKind::Variable:
                return "variable " + name;
            case graph::NodeKind::File: {
                const auto* file = node.as<graph::FileDetails>();
                std::string text = "File: ";
                if (file->line_count > 0) {
                    text += std::to_string(file->line_count) + " lines";
                }
                if (!file->language.empty()) {
                    text += " (" + file->language + ")";
                }
                return text;
            }
        }
        return std::string(graph::to_string(node.kind())) + ": " + name;
    }

    // =========================================================================
    // Search
    // =========================================================================

    std::vector<SearchResult> search_keywords(const std::string_view query, const graph::KnowledgeGraph& graph) {
        const auto keywords = parse_query(query);
        std::vector<SearchResult> results;

        if (keywords.empty()) {
            return results;
        }

        for (const auto& [id, node] : graph.nodes()) {
            auto score = score_node(node, keywords, graph);
            if (score.value > 0) {
                results.push_back(make_result(node, score.value, std::move(score.reason)));
            }
        }

        sort_results(results);
        return results;
    }

    std::vector<std::string> generate_suggestions(
        const std::string_view query,
        const std::vector<SearchResult>& results
    ) {
        std::vector<std::string> suggestions;

        if (results.empty()) {
            suggestions.emplace_back(R"(Try broader terms like "util", "handler", or "service")");
            suggestions.emplace_back(R"(Search for specific file types with "component", "model", or "test")");
        } else if (results.size() > BROAD_RESULT_COUNT) {
            suggestions.emplace_back("Add more specific terms to narrow results");

            std::vector<std::string> kinds;
            for (const auto& result : results) {
                const std::string kind = graph::to_string(result.kind);
                if (std::ranges::find(kinds, kind) == kinds.end()) {
                    kinds.push_back(kind);
                }
            }
            if (kinds.size() > 1) {
                kinds.resize(std::min<std::size_t>(kinds.size(), 3));
                suggestions.push_back("Filter by type: " + string_utils::join(kinds, ", "));
            }
        } else {
            const auto& top = results.front();
            const std::string kind = graph::to_string(top.kind);

            if (top.kind != graph::NodeKind::File) {
                suggestions.push_back("Explore file: \"" + path_utils::basename(top.file) + "\"");
            }
            if (!string_utils::contains(string_utils::to_lower(query), kind)) {
                suggestions.push_back("Search \"" + std::string(query) + " " + kind + "\"");
            }
        }

        if (suggestions.size() > SUGGESTION_LIMIT) {
            suggestions.resize(SUGGESTION_LIMIT);
        }
        return suggestions;
    }

    Result<SearchResponse, Error> search(
        const std::string_view query,
        const graph::KnowledgeGraph& graph,
        const EmbeddingIndex* index,
        const SearchOptions& options
    ) {
        const auto start = SteadyClock::now();
        auto log = logging::logger();

        SearchResponse response;
        response.query = std::string(query);
        response.mode = options.mode;

        switch (options.mode) {
            case SearchMode::Keyword:
                response.results = search_keywords(query, graph);
                break;

            case SearchMode::Semantic:
                if (index == nullptr) {
                    return Result<SearchResponse, Error>::failure(Error::index_error(
                        "No embedding index available for semantic search; build the embedding index first"));
                }
                response.results = semantic_results(query, graph, *index, options.limit);
                break;

            case SearchMode::Hybrid:
                if (index == nullptr) {
                    log->info("No embedding index, hybrid search falls back to keyword search");
                    response.mode = SearchMode::Keyword;
                    response.results = search_keywords(query, graph);
                } else {
                    response.results = hybrid_results(query, graph, *index, options.limit);
                }
                break;
        }

        sort_results(response.results);
        response.total_matches = response.results.size();
        response.suggestions = generate_suggestions(query, response.results);

        if (response.results.size() > options.limit) {
            response.results.resize(options.limit);
        }

        response.search_time = std::chrono::duration_cast<Duration>(SteadyClock::now() - start);
        log->debug("Search \"{}\" ({}): {} matches in {}ms",
                   response.query, to_string(response.mode), response.total_matches, response.search_time.count());
        return Result<SearchResponse, Error>::success(std::move(response));
    }

}  // namespace rkg::search
