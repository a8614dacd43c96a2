#ifndef RKG_SEARCH_SEARCH_ENGINE_HPP
#define RKG_SEARCH_SEARCH_ENGINE_HPP

/**
 * @file search_engine.hpp
 * @brief Keyword, semantic and hybrid search over a graph.
 *
 * Keyword search needs only the graph. It expands the query with a table
 * of development synonyms and scores node names and paths. Semantic search
 * ranks index chunks by cosine similarity and fails with IndexError when
 * no index is given. Hybrid merges both by node id and quietly becomes a
 * keyword search when there is no index.
 */

#include "rkg/error.hpp"
#include "rkg/graph/knowledge_graph.hpp"
#include "rkg/result.hpp"
#include "rkg/search/embedding_index.hpp"
#include "rkg/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rkg::search {

    enum class SearchMode {
        Keyword,
        Semantic,
        Hybrid
    };

    [[nodiscard]] const char* to_string(SearchMode mode) noexcept;
    [[nodiscard]] std::optional<SearchMode> parse_search_mode(std::string_view text) noexcept;

    struct SearchOptions {
        SearchMode mode = SearchMode::Hybrid;
        std::size_t limit = 20;
    };

    struct SearchResult {
        std::string id;
        std::string file;
        graph::NodeKind kind = graph::NodeKind::File;
        std::string name;
        int relevance = 0;  ///< 0-100
        std::optional<double> similarity;
        std::string context;
        std::size_t line = 0;
        std::string match_reason;
    };

    struct SearchResponse {
        std::string query;
        SearchMode mode = SearchMode::Keyword;  ///< Mode actually used
        std::vector<SearchResult> results;
        std::size_t total_matches = 0;  ///< Matches before the limit
        Duration search_time = Duration::zero();
        std::vector<std::string> suggestions;  ///< At most 3
    };

    /**
     * Lower-cased query words (separators: whitespace , . _ - /, words of
     * one character dropped) plus their synonyms, without duplicates.
     */
    [[nodiscard]] std::vector<std::string> parse_query(std::string_view query);

    /**
     * Short description of a node for result listings.
     */
    [[nodiscard]] std::string node_context(const graph::GraphNode& node);

    /**
     * Scores every node against the query. Returns all matches, best first,
     * ties ordered by name.
     */
    [[nodiscard]] std::vector<SearchResult> search_keywords(
        std::string_view query,
        const graph::KnowledgeGraph& graph
    );

    /**
     * Refinement hints for a result list.
     */
    [[nodiscard]] std::vector<std::string> generate_suggestions(
        std::string_view query,
        const std::vector<SearchResult>& results
    );

    /**
     * Runs a search in the requested mode.
     *
     * @param index Embedding index, or nullptr when none is built.
     * @return The response, or IndexError for a semantic search without an
     *         index.
     */
    [[nodiscard]] Result<SearchResponse, Error> search(
        std::string_view query,
        const graph::KnowledgeGraph& graph,
        const EmbeddingIndex* index,
        const SearchOptions& options = {}
    );

}  // namespace rkg::search

#endif  // RKG_SEARCH_SEARCH_ENGINE_HPP
