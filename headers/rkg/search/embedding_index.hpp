#ifndef RKG_SEARCH_EMBEDDING_INDEX_HPP
#define RKG_SEARCH_EMBEDDING_INDEX_HPP

/**
 * @file embedding_index.hpp
 * @brief TF-IDF vectors over graph nodes.
 *
 * Every graph node becomes one CodeChunk: a short synthesized document
 * (name, kind, path segments, documentation, signature bits and the names
 * of related nodes) and its L2-normalized TF-IDF vector over the sorted
 * vocabulary of all chunks.
 *
 * Building is two-pass. Pass one tokenizes every document, optionally on
 * a thread pool. Document frequencies and IDF weights are then computed
 * globally, and pass two emits the vectors.
 *
 * Vectors are dense in memory. Sparsity is applied only when persisting
 * (see index_store.hpp).
 */

#include "rkg/graph/knowledge_graph.hpp"
#include "rkg/search/vector_math.hpp"
#include "rkg/utils/parallel.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rkg::search {

    inline constexpr std::size_t RELATED_NODE_LIMIT = 10;

    struct CodeChunk {
        std::string id;
        std::string file_path;
        graph::NodeKind kind = graph::NodeKind::File;
        std::string name;
        std::string content;
        std::size_t start_line = 0;
        std::size_t end_line = 0;
        Vector embedding;  ///< vocabulary().size() entries

        bool operator==(const CodeChunk&) const = default;
    };

    struct EmbeddingIndex {
        std::vector<CodeChunk> chunks;        ///< Sorted by id
        std::vector<std::string> vocabulary;  ///< Sorted, distinct
        std::vector<double> idf;              ///< Aligned with vocabulary
        std::string version = "1.0.0";
        std::string created_at;

        [[nodiscard]] std::size_t chunk_count() const noexcept { return chunks.size(); }
        [[nodiscard]] std::size_t vocabulary_size() const noexcept { return vocabulary.size(); }
        [[nodiscard]] bool empty() const noexcept { return chunks.empty(); }

        bool operator==(const EmbeddingIndex&) const = default;
    };

    /**
     * Document text indexed for node.
     */
    [[nodiscard]] std::string chunk_content(const graph::GraphNode& node, const graph::KnowledgeGraph& graph);

    /**
     * Normalized TF-IDF vector of text against a fixed vocabulary.
     * Terms outside the vocabulary contribute nothing.
     */
    [[nodiscard]] Vector tfidf_vector(
        std::string_view text,
        const std::vector<std::string>& vocabulary,
        const std::vector<double>& idf
    );

    /**
     * Builds the index for every node of graph.
     *
     * @param pool Optional pool for pass-one tokenization.
     */
    [[nodiscard]] EmbeddingIndex build_index(
        const graph::KnowledgeGraph& graph,
        parallel::ThreadPool* pool = nullptr
    );

    struct SemanticHit {
        const CodeChunk* chunk = nullptr;  ///< Points into the searched index
        double similarity = 0.0;
    };

    /**
     * Chunks with positive cosine similarity to query, best first.
     * An all out-of-vocabulary query yields no hits.
     */
    [[nodiscard]] std::vector<SemanticHit> search_index(
        std::string_view query,
        const EmbeddingIndex& index,
        std::size_t limit = 10
    );

}  // namespace rkg::search

#endif  // RKG_SEARCH_EMBEDDING_INDEX_HPP
