#include "rkg/search/embedding_index.hpp"
#include "rkg/logging.hpp"
#include "rkg/search/tokenizer.hpp"
#include "rkg/types.hpp"
#include "rkg/utils/path_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <unordered_map>

namespace rkg::search {

    namespace {

        using TermFrequencies = std::unordered_map<std::string, double>;

        TermFrequencies term_frequencies(const std::vector<std::string>& tokens) {
            TermFrequencies tf;
            for (const auto& token : tokens) {
                tf[token] += 1.0;
            }
            const auto total = static_cast<double>(tokens.size());
            for (auto& [term, count] : tf) {
                count /= total;
            }
            return tf;
        }

        Vector vectorize(
            const TermFrequencies& tf,
            const std::unordered_map<std::string, std::size_t>& positions,
            const std::vector<double>& idf
        ) {
            Vector vector(idf.size(), 0.0);
            for (const auto& [term, frequency] : tf) {
                if (const auto it = positions.find(term); it != positions.end()) {
                    vector[it->second] = frequency * idf[it->second];
                }
            }
            l2_normalize(vector);
            return vector;
        }

        std::unordered_map<std::string, std::size_t> position_map(const std::vector<std::string>& vocabulary) {
            std::unordered_map<std::string, std::size_t> positions;
            positions.reserve(vocabulary.size());
            for (std::size_t i = 0; i < vocabulary.size(); ++i) {
                positions.emplace(vocabulary[i], i);
            }
            return positions;
        }

        /**
         * Edges touching each node id, in edge order.
         */
        std::map<std::string, std::vector<const graph::GraphEdge*>> edges_by_endpoint(
            const graph::KnowledgeGraph& graph
        ) {
            std::map<std::string, std::vector<const graph::GraphEdge*>> result;
            for (const auto& edge : graph.edges()) {
                result[edge.source].push_back(&edge);
                if (edge.target != edge.source) {
                    result[edge.target].push_back(&edge);
                }
            }
            return result;
        }

        void append_related(
            std::vector<std::string>& parts,
            const graph::GraphNode& node,
            const graph::KnowledgeGraph& graph,
            const std::vector<const graph::GraphEdge*>& touching
        ) {
            const auto count = std::min(touching.size(), RELATED_NODE_LIMIT);
            for (std::size_t i = 0; i < count; ++i) {
                const auto* edge = touching[i];
                const auto& other = edge->source == node.id() ? edge->target : edge->source;
                if (const auto* related = graph.node(other)) {
                    parts.push_back(related->name());
                }
            }
        }

        std::vector<std::string> own_parts(const graph::GraphNode& node) {
            std::vector<std::string> parts;
            parts.push_back(node.name());
            parts.emplace_back(graph::to_string(node.kind()));

            for (auto& segment : path_utils::segments(node.file_path())) {
                parts.push_back(std::move(segment));
            }
            if (node.common.documentation) {
                parts.push_back(*node.common.documentation);
            }

            if (const auto* fn = node.as<graph::FunctionDetails>()) {
                parts.insert(parts.end(), fn->parameters.begin(), fn->parameters.end());
                if (fn->return_type) {
                    parts.push_back(*fn->return_type);
                }
                if (fn->is_async) {
                    parts.emplace_back("async");
                }
            } else if (const auto* cls = node.as<graph::ClassDetails>()) {
                if (cls->extends) {
                    parts.emplace_back("extends");
                    parts.push_back(*cls->extends);
                }
                if (!cls->implements.empty()) {
                    parts.emplace_back("implements");
                    parts.insert(parts.end(), cls->implements.begin(), cls->implements.end());
                }
            }
            return parts;
        }

        std::string join_parts(const std::vector<std::string>& parts) {
            std::string text;
            for (const auto& part : parts) {
                if (!text.empty()) {
                    text.push_back(' ');
                }
                text += part;
            }
            return text;
        }

    }  // namespace

    std::string chunk_content(const graph::GraphNode& node, const graph::KnowledgeGraph& graph) {
        auto parts = own_parts(node);

        std::vector<const graph::GraphEdge*> touching;
        for (const auto& edge : graph.edges()) {
            if (edge.source == node.id() || edge.target == node.id()) {
                touching.push_back(&edge);
                if (touching.size() == RELATED_NODE_LIMIT) {
                    break;
                }
            }
        }
        append_related(parts, node, graph, touching);

        return join_parts(parts);
    }

    Vector tfidf_vector(
        const std::string_view text,
        const std::vector<std::string>& vocabulary,
        const std::vector<double>& idf
    ) {
        return vectorize(term_frequencies(tokenize(text)), position_map(vocabulary), idf);
    }

    // =========================================================================
    // Index construction
    // =========================================================================

    EmbeddingIndex build_index(const graph::KnowledgeGraph& graph, parallel::ThreadPool* pool) {
        const auto start = SteadyClock::now();
        EmbeddingIndex index;
        index.created_at = format_timestamp(std::chrono::system_clock::now());

        const auto adjacency = edges_by_endpoint(graph);
        static const std::vector<const graph::GraphEdge*> no_edges;

        for (const auto& [id, node] : graph.nodes()) {
            auto parts = own_parts(node);
            const auto it = adjacency.find(id);
            append_related(parts, node, graph, it == adjacency.end() ? no_edges : it->second);

            CodeChunk chunk;
            chunk.id = id;
            chunk.file_path = node.file_path();
            chunk.kind = node.kind();
            chunk.name = node.name();
            chunk.content = join_parts(parts);
            chunk.start_line = node.common.line_start;
            chunk.end_line = node.common.line_end;
            index.chunks.push_back(std::move(chunk));
        }

        // Pass one: tokenize
        std::vector<std::vector<std::string>> documents;
        if (pool != nullptr) {
            documents = parallel::map(index.chunks,
                                      [](const CodeChunk& chunk) { return tokenize(chunk.content); },
                                      *pool);
        } else {
            documents.reserve(index.chunks.size());
            for (const auto& chunk : index.chunks) {
                documents.push_back(tokenize(chunk.content));
            }
        }

        // Global vocabulary and document frequency
        std::map<std::string, std::size_t> document_frequency;
        for (const auto& tokens : documents) {
            for (const auto& term : std::set<std::string>(tokens.begin(), tokens.end())) {
                ++document_frequency[term];
            }
        }

        const auto n = static_cast<double>(documents.size());
        index.vocabulary.reserve(document_frequency.size());
        index.idf.reserve(document_frequency.size());
        for (const auto& [term, df] : document_frequency) {
            index.vocabulary.push_back(term);
            index.idf.push_back(std::log(n / static_cast<double>(df)));
        }

        // Pass two: vectors
        const auto positions = position_map(index.vocabulary);
        for (std::size_t i = 0; i < index.chunks.size(); ++i) {
            index.chunks[i].embedding = vectorize(term_frequencies(documents[i]), positions, index.idf);
        }

        logging::logger()->info(
            "Built embedding index: {} chunks, {} terms in {}ms",
            index.chunk_count(), index.vocabulary_size(),
            std::chrono::duration_cast<Duration>(SteadyClock::now() - start).count());
        return index;
    }

    // =========================================================================
    // Query
    // =========================================================================

    std::vector<SemanticHit> search_index(
        const std::string_view query,
        const EmbeddingIndex& index,
        const std::size_t limit
    ) {
        const auto query_vector = tfidf_vector(query, index.vocabulary, index.idf);

        std::vector<SemanticHit> hits;
        for (const auto& chunk : index.chunks) {
            const double similarity = cosine_similarity(query_vector, chunk.embedding);
            if (similarity > 0.0) {
                hits.push_back({&chunk, similarity});
            }
        }

        std::ranges::stable_sort(hits, [](const SemanticHit& a, const SemanticHit& b) {
            return a.similarity > b.similarity;
        });

        if (hits.size() > limit) {
            hits.resize(limit);
        }
        return hits;
    }

}  // namespace rkg::search
