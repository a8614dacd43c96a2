#ifndef RKG_SEARCH_INDEX_STORE_HPP
#define RKG_SEARCH_INDEX_STORE_HPP

/**
 * @file index_store.hpp
 * @brief Persists the embedding index as <root>/<storage dir>/embeddings.json.
 *
 * Embeddings are written sparsely as [[position, value], ...] for the
 * non-zero entries and expanded back to full length on load.
 */

#include "rkg/error.hpp"
#include "rkg/graph/persistence.hpp"
#include "rkg/result.hpp"
#include "rkg/search/embedding_index.hpp"
#include "rkg/types.hpp"

#include <nlohmann/json.hpp>

#include <string_view>
#include <utility>
#include <vector>

namespace rkg::search {

    inline constexpr std::string_view EMBEDDINGS_FILE = "embeddings.json";

    using SparseVector = std::vector<std::pair<std::size_t, double>>;

    /**
     * Non-zero entries of dense, in position order.
     */
    [[nodiscard]] SparseVector compress_embedding(const Vector& dense);

    /**
     * Full-length vector with the sparse entries scattered in. Entries at
     * or past size are ignored.
     */
    [[nodiscard]] Vector decompress_embedding(const SparseVector& sparse, std::size_t size);

    [[nodiscard]] fs::path index_path(const fs::path& root, std::string_view directory = graph::DEFAULT_STORAGE_DIR);

    [[nodiscard]] nlohmann::json serialize_index(const EmbeddingIndex& index);
    [[nodiscard]] Result<EmbeddingIndex, Error> deserialize_index(const nlohmann::json& j);

    [[nodiscard]] Result<void, Error> save_index(
        const EmbeddingIndex& index,
        const fs::path& root,
        std::string_view directory = graph::DEFAULT_STORAGE_DIR
    );

    /**
     * @return The index, NotFound when missing, ParseError when corrupt.
     */
    [[nodiscard]] Result<EmbeddingIndex, Error> load_index(
        const fs::path& root,
        std::string_view directory = graph::DEFAULT_STORAGE_DIR
    );

    [[nodiscard]] bool index_exists(const fs::path& root, std::string_view directory = graph::DEFAULT_STORAGE_DIR);

    [[nodiscard]] Result<void, Error> delete_index(const fs::path& root, std::string_view directory = graph::DEFAULT_STORAGE_DIR);

    /**
     * True when graph.json is newer than embeddings.json or either is
     * missing.
     */
    [[nodiscard]] bool is_index_stale(const fs::path& root, std::string_view directory = graph::DEFAULT_STORAGE_DIR);

}  // namespace rkg::search

#endif  // RKG_SEARCH_INDEX_STORE_HPP
