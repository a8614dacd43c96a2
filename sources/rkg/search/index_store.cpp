#include "rkg/search/index_store.hpp"
#include "rkg/graph/persistence.hpp"
#include "rkg/logging.hpp"
#include "rkg/utils/file_utils.hpp"
#include "rkg/utils/json_utils.hpp"

namespace rkg::search {

    using json = nlohmann::json;

    SparseVector compress_embedding(const Vector& dense) {
        SparseVector sparse;
        for (std::size_t i = 0; i < dense.size(); ++i) {
            if (dense[i] != 0.0) {
                sparse.emplace_back(i, dense[i]);
            }
        }
        return sparse;
    }

    Vector decompress_embedding(const SparseVector& sparse, const std::size_t size) {
        Vector dense(size, 0.0);
        for (const auto& [position, value] : sparse) {
            if (position < size) {
                dense[position] = value;
            }
        }
        return dense;
    }

    fs::path index_path(const fs::path& root, const std::string_view directory) {
        return graph::storage_path(root, directory) / fs::path(EMBEDDINGS_FILE);
    }

    // =========================================================================
    // Serialization
    // =========================================================================

    json serialize_index(const EmbeddingIndex& index) {
        json chunks = json::array();
        for (const auto& chunk : index.chunks) {
            json embedding = json::array();
            for (const auto& [position, value] : compress_embedding(chunk.embedding)) {
                embedding.push_back(json::array({position, value}));
            }

            chunks.push_back({
                {"id", chunk.id},
                {"filePath", chunk.file_path},
                {"type", graph::to_string(chunk.kind)},
                {"name", chunk.name},
                {"content", chunk.content},
                {"startLine", chunk.start_line},
                {"endLine", chunk.end_line},
                {"embedding", std::move(embedding)}
            });
        }

        json j;
        j["chunks"] = std::move(chunks);
        j["vocabulary"] = index.vocabulary;
        j["idf"] = index.idf;
        j["version"] = index.version;
        j["createdAt"] = index.created_at;
        j["chunkCount"] = index.chunk_count();
        j["vocabularySize"] = index.vocabulary_size();
        return j;
    }

    Result<EmbeddingIndex, Error> deserialize_index(const json& j) {
        try {
            EmbeddingIndex index;
            index.vocabulary = j.at("vocabulary").get<std::vector<std::string>>();
            index.idf = j.at("idf").get<std::vector<double>>();
            index.version = j.value("version", std::string("1.0.0"));
            index.created_at = j.value("createdAt", std::string{});

            if (index.idf.size() != index.vocabulary.size()) {
                return Result<EmbeddingIndex, Error>::failure(
                    Error::parse_error("idf and vocabulary lengths differ"));
            }

            const auto size = index.vocabulary.size();
            for (const auto& cj : j.at("chunks")) {
                CodeChunk chunk;
                chunk.id = cj.at("id").get<std::string>();
                chunk.file_path = cj.value("filePath", std::string{});
                chunk.name = cj.value("name", std::string{});
                chunk.content = cj.value("content", std::string{});
                chunk.start_line = cj.value("startLine", std::size_t{0});
                chunk.end_line = cj.value("endLine", std::size_t{0});

                const auto type = cj.value("type", std::string("file"));
                const auto kind = graph::parse_node_kind(type);
                if (!kind) {
                    return Result<EmbeddingIndex, Error>::failure(Error::parse_error("Unknown chunk type", type));
                }
                chunk.kind = *kind;

                SparseVector sparse;
                if (const auto it = cj.find("embedding"); it != cj.end() && it->is_array()) {
                    for (const auto& pair : *it) {
                        const auto position = pair.at(0).get<std::size_t>();
                        if (position >= size) {
                            return Result<EmbeddingIndex, Error>::failure(
                                Error::parse_error("Embedding position out of range", chunk.id));
                        }
                        sparse.emplace_back(position, pair.at(1).get<double>());
                    }
                }
                chunk.embedding = decompress_embedding(sparse, size);
                index.chunks.push_back(std::move(chunk));
            }
            return Result<EmbeddingIndex, Error>::success(std::move(index));
        } catch (const json::exception& e) {
            return Result<EmbeddingIndex, Error>::failure(Error::parse_error("Malformed embedding index", e.what()));
        }
    }

    // =========================================================================
    // Storage
    // =========================================================================

    Result<void, Error> save_index(const EmbeddingIndex& index, const fs::path& root, const std::string_view directory) {
        const auto path = index_path(root, directory);
        if (auto written = json_utils::write_file(path, serialize_index(index)); written.is_err()) {
            return written;
        }
        logging::logger()->info("Saved embedding index ({} chunks) to {}", index.chunk_count(), path.string());
        return Result<void, Error>::success();
    }

    Result<EmbeddingIndex, Error> load_index(const fs::path& root, const std::string_view directory) {
        const auto path = index_path(root, directory);
        auto doc = json_utils::read_file(path);
        if (doc.is_err()) {
            return Result<EmbeddingIndex, Error>::failure(doc.error());
        }
        auto index = deserialize_index(doc.value());
        if (index.is_err()) {
            return Result<EmbeddingIndex, Error>::failure(index.error().with_context(path.string()));
        }
        logging::logger()->debug("Loaded embedding index ({} chunks)", index.value().chunk_count());
        return index;
    }

    bool index_exists(const fs::path& root, const std::string_view directory) {
        std::error_code ec;
        return fs::exists(index_path(root, directory), ec);
    }

    Result<void, Error> delete_index(const fs::path& root, const std::string_view directory) {
        return file_utils::remove_file(index_path(root, directory));
    }

    bool is_index_stale(const fs::path& root, const std::string_view directory) {
        auto index_time = file_utils::last_modified(index_path(root, directory));
        auto graph_time = file_utils::last_modified(graph::graph_path(root, directory));
        if (index_time.is_err() || graph_time.is_err()) {
            return true;
        }
        return graph_time.value() > index_time.value();
    }

}  // namespace rkg::search
