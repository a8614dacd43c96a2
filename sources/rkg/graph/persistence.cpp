#include "rkg/graph/persistence.hpp"
#include "rkg/frontend/discovery.hpp"
#include "rkg/logging.hpp"
#include "rkg/utils/file_utils.hpp"
#include "rkg/utils/json_utils.hpp"

namespace rkg::graph {

    using json = nlohmann::json;

    namespace {

        template<typename T>
        void put_optional(json& j, const char* key, const std::optional<T>& value) {
            if (value) {
                j[key] = *value;
            }
        }

        template<typename T>
        std::optional<T> get_optional(const json& j, const char* key) {
            if (const auto it = j.find(key); it != j.end() && !it->is_null()) {
                return it->template get<T>();
            }
            return std::nullopt;
        }

        void serialize_details(json& j, const NodeDetails& details) {
            std::visit([&j]<typename T>(const T& d) {
                if constexpr (std::is_same_v<T, FileDetails>) {
                    j["language"] = d.language;
                    j["lineCount"] = d.line_count;
                    j["importCount"] = d.import_count;
                    j["exportCount"] = d.export_count;
                } else if constexpr (std::is_same_v<T, FunctionDetails>) {
                    j["parameters"] = d.parameters;
                    put_optional(j, "returnType", d.return_type);
                    j["isAsync"] = d.is_async;
                    j["isGenerator"] = d.is_generator;
                } else if constexpr (std::is_same_v<T, ClassDetails>) {
                    j["isAbstract"] = d.is_abstract;
                    put_optional(j, "extends", d.extends);
                    j["implements"] = d.implements;
                    j["memberCount"] = d.member_count;
                }
            }, details);
        }

        NodeDetails deserialize_details(const NodeKind kind, const json& j) {
            switch (kind) {
                case NodeKind::File: {
                    FileDetails d;
                    d.language = j.value("language", std::string("javascript"));
                    d.line_count = j.value("lineCount", std::size_t{0});
                    d.import_count = j.value("importCount", std::size_t{0});
                    d.export_count = j.value("exportCount", std::size_t{0});
                    return d;
                }
                case NodeKind::Function: {
                    FunctionDetails d;
                    d.parameters = j.value("parameters", std::vector<std::string>{});
                    d.return_type = get_optional<std::string>(j, "returnType");
                    d.is_async = j.value("isAsync", false);
                    d.is_generator = j.value("isGenerator", false);
                    return d;
                }
                case NodeKind::Class: {
                    ClassDetails d;
                    d.is_abstract = j.value("isAbstract", false);
                    d.extends = get_optional<std::string>(j, "extends");
                    d.implements = j.value("implements", std::vector<std::string>{});
                    d.member_count = j.value("memberCount", std::size_t{0});
                    return d;
                }
                case NodeKind::Interface: return InterfaceDetails{};
                case NodeKind::TypeAlias: return TypeAliasDetails{};
                case NodeKind::Enum: return EnumDetails{};
                case NodeKind::Variable: return VariableDetails{};
            }
            return VariableDetails{};
        }

        Result<json, Error> read_document(const fs::path& path) {
            auto doc = json_utils::read_file(path);
            if (doc.is_err()) {
                return doc;
            }
            if (!doc.value().is_object()) {
                return Result<json, Error>::failure(
                    Error::parse_error("Expected a JSON object", path.string()));
            }
            return doc;
        }

    }  // namespace

    // =========================================================================
    // Paths
    // =========================================================================

    fs::path storage_path(const fs::path& root, const std::string_view directory) {
        return root / fs::path(directory);
    }

    fs::path graph_path(const fs::path& root, const std::string_view directory) {
        return storage_path(root, directory) / fs::path(GRAPH_FILE);
    }

    fs::path metadata_path(const fs::path& root, const std::string_view directory) {
        return storage_path(root, directory) / fs::path(METADATA_FILE);
    }

    // =========================================================================
    // Serialization
    // =========================================================================

    json serialize_node(const GraphNode& node) {
        const auto& c = node.common;
        json j;
        j["id"] = c.id;
        j["type"] = to_string(node.kind());
        j["name"] = c.name;
        j["filePath"] = c.file_path;
        j["lineStart"] = c.line_start;
        j["lineEnd"] = c.line_end;
        j["exported"] = c.exported;
        put_optional(j, "complexity", c.complexity);
        put_optional(j, "documentation", c.documentation);
        put_optional(j, "lastModified", c.last_modified);
        put_optional(j, "modificationCount", c.modification_count);
        put_optional(j, "contributors", c.contributors);
        serialize_details(j, node.details);
        return j;
    }

    Result<GraphNode, Error> deserialize_node(const json& j) {
        try {
            const auto type = j.at("type").get<std::string>();
            const auto kind = parse_node_kind(type);
            if (!kind) {
                return Result<GraphNode, Error>::failure(Error::parse_error("Unknown node type", type));
            }

            GraphNode node;
            auto& c = node.common;
            c.id = j.at("id").get<std::string>();
            c.name = j.value("name", std::string{});
            c.file_path = j.value("filePath", std::string{});
            c.line_start = j.value("lineStart", std::size_t{0});
            c.line_end = j.value("lineEnd", std::size_t{0});
            c.exported = j.value("exported", false);
            c.complexity = get_optional<int>(j, "complexity");
            c.documentation = get_optional<std::string>(j, "documentation");
            c.last_modified = get_optional<std::string>(j, "lastModified");
            c.modification_count = get_optional<std::size_t>(j, "modificationCount");
            c.contributors = get_optional<std::vector<std::string>>(j, "contributors");
            node.details = deserialize_details(*kind, j);
            return Result<GraphNode, Error>::success(std::move(node));
        } catch (const json::exception& e) {
            return Result<GraphNode, Error>::failure(Error::parse_error("Malformed node", e.what()));
        }
    }

    json serialize_edge(const GraphEdge& edge) {
        json j;
        j["id"] = edge.id;
        j["source"] = edge.source;
        j["target"] = edge.target;
        j["type"] = to_string(edge.kind);
        put_optional(j, "weight", edge.weight);
        if (edge.metadata) {
            j["metadata"] = {
                {"symbols", edge.metadata->symbols},
                {"isDefault", edge.metadata->is_default},
                {"isNamespace", edge.metadata->is_namespace},
                {"isTypeOnly", edge.metadata->is_type_only}
            };
        }
        return j;
    }

    Result<GraphEdge, Error> deserialize_edge(const json& j) {
        try {
            const auto type = j.at("type").get<std::string>();
            const auto kind = parse_edge_kind(type);
            if (!kind) {
                return Result<GraphEdge, Error>::failure(Error::parse_error("Unknown edge type", type));
            }

            GraphEdge edge;
            edge.id = j.value("id", std::string{});
            edge.source = j.at("source").get<std::string>();
            edge.target = j.at("target").get<std::string>();
            edge.kind = *kind;
            edge.weight = get_optional<double>(j, "weight");

            if (const auto it = j.find("metadata"); it != j.end() && it->is_object()) {
                ImportEdgeMetadata meta;
                meta.symbols = it->value("symbols", std::vector<std::string>{});
                meta.is_default = it->value("isDefault", false);
                meta.is_namespace = it->value("isNamespace", false);
                meta.is_type_only = it->value("isTypeOnly", false);
                edge.metadata = std::move(meta);
            }
            return Result<GraphEdge, Error>::success(std::move(edge));
        } catch (const json::exception& e) {
            return Result<GraphEdge, Error>::failure(Error::parse_error("Malformed edge", e.what()));
        }
    }

    json serialize_metadata(const GraphMetadata& metadata) {
        json j;
        j["scannedAt"] = metadata.scanned_at;
        j["scanDurationMs"] = metadata.scan_duration_ms;
        j["rootDir"] = metadata.root_dir;
        j["fileCount"] = metadata.file_count;
        j["totalLines"] = metadata.total_lines;
        j["languages"] = metadata.languages;
        j["nodeCount"] = metadata.node_count;
        j["edgeCount"] = metadata.edge_count;
        return j;
    }

    GraphMetadata deserialize_metadata(const json& j) {
        GraphMetadata metadata;
        metadata.scanned_at = json_utils::get_or<std::string>(j, "scannedAt", "");
        metadata.scan_duration_ms = json_utils::get_or<std::int64_t>(j, "scanDurationMs", 0);
        metadata.root_dir = json_utils::get_or<std::string>(j, "rootDir", "");
        metadata.file_count = json_utils::get_or<std::size_t>(j, "fileCount", 0);
        metadata.total_lines = json_utils::get_or<std::size_t>(j, "totalLines", 0);
        metadata.languages = json_utils::get_or<std::map<std::string, std::size_t>>(j, "languages", {});
        metadata.node_count = json_utils::get_or<std::size_t>(j, "nodeCount", 0);
        metadata.edge_count = json_utils::get_or<std::size_t>(j, "edgeCount", 0);
        return metadata;
    }

    json serialize_graph(const KnowledgeGraph& graph) {
        json j;
        j["version"] = graph.version();
        j["metadata"] = serialize_metadata(graph.metadata());

        json nodes = json::object();
        for (const auto& [id, node] : graph.nodes()) {
            nodes[id] = serialize_node(node);
        }
        j["nodes"] = std::move(nodes);

        json edges = json::array();
        for (const auto& edge : graph.edges()) {
            edges.push_back(serialize_edge(edge));
        }
        j["edges"] = std::move(edges);
        return j;
    }

    Result<KnowledgeGraph, Error> deserialize_graph(const json& j) {
        const auto nodes_it = j.find("nodes");
        const auto edges_it = j.find("edges");
        if (nodes_it == j.end() || !nodes_it->is_object() || edges_it == j.end() || !edges_it->is_array()) {
            return Result<KnowledgeGraph, Error>::failure(
                Error::parse_error("Graph document needs a nodes object and an edges array"));
        }

        std::map<std::string, GraphNode> nodes;
        for (const auto& [id, value] : nodes_it->items()) {
            auto node = deserialize_node(value);
            if (node.is_err()) {
                return Result<KnowledgeGraph, Error>::failure(node.error().with_context("node " + id));
            }
            nodes.insert_or_assign(id, std::move(node.value()));
        }

        std::vector<GraphEdge> edges;
        edges.reserve(edges_it->size());
        for (const auto& value : *edges_it) {
            auto edge = deserialize_edge(value);
            if (edge.is_err()) {
                return Result<KnowledgeGraph, Error>::failure(edge.error());
            }
            edges.push_back(std::move(edge.value()));
        }

        GraphMetadata metadata;
        if (const auto it = j.find("metadata"); it != j.end() && it->is_object()) {
            metadata = deserialize_metadata(*it);
        }

        return Result<KnowledgeGraph, Error>::success(KnowledgeGraph(
            json_utils::get_or<std::string>(j, "version", "1.0.0"),
            std::move(metadata),
            std::move(nodes),
            std::move(edges)
        ));
    }

    // =========================================================================
    // Storage
    // =========================================================================

    Result<void, Error> save_graph(const KnowledgeGraph& graph, const fs::path& root, const std::string_view directory) {
        const auto path = graph_path(root, directory);
        if (auto written = json_utils::write_file(path, serialize_graph(graph)); written.is_err()) {
            return written;
        }
        if (auto written = json_utils::write_file(metadata_path(root, directory),
                                                  serialize_metadata(graph.metadata()));
            written.is_err()) {
            return written;
        }
        logging::logger()->info("Saved graph with {} nodes to {}", graph.node_count(), path.string());
        return Result<void, Error>::success();
    }

    Result<KnowledgeGraph, Error> load_graph(const fs::path& root, const std::string_view directory) {
        const auto path = graph_path(root, directory);
        auto doc = read_document(path);
        if (doc.is_err()) {
            return Result<KnowledgeGraph, Error>::failure(doc.error());
        }
        auto graph = deserialize_graph(doc.value());
        if (graph.is_err()) {
            return Result<KnowledgeGraph, Error>::failure(graph.error().with_context(path.string()));
        }
        logging::logger()->debug("Loaded graph with {} nodes from {}", graph.value().node_count(), path.string());
        return graph;
    }

    Result<GraphMetadata, Error> load_metadata(const fs::path& root, const std::string_view directory) {
        auto doc = read_document(metadata_path(root, directory));
        if (doc.is_err()) {
            return Result<GraphMetadata, Error>::failure(doc.error());
        }
        return Result<GraphMetadata, Error>::success(deserialize_metadata(doc.value()));
    }

    bool graph_exists(const fs::path& root, const std::string_view directory) {
        std::error_code ec;
        return fs::exists(graph_path(root, directory), ec);
    }

    bool is_graph_stale(const fs::path& root, const std::string_view directory) {
        auto metadata = load_metadata(root, directory);
        if (metadata.is_err()) {
            return true;
        }
        const auto scanned_at = parse_timestamp(metadata.value().scanned_at);

        auto files = frontend::discover_source_files(root);
        if (files.is_err()) {
            return true;
        }

        for (const auto& file : files.value()) {
            auto modified = file_utils::last_modified(root / file);
            if (modified.is_err()) {
                return true;
            }
            if (std::chrono::file_clock::to_sys(modified.value()) > scanned_at) {
                logging::logger()->debug("Graph is stale: {} changed after the last scan", file);
                return true;
            }
        }
        return false;
    }

    Result<void, Error> delete_graph(const fs::path& root, const std::string_view directory) {
        for (const auto& path : {graph_path(root, directory), metadata_path(root, directory)}) {
            if (auto removed = file_utils::remove_file(path); removed.is_err()) {
                return removed;
            }
        }
        return Result<void, Error>::success();
    }

}  // namespace rkg::graph
