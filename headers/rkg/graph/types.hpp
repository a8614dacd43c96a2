#ifndef RKG_GRAPH_TYPES_HPP
#define RKG_GRAPH_TYPES_HPP

/**
 * @file types.hpp
 * @brief Node, edge and metadata types of the knowledge graph.
 *
 * A GraphNode is a set of common fields plus exactly one kind-specific
 * detail struct held in a std::variant. The node kind is the active
 * alternative, so a function node cannot carry class fields and the kind
 * tag cannot disagree with the payload.
 */

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rkg::graph {

    /**
     * Node kinds. Order matches the NodeDetails alternatives.
     */
    enum class NodeKind {
        File,
        Function,
        Class,
        Interface,
        TypeAlias,
        Enum,
        Variable
    };

    enum class EdgeKind {
        Imports,
        Exports,
        Calls,
        Extends,
        Implements,
        Uses,
        Contains
    };

    /**
     * Serialized names: "file", "function", "class", "interface", "type",
     * "enum", "variable".
     */
    [[nodiscard]] const char* to_string(NodeKind kind) noexcept;
    [[nodiscard]] std::optional<NodeKind> parse_node_kind(std::string_view text) noexcept;

    [[nodiscard]] const char* to_string(EdgeKind kind) noexcept;
    [[nodiscard]] std::optional<EdgeKind> parse_edge_kind(std::string_view text) noexcept;

    /**
     * Fields shared by every node.
     *
     * History fields stay empty (not zero) when history was not collected.
     */
    struct NodeCommon {
        std::string id;
        std::string name;
        std::string file_path;
        std::size_t line_start = 0;
        std::size_t line_end = 0;
        bool exported = false;
        std::optional<int> complexity;
        std::optional<std::string> documentation;

        std::optional<std::string> last_modified;
        std::optional<std::size_t> modification_count;
        std::optional<std::vector<std::string>> contributors;

        bool operator==(const NodeCommon&) const = default;
    };

    struct FileDetails {
        std::string language;  ///< typescript, tsx, jsx or javascript
        std::size_t line_count = 0;
        std::size_t import_count = 0;
        std::size_t export_count = 0;

        bool operator==(const FileDetails&) const = default;
    };

    struct FunctionDetails {
        std::vector<std::string> parameters;
        std::optional<std::string> return_type;
        bool is_async = false;
        bool is_generator = false;

        bool operator==(const FunctionDetails&) const = default;
    };

    struct ClassDetails {
        bool is_abstract = false;
        std::optional<std::string> extends;
        std::vector<std::string> implements;
        std::size_t member_count = 0;

        bool operator==(const ClassDetails&) const = default;
    };

    struct InterfaceDetails {
        bool operator==(const InterfaceDetails&) const = default;
    };

    struct TypeAliasDetails {
        bool operator==(const TypeAliasDetails&) const = default;
    };

    struct EnumDetails {
        bool operator==(const EnumDetails&) const = default;
    };

    struct VariableDetails {
        bool operator==(const VariableDetails&) const = default;
    };

    using NodeDetails = std::variant<
        FileDetails,
        FunctionDetails,
        ClassDetails,
        InterfaceDetails,
        TypeAliasDetails,
        EnumDetails,
        VariableDetails
    >;

    struct GraphNode {
        NodeCommon common;
        NodeDetails details;

        [[nodiscard]] NodeKind kind() const noexcept {
            return static_cast<NodeKind>(details.index());
        }

        [[nodiscard]] const std::string& id() const noexcept { return common.id; }
        [[nodiscard]] const std::string& name() const noexcept { return common.name; }
        [[nodiscard]] const std::string& file_path() const noexcept { return common.file_path; }

        template<typename T>
        [[nodiscard]] const T* as() const noexcept { return std::get_if<T>(&details); }

        template<typename T>
        [[nodiscard]] T* as() noexcept { return std::get_if<T>(&details); }

        bool operator==(const GraphNode&) const = default;
    };

    /**
     * Names and flags carried by an imports edge.
     */
    struct ImportEdgeMetadata {
        std::vector<std::string> symbols;
        bool is_default = false;
        bool is_namespace = false;
        bool is_type_only = false;

        bool operator==(const ImportEdgeMetadata&) const = default;
    };

    struct GraphEdge {
        std::string id;
        std::string source;
        std::string target;
        EdgeKind kind = EdgeKind::Contains;
        std::optional<double> weight;
        std::optional<ImportEdgeMetadata> metadata;

        bool operator==(const GraphEdge&) const = default;
    };

    struct GraphMetadata {
        std::string scanned_at;  ///< ISO-8601 UTC
        std::int64_t scan_duration_ms = 0;
        std::string root_dir;
        std::size_t file_count = 0;
        std::size_t total_lines = 0;
        std::map<std::string, std::size_t> languages;
        std::size_t node_count = 0;
        std::size_t edge_count = 0;

        bool operator==(const GraphMetadata&) const = default;
    };

}  // namespace rkg::graph

#endif  // RKG_GRAPH_TYPES_HPP
