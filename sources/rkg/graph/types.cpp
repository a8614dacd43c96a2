#include "rkg/graph/types.hpp"

namespace rkg::graph {

    const char* to_string(const NodeKind kind) noexcept {
        switch (kind) {
            case NodeKind::File:      return "file";
            case NodeKind::Function:  return "function";
            case NodeKind::Class:     return "class";
            case NodeKind::Interface: return "interface";
            case NodeKind::TypeAlias: return "type";
            case NodeKind::Enum:      return "enum";
            case NodeKind::Variable:  return "variable";
        }
        return "unknown";
    }

    std::optional<NodeKind> parse_node_kind(const std::string_view text) noexcept {
        if (text == "file") return NodeKind::File;
        if (text == "function") return NodeKind::Function;
        if (text == "class") return NodeKind::Class;
        if (text == "interface") return NodeKind::Interface;
        if (text == "type") return NodeKind::TypeAlias;
        if (text == "enum") return NodeKind::Enum;
        if (text == "variable") return NodeKind::Variable;
        return std::nullopt;
    }

    const char* to_string(const EdgeKind kind) noexcept {
        switch (kind) {
            case EdgeKind::Imports:    return "imports";
            case EdgeKind::Exports:    return "exports";
            case EdgeKind::Calls:      return "calls";
            case EdgeKind::Extends:    return "extends";
            case EdgeKind::Implements: return "implements";
            case EdgeKind::Uses:       return "uses";
            case EdgeKind::Contains:   return "contains";
        }
        return "unknown";
    }

    std::optional<EdgeKind> parse_edge_kind(const std::string_view text) noexcept {
        if (text == "imports") return EdgeKind::Imports;
        if (text == "exports") return EdgeKind::Exports;
        if (text == "calls") return EdgeKind::Calls;
        if (text == "extends") return EdgeKind::Extends;
        if (text == "implements") return EdgeKind::Implements;
        if (text == "uses") return EdgeKind::Uses;
        if (text == "contains") return EdgeKind::Contains;
        return std::nullopt;
    }

}  // namespace rkg::graph
