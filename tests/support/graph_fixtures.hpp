#ifndef RKG_TESTS_SUPPORT_GRAPH_FIXTURES_HPP
#define RKG_TESTS_SUPPORT_GRAPH_FIXTURES_HPP

/**
 * @file graph_fixtures.hpp
 * @brief Small graph builders for analyzer, persistence and search tests.
 */

#include "rkg/graph/knowledge_graph.hpp"
#include "rkg/version.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rkg::test_support {

    inline graph::GraphNode file_node(const std::string& path, const std::optional<int> complexity = std::nullopt) {
        graph::GraphNode n;
        n.common.id = path;
        n.common.name = path.substr(path.find_last_of('/') + 1);
        n.common.file_path = path;
        n.common.line_start = 1;
        n.common.line_end = 100;
        n.common.complexity = complexity;
        n.details = graph::FileDetails{"typescript", 100, 0, 0};
        return n;
    }

    inline graph::GraphNode function_node(
        const std::string& path,
        const std::string& name,
        const std::optional<int> complexity,
        const std::size_t line_start = 1,
        const std::size_t line_end = 10
    ) {
        graph::GraphNode n;
        n.common.id = path + ":function:" + name + ":" + std::to_string(line_start);
        n.common.name = name;
        n.common.file_path = path;
        n.common.line_start = line_start;
        n.common.line_end = line_end;
        n.common.exported = true;
        n.common.complexity = complexity;
        n.details = graph::FunctionDetails{};
        return n;
    }

    inline graph::GraphNode class_node(const std::string& path, const std::string& name, const std::size_t line = 1) {
        graph::GraphNode n;
        n.common.id = path + ":class:" + name + ":" + std::to_string(line);
        n.common.name = name;
        n.common.file_path = path;
        n.common.line_start = line;
        n.common.line_end = line + 20;
        n.common.exported = true;
        n.details = graph::ClassDetails{};
        return n;
    }

    inline graph::GraphEdge import_edge(const std::string& id, const std::string& from, const std::string& to) {
        graph::GraphEdge e;
        e.id = id;
        e.source = from;
        e.target = to;
        e.kind = graph::EdgeKind::Imports;
        e.metadata = graph::ImportEdgeMetadata{{"x"}, false, false, false};
        return e;
    }

    inline graph::GraphEdge contains_edge(const std::string& id, const std::string& file, const std::string& node) {
        graph::GraphEdge e;
        e.id = id;
        e.source = file;
        e.target = node;
        e.kind = graph::EdgeKind::Contains;
        return e;
    }

    inline graph::KnowledgeGraph make_graph(
        const std::vector<graph::GraphNode>& nodes,
        std::vector<graph::GraphEdge> edges = {},
        const std::string& root_dir = "/repo"
    ) {
        std::map<std::string, graph::GraphNode> by_id;
        std::size_t files = 0;
        for (const auto& n : nodes) {
            if (n.kind() == graph::NodeKind::File) {
                ++files;
            }
            by_id.emplace(n.id(), n);
        }

        graph::GraphMetadata metadata;
        metadata.scanned_at = "2024-01-15T10:30:00Z";
        metadata.root_dir = root_dir;
        metadata.file_count = files;
        metadata.node_count = by_id.size();
        metadata.edge_count = edges.size();

        return {VERSION_STRING, std::move(metadata), std::move(by_id), std::move(edges)};
    }

    /**
     * A small web project: login code, a user service with many importers,
     * a date helper and a user model.
     */
    inline graph::KnowledgeGraph search_graph() {
        auto login = function_node("src/auth/login.ts", "login", 4, 3, 20);
        login.common.documentation = "Authenticate a user with email and password";
        login.details = graph::FunctionDetails{{"email", "password"}, std::string("Promise<Session>"), true, false};

        auto service = class_node("src/services/user.ts", "UserService", 5);
        service.details = graph::ClassDetails{false, std::string("BaseService"), {}, 4};

        auto format = function_node("src/utils/date.ts", "formatDate", 1, 1, 6);
        format.common.exported = false;
        format.details = graph::FunctionDetails{{"date"}, std::string("string"), false, false};

        graph::GraphNode user;
        user.common.id = "src/models/user.ts:interface:User:1";
        user.common.name = "User";
        user.common.file_path = "src/models/user.ts";
        user.common.line_start = 1;
        user.common.line_end = 8;
        user.common.exported = true;
        user.details = graph::InterfaceDetails{};

        std::vector<graph::GraphNode> nodes = {
            file_node("src/auth/login.ts", 4),
            file_node("src/services/user.ts", 1),
            file_node("src/utils/date.ts", 1),
            file_node("src/models/user.ts"),
            file_node("src/routes/a.ts"),
            file_node("src/routes/b.ts"),
            file_node("src/routes/c.ts"),
            login, service, format, user
        };

        std::vector<graph::GraphEdge> edges = {
            contains_edge("contains-0", "src/auth/login.ts", login.id()),
            contains_edge("contains-1", "src/services/user.ts", service.id()),
            contains_edge("contains-2", "src/utils/date.ts", format.id()),
            contains_edge("contains-3", "src/models/user.ts", user.id()),
            import_edge("import-0", "src/auth/login.ts", "src/services/user.ts"),
            import_edge("import-1", "src/routes/a.ts", "src/services/user.ts"),
            import_edge("import-2", "src/routes/b.ts", "src/services/user.ts"),
            import_edge("import-3", "src/routes/c.ts", "src/services/user.ts"),
            import_edge("import-4", "src/services/user.ts", "src/models/user.ts")
        };

        return make_graph(nodes, std::move(edges));
    }

}  // namespace rkg::test_support

#endif  // RKG_TESTS_SUPPORT_GRAPH_FIXTURES_HPP
