#include "rkg/analyzers/symbol_extractor.hpp"
#include "rkg/utils/path_utils.hpp"
#include "rkg/utils/string_utils.hpp"

#include <algorithm>
#include <set>

namespace rkg::analyzers {

    using frontend::ParsedFile;
    using frontend::SyntaxKind;
    using frontend::SyntaxNode;
    using graph::GraphNode;
    using graph::NodeKind;

    namespace {

        constexpr auto ANONYMOUS = "<anonymous>";

        std::optional<std::string> join_documentation(const SyntaxNode& node) {
            auto joined = string_utils::join(node.jsdoc, "\n");
            if (joined.empty()) {
                return std::nullopt;
            }
            return joined;
        }

        bool is_logical_expression(const ParsedFile& file, const SyntaxNode& node) {
            auto text = file.text(node);
            if (text.empty()) {
                // Hand-built trees may carry only the operator token.
                text = node.op;
            }
            return string_utils::contains(text, "&&") ||
                   string_utils::contains(text, "||") ||
                   string_utils::contains(text, "??");
        }

        graph::NodeCommon make_common(
            const ParsedFile& file,
            const SyntaxNode& node,
            const NodeKind kind,
            std::string name,
            const bool exported
        ) {
            graph::NodeCommon common;
            common.id = make_node_id(file.path, kind, name, node.line_start);
            common.name = std::move(name);
            common.file_path = file.path;
            common.line_start = node.line_start;
            common.line_end = node.line_end;
            common.exported = exported;
            common.documentation = join_documentation(node);
            return common;
        }

        GraphNode make_function(
            const ParsedFile& file,
            const SyntaxNode& node,
            std::string name,
            const bool exported
        ) {
            GraphNode result;
            result.common = make_common(file, node, NodeKind::Function, std::move(name), exported);
            result.common.complexity = calculate_complexity(file, node);

            graph::FunctionDetails details;
            details.parameters = node.parameters;
            details.return_type = node.return_type;
            details.is_async = node.is_async;
            details.is_generator = node.is_generator;
            result.details = std::move(details);
            return result;
        }

        bool is_class_member(const SyntaxKind kind) noexcept {
            return kind == SyntaxKind::MethodDeclaration ||
                   kind == SyntaxKind::PropertyDeclaration ||
                   kind == SyntaxKind::Constructor;
        }

        void extract_class(const ParsedFile& file, const SyntaxNode& node, std::vector<GraphNode>& out) {
            const std::string class_name = node.name.value_or(ANONYMOUS);

            GraphNode cls;
            cls.common = make_common(file, node, NodeKind::Class, class_name, node.exported);
            cls.common.complexity = calculate_complexity(file, node);

            graph::ClassDetails details;
            details.is_abstract = node.is_abstract;
            details.extends = node.extends;
            details.implements = node.implements;
            details.member_count = static_cast<std::size_t>(std::ranges::count_if(
                node.children, [](const SyntaxNode& child) { return is_class_member(child.kind); }));
            cls.details = std::move(details);
            out.push_back(std::move(cls));

            for (const auto& member : node.children) {
                if (member.kind != SyntaxKind::MethodDeclaration) {
                    continue;
                }
                auto qualified = class_name + "." + member.name.value_or(ANONYMOUS);
                out.push_back(make_function(file, member, std::move(qualified), node.exported));
            }
        }

        GraphNode make_plain(
            const ParsedFile& file,
            const SyntaxNode& node,
            const NodeKind kind,
            graph::NodeDetails details
        ) {
            GraphNode result;
            result.common = make_common(file, node, kind, node.name.value_or(ANONYMOUS), node.exported);
            result.details = std::move(details);
            return result;
        }

        /**
         * Names a file exports, in first-seen order, without duplicates.
         */
        std::vector<std::string> exported_names(const ParsedFile& file) {
            std::vector<std::string> names;
            std::set<std::string> seen;
            const auto add = [&](const std::string& name) {
                if (seen.insert(name).second) {
                    names.push_back(name);
                }
            };

            for (const auto& node : file.root.children) {
                if (!node.exported) {
                    continue;
                }
                if (node.default_export) {
                    add("default");
                    continue;
                }
                if (node.kind == SyntaxKind::VariableStatement) {
                    for (const auto& decl : node.children) {
                        if (decl.kind == SyntaxKind::VariableDeclaration && decl.name) {
                            add(*decl.name);
                        }
                    }
                } else if (node.name) {
                    add(*node.name);
                }
            }
            for (const auto& decl : file.exports) {
                for (const auto& name : decl.named_exports) {
                    add(name);
                }
            }
            if (file.export_assignment_count > 0) {
                add("default");
            }
            return names;
        }

    }  // namespace

    int calculate_complexity(const ParsedFile& file, const SyntaxNode& node) {
        int complexity = 1;

        node.for_each_descendant([&](const SyntaxNode& descendant) {
            switch (descendant.kind) {
                case SyntaxKind::IfStatement:
                case SyntaxKind::ConditionalExpression:
                case SyntaxKind::ForStatement:
                case SyntaxKind::ForInStatement:
                case SyntaxKind::ForOfStatement:
                case SyntaxKind::WhileStatement:
                case SyntaxKind::DoStatement:
                case SyntaxKind::CaseClause:
                case SyntaxKind::CatchClause:
                case SyntaxKind::ConditionalType:
                    ++complexity;
                    break;
                case SyntaxKind::BinaryExpression:
                    if (is_logical_expression(file, descendant)) {
                        ++complexity;
                    }
                    break;
                default:
                    break;
            }
        });

        return complexity;
    }

    std::string detect_language(const std::string_view path) {
        const auto dot = path.find_last_of('.');
        const auto slash = path.find_last_of('/');
        if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
            return "javascript";
        }
        const auto ext = string_utils::to_lower(path.substr(dot));
        if (ext == ".ts") return "typescript";
        if (ext == ".tsx") return "tsx";
        if (ext == ".jsx") return "jsx";
        return "javascript";
    }

    std::string make_node_id(
        const std::string& path,
        const NodeKind kind,
        const std::string& name,
        const std::size_t line
    ) {
        return path + ":" + graph::to_string(kind) + ":" + name + ":" + std::to_string(line);
    }

    std::vector<ImportInfo> analyze_imports(const ParsedFile& file) {
        std::vector<ImportInfo> imports;
        imports.reserve(file.imports.size());

        for (const auto& decl : file.imports) {
            ImportInfo info;
            info.source_path = file.path;
            info.specifier = decl.module_specifier;
            info.is_default = decl.default_import.has_value();
            info.is_namespace = decl.namespace_import.has_value();
            info.is_type_only = decl.type_only;
            info.line = decl.line;

            if (decl.default_import) {
                info.symbols.push_back(*decl.default_import);
            }
            if (decl.namespace_import) {
                info.symbols.push_back("* as " + *decl.namespace_import);
            }
            for (const auto& named : decl.named_imports) {
                info.symbols.push_back(named.alias ? named.name + " as " + *named.alias : named.name);
            }

            imports.push_back(std::move(info));
        }

        return imports;
    }

    std::vector<ExportInfo> analyze_exports(const ParsedFile& file) {
        std::vector<ExportInfo> exports;

        for (const auto& decl : file.exports) {
            for (const auto& name : decl.named_exports) {
                exports.push_back({name, false, decl.module_specifier.has_value(), decl.module_specifier});
            }
        }

        for (std::size_t i = 0; i < file.export_assignment_count; ++i) {
            exports.push_back({"default", true, false, std::nullopt});
        }

        // Declarations marked `export`; names already listed above are skipped.
        for (const auto& name : exported_names(file)) {
            const bool listed = std::ranges::any_of(exports, [&](const ExportInfo& e) { return e.name == name; });
            if (!listed) {
                exports.push_back({name, false, false, std::nullopt});
            }
        }

        return exports;
    }

    ExtractionResult extract_symbols(const ParsedFile& file) {
        ExtractionResult result;
        auto& symbols = result.symbol_nodes;

        // Grouped by declaration kind; each class is followed by its methods.
        constexpr SyntaxKind EXTRACTION_ORDER[] = {
            SyntaxKind::FunctionDeclaration,
            SyntaxKind::ClassDeclaration,
            SyntaxKind::InterfaceDeclaration,
            SyntaxKind::TypeAliasDeclaration,
            SyntaxKind::EnumDeclaration,
            SyntaxKind::VariableStatement,
        };

        for (const auto kind : EXTRACTION_ORDER) {
            for (const auto& node : file.root.children) {
                if (node.kind != kind) {
                    continue;
                }
                switch (node.kind) {
                    case SyntaxKind::FunctionDeclaration:
                        symbols.push_back(make_function(file, node, node.name.value_or(ANONYMOUS), node.exported));
                        break;
                    case SyntaxKind::ClassDeclaration:
                        extract_class(file, node, symbols);
                        break;
                    case SyntaxKind::InterfaceDeclaration:
                        symbols.push_back(make_plain(file, node, NodeKind::Interface, graph::InterfaceDetails{}));
                        break;
                    case SyntaxKind::TypeAliasDeclaration:
                        symbols.push_back(make_plain(file, node, NodeKind::TypeAlias, graph::TypeAliasDetails{}));
                        break;
                    case SyntaxKind::EnumDeclaration:
                        symbols.push_back(make_plain(file, node, NodeKind::Enum, graph::EnumDetails{}));
                        break;
                    case SyntaxKind::VariableStatement:
                        if (!node.exported) {
                            break;
                        }
                        for (const auto& decl : node.children) {
                            if (decl.kind != SyntaxKind::VariableDeclaration) {
                                continue;
                            }
                            GraphNode variable;
                            variable.common = make_common(
                                file, decl, NodeKind::Variable, decl.name.value_or(ANONYMOUS), true);
                            variable.common.documentation.reset();
                            variable.details = graph::VariableDetails{};
                            symbols.push_back(std::move(variable));
                        }
                        break;
                    default:
                        break;
                }
            }
        }

        result.imports = analyze_imports(file);
        result.exports = analyze_exports(file);

        int total_complexity = 0;
        for (const auto& symbol : symbols) {
            total_complexity += symbol.common.complexity.value_or(0);
        }

        auto& file_node = result.file_node;
        file_node.common.id = file.path;
        file_node.common.name = path_utils::basename(file.path);
        file_node.common.file_path = file.path;
        file_node.common.line_start = 1;
        file_node.common.line_end = file.end_line;
        file_node.common.exported = false;
        file_node.common.complexity = total_complexity;

        graph::FileDetails details;
        details.language = detect_language(file.path);
        details.line_count = file.end_line;
        details.import_count = file.imports.size();
        details.export_count = exported_names(file).size();
        file_node.details = std::move(details);

        return result;
    }

}  // namespace rkg::analyzers
