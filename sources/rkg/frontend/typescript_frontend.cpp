#include "rkg/frontend/typescript_frontend.hpp"
#include "rkg/utils/file_utils.hpp"
#include "rkg/utils/string_utils.hpp"

#include <cstdint>
#include <cstring>
#include <memory>
#include <unordered_map>

extern "C" {
#include <tree_sitter/api.h>

const TSLanguage* tree_sitter_typescript();
const TSLanguage* tree_sitter_tsx();
}

namespace rkg::frontend {

    namespace {

        struct ParserDeleter {
            void operator()(TSParser* parser) const { ts_parser_delete(parser); }
        };

        struct TreeDeleter {
            void operator()(TSTree* tree) const { ts_tree_delete(tree); }
        };

        using ParserPtr = std::unique_ptr<TSParser, ParserDeleter>;
        using TreePtr = std::unique_ptr<TSTree, TreeDeleter>;

        // ============================================================================
        // Node type table
        // ============================================================================

        const std::unordered_map<std::string_view, SyntaxKind>& kind_table() {
            static const std::unordered_map<std::string_view, SyntaxKind> table = {
                {"program", SyntaxKind::SourceFile},
                {"function_declaration", SyntaxKind::FunctionDeclaration},
                {"generator_function_declaration", SyntaxKind::FunctionDeclaration},
                {"class_declaration", SyntaxKind::ClassDeclaration},
                {"abstract_class_declaration", SyntaxKind::ClassDeclaration},
                {"method_definition", SyntaxKind::MethodDeclaration},
                {"abstract_method_signature", SyntaxKind::MethodDeclaration},
                {"public_field_definition", SyntaxKind::PropertyDeclaration},
                {"field_definition", SyntaxKind::PropertyDeclaration},
                {"interface_declaration", SyntaxKind::InterfaceDeclaration},
                {"type_alias_declaration", SyntaxKind::TypeAliasDeclaration},
                {"enum_declaration", SyntaxKind::EnumDeclaration},
                {"lexical_declaration", SyntaxKind::VariableStatement},
                {"variable_declaration", SyntaxKind::VariableStatement},
                {"variable_declarator", SyntaxKind::VariableDeclaration},
                {"statement_block", SyntaxKind::Block},
                {"if_statement", SyntaxKind::IfStatement},
                {"ternary_expression", SyntaxKind::ConditionalExpression},
                {"for_statement", SyntaxKind::ForStatement},
                {"for_in_statement", SyntaxKind::ForInStatement},
                {"while_statement", SyntaxKind::WhileStatement},
                {"do_statement", SyntaxKind::DoStatement},
                {"switch_statement", SyntaxKind::SwitchStatement},
                {"switch_case", SyntaxKind::CaseClause},
                {"switch_default", SyntaxKind::DefaultClause},
                {"catch_clause", SyntaxKind::CatchClause},
                {"conditional_type", SyntaxKind::ConditionalType},
                {"binary_expression", SyntaxKind::BinaryExpression},
                {"call_expression", SyntaxKind::CallExpression},
                {"identifier", SyntaxKind::Identifier},
                {"return_statement", SyntaxKind::ReturnStatement},
                {"expression_statement", SyntaxKind::ExpressionStatement},
                {"arrow_function", SyntaxKind::ArrowFunction},
            };
            return table;
        }

        bool is_function_expression(const std::string_view type) noexcept {
            return type == "function_expression" || type == "function" || type == "generator_function";
        }

        bool is_comment(const TSNode node) noexcept {
            return std::strcmp(ts_node_type(node), "comment") == 0;
        }

        TSNode field(const TSNode node, const std::string_view name) {
            return ts_node_child_by_field_name(node, name.data(), static_cast<std::uint32_t>(name.size()));
        }

        bool has_token(const TSNode node, const std::string_view token) {
            const auto count = ts_node_child_count(node);
            for (std::uint32_t i = 0; i < count; ++i) {
                const TSNode child = ts_node_child(node, i);
                if (!ts_node_is_named(child) && token == ts_node_type(child)) {
                    return true;
                }
            }
            return false;
        }

        std::string unquote(std::string_view text) {
            if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'' || text.front() == '`')) {
                text = text.substr(1, text.size() - 2);
            }
            return std::string(text);
        }

        /**
         * Description part of a doc comment: the text before the first tag,
         * with comment markers stripped.
         */
        std::string doc_description(const std::string_view comment) {
            auto body = comment.substr(3);
            if (string_utils::ends_with(body, "*/")) {
                body.remove_suffix(2);
            }

            std::vector<std::string> lines;
            for (auto line : string_utils::split(body, '\n')) {
                line = string_utils::trim(line);
                if (string_utils::starts_with(line, "*")) {
                    line = string_utils::trim(line.substr(1));
                }
                if (string_utils::starts_with(line, "@")) {
                    break;
                }
                lines.emplace_back(line);
            }

            while (!lines.empty() && lines.back().empty()) {
                lines.pop_back();
            }
            while (!lines.empty() && lines.front().empty()) {
                lines.erase(lines.begin());
            }
            return string_utils::join(lines, "\n");
        }

        // ============================================================================
        // Tree conversion
        // ============================================================================

        class TreeConverter {
        public:
            explicit TreeConverter(ParsedFile& file) : file_(file) {}

            void convert_program(const TSNode program) {
                file_.root = make_node(program, SyntaxKind::SourceFile);

                const auto count = ts_node_named_child_count(program);
                for (std::uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(program, i);
                    const std::string_view type = ts_node_type(child);

                    if (type == "comment") {
                        continue;
                    }
                    if (type == "import_statement") {
                        record_import(child);
                        continue;
                    }
                    if (type == "export_statement") {
                        convert_export(child);
                        continue;
                    }

                    auto node = convert(child);
                    attach_doc(child, node);
                    file_.root.children.push_back(std::move(node));
                }
            }

        private:
            std::string_view text(const TSNode node) const {
                const auto begin = ts_node_start_byte(node);
                const auto end = ts_node_end_byte(node);
                if (end <= begin || end > file_.source.size()) {
                    return {};
                }
                return std::string_view(file_.source).substr(begin, end - begin);
            }

            std::optional<std::string> field_text(const TSNode node, const std::string_view name) const {
                const TSNode child = field(node, name);
                if (ts_node_is_null(child)) {
                    return std::nullopt;
                }
                return std::string(text(child));
            }

            SyntaxNode make_node(const TSNode node, const SyntaxKind kind) const {
                SyntaxNode out;
                out.kind = kind;
                out.begin = ts_node_start_byte(node);
                out.end = ts_node_end_byte(node);
                out.line_start = ts_node_start_point(node).row + 1;
                out.line_end = ts_node_end_point(node).row + 1;
                return out;
            }

            SyntaxKind map_kind(const TSNode node) const {
                const std::string_view type = ts_node_type(node);
                const auto& table = kind_table();
                const auto it = table.find(type);
                if (it == table.end()) {
                    return SyntaxKind::Other;
                }

                if (it->second == SyntaxKind::ForInStatement) {
                    const TSNode op = field(node, "operator");
                    const bool is_of = ts_node_is_null(op) ? has_token(node, "of")
                                                           : std::strcmp(ts_node_type(op), "of") == 0;
                    return is_of ? SyntaxKind::ForOfStatement : SyntaxKind::ForInStatement;
                }
                if (it->second == SyntaxKind::MethodDeclaration && field_text(node, "name") == "constructor") {
                    return SyntaxKind::Constructor;
                }
                return it->second;
            }

            SyntaxNode convert(const TSNode node) {
                return convert_as(node, map_kind(node));
            }

            SyntaxNode convert_as(const TSNode node, const SyntaxKind kind) {
                auto out = make_node(node, kind);

                switch (kind) {
                    case SyntaxKind::FunctionDeclaration:
                    case SyntaxKind::MethodDeclaration:
                    case SyntaxKind::Constructor:
                        fill_function(node, out);
                        break;
                    case SyntaxKind::ClassDeclaration:
                        fill_class(node, out);
                        return out;
                    case SyntaxKind::InterfaceDeclaration:
                    case SyntaxKind::TypeAliasDeclaration:
                    case SyntaxKind::EnumDeclaration:
                    case SyntaxKind::VariableDeclaration:
                    case SyntaxKind::PropertyDeclaration:
                        out.name = field_text(node, "name");
                        break;
                    case SyntaxKind::BinaryExpression: {
                        const TSNode op = field(node, "operator");
                        if (!ts_node_is_null(op)) {
                            out.op = ts_node_type(op);
                        }
                        break;
                    }
                    default:
                        break;
                }

                append_children(node, out);
                return out;
            }

            void append_children(const TSNode node, SyntaxNode& out) {
                const auto count = ts_node_named_child_count(node);
                for (std::uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(node, i);
                    if (!is_comment(child)) {
                        out.children.push_back(convert(child));
                    }
                }
            }

            void fill_function(const TSNode node, SyntaxNode& out) const {
                out.name = field_text(node, "name");
                out.is_async = has_token(node, "async");
                out.is_generator = has_token(node, "*") ||
                                   string_utils::contains(ts_node_type(node), "generator");

                if (const TSNode params = field(node, "parameters"); !ts_node_is_null(params)) {
                    const auto count = ts_node_named_child_count(params);
                    for (std::uint32_t i = 0; i < count; ++i) {
                        const TSNode param = ts_node_named_child(params, i);
                        if (!is_comment(param)) {
                            out.parameters.push_back(parameter_name(param));
                        }
                    }
                }

                if (const TSNode annotation = field(node, "return_type"); !ts_node_is_null(annotation)) {
                    auto type = string_utils::trim(text(annotation));
                    if (string_utils::starts_with(type, ":")) {
                        type = string_utils::trim(type.substr(1));
                    }
                    if (!type.empty()) {
                        out.return_type = std::string(type);
                    }
                }
            }

            std::string parameter_name(const TSNode param) const {
                const std::string_view type = ts_node_type(param);
                if (type == "required_parameter" || type == "optional_parameter") {
                    if (auto pattern = field_text(param, "pattern")) {
                        return *pattern;
                    }
                }
                if (type == "assignment_pattern") {
                    if (auto left = field_text(param, "left")) {
                        return *left;
                    }
                }
                return std::string(text(param));
            }

            void fill_class(const TSNode node, SyntaxNode& out) {
                out.name = field_text(node, "name");
                out.is_abstract = std::strcmp(ts_node_type(node), "abstract_class_declaration") == 0;

                const auto count = ts_node_named_child_count(node);
                for (std::uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_named_child(node, i);
                    const std::string_view type = ts_node_type(child);

                    if (type == "class_heritage") {
                        fill_heritage(child, out);
                    } else if (type == "class_body") {
                        const auto members = ts_node_named_child_count(child);
                        for (std::uint32_t m = 0; m < members; ++m) {
                            const TSNode member = ts_node_named_child(child, m);
                            if (is_comment(member)) {
                                continue;
                            }
                            auto converted = convert(member);
                            attach_doc(member, converted);
                            out.children.push_back(std::move(converted));
                        }
                    } else if (type != "comment") {
                        out.children.push_back(convert(child));
                    }
                }
            }

            void fill_heritage(const TSNode heritage, SyntaxNode& out) const {
                const auto count = ts_node_named_child_count(heritage);
                for (std::uint32_t i = 0; i < count; ++i) {
                    const TSNode clause = ts_node_named_child(heritage, i);
                    const std::string_view type = ts_node_type(clause);

                    if (type == "extends_clause") {
                        if (auto value = field_text(clause, "value")) {
                            out.extends = std::move(value);
                        } else if (ts_node_named_child_count(clause) > 0) {
                            out.extends = std::string(text(ts_node_named_child(clause, 0)));
                        }
                    } else if (type == "implements_clause") {
                        const auto types = ts_node_named_child_count(clause);
                        for (std::uint32_t t = 0; t < types; ++t) {
                            out.implements.emplace_back(text(ts_node_named_child(clause, t)));
                        }
                    } else if (!out.extends) {
                        // JavaScript grammar: `extends <expression>` directly under the heritage.
                        out.extends = std::string(text(clause));
                    }
                }
            }

            void attach_doc(const TSNode node, SyntaxNode& out) const {
                const TSNode previous = ts_node_prev_named_sibling(node);
                if (ts_node_is_null(previous) || !is_comment(previous)) {
                    return;
                }
                const auto comment = text(previous);
                if (!string_utils::starts_with(comment, "/**")) {
                    return;
                }
                if (auto description = doc_description(comment); !description.empty()) {
                    out.jsdoc.push_back(std::move(description));
                }
            }

            // ============================================================================
            // Module declarations
            // ============================================================================

            void record_import(const TSNode node) {
                const TSNode source = field(node, "source");
                if (ts_node_is_null(source)) {
                    return;
                }

                ImportDeclaration decl;
                decl.module_specifier = unquote(text(source));
                decl.type_only = has_token(node, "type");
                decl.line = ts_node_start_point(node).row + 1;

                const auto count = ts_node_named_child_count(node);
                for (std::uint32_t i = 0; i < count; ++i) {
                    const TSNode clause = ts_node_named_child(node, i);
                    if (std::strcmp(ts_node_type(clause), "import_clause") != 0) {
                        continue;
                    }

                    const auto parts = ts_node_named_child_count(clause);
                    for (std::uint32_t p = 0; p < parts; ++p) {
                        const TSNode part = ts_node_named_child(clause, p);
                        const std::string_view type = ts_node_type(part);

                        if (type == "identifier") {
                            decl.default_import = std::string(text(part));
                        } else if (type == "namespace_import") {
                            const auto n = ts_node_named_child_count(part);
                            if (n > 0) {
                                decl.namespace_import = std::string(text(ts_node_named_child(part, n - 1)));
                            }
                        } else if (type == "named_imports") {
                            const auto specs = ts_node_named_child_count(part);
                            for (std::uint32_t s = 0; s < specs; ++s) {
                                const TSNode spec = ts_node_named_child(part, s);
                                if (std::strcmp(ts_node_type(spec), "import_specifier") != 0) {
                                    continue;
                                }
                                ImportSpecifier specifier;
                                specifier.name = field_text(spec, "name").value_or(std::string(text(spec)));
                                specifier.alias = field_text(spec, "alias");
                                decl.named_imports.push_back(std::move(specifier));
                            }
                        }
                    }
                }

                file_.imports.push_back(std::move(decl));
            }

            void convert_export(const TSNode node) {
                const bool is_default = has_token(node, "default");

                if (const TSNode decl = field(node, "declaration"); !ts_node_is_null(decl)) {
                    auto converted = convert(decl);
                    converted.exported = true;
                    converted.default_export = is_default;
                    attach_doc(node, converted);
                    file_.root.children.push_back(std::move(converted));
                    return;
                }

                if (const TSNode value = field(node, "value"); !ts_node_is_null(value)) {
                    const std::string_view type = ts_node_type(value);
                    std::optional<SyntaxKind> kind;
                    if (is_function_expression(type)) {
                        kind = SyntaxKind::FunctionDeclaration;
                    } else if (type == "class") {
                        kind = SyntaxKind::ClassDeclaration;
                    }

                    if (!kind) {
                        ++file_.export_assignment_count;
                        return;
                    }
                    auto converted = convert_as(value, *kind);
                    converted.exported = true;
                    converted.default_export = true;
                    attach_doc(node, converted);
                    file_.root.children.push_back(std::move(converted));
                    return;
                }

                ExportDeclaration decl;
                if (const TSNode source = field(node, "source"); !ts_node_is_null(source)) {
                    decl.module_specifier = unquote(text(source));
                }

                const auto count = ts_node_named_child_count(node);
                for (std::uint32_t i = 0; i < count; ++i) {
                    const TSNode clause = ts_node_named_child(node, i);
                    const std::string_view type = ts_node_type(clause);

                    if (type == "export_clause") {
                        const auto specs = ts_node_named_child_count(clause);
                        for (std::uint32_t s = 0; s < specs; ++s) {
                            const TSNode spec = ts_node_named_child(clause, s);
                            if (std::strcmp(ts_node_type(spec), "export_specifier") != 0) {
                                continue;
                            }
                            auto exported = field_text(spec, "alias");
                            if (!exported) {
                                exported = field_text(spec, "name");
                            }
                            decl.named_exports.push_back(exported.value_or(std::string(text(spec))));
                        }
                    } else if (type == "namespace_export") {
                        const auto n = ts_node_named_child_count(clause);
                        if (n > 0) {
                            decl.named_exports.emplace_back(unquote(text(ts_node_named_child(clause, n - 1))));
                        }
                    }
                }

                file_.exports.push_back(std::move(decl));
            }

            ParsedFile& file_;
        };

    }  // namespace

    bool TypeScriptFrontend::supports(const std::string& path) const {
        return string_utils::ends_with(path, ".ts") || string_utils::ends_with(path, ".tsx") ||
               string_utils::ends_with(path, ".js") || string_utils::ends_with(path, ".jsx");
    }

    Result<ParsedFile, Error> TypeScriptFrontend::parse(const fs::path& root, const std::string& path) const {
        auto content = file_utils::read_file(root / fs::path(path));
        if (content.is_err()) {
            return Result<ParsedFile, Error>::failure(content.error());
        }
        return parse_source(path, std::move(content.value()));
    }

    Result<ParsedFile, Error> TypeScriptFrontend::parse_source(const std::string& path, std::string source) const {
        const TSLanguage* language = string_utils::ends_with(path, ".ts") ? tree_sitter_typescript()
                                                                          : tree_sitter_tsx();

        ParserPtr parser(ts_parser_new());
        if (!parser || !ts_parser_set_language(parser.get(), language)) {
            return Result<ParsedFile, Error>::failure(
                Error::internal_error("tree-sitter TypeScript grammar is incompatible with the runtime", path));
        }

        ParsedFile file;
        file.path = path;
        file.source = std::move(source);
        file.end_line = string_utils::count_lines(file.source);

        const TreePtr tree(ts_parser_parse_string(
            parser.get(), nullptr, file.source.data(), static_cast<std::uint32_t>(file.source.size())));
        if (!tree) {
            return Result<ParsedFile, Error>::failure(Error::parse_error("tree-sitter could not parse file", path));
        }

        TreeConverter converter(file);
        converter.convert_program(ts_tree_root_node(tree.get()));
        return Result<ParsedFile, Error>::success(std::move(file));
    }

}  // namespace rkg::frontend
