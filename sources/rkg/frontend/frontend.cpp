#include "rkg/frontend/frontend.hpp"

#include <stdexcept>
#include <thread>

namespace rkg::frontend {

    const char* to_string(const SyntaxKind kind) noexcept {
        switch (kind) {
            case SyntaxKind::SourceFile:            return "SourceFile";
            case SyntaxKind::FunctionDeclaration:   return "FunctionDeclaration";
            case SyntaxKind::ClassDeclaration:      return "ClassDeclaration";
            case SyntaxKind::MethodDeclaration:     return "MethodDeclaration";
            case SyntaxKind::PropertyDeclaration:   return "PropertyDeclaration";
            case SyntaxKind::Constructor:           return "Constructor";
            case SyntaxKind::InterfaceDeclaration:  return "InterfaceDeclaration";
            case SyntaxKind::TypeAliasDeclaration:  return "TypeAliasDeclaration";
            case SyntaxKind::EnumDeclaration:       return "EnumDeclaration";
            case SyntaxKind::VariableStatement:     return "VariableStatement";
            case SyntaxKind::VariableDeclaration:   return "VariableDeclaration";
            case SyntaxKind::Block:                 return "Block";
            case SyntaxKind::IfStatement:           return "IfStatement";
            case SyntaxKind::ConditionalExpression: return "ConditionalExpression";
            case SyntaxKind::ForStatement:          return "ForStatement";
            case SyntaxKind::ForInStatement:        return "ForInStatement";
            case SyntaxKind::ForOfStatement:        return "ForOfStatement";
            case SyntaxKind::WhileStatement:        return "WhileStatement";
            case SyntaxKind::DoStatement:           return "DoStatement";
            case SyntaxKind::SwitchStatement:       return "SwitchStatement";
            case SyntaxKind::CaseClause:            return "CaseClause";
            case SyntaxKind::DefaultClause:         return "DefaultClause";
            case SyntaxKind::CatchClause:           return "CatchClause";
            case SyntaxKind::ConditionalType:       return "ConditionalType";
            case SyntaxKind::BinaryExpression:      return "BinaryExpression";
            case SyntaxKind::CallExpression:        return "CallExpression";
            case SyntaxKind::Identifier:            return "Identifier";
            case SyntaxKind::ReturnStatement:       return "ReturnStatement";
            case SyntaxKind::ExpressionStatement:   return "ExpressionStatement";
            case SyntaxKind::ArrowFunction:         return "ArrowFunction";
            case SyntaxKind::Other:                 return "Other";
        }
        return "Unknown";
    }

    void FrontendRegistry::register_frontend(std::shared_ptr<IParserFrontend> frontend) {
        if (frontend) {
            frontends_.push_back(std::move(frontend));
        }
    }

    std::shared_ptr<IParserFrontend> FrontendRegistry::find_frontend_for(const std::string& path) const {
        for (const auto& frontend : frontends_) {
            if (frontend->supports(path)) {
                return frontend;
            }
        }
        return nullptr;
    }

    std::vector<std::shared_ptr<IParserFrontend>> FrontendRegistry::list_frontends() const {
        return frontends_;
    }

    InMemoryFrontend::InMemoryFrontend(std::string name)
        : name_(std::move(name)) {}

    void InMemoryFrontend::add_file(ParsedFile file) {
        auto key = file.path;
        files_.insert_or_assign(std::move(key), std::move(file));
    }

    void InMemoryFrontend::set_delay(const std::string& path, const Duration delay) {
        delays_.insert_or_assign(path, delay);
    }

    void InMemoryFrontend::set_failure(const std::string& path, Error error) {
        failures_.insert_or_assign(path, std::move(error));
    }

    void InMemoryFrontend::set_throw(const std::string& path, std::string message) {
        throws_.insert_or_assign(path, std::move(message));
    }

    std::vector<std::string> InMemoryFrontend::paths() const {
        std::map<std::string, bool> all;
        for (const auto& [path, _] : files_) all[path] = true;
        for (const auto& [path, _] : failures_) all[path] = true;
        for (const auto& [path, _] : throws_) all[path] = true;

        std::vector<std::string> result;
        result.reserve(all.size());
        for (const auto& [path, _] : all) {
            result.push_back(path);
        }
        return result;
    }

    bool InMemoryFrontend::supports(const std::string& path) const {
        return files_.contains(path) || failures_.contains(path) || throws_.contains(path);
    }

    Result<ParsedFile, Error> InMemoryFrontend::parse(
        const fs::path& /*root*/,
        const std::string& path
    ) const {
        if (const auto it = delays_.find(path); it != delays_.end()) {
            std::this_thread::sleep_for(it->second);
        }

        if (const auto it = throws_.find(path); it != throws_.end()) {
            throw std::runtime_error(it->second);
        }

        if (const auto it = failures_.find(path); it != failures_.end()) {
            return Result<ParsedFile, Error>::failure(it->second);
        }

        const auto it = files_.find(path);
        if (it == files_.end()) {
            return Result<ParsedFile, Error>::failure(
                Error::not_found("No syntax tree registered", path)
            );
        }
        return Result<ParsedFile, Error>::success(it->second);
    }

}  // namespace rkg::frontend
