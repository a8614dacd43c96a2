#include "rkg/analyzers/relationship_resolver.hpp"
#include "rkg/utils/path_utils.hpp"
#include "rkg/utils/string_utils.hpp"

#include <algorithm>
#include <array>

namespace rkg::analyzers {

    namespace {

        constexpr std::array<const char*, 4> SOURCE_EXTENSIONS = {".ts", ".tsx", ".js", ".jsx"};
        constexpr std::array<const char*, 4> INDEX_FILES = {
            "/index.ts", "/index.tsx", "/index.js", "/index.jsx"
        };

        bool is_relative(const std::string& specifier) noexcept {
            return string_utils::starts_with(specifier, ".") || string_utils::starts_with(specifier, "/");
        }

        bool has_extension(const std::string& path) {
            const auto base = path_utils::basename(path);
            return base.find('.') != std::string::npos;
        }

        std::size_t count_shared(const std::set<std::string>& a, const std::set<std::string>& b) {
            std::size_t shared = 0;
            for (const auto& item : a) {
                if (b.contains(item)) {
                    ++shared;
                }
            }
            return shared;
        }

        const std::set<std::string>& lookup(const DependencyMap& map, const std::string& key) {
            static const std::set<std::string> empty;
            const auto it = map.find(key);
            return it == map.end() ? empty : it->second;
        }

    }  // namespace

    std::optional<std::string> resolve_import_target(
        const std::string& importer,
        const std::string& specifier,
        const std::set<std::string>& known_files
    ) {
        if (!is_relative(specifier)) {
            return std::nullopt;
        }

        fs::path joined;
        if (string_utils::starts_with(specifier, "/")) {
            joined = fs::path(specifier.substr(1));
        } else {
            joined = fs::path(path_utils::dirname(importer)) / specifier;
        }
        const auto base = path_utils::to_forward_slashes(path_utils::normalize(joined));
        if (base.empty() || string_utils::starts_with(base, "..")) {
            return std::nullopt;
        }

        if (known_files.contains(base)) {
            return base;
        }

        if (!has_extension(base)) {
            for (const auto* ext : SOURCE_EXTENSIONS) {
                if (auto candidate = base + ext; known_files.contains(candidate)) {
                    return candidate;
                }
            }
        } else if (string_utils::ends_with(base, ".js") || string_utils::ends_with(base, ".jsx")) {
            const auto stem = base.substr(0, base.find_last_of('.'));
            for (const auto* ext : {".ts", ".tsx"}) {
                if (auto candidate = stem + ext; known_files.contains(candidate)) {
                    return candidate;
                }
            }
        }

        for (const auto* index : INDEX_FILES) {
            if (auto candidate = base + index; known_files.contains(candidate)) {
                return candidate;
            }
        }

        return std::nullopt;
    }

    ResolutionResult resolve(
        const std::vector<ImportInfo>& imports,
        const std::set<std::string>& known_files,
        const std::size_t first_edge_index
    ) {
        ResolutionResult result;
        std::size_t next_index = first_edge_index;

        for (const auto& import : imports) {
            auto target = resolve_import_target(import.source_path, import.specifier, known_files);
            if (!target) {
                continue;
            }

            graph::GraphEdge edge;
            edge.id = "import-" + std::to_string(next_index++);
            edge.source = import.source_path;
            edge.target = *target;
            edge.kind = graph::EdgeKind::Imports;
            edge.metadata = graph::ImportEdgeMetadata{
                import.symbols,
                import.is_default,
                import.is_namespace,
                import.is_type_only
            };
            result.edges.push_back(std::move(edge));

            result.dependencies[import.source_path].insert(*target);
            result.dependents[*target].insert(import.source_path);

            ImportInfo resolved = import;
            resolved.target_path = std::move(*target);
            result.resolved.push_back(std::move(resolved));
        }

        return result;
    }

    double coupling_score(
        const std::string& a,
        const std::string& b,
        const DependencyMap& dependencies,
        const DependencyMap& dependents
    ) {
        const auto& deps_a = lookup(dependencies, a);
        const auto& deps_b = lookup(dependencies, b);

        double score = 0.0;
        if (deps_a.contains(b)) {
            score += 0.3;
        }
        if (deps_b.contains(a)) {
            score += 0.3;
        }

        score += std::min(0.2, 0.05 * static_cast<double>(count_shared(deps_a, deps_b)));
        score += std::min(0.2, 0.05 * static_cast<double>(
            count_shared(lookup(dependents, a), lookup(dependents, b))));

        return std::min(1.0, score);
    }

    FileRelationships file_relationships(
        const std::string& path,
        const std::vector<ImportInfo>& imports,
        const std::vector<ExportInfo>& exports,
        const DependencyMap& dependents
    ) {
        FileRelationships rel;
        rel.path = path;

        std::set<std::string> targets;
        for (const auto& import : imports) {
            if (import.source_path == path && !import.target_path.empty()) {
                targets.insert(import.target_path);
            }
        }
        rel.imports.assign(targets.begin(), targets.end());

        const auto& importers = lookup(dependents, path);
        rel.imported_by.assign(importers.begin(), importers.end());

        for (const auto& exp : exports) {
            rel.exports.push_back(exp.name);
        }
        return rel;
    }

}  // namespace rkg::analyzers
