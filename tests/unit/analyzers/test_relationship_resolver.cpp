#include "rkg/analyzers/relationship_resolver.hpp"

#include <gtest/gtest.h>

namespace rkg::analyzers
{
    class RelationshipResolverTest : public ::testing::Test {
    protected:
        std::set<std::string> known_files = {
            "src/app.ts",
            "src/utils/format.ts",
            "src/utils/index.ts",
            "src/components/Button.tsx",
            "src/legacy/helper.js",
            "src/models/user.ts",
            "lib/shared.ts"
        };

        static ImportInfo make_import(const std::string& from, const std::string& specifier) {
            ImportInfo info;
            info.source_path = from;
            info.specifier = specifier;
            info.symbols = {"x"};
            info.line = 1;
            return info;
        }
    };

    // =============================================================================
    // Target resolution
    // =============================================================================

    TEST_F(RelationshipResolverTest, ResolvesByExtension) {
        EXPECT_EQ(resolve_import_target("src/app.ts", "./utils/format", known_files).value_or(""),
                  "src/utils/format.ts");
        EXPECT_EQ(resolve_import_target("src/app.ts", "./components/Button", known_files).value_or(""),
                  "src/components/Button.tsx");
        EXPECT_EQ(resolve_import_target("src/app.ts", "./legacy/helper", known_files).value_or(""),
                  "src/legacy/helper.js");
    }

    TEST_F(RelationshipResolverTest, ResolvesExactPath) {
        EXPECT_EQ(resolve_import_target("src/app.ts", "./models/user.ts", known_files).value_or(""),
                  "src/models/user.ts");
    }

    TEST_F(RelationshipResolverTest, ResolvesDirectoryIndex) {
        EXPECT_EQ(resolve_import_target("src/app.ts", "./utils", known_files).value_or(""),
                  "src/utils/index.ts");
    }

    TEST_F(RelationshipResolverTest, JsSpecifierMatchesTypeScriptSource) {
        EXPECT_EQ(resolve_import_target("src/app.ts", "./models/user.js", known_files).value_or(""),
                  "src/models/user.ts");
    }

    TEST_F(RelationshipResolverTest, ResolvesParentDirectories) {
        EXPECT_EQ(resolve_import_target("src/utils/format.ts", "../../lib/shared", known_files).value_or(""),
                  "lib/shared.ts");
    }

    TEST_F(RelationshipResolverTest, DropsPackagesAndMisses) {
        EXPECT_FALSE(resolve_import_target("src/app.ts", "react", known_files).has_value());
        EXPECT_FALSE(resolve_import_target("src/app.ts", "@scope/pkg", known_files).has_value());
        EXPECT_FALSE(resolve_import_target("src/app.ts", "./missing", known_files).has_value());
        EXPECT_FALSE(resolve_import_target("src/app.ts", "../../outside", known_files).has_value());
    }

    // =============================================================================
    // Edges and dependency maps
    // =============================================================================

    TEST_F(RelationshipResolverTest, ResolveBuildsEdgesInOrder) {
        auto type_import = make_import("src/app.ts", "./models/user");
        type_import.is_type_only = true;

        const std::vector<ImportInfo> imports = {
            make_import("src/app.ts", "./utils/format"),
            make_import("src/app.ts", "react"),
            type_import,
            make_import("src/components/Button.tsx", "../utils/format")
        };

        const auto result = resolve(imports, known_files, 5);

        ASSERT_EQ(result.edges.size(), 3u);
        EXPECT_EQ(result.edges[0].id, "import-5");
        EXPECT_EQ(result.edges[0].source, "src/app.ts");
        EXPECT_EQ(result.edges[0].target, "src/utils/format.ts");
        EXPECT_EQ(result.edges[0].kind, graph::EdgeKind::Imports);
        EXPECT_EQ(result.edges[1].id, "import-6");
        ASSERT_TRUE(result.edges[1].metadata.has_value());
        EXPECT_TRUE(result.edges[1].metadata->is_type_only);
        EXPECT_EQ(result.edges[1].metadata->symbols, std::vector<std::string>{"x"});
        EXPECT_EQ(result.edges[2].id, "import-7");

        ASSERT_EQ(result.resolved.size(), 3u);
        EXPECT_EQ(result.resolved[0].target_path, "src/utils/format.ts");

        EXPECT_EQ(result.dependencies.at("src/app.ts"),
                  (std::set<std::string>{"src/models/user.ts", "src/utils/format.ts"}));
        EXPECT_EQ(result.dependents.at("src/utils/format.ts"),
                  (std::set<std::string>{"src/app.ts", "src/components/Button.tsx"}));
    }

    TEST_F(RelationshipResolverTest, ResolveIsDeterministic) {
        const std::vector<ImportInfo> imports = {
            make_import("src/app.ts", "./utils"),
            make_import("src/app.ts", "./legacy/helper")
        };

        const auto first = resolve(imports, known_files);
        const auto second = resolve(imports, known_files);

        EXPECT_EQ(first.edges, second.edges);
        EXPECT_EQ(first.dependencies, second.dependencies);
    }

    // =============================================================================
    // Coupling
    // =============================================================================

    TEST_F(RelationshipResolverTest, CouplingScore) {
        DependencyMap dependencies = {
            {"a", {"b", "c", "d"}},
            {"b", {"a", "c", "d"}},
            {"e", {"c"}}
        };
        DependencyMap dependents = {
            {"a", {"b", "x"}},
            {"b", {"a", "x"}},
            {"c", {"a", "b", "e"}},
            {"d", {"a", "b"}}
        };

        // Both directions 0.6, two shared deps 0.1, one shared importer 0.05
        EXPECT_NEAR(coupling_score("a", "b", dependencies, dependents), 0.75, 1e-9);
        // Shared dependency c only
        EXPECT_NEAR(coupling_score("a", "e", dependencies, dependents), 0.05, 1e-9);
        EXPECT_DOUBLE_EQ(coupling_score("x", "y", dependencies, dependents), 0.0);
    }

    TEST_F(RelationshipResolverTest, CouplingSharedTermsAreCapped) {
        DependencyMap dependencies = {
            {"a", {"1", "2", "3", "4", "5", "6"}},
            {"b", {"1", "2", "3", "4", "5", "6"}}
        };
        const DependencyMap dependents;

        EXPECT_NEAR(coupling_score("a", "b", dependencies, dependents), 0.2, 1e-9);
    }

    TEST_F(RelationshipResolverTest, FileRelationships) {
        const auto result = resolve({
            make_import("src/app.ts", "./utils/format"),
            make_import("src/app.ts", "./models/user"),
            make_import("src/app.ts", "./utils/format.ts"),
            make_import("src/models/user.ts", "../app")
        }, known_files);

        const std::vector<ExportInfo> exports = {{"App", false, false, std::nullopt}, {"default", true, false, std::nullopt}};
        const auto rel = file_relationships("src/app.ts", result.resolved, exports, result.dependents);

        EXPECT_EQ(rel.path, "src/app.ts");
        EXPECT_EQ(rel.imports, (std::vector<std::string>{"src/models/user.ts", "src/utils/format.ts"}));
        EXPECT_EQ(rel.imported_by, std::vector<std::string>{"src/models/user.ts"});
        EXPECT_EQ(rel.exports, (std::vector<std::string>{"App", "default"}));
    }

}  // namespace rkg::analyzers
