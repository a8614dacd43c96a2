#include "rkg/frontend/frontend.hpp"
#include "support/syntax_fixtures.hpp"

#include <gtest/gtest.h>

namespace rkg::frontend
{
    using namespace rkg::test_support;

    TEST(SyntaxTest, TextUsesByteSpan) {
        ParsedFile file;
        file.source = "if (a && b) {}";

        SyntaxNode n;
        n.begin = 4;
        n.end = 10;
        EXPECT_EQ(file.text(n), "a && b");

        n.end = 100;
        EXPECT_EQ(file.text(n), "");
    }

    TEST(SyntaxTest, DescendantsAreVisitedDepthFirst) {
        const auto tree = node(SyntaxKind::Block, 1, 1, {
            node(SyntaxKind::IfStatement, 1, 1, {node(SyntaxKind::ReturnStatement)}),
            node(SyntaxKind::CallExpression)
        });

        std::vector<SyntaxKind> seen;
        tree.for_each_descendant([&](const SyntaxNode& n) { seen.push_back(n.kind); });
        EXPECT_EQ(seen, (std::vector<SyntaxKind>{
            SyntaxKind::IfStatement, SyntaxKind::ReturnStatement, SyntaxKind::CallExpression}));
    }

    TEST(InMemoryFrontendTest, ServesRegisteredFiles) {
        InMemoryFrontend frontend;
        frontend.add_file(parsed_file("src/a.ts", 3));

        EXPECT_TRUE(frontend.supports("src/a.ts"));
        EXPECT_FALSE(frontend.supports("src/b.ts"));

        const auto parsed = frontend.parse("/repo", "src/a.ts");
        ASSERT_TRUE(parsed.is_ok());
        EXPECT_EQ(parsed.value().end_line, 3u);
    }

    TEST(InMemoryFrontendTest, InjectedFailures) {
        InMemoryFrontend frontend;
        frontend.set_failure("bad.ts", Error::parse_error("unexpected token"));
        frontend.set_throw("boom.ts", "kaboom");

        EXPECT_EQ(frontend.paths(), (std::vector<std::string>{"bad.ts", "boom.ts"}));

        const auto failed = frontend.parse("/repo", "bad.ts");
        ASSERT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().code(), ErrorCode::ParseError);

        EXPECT_THROW((void)frontend.parse("/repo", "boom.ts"), std::runtime_error);
    }

    TEST(FrontendRegistryTest, FirstSupportingFrontendWins) {
        auto first = std::make_shared<InMemoryFrontend>("first");
        first->add_file(parsed_file("a.ts", 1));
        auto second = std::make_shared<InMemoryFrontend>("second");
        second->add_file(parsed_file("a.ts", 1));
        second->add_file(parsed_file("b.ts", 1));

        FrontendRegistry registry;
        EXPECT_TRUE(registry.empty());
        registry.register_frontend(first);
        registry.register_frontend(second);
        registry.register_frontend(nullptr);

        EXPECT_EQ(registry.list_frontends().size(), 2u);
        EXPECT_EQ(registry.find_frontend_for("a.ts")->name(), "first");
        EXPECT_EQ(registry.find_frontend_for("b.ts")->name(), "second");
        EXPECT_EQ(registry.find_frontend_for("c.ts"), nullptr);
    }

}  // namespace rkg::frontend
