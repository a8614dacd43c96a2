#include "rkg/search/search_engine.hpp"
#include "support/graph_fixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

namespace rkg::search
{
    using namespace rkg::test_support;
    using ::testing::Contains;
    using ::testing::EndsWith;
    using ::testing::IsEmpty;
    using ::testing::StartsWith;

    class SearchEngineTest : public ::testing::Test {
    protected:
        void SetUp() override {
            graph = search_graph();
            index = build_index(graph);
        }

        static const SearchResult* find_result(const SearchResponse& response, const std::string& id) {
            const auto it = std::ranges::find(response.results, id, &SearchResult::id);
            return it == response.results.end() ? nullptr : &*it;
        }

        graph::KnowledgeGraph graph;
        EmbeddingIndex index;
    };

    // =============================================================================
    // Query parsing
    // =============================================================================

    TEST_F(SearchEngineTest, ParseQueryExpandsSynonyms) {
        EXPECT_EQ(parse_query("User_auth"), (std::vector<std::string>{
            "user", "auth", "account", "profile", "member",
            "authentication", "login", "session", "token", "jwt", "oauth",
            "signin", "sign-in", "authenticate", "cookie"
        }));
    }

    TEST_F(SearchEngineTest, ParseQueryMatchesSynonymMembers) {
        const auto words = parse_query("DB");

        EXPECT_EQ(words.front(), "db");
        EXPECT_THAT(words, Contains("database"));
        EXPECT_THAT(words, Contains("repository"));
    }

    TEST_F(SearchEngineTest, ParseQueryDropsShortWords) {
        EXPECT_THAT(parse_query("  a , x-y / "), IsEmpty());
        EXPECT_EQ(parse_query("parse.tree"), (std::vector<std::string>{"parse", "tree"}));
    }

    TEST_F(SearchEngineTest, SearchModeNames) {
        EXPECT_STREQ(to_string(SearchMode::Hybrid), "hybrid");
        EXPECT_EQ(parse_search_mode("semantic"), SearchMode::Semantic);
        EXPECT_FALSE(parse_search_mode("fuzzy").has_value());
    }

    // =============================================================================
    // Context
    // =============================================================================

    TEST_F(SearchEngineTest, NodeContext) {
        EXPECT_EQ(node_context(*graph.node("src/utils/date.ts:function:formatDate:1")),
                  "formatDate(date): string");
        EXPECT_EQ(node_context(*graph.node("src/services/user.ts:class:UserService:5")),
                  "class UserService extends BaseService (4 members)");
        EXPECT_EQ(node_context(*graph.node("src/models/user.ts:interface:User:1")),
                  "interface User definition");
        EXPECT_EQ(node_context(*graph.node("src/models/user.ts")), "File: 100 lines (typescript)");
        EXPECT_EQ(node_context(*graph.node("src/auth/login.ts:function:login:3")),
                  "Authenticate a user with email and password");
    }

    TEST_F(SearchEngineTest, NodeContextTruncatesDocumentation) {
        auto node = function_node("a.ts", "f", 1);
        node.common.documentation = std::string(150, 'd');

        const auto context = node_context(node);

        EXPECT_EQ(context.size(), 103u);
        EXPECT_THAT(context, EndsWith("..."));
    }

    TEST_F(SearchEngineTest, NodeContextOfAsyncFunction) {
        auto node = function_node("a.ts", "load", 1);
        node.details = graph::FunctionDetails{{"id"}, std::nullopt, true, false};

        EXPECT_EQ(node_context(node), "async load(id)");
    }

    // =============================================================================
    // Keyword search
    // =============================================================================

    TEST_F(SearchEngineTest, KeywordScoring) {
        auto response = search("user", graph, nullptr, {SearchMode::Keyword, 20});
        ASSERT_TRUE(response.is_ok());
        const auto& results = response.value().results;

        ASSERT_EQ(results.size(), 6u);
        EXPECT_EQ(response.value().total_matches, 6u);

        EXPECT_EQ(results[0].name, "User");
        EXPECT_EQ(results[0].relevance, 100);
        EXPECT_EQ(results[0].match_reason, "Exact name match: \"user\"");

        // Prefix match plus the bonus for four importers
        EXPECT_EQ(results[1].id, "src/services/user.ts");
        EXPECT_EQ(results[1].relevance, 95);
        EXPECT_EQ(results[1].match_reason, "Name starts with: \"user\"");

        EXPECT_EQ(results[2].name, "UserService");
        EXPECT_EQ(results[2].relevance, 90);
        EXPECT_EQ(results[3].id, "src/models/user.ts");
        EXPECT_EQ(results[3].relevance, 90);

        // Only the path matches, through the "auth" synonym
        EXPECT_EQ(results[4].name, "login");
        EXPECT_EQ(results[4].relevance, 55);
        EXPECT_EQ(results[5].match_reason, "Path contains: \"auth\"");
        EXPECT_EQ(results[5].relevance, 50);

        EXPECT_FALSE(results[0].similarity.has_value());
        EXPECT_EQ(results[0].line, 1u);
    }

    TEST_F(SearchEngineTest, LimitAppliesAfterCounting) {
        auto response = search("user", graph, nullptr, {SearchMode::Keyword, 2});
        ASSERT_TRUE(response.is_ok());

        EXPECT_EQ(response.value().results.size(), 2u);
        EXPECT_EQ(response.value().total_matches, 6u);
        EXPECT_EQ(response.value().query, "user");
    }

    TEST_F(SearchEngineTest, NoMatchesSuggestBroaderTerms) {
        auto response = search("kubernetes", graph, nullptr, {SearchMode::Keyword, 20});
        ASSERT_TRUE(response.is_ok());

        EXPECT_THAT(response.value().results, IsEmpty());
        ASSERT_EQ(response.value().suggestions.size(), 2u);
        EXPECT_THAT(response.value().suggestions[0], StartsWith("Try broader terms"));
    }

    // =============================================================================
    // Semantic and hybrid search
    // =============================================================================

    TEST_F(SearchEngineTest, SemanticWithoutIndexFails) {
        auto response = search("password", graph, nullptr, {SearchMode::Semantic, 20});

        ASSERT_TRUE(response.is_err());
        EXPECT_EQ(response.error().code(), ErrorCode::IndexError);
    }

    TEST_F(SearchEngineTest, SemanticSearch) {
        auto response = search("password", graph, &index, {SearchMode::Semantic, 20});
        ASSERT_TRUE(response.is_ok());
        const auto& results = response.value().results;

        EXPECT_EQ(response.value().mode, SearchMode::Semantic);
        ASSERT_FALSE(results.empty());
        EXPECT_EQ(results[0].id, "src/auth/login.ts:function:login:3");
        ASSERT_TRUE(results[0].similarity.has_value());
        EXPECT_EQ(results[0].relevance, static_cast<int>(std::lround(*results[0].similarity * 100.0)));
        EXPECT_EQ(results[0].match_reason,
                  "Semantic similarity: " + std::to_string(results[0].relevance) + "%");
    }

    TEST_F(SearchEngineTest, SemanticOutOfVocabularyIsEmpty) {
        auto response = search("kubernetes", graph, &index, {SearchMode::Semantic, 20});
        ASSERT_TRUE(response.is_ok());

        EXPECT_THAT(response.value().results, IsEmpty());
        EXPECT_EQ(response.value().total_matches, 0u);
    }

    TEST_F(SearchEngineTest, HybridWithoutIndexFallsBackToKeyword) {
        auto hybrid = search("user", graph, nullptr, {SearchMode::Hybrid, 20});
        auto keyword = search("user", graph, nullptr, {SearchMode::Keyword, 20});
        ASSERT_TRUE(hybrid.is_ok());
        ASSERT_TRUE(keyword.is_ok());

        EXPECT_EQ(hybrid.value().mode, SearchMode::Keyword);
        ASSERT_EQ(hybrid.value().results.size(), keyword.value().results.size());
        for (std::size_t i = 0; i < keyword.value().results.size(); ++i) {
            EXPECT_EQ(hybrid.value().results[i].id, keyword.value().results[i].id);
        }
    }

    TEST_F(SearchEngineTest, HybridMergesBothSignals) {
        auto response = search("login", graph, &index, {SearchMode::Hybrid, 20});
        ASSERT_TRUE(response.is_ok());

        EXPECT_EQ(response.value().mode, SearchMode::Hybrid);

        const auto* login = find_result(response.value(), "src/auth/login.ts:function:login:3");
        ASSERT_NE(login, nullptr);
        EXPECT_EQ(login->relevance, 100);
        EXPECT_EQ(login->match_reason, "Exact name match: \"login\" + Semantic match");
        EXPECT_TRUE(login->similarity.has_value());

        for (std::size_t i = 1; i < response.value().results.size(); ++i) {
            EXPECT_GE(response.value().results[i - 1].relevance, response.value().results[i].relevance);
        }
    }

    // =============================================================================
    // Suggestions
    // =============================================================================

    TEST_F(SearchEngineTest, SuggestionsForFocusedResults) {
        auto response = search("user", graph, nullptr, {SearchMode::Keyword, 20});
        ASSERT_TRUE(response.is_ok());

        EXPECT_EQ(response.value().suggestions, (std::vector<std::string>{
            "Explore file: \"user.ts\"",
            "Search \"user interface\""
        }));
    }

    TEST_F(SearchEngineTest, SuggestionsForBroadResults) {
        std::vector<SearchResult> results(51);
        for (std::size_t i = 0; i < results.size(); ++i) {
            results[i].kind = i % 2 == 0 ? graph::NodeKind::Function : graph::NodeKind::Class;
        }

        EXPECT_EQ(generate_suggestions("x", results), (std::vector<std::string>{
            "Add more specific terms to narrow results",
            "Filter by type: function, class"
        }));
    }

}  // namespace rkg::search
