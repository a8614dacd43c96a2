#include "rkg/analyzers/history_enricher.hpp"
#include "support/mock_history_provider.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace rkg::analyzers
{
    using namespace rkg::test_support;
    using ::testing::_;
    using ::testing::NiceMock;
    using ::testing::Return;

    using LogResult = Result<std::vector<CommitRecord>, Error>;
    using StatsResult = Result<RepositoryStats, Error>;
    using FilesResult = Result<std::vector<std::string>, Error>;
    using CountResult = Result<std::size_t, Error>;

    class HistoryEnricherTest : public ::testing::Test {
    protected:
        NiceMock<MockHistoryProvider> provider;
        const fs::path root = "/repo";
    };

    // =============================================================================
    // summarize_log
    // =============================================================================

    TEST_F(HistoryEnricherTest, SummarizeEmptyLog) {
        EXPECT_FALSE(summarize_log("a.ts", {}).has_value());
    }

    TEST_F(HistoryEnricherTest, SummarizeGroupsContributors) {
        const std::vector<CommitRecord> log = {
            commit("aaaaaaaaaa", "bob", "2024-03-01T10:00:00Z", "Fix parser\n\nLong body"),
            commit("bbbbbbbbbb", "alice", "2024-02-01T10:00:00Z"),
            commit("cccccccccc", "bob", "2024-01-01T10:00:00Z"),
            commit("dddddddddd", "carol", "2023-12-01T10:00:00Z"),
            commit("eeeeeeeeee", "alice", "2023-11-01T10:00:00Z"),
            commit("ffffffffff", "alice", "2023-10-01T10:00:00Z")
        };

        const auto history = summarize_log("src/a.ts", log);
        ASSERT_TRUE(history.has_value());

        EXPECT_EQ(history->path, "src/a.ts");
        EXPECT_EQ(history->last_modified, "2024-03-01T10:00:00Z");
        EXPECT_EQ(history->commit_count, 6u);

        ASSERT_EQ(history->contributors.size(), 3u);
        EXPECT_EQ(history->contributors[0].name, "alice");
        EXPECT_EQ(history->contributors[0].commits, 3u);
        EXPECT_EQ(history->contributors[0].last_commit, "2024-02-01T10:00:00Z");
        EXPECT_EQ(history->contributors[1].name, "bob");
        EXPECT_EQ(history->contributors[1].email, "bob@example.com");
        EXPECT_EQ(history->contributors[2].name, "carol");

        ASSERT_EQ(history->recent_commits.size(), 6u);
        EXPECT_EQ(history->recent_commits[0].hash, "aaaaaaa");
        EXPECT_EQ(history->recent_commits[0].message, "Fix parser");
        EXPECT_EQ(history->recent_commits[0].author, "bob");
    }

    TEST_F(HistoryEnricherTest, SummarizeCapsRecentCommits) {
        std::vector<CommitRecord> log;
        for (int i = 0; i < 15; ++i) {
            log.push_back(commit("hash" + std::to_string(i), "dev", "2024-01-01T00:00:00Z", std::string(120, 'm')));
        }

        const auto history = summarize_log("a.ts", log);
        ASSERT_TRUE(history.has_value());

        EXPECT_EQ(history->commit_count, 15u);
        ASSERT_EQ(history->recent_commits.size(), 10u);
        EXPECT_EQ(history->recent_commits[0].message.size(), 80u);
    }

    // =============================================================================
    // HistoryEnricher
    // =============================================================================

    TEST_F(HistoryEnricherTest, NonRepositoryReturnsEmpty) {
        EXPECT_CALL(provider, is_repository(root)).WillOnce(Return(false));
        EXPECT_CALL(provider, file_log(_, _, _)).Times(0);

        const HistoryEnricher enricher(provider);
        const auto result = enricher.enrich(root, {"a.ts", "b.ts"});

        EXPECT_FALSE(result.is_repository);
        EXPECT_TRUE(result.histories.empty());
    }

    TEST_F(HistoryEnricherTest, CollectsHistoryInBatches) {
        EXPECT_CALL(provider, is_repository(root)).WillOnce(Return(true));

        RepositoryStats stats;
        stats.total_commits = 42;
        stats.total_contributors = 3;
        EXPECT_CALL(provider, repository_stats(root)).WillOnce(Return(StatsResult::success(stats)));

        EXPECT_CALL(provider, file_log(root, "a.ts", 5)).WillOnce(Return(LogResult::success({
            commit("1111111111", "alice", "2024-01-02T00:00:00Z")
        })));
        EXPECT_CALL(provider, file_log(root, "b.ts", 5)).WillOnce(Return(LogResult::success({})));
        EXPECT_CALL(provider, file_log(root, "c.ts", 5))
            .WillOnce(Return(LogResult::failure(Error::git_error("git log failed"))));
        EXPECT_CALL(provider, file_log(root, "d.ts", 5)).WillOnce(Return(LogResult::success({
            commit("2222222222", "bob", "2024-01-03T00:00:00Z"),
            commit("3333333333", "bob", "2024-01-01T00:00:00Z")
        })));
        EXPECT_CALL(provider, file_log(root, "e.ts", 5)).WillOnce(Return(LogResult::success({
            commit("4444444444", "carol", "2024-01-04T00:00:00Z")
        })));

        std::vector<std::pair<std::size_t, std::size_t>> progress;
        const HistoryEnricher enricher(provider, {.max_commits_per_file = 5, .batch_size = 2, .workers = 2});
        const auto result = enricher.enrich(root, {"a.ts", "b.ts", "c.ts", "d.ts", "e.ts"},
            [&](const std::size_t done, const std::size_t total) { progress.emplace_back(done, total); });

        EXPECT_TRUE(result.is_repository);
        EXPECT_EQ(result.repository.total_commits, 42u);

        ASSERT_EQ(result.histories.size(), 3u);
        EXPECT_EQ(result.histories.at("a.ts").commit_count, 1u);
        EXPECT_EQ(result.histories.at("d.ts").commit_count, 2u);
        EXPECT_EQ(result.histories.at("d.ts").last_modified, "2024-01-03T00:00:00Z");
        EXPECT_FALSE(result.histories.contains("b.ts"));
        EXPECT_FALSE(result.histories.contains("c.ts"));

        using Progress = std::vector<std::pair<std::size_t, std::size_t>>;
        EXPECT_EQ(progress, (Progress{{2, 5}, {4, 5}, {5, 5}}));
    }

    TEST_F(HistoryEnricherTest, RepositoryStatsFailureIsNotFatal) {
        EXPECT_CALL(provider, is_repository(root)).WillOnce(Return(true));
        EXPECT_CALL(provider, repository_stats(root))
            .WillOnce(Return(StatsResult::failure(Error::git_error("no HEAD"))));
        EXPECT_CALL(provider, file_log(root, "a.ts", 50)).WillOnce(Return(LogResult::success({
            commit("1111111111", "alice", "2024-01-02T00:00:00Z")
        })));

        const HistoryEnricher enricher(provider);
        const auto result = enricher.enrich(root, {"a.ts"});

        EXPECT_TRUE(result.is_repository);
        EXPECT_EQ(result.repository.total_commits, 0u);
        EXPECT_EQ(result.histories.size(), 1u);
    }

    // =============================================================================
    // Derived metrics
    // =============================================================================

    TEST_F(HistoryEnricherTest, IdentifyHotFiles) {
        std::map<std::string, FileHistory> histories;
        histories["a.ts"] = FileHistory{"a.ts", "", 12, {}, {}};
        histories["b.ts"] = FileHistory{"b.ts", "", 3, {}, {}};
        histories["c.ts"] = FileHistory{"c.ts", "", 30, {}, {}};
        histories["d.ts"] = FileHistory{"d.ts", "", 10, {}, {}};

        EXPECT_EQ(identify_hot_files(histories), (std::vector<std::string>{"c.ts", "a.ts", "d.ts"}));
        EXPECT_EQ(identify_hot_files(histories, 20), std::vector<std::string>{"c.ts"});
        EXPECT_TRUE(identify_hot_files({}, 1).empty());
    }

    TEST_F(HistoryEnricherTest, ChurnScore) {
        const auto now = parse_timestamp("2024-07-01T00:00:00Z");

        FileHistory busy;
        busy.commit_count = 100;
        busy.contributors.resize(8);
        busy.last_modified = "2024-07-01T00:00:00Z";
        EXPECT_NEAR(churn_score(busy, now), 1.0, 1e-9);

        FileHistory quiet;
        quiet.commit_count = 25;
        quiet.contributors.resize(1);
        quiet.last_modified = "2023-01-01T00:00:00Z";
        // 0.5 * 0.4 + 0.2 * 0.3 + 0
        EXPECT_NEAR(churn_score(quiet, now), 0.26, 1e-9);

        FileHistory recent;
        recent.commit_count = 0;
        recent.last_modified = "2024-04-02T00:00:00Z";  // 90 days before now
        EXPECT_NEAR(churn_score(recent, now), 0.15, 1e-9);
    }

    // =============================================================================
    // Change coupling
    // =============================================================================

    TEST_F(HistoryEnricherTest, ChangeCouplingRanksCoChangedFiles) {
        ON_CALL(provider, is_repository(_)).WillByDefault(Return(true));
        ON_CALL(provider, file_log(root, "src/a.ts", 200)).WillByDefault(Return(LogResult::success({
            commit("1111111111", "alice", "2024-04-01T00:00:00Z",
                   "Move session handling into one shared module for every login path\n\nbody"),
            commit("2222222222", "bob", "2024-03-01T00:00:00Z"),
            commit("3333333333", "alice", "2024-02-01T00:00:00Z"),
            commit("4444444444", "bob", "2024-01-01T00:00:00Z")
        })));
        ON_CALL(provider, changed_files(root, "1111111111")).WillByDefault(Return(FilesResult::success(
            {"src/a.ts", "src/b.ts", "src/c.ts", "README.md"})));
        ON_CALL(provider, changed_files(root, "2222222222")).WillByDefault(Return(FilesResult::success(
            {"src/a.ts", "src/b.ts"})));
        ON_CALL(provider, changed_files(root, "3333333333")).WillByDefault(Return(FilesResult::success(
            {"src/a.ts", "src/b.ts", "src/c.ts", "src/d.ts"})));
        ON_CALL(provider, changed_files(root, "4444444444")).WillByDefault(Return(FilesResult::failure(
            Error::git_error("bad object"))));
        ON_CALL(provider, commit_count(root, "src/b.ts")).WillByDefault(Return(CountResult::success(10)));
        ON_CALL(provider, commit_count(root, "src/c.ts")).WillByDefault(Return(CountResult::failure(
            Error::git_error("rev-list failed"))));

        CouplingOptions options;
        options.import_edges = {{"src/c.ts", "src/a.ts"}};
        const auto result = analyze_change_coupling(provider, root, "src/a.ts", options);

        EXPECT_EQ(result.target_file, "src/a.ts");
        ASSERT_EQ(result.coupled_files.size(), 2u);

        const auto& b = result.coupled_files[0];
        EXPECT_EQ(b.file1, "src/a.ts");
        EXPECT_EQ(b.file2, "src/b.ts");
        EXPECT_DOUBLE_EQ(b.strength, 0.75);
        EXPECT_EQ(b.shared_commits, 3u);
        EXPECT_EQ(b.total_commits_file1, 4u);
        EXPECT_EQ(b.total_commits_file2, 10u);
        EXPECT_FALSE(b.has_import_relationship);
        ASSERT_EQ(b.recent_examples.size(), 3u);
        EXPECT_EQ(b.recent_examples[0].hash, "1111111");
        EXPECT_EQ(b.recent_examples[0].message.size(), 60u);
        EXPECT_EQ(b.recent_examples[0].date, "2024-04-01T00:00:00Z");

        const auto& c = result.coupled_files[1];
        EXPECT_EQ(c.file2, "src/c.ts");
        EXPECT_DOUBLE_EQ(c.strength, 0.5);
        EXPECT_EQ(c.total_commits_file2, 2u);  // shared count when the lookup fails
        EXPECT_TRUE(c.has_import_relationship);

        EXPECT_EQ(result.insights, (std::vector<std::string>{
            "Found 1 hidden dependency: src/b.ts always changes with this file but has no import relationship.",
            "src/b.ts changes together 75% of the time (3 shared commits). "
            "Consider if these should be merged or if there's a missing abstraction."
        }));
    }

    TEST_F(HistoryEnricherTest, ChangeCouplingWithoutHistory) {
        ON_CALL(provider, is_repository(_)).WillByDefault(Return(false));
        EXPECT_EQ(analyze_change_coupling(provider, root, "src/a.ts").insights,
                  std::vector<std::string>{"Not a git repository"});

        ON_CALL(provider, is_repository(_)).WillByDefault(Return(true));
        EXPECT_CALL(provider, file_log(_, "src/new.ts", _)).WillOnce(Return(LogResult::success({})));
        EXPECT_EQ(analyze_change_coupling(provider, root, "src/new.ts").insights,
                  std::vector<std::string>{"No git history for this file"});

        EXPECT_CALL(provider, file_log(_, "src/gone.ts", _))
            .WillOnce(Return(LogResult::failure(Error::git_error("unknown revision"))));
        const auto failed = analyze_change_coupling(provider, root, "src/gone.ts");
        EXPECT_TRUE(failed.coupled_files.empty());
        EXPECT_EQ(failed.insights, std::vector<std::string>{"Error analyzing coupling: unknown revision"});
    }

    TEST_F(HistoryEnricherTest, CouplingInsights) {
        EXPECT_EQ(coupling_insights({}),
                  std::vector<std::string>{"This file changes independently - no strong coupling detected."});

        std::vector<ChangeCoupling> cluster;
        for (int i = 0; i < 5; ++i) {
            ChangeCoupling coupling;
            coupling.file2 = "src/f" + std::to_string(i) + ".ts";
            coupling.strength = 0.4;
            coupling.has_import_relationship = i == 0;
            cluster.push_back(coupling);
        }
        cluster[0].strength = 0.9;
        cluster[0].shared_commits = 9;

        const auto insights = coupling_insights(cluster);
        ASSERT_EQ(insights.size(), 2u);
        EXPECT_EQ(insights[0], "src/f0.ts changes together 90% of the time (9 shared commits). "
                               "They have a direct dependency.");
        EXPECT_EQ(insights[1], "This file is part of a change cluster with 5 files. "
                               "Changes here tend to ripple. Consider refactoring to reduce coupling.");
    }

}  // namespace rkg::analyzers
