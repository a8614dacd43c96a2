#ifndef RKG_ANALYZERS_HISTORY_ENRICHER_HPP
#define RKG_ANALYZERS_HISTORY_ENRICHER_HPP

/**
 * @file history_enricher.hpp
 * @brief Per-file version control history for file nodes.
 *
 * The enricher talks to an IHistoryProvider so the graph builder can be
 * tested without a real repository. GitHistoryProvider in
 * rkg/git/git_integration.hpp is the production implementation.
 */

#include "rkg/error.hpp"
#include "rkg/result.hpp"
#include "rkg/types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rkg::analyzers {

    /**
     * One log entry, newest first as the provider returns them.
     */
    struct CommitRecord {
        std::string hash;
        std::string author_name;
        std::string author_email;
        std::string date;     ///< ISO-8601 author date
        std::string message;  ///< Full message or subject line

        bool operator==(const CommitRecord&) const = default;
    };

    struct RepositoryStats {
        std::size_t total_commits = 0;
        std::size_t total_contributors = 0;
        std::optional<std::string> oldest_commit;
        std::optional<std::string> newest_commit;
    };

    class IHistoryProvider {
    public:
        virtual ~IHistoryProvider() = default;

        [[nodiscard]] virtual bool is_repository(const fs::path& root) const = 0;

        /**
         * Log of one file, newest first, at most max_commits entries.
         * Must be safe to call concurrently for different paths.
         */
        [[nodiscard]] virtual Result<std::vector<CommitRecord>, Error> file_log(
            const fs::path& root,
            const std::string& path,
            std::size_t max_commits
        ) const = 0;

        [[nodiscard]] virtual Result<RepositoryStats, Error> repository_stats(const fs::path& root) const = 0;

        /**
         * Root-relative paths touched by one commit.
         */
        [[nodiscard]] virtual Result<std::vector<std::string>, Error> changed_files(
            const fs::path& root,
            const std::string& commit
        ) const = 0;

        /**
         * Number of commits reachable from HEAD that touch path.
         */
        [[nodiscard]] virtual Result<std::size_t, Error> commit_count(
            const fs::path& root,
            const std::string& path
        ) const = 0;
    };

    struct Contributor {
        std::string name;
        std::string email;
        std::size_t commits = 0;
        std::string last_commit;
    };

    struct RecentCommit {
        std::string hash;     ///< 7 characters
        std::string message;  ///< First line, at most 80 characters
        std::string author;
        std::string date;
    };

    struct FileHistory {
        std::string path;
        std::string last_modified;
        std::size_t commit_count = 0;
        std::vector<Contributor> contributors;  ///< Most commits first
        std::vector<RecentCommit> recent_commits;
    };

    struct HistoryResult {
        bool is_repository = false;
        std::map<std::string, FileHistory> histories;
        RepositoryStats repository;
    };

    using HistoryProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

    struct HistoryOptions {
        std::size_t max_commits_per_file = 50;
        std::size_t batch_size = 10;
        std::size_t workers = 1;  ///< Concurrent queries inside one batch
    };

    /**
     * Folds a file log into a FileHistory.
     *
     * Contributors are grouped by email and ordered by commit count, ties
     * keeping first appearance. Returns nullopt for an empty log.
     */
    [[nodiscard]] std::optional<FileHistory> summarize_log(
        const std::string& path,
        const std::vector<CommitRecord>& log
    );

    class HistoryEnricher {
    public:
        explicit HistoryEnricher(const IHistoryProvider& provider, HistoryOptions options = {});

        /**
         * Collects history for every path.
         *
         * A non-repository root returns is_repository == false and no
         * histories. Files whose query fails or whose log is empty are left
         * out. progress is called after every batch.
         */
        [[nodiscard]] HistoryResult enrich(
            const fs::path& root,
            const std::vector<std::string>& paths,
            const HistoryProgressCallback& progress = {}
        ) const;

    private:
        const IHistoryProvider& provider_;
        HistoryOptions options_;
    };

    /**
     * Files with at least threshold commits, most changed first.
     */
    [[nodiscard]] std::vector<std::string> identify_hot_files(
        const std::map<std::string, FileHistory>& histories,
        std::size_t threshold = 10
    );

    /**
     * Volatility in [0, 1] from commit count, contributor count and
     * recency of the last change relative to now.
     */
    [[nodiscard]] double churn_score(const FileHistory& history, Timestamp now);

    // =========================================================================
    // Change coupling
    // =========================================================================

    struct CouplingExample {
        std::string hash;     ///< 7 characters
        std::string message;  ///< First line, at most 60 characters
        std::string date;
    };

    /**
     * How often file2 changed in the same commit as file1.
     */
    struct ChangeCoupling {
        std::string file1;
        std::string file2;
        double strength = 0.0;  ///< shared_commits / total_commits_file1, two decimals
        std::size_t shared_commits = 0;
        std::size_t total_commits_file1 = 0;
        std::size_t total_commits_file2 = 0;
        bool has_import_relationship = false;
        std::vector<CouplingExample> recent_examples;  ///< At most 3
    };

    struct ChangeCouplingResult {
        std::string target_file;
        std::vector<ChangeCoupling> coupled_files;  ///< Strongest first
        std::vector<std::string> insights;
    };

    struct CouplingOptions {
        std::size_t max_commits = 200;
        double min_strength = 0.3;
        /// Resolved imports as (importer, imported) pairs
        std::set<std::pair<std::string, std::string>> import_edges;
    };

    /**
     * Finds source files that change together with target_file.
     *
     * Looks at the target's last max_commits commits and counts the other
     * .ts/.tsx/.js/.jsx files each one touched. Commits whose file list
     * cannot be read are skipped. Failures are reported as insights, never
     * as errors.
     */
    [[nodiscard]] ChangeCouplingResult analyze_change_coupling(
        const IHistoryProvider& provider,
        const fs::path& root,
        const std::string& target_file,
        const CouplingOptions& options = {}
    );

    /**
     * Readable findings: hidden dependencies, very strong pairs, clusters.
     */
    [[nodiscard]] std::vector<std::string> coupling_insights(const std::vector<ChangeCoupling>& couplings);

}  // namespace rkg::analyzers

#endif  // RKG_ANALYZERS_HISTORY_ENRICHER_HPP
