#ifndef RKG_GIT_GIT_INTEGRATION_HPP
#define RKG_GIT_GIT_INTEGRATION_HPP

/**
 * @file git_integration.hpp
 * @brief Runs git as a subprocess and reads file history from it.
 *
 * Commands are executed directly (no shell) with a timeout. A command that
 * runs past its timeout is terminated and reported as a GitError.
 */

#include "rkg/analyzers/history_enricher.hpp"
#include "rkg/error.hpp"
#include "rkg/result.hpp"
#include "rkg/types.hpp"

#include <string>
#include <vector>

namespace rkg::git {

    /**
     * Command execution result.
     */
    struct CommandResult {
        int exit_code = 0;
        std::string stdout_output;
        std::string stderr_output;
        Duration execution_time = Duration::zero();
    };

    /**
     * Executes a git command.
     *
     * @param args Command arguments (without "git" prefix).
     * @param working_dir Working directory for the command.
     * @param timeout Maximum execution time.
     * @return Command result, NotFound for a missing directory, GitError on
     *         timeout or when git cannot be started.
     */
    [[nodiscard]] Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        Duration timeout = std::chrono::seconds(30)
    );

    /**
     * Checks if a directory is inside a git work tree.
     */
    [[nodiscard]] bool is_git_repository(const fs::path& dir);

    /**
     * Parses the output of the log format used by GitHistoryProvider.
     * Malformed records are skipped.
     */
    [[nodiscard]] std::vector<analyzers::CommitRecord> parse_log_output(const std::string& output);

    class GitHistoryProvider : public analyzers::IHistoryProvider {
    public:
        explicit GitHistoryProvider(Duration command_timeout = std::chrono::seconds(30));

        [[nodiscard]] bool is_repository(const fs::path& root) const override;

        [[nodiscard]] Result<std::vector<analyzers::CommitRecord>, Error> file_log(
            const fs::path& root,
            const std::string& path,
            std::size_t max_commits
        ) const override;

        [[nodiscard]] Result<analyzers::RepositoryStats, Error> repository_stats(
            const fs::path& root
        ) const override;

        [[nodiscard]] Result<std::vector<std::string>, Error> changed_files(
            const fs::path& root,
            const std::string& commit
        ) const override;

        [[nodiscard]] Result<std::size_t, Error> commit_count(
            const fs::path& root,
            const std::string& path
        ) const override;

    private:
        Duration command_timeout_;
    };

}  // namespace rkg::git

#endif  // RKG_GIT_GIT_INTEGRATION_HPP
