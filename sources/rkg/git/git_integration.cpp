#include "rkg/git/git_integration.hpp"
#include "rkg/logging.hpp"
#include "rkg/utils/string_utils.hpp"

#include <sstream>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>
#include <csignal>

namespace rkg::git {

    namespace {

        constexpr char FIELD_SEPARATOR = '\x1f';
        constexpr char RECORD_SEPARATOR = '\x1e';
        constexpr auto LOG_FORMAT = "--format=%H%x1f%an%x1f%ae%x1f%aI%x1f%s%x1e";

        void drain(const int fd, std::string& out) {
            char buffer[4096];
            ssize_t n;
            while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
                out.append(buffer, static_cast<std::size_t>(n));
            }
        }

        CommandResult execute_command_impl(
            const std::vector<std::string>& argv,
            const fs::path& working_dir,
            const Duration timeout
        ) {
            CommandResult result;
            const auto start_time = SteadyClock::now();

            int stdout_pipe[2];
            int stderr_pipe[2];

            if (pipe(stdout_pipe) < 0) {
                result.exit_code = -1;
                return result;
            }
            if (pipe(stderr_pipe) < 0) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
                result.exit_code = -1;
                return result;
            }

            std::vector<char*> args;
            args.reserve(argv.size() + 1);
            for (const auto& arg : argv) {
                args.push_back(const_cast<char*>(arg.c_str()));
            }
            args.push_back(nullptr);

            const pid_t pid = fork();
            if (pid < 0) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
                close(stderr_pipe[0]);
                close(stderr_pipe[1]);
                result.exit_code = -1;
                return result;
            }

            if (pid == 0) {
                // Child process
                close(stdout_pipe[0]);
                close(stderr_pipe[0]);

                dup2(stdout_pipe[1], STDOUT_FILENO);
                dup2(stderr_pipe[1], STDERR_FILENO);

                close(stdout_pipe[1]);
                close(stderr_pipe[1]);

                if (chdir(working_dir.c_str()) != 0) {
                    _exit(127);
                }

                execvp(args[0], args.data());
                _exit(127);
            }

            // Parent process
            close(stdout_pipe[1]);
            close(stderr_pipe[1]);

            fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
            fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

            const auto timeout_point = SteadyClock::now() + timeout;
            int status = 0;
            bool finished = false;

            while (!finished) {
                if (SteadyClock::now() > timeout_point) {
                    kill(pid, SIGTERM);
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    kill(pid, SIGKILL);
                    waitpid(pid, &status, 0);
                    result.exit_code = -2;  // Timeout
                    finished = true;
                    continue;
                }

                drain(stdout_pipe[0], result.stdout_output);
                drain(stderr_pipe[0], result.stderr_output);

                if (waitpid(pid, &status, WNOHANG) > 0) {
                    drain(stdout_pipe[0], result.stdout_output);
                    drain(stderr_pipe[0], result.stderr_output);

                    if (WIFEXITED(status)) {
                        result.exit_code = WEXITSTATUS(status);
                    } else if (WIFSIGNALED(status)) {
                        result.exit_code = -WTERMSIG(status);
                    }
                    finished = true;
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
            }

            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            result.execution_time = std::chrono::duration_cast<Duration>(SteadyClock::now() - start_time);
            return result;
        }

        /**
         * Printable form of a command for messages.
         */
        std::string describe_command(const std::vector<std::string>& args) {
            std::ostringstream cmd;
            cmd << "git";
            for (const auto& arg : args) {
                cmd << ' ';
                if (arg.find(' ') != std::string::npos) {
                    cmd << '"' << arg << '"';
                } else {
                    cmd << arg;
                }
            }
            return cmd.str();
        }

        Result<CommandResult, Error> run_checked(
            const std::vector<std::string>& args,
            const fs::path& working_dir,
            const Duration timeout
        ) {
            auto result = execute_git(args, working_dir, timeout);
            if (result.is_err()) {
                return result;
            }
            if (result.value().exit_code != 0) {
                return Result<CommandResult, Error>::failure(Error::git_error(
                    "Git command failed: " + describe_command(args),
                    std::string(string_utils::trim(result.value().stderr_output))
                ));
            }
            return result;
        }

    }  // namespace

    // =============================================================================
    // Core Git Functions
    // =============================================================================

    Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        const Duration timeout
    ) {
        std::error_code ec;
        if (!fs::is_directory(working_dir, ec)) {
            return Result<CommandResult, Error>::failure(
                Error::not_found("Working directory not found: " + working_dir.string())
            );
        }

        std::vector<std::string> argv;
        argv.reserve(args.size() + 1);
        argv.emplace_back("git");
        argv.insert(argv.end(), args.begin(), args.end());

        auto result = execute_command_impl(argv, working_dir, timeout);

        if (result.exit_code == -2) {
            return Result<CommandResult, Error>::failure(
                Error::git_error("Git command timed out: " + describe_command(args))
            );
        }
        if (result.exit_code == -1) {
            return Result<CommandResult, Error>::failure(
                Error::git_error("Could not start git: " + describe_command(args))
            );
        }

        return Result<CommandResult, Error>::success(std::move(result));
    }

    bool is_git_repository(const fs::path& dir) {
        auto result = execute_git(
            {"rev-parse", "--is-inside-work-tree"},
            dir,
            std::chrono::seconds(5)
        );
        return result.is_ok() &&
               result.value().exit_code == 0 &&
               string_utils::trim(result.value().stdout_output) == "true";
    }

    std::vector<analyzers::CommitRecord> parse_log_output(const std::string& output) {
        std::vector<analyzers::CommitRecord> commits;

        for (const auto record : string_utils::split(output, RECORD_SEPARATOR)) {
            const auto trimmed = string_utils::trim(record);
            if (trimmed.empty()) {
                continue;
            }

            const auto fields = string_utils::split(trimmed, FIELD_SEPARATOR);
            if (fields.size() < 5) {
                continue;
            }

            analyzers::CommitRecord commit;
            commit.hash = std::string(fields[0]);
            commit.author_name = std::string(fields[1]);
            commit.author_email = std::string(fields[2]);
            commit.date = std::string(fields[3]);
            commit.message = std::string(fields[4]);
            commits.push_back(std::move(commit));
        }

        return commits;
    }

    // =============================================================================
    // GitHistoryProvider
    // =============================================================================

    GitHistoryProvider::GitHistoryProvider(const Duration command_timeout)
        : command_timeout_(command_timeout) {}

    bool GitHistoryProvider::is_repository(const fs::path& root) const {
        return is_git_repository(root);
    }

    Result<std::vector<analyzers::CommitRecord>, Error> GitHistoryProvider::file_log(
        const fs::path& root,
        const std::string& path,
        const std::size_t max_commits
    ) const {
        auto result = run_checked(
            {"log", "--max-count=" + std::to_string(max_commits), LOG_FORMAT, "--", path},
            root,
            command_timeout_
        );
        if (result.is_err()) {
            return Result<std::vector<analyzers::CommitRecord>, Error>::failure(result.error());
        }
        return Result<std::vector<analyzers::CommitRecord>, Error>::success(
            parse_log_output(result.value().stdout_output)
        );
    }

    Result<analyzers::RepositoryStats, Error> GitHistoryProvider::repository_stats(const fs::path& root) const {
        analyzers::RepositoryStats stats;

        auto count = run_checked({"rev-list", "--count", "HEAD"}, root, command_timeout_);
        if (count.is_err()) {
            return Result<analyzers::RepositoryStats, Error>::failure(count.error());
        }
        try {
            stats.total_commits = std::stoul(std::string(string_utils::trim(count.value().stdout_output)));
        } catch (const std::exception&) {
            stats.total_commits = 0;
        }

        // shortlog needs an explicit revision when stdin is not a terminal
        if (auto shortlog = run_checked({"shortlog", "-sn", "--all"}, root, command_timeout_); shortlog.is_ok()) {
            for (const auto line : string_utils::split(shortlog.value().stdout_output, '\n')) {
                if (!string_utils::trim(line).empty()) {
                    ++stats.total_contributors;
                }
            }
        }

        // Root commits only; a history can have several after unrelated merges.
        if (auto roots = run_checked({"rev-list", "--max-parents=0", "HEAD"}, root, command_timeout_); roots.is_ok()) {
            std::vector<std::string> args{"log", "--no-walk=unsorted", "--format=%aI"};
            for (const auto hash : string_utils::split(roots.value().stdout_output, '\n')) {
                if (const auto trimmed = string_utils::trim(hash); !trimmed.empty()) {
                    args.emplace_back(trimmed);
                }
            }
            if (args.size() > 3) {
                if (auto dates = run_checked(args, root, command_timeout_); dates.is_ok()) {
                    for (const auto line : string_utils::split(dates.value().stdout_output, '\n')) {
                        const auto date = std::string(string_utils::trim(line));
                        if (!date.empty() &&
                            (!stats.oldest_commit || parse_timestamp(date) < parse_timestamp(*stats.oldest_commit))) {
                            stats.oldest_commit = date;
                        }
                    }
                }
            }
        }

        if (auto newest = run_checked({"log", "-1", "--format=%aI"}, root, command_timeout_); newest.is_ok()) {
            const auto date = string_utils::trim(newest.value().stdout_output);
            if (!date.empty()) {
                stats.newest_commit = std::string(date);
            }
        }

        return Result<analyzers::RepositoryStats, Error>::success(std::move(stats));
    }

    Result<std::vector<std::string>, Error> GitHistoryProvider::changed_files(
        const fs::path& root,
        const std::string& commit
    ) const {
        // --root lists the files of an initial commit against the empty tree
        auto result = run_checked(
            {"diff-tree", "--no-commit-id", "--name-only", "-r", "--root", commit},
            root,
            command_timeout_
        );
        if (result.is_err()) {
            return Result<std::vector<std::string>, Error>::failure(result.error());
        }

        std::vector<std::string> files;
        for (const auto line : string_utils::split(result.value().stdout_output, '\n')) {
            if (const auto trimmed = string_utils::trim(line); !trimmed.empty()) {
                files.emplace_back(trimmed);
            }
        }
        return Result<std::vector<std::string>, Error>::success(std::move(files));
    }

    Result<std::size_t, Error> GitHistoryProvider::commit_count(const fs::path& root, const std::string& path) const {
        auto result = run_checked({"rev-list", "--count", "HEAD", "--", path}, root, command_timeout_);
        if (result.is_err()) {
            return Result<std::size_t, Error>::failure(result.error());
        }
        try {
            return Result<std::size_t, Error>::success(
                std::stoul(std::string(string_utils::trim(result.value().stdout_output))));
        } catch (const std::exception&) {
            return Result<std::size_t, Error>::failure(
                Error::git_error("Unexpected rev-list output", result.value().stdout_output));
        }
    }

}  // namespace rkg::git
