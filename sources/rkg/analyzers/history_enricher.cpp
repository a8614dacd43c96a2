#include "rkg/analyzers/history_enricher.hpp"
#include "rkg/logging.hpp"
#include "rkg/utils/parallel.hpp"
#include "rkg/utils/string_utils.hpp"

#include <algorithm>
#include <cmath>

namespace rkg::analyzers {

    namespace {

        constexpr std::size_t RECENT_COMMIT_LIMIT = 10;
        constexpr std::size_t SHORT_HASH_LENGTH = 7;
        constexpr std::size_t MESSAGE_LIMIT = 80;

        constexpr std::size_t COUPLING_MESSAGE_LIMIT = 60;
        constexpr std::size_t COUPLING_EXAMPLES_KEPT = 5;
        constexpr std::size_t COUPLING_EXAMPLES_REPORTED = 3;

        std::string first_line(const std::string& message, const std::size_t limit = MESSAGE_LIMIT) {
            const auto line = message.substr(0, message.find('\n'));
            return line.substr(0, limit);
        }

        bool is_source_file(const std::string& path) {
            return string_utils::ends_with(path, ".ts") || string_utils::ends_with(path, ".tsx") ||
                   string_utils::ends_with(path, ".js") || string_utils::ends_with(path, ".jsx");
        }

    }  // namespace

    std::optional<FileHistory> summarize_log(const std::string& path, const std::vector<CommitRecord>& log) {
        if (log.empty()) {
            return std::nullopt;
        }

        FileHistory history;
        history.path = path;
        history.last_modified = log.front().date;
        history.commit_count = log.size();

        std::map<std::string, std::size_t> index_by_email;
        for (const auto& commit : log) {
            auto [it, inserted] = index_by_email.try_emplace(commit.author_email, history.contributors.size());
            if (inserted) {
                history.contributors.push_back({commit.author_name, commit.author_email, 1, commit.date});
                continue;
            }
            auto& contributor = history.contributors[it->second];
            ++contributor.commits;
            if (parse_timestamp(commit.date) > parse_timestamp(contributor.last_commit)) {
                contributor.last_commit = commit.date;
            }
        }

        std::ranges::stable_sort(history.contributors, [](const Contributor& a, const Contributor& b) {
            return a.commits > b.commits;
        });

        const auto recent = std::min(log.size(), RECENT_COMMIT_LIMIT);
        for (std::size_t i = 0; i < recent; ++i) {
            const auto& commit = log[i];
            history.recent_commits.push_back({
                commit.hash.substr(0, SHORT_HASH_LENGTH),
                first_line(commit.message),
                commit.author_name,
                commit.date
            });
        }

        return history;
    }

    // =========================================================================
    // HistoryEnricher
    // =========================================================================

    HistoryEnricher::HistoryEnricher(const IHistoryProvider& provider, HistoryOptions options)
        : provider_(provider)
        , options_(options) {
        if (options_.batch_size == 0) {
            options_.batch_size = 1;
        }
        if (options_.workers == 0) {
            options_.workers = 1;
        }
    }

    HistoryResult HistoryEnricher::enrich(
        const fs::path& root,
        const std::vector<std::string>& paths,
        const HistoryProgressCallback& progress
    ) const {
        HistoryResult result;

        if (!provider_.is_repository(root)) {
            logging::logger()->info("{} is not a git repository", root.string());
            return result;
        }
        result.is_repository = true;

        if (auto stats = provider_.repository_stats(root); stats.is_ok()) {
            result.repository = std::move(stats.value());
        } else {
            logging::logger()->warn("Repository statistics unavailable: {}", stats.error().to_string());
        }

        parallel::ThreadPool pool(static_cast<unsigned int>(std::min(options_.workers, options_.batch_size)));

        const auto query = [&](const std::string& path) -> std::optional<FileHistory> {
            auto log = provider_.file_log(root, path, options_.max_commits_per_file);
            if (log.is_err()) {
                return std::nullopt;
            }
            return summarize_log(path, log.value());
        };

        const std::size_t total = paths.size();
        for (std::size_t start = 0; start < total; start += options_.batch_size) {
            const auto end = std::min(start + options_.batch_size, total);
            const std::vector<std::string> batch(paths.begin() + static_cast<std::ptrdiff_t>(start),
                                                 paths.begin() + static_cast<std::ptrdiff_t>(end));

            auto histories = parallel::map(batch, query, pool);
            for (std::size_t i = 0; i < batch.size(); ++i) {
                if (histories[i]) {
                    result.histories.emplace(batch[i], std::move(*histories[i]));
                } else {
                    logging::logger()->debug("No history for {}", batch[i]);
                }
            }

            if (progress) {
                progress(end, total);
            }
        }

        logging::logger()->info("History collected for {} of {} files", result.histories.size(), total);
        return result;
    }

    // =========================================================================
    // Derived metrics
    // =========================================================================

    std::vector<std::string> identify_hot_files(
        const std::map<std::string, FileHistory>& histories,
        const std::size_t threshold
    ) {
        std::vector<const FileHistory*> hot;
        for (const auto& [path, history] : histories) {
            if (history.commit_count >= threshold) {
                hot.push_back(&history);
            }
        }

        std::ranges::stable_sort(hot, [](const FileHistory* a, const FileHistory* b) {
            return a->commit_count > b->commit_count;
        });

        std::vector<std::string> result;
        result.reserve(hot.size());
        for (const auto* history : hot) {
            result.push_back(history->path);
        }
        return result;
    }

    double churn_score(const FileHistory& history, const Timestamp now) {
        const double commit_factor = std::min(static_cast<double>(history.commit_count) / 50.0, 1.0) * 0.4;
        const double contributor_factor =
            std::min(static_cast<double>(history.contributors.size()) / 5.0, 1.0) * 0.3;

        const auto age = std::chrono::duration_cast<std::chrono::hours>(now - parse_timestamp(history.last_modified));
        const double days = static_cast<double>(age.count()) / 24.0;
        const double recency_factor = std::max(0.0, 1.0 - days / 180.0) * 0.3;

        return commit_factor + contributor_factor + recency_factor;
    }

    // =========================================================================
    // Change coupling
    // =========================================================================

    ChangeCouplingResult analyze_change_coupling(
        const IHistoryProvider& provider,
        const fs::path& root,
        const std::string& target_file,
        const CouplingOptions& options
    ) {
        ChangeCouplingResult result;
        result.target_file = target_file;

        if (!provider.is_repository(root)) {
            result.insights.emplace_back("Not a git repository");
            return result;
        }

        auto log = provider.file_log(root, target_file, options.max_commits);
        if (log.is_err()) {
            logging::logger()->warn("Change coupling for {} failed: {}", target_file, log.error().to_string());
            result.insights.push_back("Error analyzing coupling: " + log.error().message());
            return result;
        }
        const auto& commits = log.value();
        if (commits.empty()) {
            result.insights.emplace_back("No git history for this file");
            return result;
        }

        struct CoChange {
            std::size_t count = 0;
            std::vector<CouplingExample> examples;
        };

        // First-seen order, so equal strengths keep a stable ranking
        std::vector<std::string> order;
        std::map<std::string, CoChange> co_changes;

        for (const auto& commit : commits) {
            auto files = provider.changed_files(root, commit.hash);
            if (files.is_err()) {
                logging::logger()->debug("Skipping commit {}: {}", commit.hash, files.error().to_string());
                continue;
            }
            for (const auto& file : files.value()) {
                if (file == target_file || !is_source_file(file)) {
                    continue;
                }
                auto [it, inserted] = co_changes.try_emplace(file);
                if (inserted) {
                    order.push_back(file);
                }
                auto& entry = it->second;
                ++entry.count;
                if (entry.examples.size() < COUPLING_EXAMPLES_KEPT) {
                    entry.examples.push_back({
                        commit.hash.substr(0, SHORT_HASH_LENGTH),
                        first_line(commit.message, COUPLING_MESSAGE_LIMIT),
                        commit.date
                    });
                }
            }
        }

        const auto total = commits.size();
        for (const auto& file : order) {
            const auto& entry = co_changes.at(file);
            const double strength = static_cast<double>(entry.count) / static_cast<double>(total);
            if (strength < options.min_strength) {
                continue;
            }

            ChangeCoupling coupling;
            coupling.file1 = target_file;
            coupling.file2 = file;
            coupling.strength = std::round(strength * 100.0) / 100.0;
            coupling.shared_commits = entry.count;
            coupling.total_commits_file1 = total;
            auto other = provider.commit_count(root, file);
            coupling.total_commits_file2 = other.is_ok() ? other.value() : entry.count;
            coupling.has_import_relationship = options.import_edges.contains({target_file, file}) ||
                                               options.import_edges.contains({file, target_file});
            const auto examples = std::min(entry.examples.size(), COUPLING_EXAMPLES_REPORTED);
            coupling.recent_examples.assign(entry.examples.begin(),
                                            entry.examples.begin() + static_cast<std::ptrdiff_t>(examples));
            result.coupled_files.push_back(std::move(coupling));
        }

        std::ranges::stable_sort(result.coupled_files, [](const ChangeCoupling& a, const ChangeCoupling& b) {
            return a.strength > b.strength;
        });

        result.insights = coupling_insights(result.coupled_files);
        logging::logger()->debug("{} is coupled to {} files", target_file, result.coupled_files.size());
        return result;
    }

    std::vector<std::string> coupling_insights(const std::vector<ChangeCoupling>& couplings) {
        std::vector<std::string> insights;

        if (couplings.empty()) {
            insights.emplace_back("This file changes independently - no strong coupling detected.");
            return insights;
        }

        std::vector<std::string> hidden;
        for (const auto& coupling : couplings) {
            if (!coupling.has_import_relationship && coupling.strength >= 0.5) {
                hidden.push_back(coupling.file2);
            }
        }
        if (!hidden.empty()) {
            insights.push_back("Found " + std::to_string(hidden.size()) + " hidden dependency: " +
                               string_utils::join(hidden, ", ") +
                               " always changes with this file but has no import relationship.");
        }

        std::size_t strong = 0;
        for (const auto& coupling : couplings) {
            if (coupling.strength < 0.7 || strong == 2) {
                continue;
            }
            ++strong;
            const auto percent = std::llround(coupling.strength * 100.0);
            insights.push_back(
                coupling.file2 + " changes together " + std::to_string(percent) + "% of the time (" +
                std::to_string(coupling.shared_commits) + " shared commits). " +
                (coupling.has_import_relationship
                     ? "They have a direct dependency."
                     : "Consider if these should be merged or if there's a missing abstraction."));
        }

        if (couplings.size() >= 5) {
            insights.push_back("This file is part of a change cluster with " + std::to_string(couplings.size()) +
                               " files. Changes here tend to ripple. Consider refactoring to reduce coupling.");
        }

        return insights;
    }

}  // namespace rkg::analyzers
