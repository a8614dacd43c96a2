#ifndef RKG_CONFIG_CONFIG_HPP
#define RKG_CONFIG_CONFIG_HPP

/**
 * @file config.hpp
 * @brief TOML configuration for scans, history, search and logging.
 *
 * Every key is optional. Missing sections keep their defaults:
 *
 *   [scan]     include_history, timeout_ms, file_timeout_ms, workers,
 *              patterns, exclude
 *   [history]  max_commits_per_file, batch_size
 *   [search]   default_mode, default_limit
 *   [storage]  directory
 *   [logging]  level, file, console, pattern
 */

#include "rkg/error.hpp"
#include "rkg/graph/graph_builder.hpp"
#include "rkg/logging.hpp"
#include "rkg/result.hpp"
#include "rkg/search/search_engine.hpp"
#include "rkg/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rkg::config {

    struct ScanConfig {
        bool include_history = true;
        long long timeout_ms = 300000;
        long long file_timeout_ms = 10000;
        long long workers = 1;
        std::vector<std::string> patterns = {".ts", ".tsx", ".js", ".jsx"};
        std::vector<std::string> exclude;
    };

    struct HistoryConfig {
        long long max_commits_per_file = 50;
        long long batch_size = 10;
    };

    struct SearchConfig {
        std::string default_mode = "hybrid";
        long long default_limit = 20;
    };

    struct StorageConfig {
        std::string directory = ".rkg";
    };

    class Config {
    public:
        Config() = default;

        ScanConfig scan;
        HistoryConfig history;
        SearchConfig search;
        StorageConfig storage;
        logging::LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @return The validated config, NotFound when the file is missing,
         *         ParseError on bad TOML, ConfigError on invalid values.
         */
        static Result<Config, Error> load_from_file(const fs::path& path);

        static Result<Config, Error> load_from_string(std::string_view content);

        static Config default_config();

        Result<void, Error> save_to_file(const fs::path& path) const;

        /**
         * TOML text that load_from_string() reads back to an equal config.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Checks ranges and enumerations. Reports every problem in one
         * ConfigError.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Graph builder options for the [scan] and [history] sections.
         */
        [[nodiscard]] graph::BuildOptions build_options() const;

        /**
         * Search options for the [search] section. An unknown mode falls
         * back to hybrid; validate() rejects it first.
         */
        [[nodiscard]] search::SearchOptions search_options() const;
    };

}  // namespace rkg::config

#endif  // RKG_CONFIG_CONFIG_HPP
