#include "rkg/config/config.hpp"
#include "rkg/utils/file_utils.hpp"
#include "rkg/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <toml++/toml.h>

#include <sstream>

namespace rkg::config {

    namespace {

        std::vector<std::string> string_array(const toml::array& array) {
            std::vector<std::string> values;
            values.reserve(array.size());
            for (auto& item : array) {
                values.emplace_back(item.value_or(""));
            }
            return values;
        }

        std::string quoted(const std::string_view text) {
            std::string out = "\"";
            for (const char c : text) {
                switch (c) {
                    case '"': out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\n': out += "\\n"; break;
                    case '\t': out += "\\t"; break;
                    default: out.push_back(c);
                }
            }
            out.push_back('"');
            return out;
        }

        std::string quoted_array(const std::vector<std::string>& values) {
            std::string out = "[";
            for (std::size_t i = 0; i < values.size(); ++i) {
                if (i > 0) out += ", ";
                out += quoted(values[i]);
            }
            out += "]";
            return out;
        }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config, Error>::failure(content.error());
        }

        auto config = load_from_string(content.value());
        if (config.is_err()) {
            return Result<Config, Error>::failure(config.error().with_context(path.string()));
        }
        return config;
    }

    Result<Config, Error> Config::load_from_string(const std::string_view content) {
        try {
            auto tbl = toml::parse(content);
            Config config;

            for (const auto* section : {"scan", "history", "search", "storage", "logging"}) {
                if (tbl[section] && !tbl[section].is_table()) {
                    return Result<Config, Error>::failure(
                        Error::config_error("[" + std::string(section) + "] must be a table"));
                }
            }

            if (auto* scan = tbl["scan"].as_table()) {
                if ((*scan)["include_history"])
                    config.scan.include_history = (*scan)["include_history"].value_or(true);
                if ((*scan)["timeout_ms"])
                    config.scan.timeout_ms = (*scan)["timeout_ms"].value_or(300000LL);
                if ((*scan)["file_timeout_ms"])
                    config.scan.file_timeout_ms = (*scan)["file_timeout_ms"].value_or(10000LL);
                if ((*scan)["workers"])
                    config.scan.workers = (*scan)["workers"].value_or(1LL);

                if (auto* patterns = (*scan)["patterns"].as_array()) {
                    config.scan.patterns = string_array(*patterns);
                }
                if (auto* exclude = (*scan)["exclude"].as_array()) {
                    config.scan.exclude = string_array(*exclude);
                }
            }

            if (auto* history = tbl["history"].as_table()) {
                if ((*history)["max_commits_per_file"])
                    config.history.max_commits_per_file = (*history)["max_commits_per_file"].value_or(50LL);
                if ((*history)["batch_size"])
                    config.history.batch_size = (*history)["batch_size"].value_or(10LL);
            }

            if (auto* search = tbl["search"].as_table()) {
                if ((*search)["default_mode"])
                    config.search.default_mode = (*search)["default_mode"].value_or("hybrid");
                if ((*search)["default_limit"])
                    config.search.default_limit = (*search)["default_limit"].value_or(20LL);
            }

            if (auto* storage = tbl["storage"].as_table()) {
                if ((*storage)["directory"])
                    config.storage.directory = (*storage)["directory"].value_or(".rkg");
            }

            if (auto* log = tbl["logging"].as_table()) {
                if ((*log)["level"])
                    config.logging.level = (*log)["level"].value_or("info");
                if ((*log)["file"])
                    config.logging.file = (*log)["file"].value_or("");
                if ((*log)["console"])
                    config.logging.console = (*log)["console"].value_or(false);
                if ((*log)["pattern"])
                    config.logging.pattern = (*log)["pattern"].value_or(config.logging.pattern);
            }

            if (auto validation = config.validate(); validation.is_err()) {
                return Result<Config, Error>::failure(validation.error());
            }

            return Result<Config, Error>::success(std::move(config));

        } catch (const toml::parse_error& err) {
            return Result<Config, Error>::failure(
                Error::parse_error("Failed to parse TOML configuration", std::string(err.description())));
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void, Error> Config::save_to_file(const fs::path& path) const {
        return file_utils::write_file(path, to_string());
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[scan]\n";
        ss << "include_history = " << (scan.include_history ? "true" : "false") << "\n";
        ss << "timeout_ms = " << scan.timeout_ms << "\n";
        ss << "file_timeout_ms = " << scan.file_timeout_ms << "\n";
        ss << "workers = " << scan.workers << "\n";
        ss << "patterns = " << quoted_array(scan.patterns) << "\n";
        ss << "exclude = " << quoted_array(scan.exclude) << "\n\n";

        ss << "[history]\n";
        ss << "max_commits_per_file = " << history.max_commits_per_file << "\n";
        ss << "batch_size = " << history.batch_size << "\n\n";

        ss << "[search]\n";
        ss << "default_mode = " << quoted(search.default_mode) << "\n";
        ss << "default_limit = " << search.default_limit << "\n\n";

        ss << "[storage]\n";
        ss << "directory = " << quoted(storage.directory) << "\n\n";

        ss << "[logging]\n";
        ss << "level = " << quoted(logging.level) << "\n";
        ss << "file = " << quoted(logging.file) << "\n";
        ss << "console = " << (logging.console ? "true" : "false") << "\n";
        ss << "pattern = " << quoted(logging.pattern) << "\n";

        return ss.str();
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (scan.timeout_ms <= 0) {
            errors.emplace_back("scan.timeout_ms must be positive");
        }
        if (scan.file_timeout_ms <= 0) {
            errors.emplace_back("scan.file_timeout_ms must be positive");
        }
        if (scan.workers < 1) {
            errors.emplace_back("scan.workers must be at least 1");
        }
        for (const auto& pattern : scan.patterns) {
            if (!string_utils::starts_with(pattern, ".")) {
                errors.push_back("scan.patterns entry must be an extension starting with '.': " + pattern);
            }
        }

        if (history.max_commits_per_file < 1) {
            errors.emplace_back("history.max_commits_per_file must be at least 1");
        }
        if (history.batch_size < 1) {
            errors.emplace_back("history.batch_size must be at least 1");
        }

        if (!search::parse_search_mode(search.default_mode)) {
            errors.push_back("search.default_mode must be keyword, semantic or hybrid: " + search.default_mode);
        }
        if (search.default_limit < 1) {
            errors.emplace_back("search.default_limit must be at least 1");
        }

        if (storage.directory.empty()) {
            errors.emplace_back("storage.directory must not be empty");
        }

        if (spdlog::level::level_enum level; !logging::parse_level(logging.level, level)) {
            errors.push_back("logging.level is not a known level: " + logging.level);
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed:\n  " + string_utils::join(errors, "\n  ")));
        }

        return Result<void, Error>::success();
    }

    graph::BuildOptions Config::build_options() const {
        graph::BuildOptions options;
        options.include_history = scan.include_history;
        options.timeout = Duration(scan.timeout_ms);
        options.file_timeout = Duration(scan.file_timeout_ms);
        options.workers = static_cast<std::size_t>(scan.workers);
        options.patterns = scan.patterns;
        options.excludes = scan.exclude;
        options.history.max_commits_per_file = static_cast<std::size_t>(history.max_commits_per_file);
        options.history.batch_size = static_cast<std::size_t>(history.batch_size);
        options.history.workers = static_cast<std::size_t>(scan.workers);
        return options;
    }

    search::SearchOptions Config::search_options() const {
        search::SearchOptions options;
        options.mode = search::parse_search_mode(search.default_mode).value_or(search::SearchMode::Hybrid);
        options.limit = static_cast<std::size_t>(search.default_limit);
        return options;
    }

}  // namespace rkg::config
