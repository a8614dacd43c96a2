#include "rkg/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace rkg::logging {

    namespace {

        constexpr auto LOGGER_NAME = "rkg";

        std::mutex& logger_mutex() {
            static std::mutex mutex;
            return mutex;
        }

        std::shared_ptr<spdlog::logger>& current_logger() {
            static std::shared_ptr<spdlog::logger> instance;
            return instance;
        }

    }  // namespace

    bool parse_level(const std::string& name, spdlog::level::level_enum& out) {
        if (name == "trace") { out = spdlog::level::trace; return true; }
        if (name == "debug") { out = spdlog::level::debug; return true; }
        if (name == "info")  { out = spdlog::level::info;  return true; }
        if (name == "warn")  { out = spdlog::level::warn;  return true; }
        if (name == "error") { out = spdlog::level::err;   return true; }
        if (name == "off")   { out = spdlog::level::off;   return true; }
        return false;
    }

    Result<void, Error> init_logging(const LoggingConfig& config) {
        spdlog::level::level_enum level;
        if (!parse_level(config.level, level)) {
            return Result<void, Error>::failure(
                Error::config_error("Unknown log level", config.level)
            );
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (config.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (!config.file.empty()) {
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
            } catch (const spdlog::spdlog_ex& e) {
                return Result<void, Error>::failure(
                    Error::config_error("Cannot open log file", config.file + ": " + e.what())
                );
            }
        }
        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }

        auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        created->set_level(level);
        created->set_pattern(config.pattern);
        created->flush_on(spdlog::level::warn);

        std::lock_guard lock(logger_mutex());
        current_logger() = std::move(created);
        return Result<void, Error>::success();
    }

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard lock(logger_mutex());
        auto& instance = current_logger();
        if (!instance) {
            instance = std::make_shared<spdlog::logger>(
                LOGGER_NAME, std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        return instance;
    }

}  // namespace rkg::logging
