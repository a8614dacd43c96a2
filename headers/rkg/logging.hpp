#ifndef RKG_LOGGING_HPP
#define RKG_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Library logger setup on top of spdlog.
 *
 * All rkg components log through logger(). Until init_logging() is called
 * the logger writes to a null sink, so embedding the library is silent by
 * default.
 */

#include "rkg/error.hpp"
#include "rkg/result.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace rkg::logging {

    struct LoggingConfig {
        std::string level = "info";    ///< trace, debug, info, warn, error, off
        std::string file;              ///< Empty for no file sink
        bool console = false;
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
    };

    /**
     * Replaces the "rkg" logger with one built from config.
     * Fails with ConfigError on an unknown level or an unopenable file.
     */
    Result<void, Error> init_logging(const LoggingConfig& config);

    /**
     * Shared "rkg" logger, created with a null sink on first use.
     */
    std::shared_ptr<spdlog::logger> logger();

    /**
     * Parses a level name. Returns false for unknown names.
     */
    bool parse_level(const std::string& name, spdlog::level::level_enum& out);

}  // namespace rkg::logging

#endif  // RKG_LOGGING_HPP
