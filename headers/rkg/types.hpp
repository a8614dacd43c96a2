#ifndef RKG_TYPES_HPP
#define RKG_TYPES_HPP

/**
 * @file types.hpp
 * @brief Basic vocabulary types used across rkg.
 */

#include <chrono>
#include <filesystem>
#include <string>

namespace rkg {

    namespace fs = std::filesystem;

    /**
     * Elapsed-time unit for deadlines and measured durations.
     */
    using Duration = std::chrono::milliseconds;

    /**
     * Absolute wall-clock time point.
     */
    using Timestamp = std::chrono::system_clock::time_point;

    using SteadyClock = std::chrono::steady_clock;

    /**
     * Formats a timestamp as ISO-8601 UTC, e.g. "2025-01-31T12:00:00Z".
     */
    [[nodiscard]] std::string format_timestamp(Timestamp ts);

    /**
     * Parses an ISO-8601 timestamp ("YYYY-MM-DDTHH:MM:SS" with optional
     * fraction and a Z or +HH:MM offset). Returns the epoch on failure.
     */
    [[nodiscard]] Timestamp parse_timestamp(const std::string& text);

}  // namespace rkg

#endif  // RKG_TYPES_HPP
