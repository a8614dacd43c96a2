#ifndef RKG_GRAPH_SCAN_CACHE_HPP
#define RKG_GRAPH_SCAN_CACHE_HPP

/**
 * @file scan_cache.hpp
 * @brief Per-session file size and line count cache.
 *
 * Scoped to one scan or one watch session. The graph builder creates its
 * own when the caller does not pass one. Safe for concurrent use.
 */

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rkg::graph {

    struct FileStats {
        std::size_t size_bytes = 0;
        std::size_t line_count = 0;

        bool operator==(const FileStats&) const = default;
    };

    class ScanCache {
    public:
        void record(const std::string& path, FileStats stats);

        [[nodiscard]] std::optional<FileStats> lookup(const std::string& path) const;

        /**
         * True when path is unknown or its recorded stats differ.
         */
        [[nodiscard]] bool has_changed(const std::string& path, const FileStats& current) const;

        /**
         * Recorded paths, sorted.
         */
        [[nodiscard]] std::vector<std::string> paths() const;

        [[nodiscard]] std::size_t total_lines() const;
        [[nodiscard]] std::size_t size() const;

        void clear();

    private:
        mutable std::mutex mutex_;
        std::map<std::string, FileStats> entries_;
    };

}  // namespace rkg::graph

#endif  // RKG_GRAPH_SCAN_CACHE_HPP
