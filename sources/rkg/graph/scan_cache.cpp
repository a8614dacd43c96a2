#include "rkg/graph/scan_cache.hpp"

namespace rkg::graph {

    void ScanCache::record(const std::string& path, const FileStats stats) {
        std::lock_guard lock(mutex_);
        entries_[path] = stats;
    }

    std::optional<FileStats> ScanCache::lookup(const std::string& path) const {
        std::lock_guard lock(mutex_);
        const auto it = entries_.find(path);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool ScanCache::has_changed(const std::string& path, const FileStats& current) const {
        const auto previous = lookup(path);
        return !previous || *previous != current;
    }

    std::vector<std::string> ScanCache::paths() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& [path, stats] : entries_) {
            result.push_back(path);
        }
        return result;
    }

    std::size_t ScanCache::total_lines() const {
        std::lock_guard lock(mutex_);
        std::size_t total = 0;
        for (const auto& [path, stats] : entries_) {
            total += stats.line_count;
        }
        return total;
    }

    std::size_t ScanCache::size() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    void ScanCache::clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

}  // namespace rkg::graph
