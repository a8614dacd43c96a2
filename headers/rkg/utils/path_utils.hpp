#ifndef RKG_PATH_UTILS_HPP
#define RKG_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Lexical path helpers.
 *
 * Graph node ids and import targets are root-relative paths with forward
 * slashes, so these helpers never touch the filesystem.
 */

#include "rkg/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rkg::path_utils {

    /**
     * Resolves "." and ".." components without touching the filesystem.
     * Leading ".." that cannot be resolved are kept.
     */
    inline fs::path normalize(const fs::path& path) {
        fs::path result;

        for (const auto& component : path) {
            if (component == "." || component.empty()) {
                continue;
            }
            if (component == "..") {
                if (!result.empty() && result.filename() != "..") {
                    result = result.parent_path();
                } else {
                    result /= component;
                }
            } else {
                result /= component;
            }
        }

        return result;
    }

    inline std::string to_forward_slashes(const fs::path& path) {
        std::string result = path.generic_string();
        for (char& c : result) {
            if (c == '\\') {
                c = '/';
            }
        }
        return result;
    }

    /**
     * Makes path relative to base, or returns it unchanged when impossible.
     */
    inline fs::path make_relative(const fs::path& path, const fs::path& base) {
        std::error_code ec;
        auto result = fs::relative(path, base, ec);
        if (ec || result.empty()) {
            return path;
        }
        return result;
    }

    /**
     * Splits a slash-separated relative path into its non-empty segments.
     */
    inline std::vector<std::string> segments(const std::string_view path) {
        std::vector<std::string> parts;
        std::string current;
        for (const char c : path) {
            if (c == '/' || c == '\\') {
                if (!current.empty()) {
                    parts.push_back(std::move(current));
                    current.clear();
                }
            } else {
                current += c;
            }
        }
        if (!current.empty()) {
            parts.push_back(std::move(current));
        }
        return parts;
    }

    /**
     * Directory part of a slash-separated relative path ("" at top level).
     */
    inline std::string dirname(const std::string_view path) {
        const auto pos = path.find_last_of('/');
        return pos == std::string_view::npos ? std::string{} : std::string(path.substr(0, pos));
    }

    inline std::string basename(const std::string_view path) {
        const auto pos = path.find_last_of('/');
        return pos == std::string_view::npos ? std::string(path) : std::string(path.substr(pos + 1));
    }

}  // namespace rkg::path_utils

#endif  // RKG_PATH_UTILS_HPP
