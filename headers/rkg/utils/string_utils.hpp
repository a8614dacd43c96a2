#ifndef RKG_STRING_UTILS_HPP
#define RKG_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers shared by the extractor, indexer and ranker.
 */

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace rkg::string_utils {

    inline std::string_view trim(std::string_view s) noexcept {
        const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };
        while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) {
            s.remove_prefix(1);
        }
        while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) {
            s.remove_suffix(1);
        }
        return s;
    }

    /**
     * Splits on a single character. Empty fields are kept.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits on any run of characters for which is_separator returns true.
     * Empty fields are dropped.
     */
    template<typename Pred>
    std::vector<std::string> split_if(std::string_view s, Pred is_separator) {
        std::vector<std::string> result;
        std::string current;
        for (const char c : s) {
            if (is_separator(c)) {
                if (!current.empty()) {
                    result.push_back(std::move(current));
                    current.clear();
                }
            } else {
                current += c;
            }
        }
        if (!current.empty()) {
            result.push_back(std::move(current));
        }
        return result;
    }

    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        std::ostringstream oss;
        bool first = true;
        for (const auto& part : parts) {
            if (!first) {
                oss << delimiter;
            }
            oss << part;
            first = false;
        }
        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Counts lines the way an editor does: an empty string has one line and
     * a trailing newline opens one more.
     */
    inline std::size_t count_lines(const std::string_view s) noexcept {
        return static_cast<std::size_t>(std::ranges::count(s, '\n')) + 1;
    }

}  // namespace rkg::string_utils

#endif  // RKG_STRING_UTILS_HPP
