#include "rkg/search/tokenizer.hpp"

namespace rkg::search {

    namespace {

        bool is_lower(const char c) noexcept { return c >= 'a' && c <= 'z'; }
        bool is_upper(const char c) noexcept { return c >= 'A' && c <= 'Z'; }
        bool is_digit(const char c) noexcept { return c >= '0' && c <= '9'; }

        char to_lower_ascii(const char c) noexcept {
            return is_upper(c) ? static_cast<char>(c - 'A' + 'a') : c;
        }

        /**
         * Inserts a space at lower->Upper and at Upper|Upper-lower boundaries.
         */
        std::string split_case_boundaries(const std::string_view text) {
            std::string first;
            first.reserve(text.size() + text.size() / 4);
            for (std::size_t i = 0; i < text.size(); ++i) {
                first.push_back(text[i]);
                if (i + 1 < text.size() && is_lower(text[i]) && is_upper(text[i + 1])) {
                    first.push_back(' ');
                }
            }

            std::string second;
            second.reserve(first.size() + first.size() / 4);
            for (std::size_t i = 0; i < first.size(); ++i) {
                second.push_back(first[i]);
                if (i + 2 < first.size() && is_upper(first[i]) && is_upper(first[i + 1]) && is_lower(first[i + 2])) {
                    second.push_back(' ');
                }
            }
            return second;
        }

    }  // namespace

    std::vector<std::string> tokenize(const std::string_view text) {
        const auto expanded = split_case_boundaries(text);

        std::vector<std::string> tokens;
        std::string current;

        const auto flush = [&] {
            if (current.size() > 1) {
                tokens.push_back(std::move(current));
            }
            current.clear();
        };

        for (const char raw : expanded) {
            const char c = to_lower_ascii(raw);
            if (is_lower(c) || is_digit(c)) {
                current.push_back(c);
            } else {
                flush();
            }
        }
        flush();

        return tokens;
    }

}  // namespace rkg::search
