#ifndef RKG_SEARCH_TOKENIZER_HPP
#define RKG_SEARCH_TOKENIZER_HPP

#include <string>
#include <string_view>
#include <vector>

namespace rkg::search {

    /**
     * Splits identifiers and prose into lower-case word tokens.
     *
     * camelCase and PascalCase boundaries ("parseHTMLFile" -> parse, html,
     * file) become separate words, then the text is split on anything
     * outside [a-z0-9]. Tokens of one character are dropped. Only ASCII
     * letters are case-folded.
     */
    [[nodiscard]] std::vector<std::string> tokenize(std::string_view text);

}  // namespace rkg::search

#endif  // RKG_SEARCH_TOKENIZER_HPP
