#ifndef RKG_JSON_UTILS_HPP
#define RKG_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief nlohmann::json wrappers that report failures as Error.
 */

#include "rkg/error.hpp"
#include "rkg/result.hpp"
#include "rkg/types.hpp"
#include "rkg/utils/file_utils.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace rkg::json_utils {

    using json = nlohmann::json;

    inline Result<json, Error> read_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<json, Error>::failure(content.error());
        }

        try {
            return Result<json, Error>::success(json::parse(content.value()));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", path.string() + ": " + e.what())
            );
        }
    }

    /**
     * Serializes and writes a JSON document. Invalid UTF-8 in strings is
     * written as U+FFFD.
     *
     * @param indent Indentation width, or -1 for compact output.
     */
    inline Result<void, Error> write_file(const fs::path& path, const json& data, const int indent = 2) {
        std::string text;
        try {
            text = data.dump(indent, ' ', false, json::error_handler_t::replace);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }
        return file_utils::write_file(path, text);
    }

    template<typename T>
    T get_or(const json& obj, const std::string& key, const T& default_value) {
        if (const auto it = obj.find(key); it != obj.end() && !it->is_null()) {
            try {
                return it->template get<T>();
            } catch (const json::exception&) {
                return default_value;
            }
        }
        return default_value;
    }

}  // namespace rkg::json_utils

#endif  // RKG_JSON_UTILS_HPP
