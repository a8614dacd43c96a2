#ifndef RKG_ERROR_HPP
#define RKG_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error type shared by every fallible rkg operation.
 *
 * An Error carries a code, a human-readable message and an optional
 * context string (usually a file path or a node id). It is paired with
 * Result<T, Error> so error paths stay visible in signatures.
 *
 * @code
 *     auto graph = load_graph(root);
 *     if (graph.is_err()) {
 *         std::cerr << graph.error() << std::endl;
 *         // [NotFound] Graph artifact not found (context: /repo/.rkg/graph.json)
 *     }
 * @endcode
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace rkg {

    /**
     * Broad error category.
     */
    enum class ErrorCode {
        InvalidArgument,  ///< Bad argument or option value
        NotFound,         ///< Missing file, artifact or node
        ParseError,       ///< Source, JSON or TOML failed to parse
        IoError,          ///< Filesystem operation failed
        ConfigError,      ///< Configuration failed validation
        AnalysisError,    ///< Extraction or resolution failed
        Timeout,          ///< A deadline expired
        GitError,         ///< Version-control query failed
        IndexError,       ///< Embedding index missing or unusable
        InternalError     ///< Unexpected internal failure
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::Timeout:         return "Timeout";
            case ErrorCode::GitError:        return "GitError";
            case ErrorCode::IndexError:      return "IndexError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Immutable error value with code, message and optional context.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message)) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message, std::string context = {}) {
            return make(ErrorCode::InvalidArgument, std::move(message), std::move(context));
        }

        static Error not_found(std::string message, std::string context = {}) {
            return make(ErrorCode::NotFound, std::move(message), std::move(context));
        }

        static Error parse_error(std::string message, std::string context = {}) {
            return make(ErrorCode::ParseError, std::move(message), std::move(context));
        }

        static Error io_error(std::string message, std::string context = {}) {
            return make(ErrorCode::IoError, std::move(message), std::move(context));
        }

        static Error config_error(std::string message, std::string context = {}) {
            return make(ErrorCode::ConfigError, std::move(message), std::move(context));
        }

        static Error analysis_error(std::string message, std::string context = {}) {
            return make(ErrorCode::AnalysisError, std::move(message), std::move(context));
        }

        static Error timeout(std::string message, std::string context = {}) {
            return make(ErrorCode::Timeout, std::move(message), std::move(context));
        }

        static Error git_error(std::string message, std::string context = {}) {
            return make(ErrorCode::GitError, std::move(message), std::move(context));
        }

        static Error index_error(std::string message, std::string context = {}) {
            return make(ErrorCode::IndexError, std::move(message), std::move(context));
        }

        static Error internal_error(std::string message, std::string context = {}) {
            return make(ErrorCode::InternalError, std::move(message), std::move(context));
        }

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }

        [[nodiscard]] const std::string& message() const noexcept { return message_; }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept { return context_; }

        [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }

        /**
         * Returns a copy with more context appended ("a; b").
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Formats as "[Code] message" or "[Code] message (context: ...)".
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const = default;

    private:
        static Error make(ErrorCode code, std::string message, std::string context) {
            if (context.empty()) {
                return {code, std::move(message)};
            }
            return {code, std::move(message), std::move(context)};
        }

        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace rkg

#endif  // RKG_ERROR_HPP
