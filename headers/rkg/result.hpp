#ifndef RKG_RESULT_HPP
#define RKG_RESULT_HPP

/**
 * @file result.hpp
 * @brief Value-or-error return type.
 *
 * Result<T, E> holds exactly one of a success value T or an error E.
 * Every fallible rkg operation returns one instead of throwing.
 *
 * @code
 *     Result<KnowledgeGraph, Error> loaded = load_graph(root);
 *     if (!loaded) {
 *         return Result<SearchResponse, Error>::failure(loaded.error());
 *     }
 *     const KnowledgeGraph& graph = loaded.value();
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace rkg {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    template<typename T, typename E>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        static Result success(T value) {
            return Result(success_tag, std::move(value));
        }

        static Result failure(E error) {
            return Result(failure_tag, std::move(error));
        }

        Result(SuccessTag, T value) : data_(std::in_place_index<0>, std::move(value)) {}
        Result(FailureTag, E error) : data_(std::in_place_index<1>, std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
        [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

        explicit operator bool() const noexcept { return is_ok(); }

        /**
         * Access the success value.
         * @throws std::logic_error when this holds an error.
         */
        T& value() & {
            ensure_ok();
            return std::get<0>(data_);
        }

        const T& value() const& {
            ensure_ok();
            return std::get<0>(data_);
        }

        T&& value() && {
            ensure_ok();
            return std::get<0>(std::move(data_));
        }

        /**
         * Access the error.
         * @throws std::logic_error when this holds a value.
         */
        E& error() & {
            ensure_err();
            return std::get<1>(data_);
        }

        const E& error() const& {
            ensure_err();
            return std::get<1>(data_);
        }

        T value_or(T default_value) const& {
            return is_ok() ? std::get<0>(data_) : std::move(default_value);
        }

        T value_or(T default_value) && {
            return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
        }

        /**
         * Transforms the value, passing an error through untouched.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(data_)));
            }
            return Result<U, E>::failure(std::get<1>(data_));
        }

        /**
         * Chains another fallible step onto the value.
         */
        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(std::move(data_)));
            }
            using Next = std::invoke_result_t<F, T&&>;
            return Next::failure(std::get<1>(std::move(data_)));
        }

    private:
        void ensure_ok() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
        }

        void ensure_err() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
        }

        std::variant<T, E> data_;
    };

    /**
     * Result for operations that produce nothing on success.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        static Result success() { return Result(success_tag); }

        static Result failure(E error) { return Result(failure_tag, std::move(error)); }

        explicit Result(SuccessTag) {}
        Result(FailureTag, E error) : error_(std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
        [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

        explicit operator bool() const noexcept { return is_ok(); }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

    private:
        std::optional<E> error_;
    };

}  // namespace rkg

#endif  // RKG_RESULT_HPP
