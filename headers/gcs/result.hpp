//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef GCS_RESULT_HPP
#define GCS_RESULT_HPP

/**
 * @file result.hpp
 * @brief Value-or-error return type used across the statistics engine.
 *
 * Every operation that touches the repository or can be cancelled returns a
 * Result<T, Error>. A Result always holds exactly one of the two.
 *
 * Usage:
 * @code
 *     Result<CommitId, Error> head = repo.resolve_start("HEAD");
 *     if (head.is_err()) {
 *         log::error(head.error().to_string());
 *         return Result<Table, Error>::failure(head.error());
 *     }
 *     walk_from(head.value());
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace gcs {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Holds either a success value of type T or an error of type E.
     */
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
         * Returns the success value.
         * @throws std::logic_error if the Result holds an error.
         */
        T& value() & {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        const T& value() const& {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(data_);
        }

        T&& value() && {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
            return std::get<0>(std::move(data_));
        }

        /**
         * Returns the error.
         * @throws std::logic_error if the Result holds a value.
         */
        E& error() & {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        T value_or(T fallback) const& {
            return is_ok() ? std::get<0>(data_) : std::move(fallback);
        }

        /**
         * Transforms the success value, passing errors through unchanged.
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
         * Transforms the error, passing success values through unchanged.
         */
        template<typename F>
        Result map_error(F&& f) && {
            if (is_ok()) {
                return std::move(*this);
            }
            return Result::failure(std::forward<F>(f)(std::get<1>(std::move(data_))));
        }

    private:
        std::variant<T, E> data_;
    };

    /**
     * Result of an operation with no value on success.
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

}  // namespace gcs

#endif //GCS_RESULT_HPP
