//
// Created by gregorian-rayne on 02/03/26.
//

#ifndef JANITOR_RESULT_HPP
#define JANITOR_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success-or-error return type used across the analysis engine.
 *
 * Every fallible engine operation (parsing a file, loading configuration,
 * resolving the change scope, scheduling a task) returns Result<T, Error>
 * instead of throwing. Failures travel as values so they can be isolated
 * to the smallest unit: a detector, a file, or a whole run.
 *
 * Usage:
 * @code
 *     Result<SyntaxTree, Error> tree = provider.parse("src/a.ts");
 *     if (tree.is_err()) {
 *         return FileAnalysisResult::failed("src/a.ts", tree.error());
 *     }
 *     auto names = tree.map([](const SyntaxTree& t) { return t.imports.size(); });
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace janitor {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Holds either a value of type T or an error of type E, never neither.
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

        Result(SuccessTag, T value) : storage_(std::in_place_index<0>, std::move(value)) {}
        Result(FailureTag, E error) : storage_(std::in_place_index<1>, std::move(error)) {}

        [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
        [[nodiscard]] bool is_err() const noexcept { return storage_.index() == 1; }

        explicit operator bool() const noexcept { return is_ok(); }

        /**
         * Access to the success value.
         * @throws std::logic_error when the Result holds an error.
         */
        T& value() & {
            require_ok();
            return std::get<0>(storage_);
        }

        const T& value() const& {
            require_ok();
            return std::get<0>(storage_);
        }

        T&& value() && {
            require_ok();
            return std::get<0>(std::move(storage_));
        }

        /**
         * Access to the error value.
         * @throws std::logic_error when the Result holds a value.
         */
        E& error() & {
            require_err();
            return std::get<1>(storage_);
        }

        const E& error() const& {
            require_err();
            return std::get<1>(storage_);
        }

        T value_or(T fallback) const& {
            return is_ok() ? std::get<0>(storage_) : std::move(fallback);
        }

        T value_or(T fallback) && {
            return is_ok() ? std::get<0>(std::move(storage_)) : std::move(fallback);
        }

        /**
         * Transforms the value, passing an error through untouched.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(storage_)));
            }
            return Result<U, E>::failure(std::get<1>(storage_));
        }

        /**
         * Chains another fallible step onto the value.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            using Next = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(storage_));
            }
            return Next::failure(std::get<1>(storage_));
        }

        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            using Next = std::invoke_result_t<F, T&&>;
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(std::move(storage_)));
            }
            return Next::failure(std::get<1>(std::move(storage_)));
        }

    private:
        void require_ok() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on a failed result");
            }
        }

        void require_err() const {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on a successful result");
            }
        }

        std::variant<T, E> storage_;
    };

    /**
     * Result of an operation that only reports success or an error.
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
                throw std::logic_error("Result::error() called on a successful result");
            }
            return *error_;
        }

    private:
        std::optional<E> error_;
    };

}  // namespace janitor

#endif //JANITOR_RESULT_HPP
