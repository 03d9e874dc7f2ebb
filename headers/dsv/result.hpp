//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef DEPSIEVE_RESULT_HPP
#define DEPSIEVE_RESULT_HPP

/**
 * @file result.hpp
 * @brief Result<T, E>: either a value or an error, never both, never empty.
 *
 * @code
 *     Result<Manifest, Error> m = load_manifest(path);
 *     auto names = m.map([](const Manifest& mf) { return mf.dependency_names(); });
 *     if (!names) {
 *         return Result<Report, Error>::failure(names.error());
 *     }
 * @endcode
 */

#include "dsv/error.hpp"

#include <variant>
#include <optional>
#include <utility>
#include <type_traits>
#include <stdexcept>

namespace dsv {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Holds either a success value of type T or an error of type E.
     *
     * Accessing the wrong alternative throws std::logic_error; callers are
     * expected to check is_ok()/is_err() first.
     */
    template<typename T, typename E = Error>
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

        T value_or(T fallback) && {
            return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
        }

        /**
         * Transforms the success value, passing an error through untouched.
         */
        template<typename F>
        auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
            using U = std::invoke_result_t<F, const T&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(data_)));
            }
            return Result<U, E>::failure(std::get<1>(data_));
        }

        template<typename F>
        auto map(F&& f) && -> Result<std::invoke_result_t<F, T&&>, E> {
            using U = std::invoke_result_t<F, T&&>;
            if (is_ok()) {
                return Result<U, E>::success(std::forward<F>(f)(std::get<0>(std::move(data_))));
            }
            return Result<U, E>::failure(std::get<1>(std::move(data_)));
        }

        /**
         * Chains a fallible step that itself returns a Result.
         */
        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(data_));
            }
            using R = std::invoke_result_t<F, const T&>;
            return R::failure(std::get<1>(data_));
        }

        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            if (is_ok()) {
                return std::forward<F>(f)(std::get<0>(std::move(data_)));
            }
            using R = std::invoke_result_t<F, T&&>;
            return R::failure(std::get<1>(std::move(data_)));
        }

        /**
         * Recovers from an error with a function returning a Result.
         */
        template<typename F>
        auto or_else(F&& f) const& -> std::invoke_result_t<F, const E&> {
            if (is_ok()) {
                using R = std::invoke_result_t<F, const E&>;
                return R::success(std::get<0>(data_));
            }
            return std::forward<F>(f)(std::get<1>(data_));
        }

    private:
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

        template<typename F>
        auto and_then(F&& f) const& -> std::invoke_result_t<F> {
            if (is_ok()) {
                return std::forward<F>(f)();
            }
            using R = std::invoke_result_t<F>;
            return R::failure(*error_);
        }

    private:
        std::optional<E> error_;
    };

}  // namespace dsv

#endif //DEPSIEVE_RESULT_HPP
