/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for error handling without exceptions
 *
 * Design Philosophy:
 * - Distinguishes between success (T) and expected failures (E)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool (prevents accidental misuse)
 * - [[nodiscard]] prevents ignoring errors
 *
 * Every validating entry point of the bounded runtime (construction, `set`, guard
 * commit, parsing, decoding) reports through `Result<T, checkedval::bounded::Error>`.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace checkedval::utils
{

/**
 * @brief Carrier for an error on its way into a Result whose value type is not spelled out.
 *
 * Any `Result<T, E>` is implicitly constructible from a `Failure<E>`, which lets helper
 * macros propagate an error out of functions with different success types.
 */
template <typename E> struct Failure
{
    E error;
    int code{0};
};

template <typename E> [[nodiscard]] Failure<std::decay_t<E>> fail(E &&err, int code = 0)
{
    return Failure<std::decay_t<E>>{std::forward<E>(err), code};
}

/**
 * @class Result
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * @tparam T Success value type
 * @tparam E Error type (an enum or a movable error record)
 *
 * Usage:
 * @code
 * Result<int, Error> compute() {
 *     if (condition) {
 *         return Result<int, Error>::ok(42);
 *     }
 *     return Result<int, Error>::error(Error::divide_by_zero());
 * }
 *
 * auto result = compute();
 * if (result.is_ok()) {
 *     int value = result.content();
 * } else {
 *     const Error &err = result.error();
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    // ====================================================================
    // Construction - Use static factory methods for clarity
    // ====================================================================

    /**
     * @brief Create a successful Result containing a value
     */
    [[nodiscard]] static Result ok(T value)
    {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error value
     * @param code Optional detailed error code (default 0)
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        return Result(std::in_place_index<1>, ErrorData{std::move(err), code});
    }

    // Implicit on purpose: see Failure.
    Result(Failure<E> failure)
        : m_data(std::in_place_index<1>, ErrorData{std::move(failure.error), failure.code})
    {
    }

    // Movable but not copyable (to avoid accidental copies of large values)
    Result(Result &&) noexcept(std::is_nothrow_move_constructible_v<T> &&
                               std::is_nothrow_move_constructible_v<E>) = default;
    Result &operator=(Result &&) noexcept(std::is_nothrow_move_assignable_v<T> &&
                                          std::is_nothrow_move_assignable_v<E>) = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    // ====================================================================
    // State Queries
    // ====================================================================

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    // ====================================================================
    // Value Access
    // ====================================================================

    /**
     * @brief Get the success content (mutable reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(m_data);
    }

    /**
     * @brief Move the success content out of Result
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<0>(std::move(m_data));
    }

    /**
     * @brief Get the success value or a default if error
     */
    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<0>(m_data) : std::move(default_value);
    }

    // ====================================================================
    // Error Access
    // ====================================================================

    /**
     * @brief Get the error
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] const E &error() const &
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<1>(m_data).error_value;
    }

    [[nodiscard]] E error() &&
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::move(std::get<1>(m_data).error_value);
    }

    /**
     * @brief Get the detailed error code (0 if not set)
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<1>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_value;
        int error_code;
    };

    template <std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> tag, Arg &&arg) : m_data(tag, std::forward<Arg>(arg))
    {
    }

    // Index 0: success value; index 1: failure.
    std::variant<T, ErrorData> m_data;
};

/**
 * @brief Result for operations that succeed without producing a value.
 */
template <typename E>
class Result<void, E>
{
  public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_error.emplace(ErrorData{std::move(err), code});
        return result;
    }

    Result(Failure<E> failure) : m_error(ErrorData{std::move(failure.error), failure.code}) {}

    Result(Result &&) noexcept(std::is_nothrow_move_constructible_v<E>) = default;
    Result &operator=(Result &&) noexcept(std::is_nothrow_move_assignable_v<E>) = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_error() const noexcept { return m_error.has_value(); }

    [[nodiscard]] const E &error() const &
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return m_error->error_value;
    }

    [[nodiscard]] E error() &&
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::move(m_error->error_value);
    }

    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return m_error->error_code;
    }

  private:
    struct ErrorData
    {
        E error_value;
        int error_code;
    };

    Result() = default;

    std::optional<ErrorData> m_error;
};

} // namespace checkedval::utils
