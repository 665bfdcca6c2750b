#pragma once
/**
 * @file error.hpp
 * @brief Error record and violation reporting for the bounded runtime.
 *
 * Validating entry points return `utils::Result<T, Error>`. Operations whose only
 * channel is the value itself (operators, `create_or_throw`, `View::unwrap`) report
 * through `raise_violation`, which throws `ViolationError`, or logs and panics when the
 * program is built with `CKV_PANIC_ON_VIOLATION`. That macro must be set the same way
 * for every translation unit of a program.
 */
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "ckv_base.hpp"
#include "bounded/wide_int.hpp"

namespace checkedval::bounded
{

enum class ErrorKind
{
    OutOfBounds,          ///< Value outside [lower, upper]
    ValidationFailed,     ///< A Validator rejected the value
    ConfigurationInvalid, ///< lower > upper when limits were fixed
    DivideByZero,         ///< Division or remainder by zero
    MachineOverflow,      ///< The wide intermediate overflowed, or an invalid shift count
    ParseFailed,          ///< Malformed text or undecodable input
    LeaseHeld,            ///< A guard is already open on the owner
};

/// Which bound an OutOfBounds error violated.
enum class BoundSide
{
    None,
    Lower, ///< value too small
    Upper, ///< value too large
};

CHECKEDVAL_UTILS_EXPORT const char *to_string(ErrorKind kind) noexcept;
CHECKEDVAL_UTILS_EXPORT const char *to_string(BoundSide side) noexcept;

struct CHECKEDVAL_UTILS_EXPORT Error
{
    ErrorKind kind{ErrorKind::ValidationFailed};
    BoundSide side{BoundSide::None};
    std::string message;

    /**
     * @brief "Kind: message", suitable for logs and exception texts.
     */
    [[nodiscard]] std::string describe() const;

    bool operator==(const Error &) const = default;

    template <typename V, typename B>
    [[nodiscard]] static Error out_of_bounds(const V &value, const B &lower, const B &upper)
    {
        const wide_int wv = static_cast<wide_int>(value);
        if (wv < static_cast<wide_int>(lower))
        {
            return Error{ErrorKind::OutOfBounds, BoundSide::Lower,
                         fmt::format("value {} is below the lower bound of [{}, {}]", wv,
                                     static_cast<wide_int>(lower),
                                     static_cast<wide_int>(upper))};
        }
        return Error{ErrorKind::OutOfBounds, BoundSide::Upper,
                     fmt::format("value {} is above the upper bound of [{}, {}]", wv,
                                 static_cast<wide_int>(lower), static_cast<wide_int>(upper))};
    }

    template <typename B>
    [[nodiscard]] static Error configuration_invalid(const B &lower, const B &upper)
    {
        return Error{ErrorKind::ConfigurationInvalid, BoundSide::None,
                     fmt::format("lower bound {} exceeds upper bound {}",
                                 static_cast<wide_int>(lower), static_cast<wide_int>(upper))};
    }

    [[nodiscard]] static Error validation_failed(std::string reason);
    [[nodiscard]] static Error divide_by_zero();
    [[nodiscard]] static Error machine_overflow(std::string_view operation);
    [[nodiscard]] static Error parse_failed(std::string_view input, std::string_view detail);
    [[nodiscard]] static Error lease_held();
};

/**
 * @brief Exception carrying an Error out of operations that cannot return one.
 */
class CHECKEDVAL_UTILS_EXPORT ViolationError : public std::runtime_error
{
  public:
    explicit ViolationError(Error error);

    [[nodiscard]] const Error &error() const noexcept { return m_error; }
    [[nodiscard]] ErrorKind kind() const noexcept { return m_error.kind; }

  private:
    Error m_error;
};

/**
 * @brief Reports an unrecoverable violation for the current call.
 *
 * Throws ViolationError. With CKV_PANIC_ON_VIOLATION the error is logged at error
 * level and the process is aborted through CKV_PANIC's machinery instead.
 */
[[noreturn]] inline void raise_violation(Error error,
                                         std::source_location loc = std::source_location::current())
{
#if defined(CKV_PANIC_ON_VIOLATION)
    const auto text = error.describe();
    LOGGER_ERROR("bounds violation at {}: {}", SRCLOC_TO_STR(loc), text);
    ::checkedval::debug::panic(loc, "bounds violation: {}", text);
#else
    (void)loc;
    throw ViolationError(std::move(error));
#endif
}

using utils::Result;

} // namespace checkedval::bounded

template <> struct fmt::formatter<checkedval::bounded::Error> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const checkedval::bounded::Error &err, FormatContext &ctx) const
        -> decltype(ctx.out())
    {
        const auto text = err.describe();
        return fmt::formatter<std::string_view>::format(text, ctx);
    }
};
