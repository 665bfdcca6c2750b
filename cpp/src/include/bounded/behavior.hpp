#pragma once
/**
 * @file behavior.hpp
 * @brief Overflow/underflow policies.
 *
 * A Behavior is a stateless tag chosen per wrapper type. Given a raw result outside
 * the limits it either produces the replacement value or reports failure:
 *
 * | Policy       | above upper        | below lower        |
 * |--------------|--------------------|--------------------|
 * | `Panicking`  | OutOfBounds error  | OutOfBounds error  |
 * | `Saturating` | upper              | lower              |
 *
 * `Panicking` errors are raised (not returned) by the arithmetic operators.
 */
#include <concepts>
#include <string_view>

#include "bounded/limits.hpp"

namespace checkedval::bounded
{

struct Panicking
{
    static constexpr std::string_view name = "Panicking";

    template <typename LimitsT>
    [[nodiscard]] static Result<typename LimitsT::value_type, Error> resolve_overflow(wide_int raw)
    {
        return Result<typename LimitsT::value_type, Error>::error(
            Error::out_of_bounds(raw, LimitsT::lower(), LimitsT::upper()));
    }

    template <typename LimitsT>
    [[nodiscard]] static Result<typename LimitsT::value_type, Error> resolve_underflow(wide_int raw)
    {
        return Result<typename LimitsT::value_type, Error>::error(
            Error::out_of_bounds(raw, LimitsT::lower(), LimitsT::upper()));
    }
};

struct Saturating
{
    static constexpr std::string_view name = "Saturating";

    template <typename LimitsT>
    [[nodiscard]] static Result<typename LimitsT::value_type, Error> resolve_overflow(wide_int raw)
    {
        LOGGER_TRACE("saturating {} to upper bound {}", raw, LimitsT::upper());
        return Result<typename LimitsT::value_type, Error>::ok(LimitsT::upper());
    }

    template <typename LimitsT>
    [[nodiscard]] static Result<typename LimitsT::value_type, Error> resolve_underflow(wide_int raw)
    {
        LOGGER_TRACE("saturating {} to lower bound {}", raw, LimitsT::lower());
        return Result<typename LimitsT::value_type, Error>::ok(LimitsT::lower());
    }
};

template <typename B>
concept BehaviorPolicy = requires(wide_int raw) {
    { B::name } -> std::convertible_to<std::string_view>;
    { B::template resolve_overflow<Limits<int>>(raw) } -> std::same_as<Result<int, Error>>;
    { B::template resolve_underflow<Limits<int>>(raw) } -> std::same_as<Result<int, Error>>;
};

/**
 * @brief Maps a raw wide result into LimitsT, consulting B only when it falls outside.
 */
template <BehaviorPolicy B, typename LimitsT>
[[nodiscard]] Result<typename LimitsT::value_type, Error> resolve(wide_int raw)
{
    using T = typename LimitsT::value_type;
    if (LimitsT::contains_wide(raw))
        return Result<T, Error>::ok(static_cast<T>(raw));
    if (raw > widen(LimitsT::upper()))
        return B::template resolve_overflow<LimitsT>(raw);
    return B::template resolve_underflow<LimitsT>(raw);
}

} // namespace checkedval::bounded
