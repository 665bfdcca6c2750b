#pragma once
/**
 * @file capabilities.hpp
 * @brief The stable capability surface of bounded wrapper types.
 *
 * Generated wrapper types and generic code rely on three capabilities only:
 *  - bounds: `W::lower()` and `W::upper()`,
 *  - behavior: `W::behavior_type`,
 *  - conversion: `w.to_raw()` and `W::from_raw(raw) -> Result<W, Error>`.
 * HardClamp and SoftClamp model all three. Anything else about them may change.
 */
#include <concepts>
#include <type_traits>

#include "bounded/behavior.hpp"
#include "bounded/error.hpp"

namespace checkedval::bounded
{

template <typename W>
concept HasBounds = requires {
    typename W::value_type;
    { W::lower() } -> std::same_as<typename W::value_type>;
    { W::upper() } -> std::same_as<typename W::value_type>;
};

template <typename W>
concept HasBehavior = requires { typename W::behavior_type; } &&
                      BehaviorPolicy<typename W::behavior_type>;

template <typename W>
concept RawConvertible = requires(const W &wrapper, typename W::value_type raw) {
    { wrapper.to_raw() } -> std::same_as<typename W::value_type>;
    { W::from_raw(raw) } -> std::same_as<Result<W, Error>>;
};

template <typename W>
concept ClampedWrapper = HasBounds<W> && HasBehavior<W> && RawConvertible<W> &&
                         BoundedInteger<typename W::value_type>;

/**
 * @brief Bounds of a wrapper type as a value-level description.
 */
template <HasBounds W>
struct bounds_of
{
    using value_type = typename W::value_type;
    static constexpr value_type lower = W::lower();
    static constexpr value_type upper = W::upper();
};

template <HasBehavior W>
struct behavior_of
{
    using type = typename W::behavior_type;
};

template <HasBehavior W> using behavior_of_t = typename behavior_of<W>::type;

/**
 * @brief Converts between wrapper types through the raw value, validated by @p To.
 *
 * A value not representable in To's value type is reported as OutOfBounds against
 * To's limits. Otherwise the result is whatever `To::from_raw` decides: HardClamp
 * rejects values outside its limits, SoftClamp accepts anything.
 */
template <ClampedWrapper To, ClampedWrapper From>
[[nodiscard]] Result<To, Error> clamp_cast(const From &from)
{
    using ToValue = typename To::value_type;
    const wide_int raw = widen(from.to_raw());
    if (!fits_in<ToValue>(raw))
        return Result<To, Error>::error(Error::out_of_bounds(raw, To::lower(), To::upper()));
    return To::from_raw(static_cast<ToValue>(raw));
}

} // namespace checkedval::bounded
