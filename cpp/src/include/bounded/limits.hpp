#pragma once
/**
 * @file limits.hpp
 * @brief Inclusive [lower, upper] range descriptors.
 *
 * `Limits` fixes the range at the type level; a reversed range fails to compile.
 * `RuntimeLimits` is the configured counterpart, validated once by `create`.
 */
#include <cstdint>
#include <limits>

#include "bounded/error.hpp"
#include "bounded/wide_int.hpp"

namespace checkedval::bounded
{

template <BoundedInteger T, T Lower = std::numeric_limits<T>::min(),
          T Upper = std::numeric_limits<T>::max()>
struct Limits
{
    static_assert(Lower <= Upper, "Limits: lower bound must not exceed upper bound");

    using value_type = T;

    static constexpr T lower() noexcept { return Lower; }
    static constexpr T upper() noexcept { return Upper; }

    static constexpr bool contains_wide(wide_int value) noexcept
    {
        return widen(Lower) <= value && value <= widen(Upper);
    }

    // Compares exactly; a U value is never narrowed to T first.
    template <BoundedInteger U> static constexpr bool contains(U value) noexcept
    {
        return contains_wide(widen(value));
    }

    /**
     * @brief Zero when the range contains it, otherwise the lower bound.
     */
    static constexpr T default_value() noexcept { return contains(T{0}) ? T{0} : Lower; }

    /**
     * @brief Number of representable values minus one; at most 2^64 - 1.
     */
    static constexpr std::uint64_t span() noexcept
    {
        return static_cast<std::uint64_t>(widen(Upper) - widen(Lower));
    }

    template <BoundedInteger U> [[nodiscard]] static Result<T, Error> validate(U value)
    {
        if (contains(value))
            return Result<T, Error>::ok(static_cast<T>(value));
        return Result<T, Error>::error(Error::out_of_bounds(value, Lower, Upper));
    }
};

/**
 * @brief A [lower, upper] range fixed at run time (configuration, JSON).
 *
 * The only way to obtain one is `create` (or `full_range`), so every instance
 * satisfies lower <= upper.
 */
template <BoundedInteger T>
class RuntimeLimits
{
  public:
    using value_type = T;

    [[nodiscard]] static Result<RuntimeLimits, Error> create(T lower, T upper)
    {
        if (lower > upper)
            return Result<RuntimeLimits, Error>::error(Error::configuration_invalid(lower, upper));
        return Result<RuntimeLimits, Error>::ok(RuntimeLimits(lower, upper));
    }

    static constexpr RuntimeLimits full_range() noexcept
    {
        return RuntimeLimits(std::numeric_limits<T>::min(), std::numeric_limits<T>::max());
    }

    constexpr T lower() const noexcept { return m_lower; }
    constexpr T upper() const noexcept { return m_upper; }

    template <BoundedInteger U> constexpr bool contains(U value) const noexcept
    {
        return widen(m_lower) <= widen(value) && widen(value) <= widen(m_upper);
    }

    constexpr T default_value() const noexcept { return contains(T{0}) ? T{0} : m_lower; }

    template <BoundedInteger U> [[nodiscard]] Result<T, Error> validate(U value) const
    {
        if (contains(value))
            return Result<T, Error>::ok(static_cast<T>(value));
        return Result<T, Error>::error(Error::out_of_bounds(value, m_lower, m_upper));
    }

    bool operator==(const RuntimeLimits &) const = default;

  private:
    constexpr RuntimeLimits(T lower, T upper) noexcept : m_lower(lower), m_upper(upper) {}

    T m_lower;
    T m_upper;
};

} // namespace checkedval::bounded
