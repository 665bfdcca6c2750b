#pragma once
/**
 * @file wide_int.hpp
 * @brief The 128-bit signed intermediate used by the checked arithmetic engine.
 *
 * Every element type is at most 64 bits wide, so the sum or difference of any two
 * values, and any value of either signedness, is exactly representable here.
 */
#include <concepts>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace checkedval::bounded
{

__extension__ typedef __int128 wide_int;

/**
 * @brief Element types accepted by Limits, HardClamp and SoftClamp.
 */
template <typename T>
concept BoundedInteger =
    std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool> && (sizeof(T) <= 8);

template <BoundedInteger T> constexpr wide_int widen(T value) noexcept
{
    return static_cast<wide_int>(value);
}

/**
 * @brief True if @p value is representable in T.
 */
template <BoundedInteger T> constexpr bool fits_in(wide_int value) noexcept
{
    return value >= widen(std::numeric_limits<T>::min()) &&
           value <= widen(std::numeric_limits<T>::max());
}

} // namespace checkedval::bounded
