#pragma once
/**
 * @file clamp_operators.hpp
 * @brief Operator set shared by HardClamp and SoftClamp.
 *
 * Expanded inside the class body. The class provides
 *  - `void apply_in_place_(Op, wide_int)`,
 *  - `static Self from_op_(Op, wide_int, wide_int)`,
 *  - `Self negated_() const` and `Self complemented_() const`,
 *  - a `value_type m_value` member.
 * All binary forms (clamp op clamp, clamp op raw, raw op clamp) produce a new clamp.
 * A raw operand may be of any integer type and reaches the engine widened, never
 * narrowed to value_type; raw comparisons are exact in the same way.
 */
#include <compare>

#include "bounded/arithmetic.hpp"

namespace checkedval::bounded::detail
{
constexpr std::strong_ordering compare_wide(wide_int lhs, wide_int rhs) noexcept
{
    if (lhs < rhs)
        return std::strong_ordering::less;
    if (lhs > rhs)
        return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}
} // namespace checkedval::bounded::detail

#define CKV_CLAMP_BINARY_OP_(Self, sym, compound, op)                                              \
    template <::checkedval::bounded::BoundedInteger U> Self &operator compound(U rhs)              \
    {                                                                                              \
        apply_in_place_(op, ::checkedval::bounded::widen(rhs));                                    \
        return *this;                                                                              \
    }                                                                                              \
    Self &operator compound(const Self &rhs)                                                       \
    {                                                                                              \
        apply_in_place_(op, rhs.m_value);                                                          \
        return *this;                                                                              \
    }                                                                                              \
    friend Self operator sym(const Self &lhs, const Self &rhs)                                     \
    {                                                                                              \
        return Self::from_op_(op, lhs.m_value, rhs.m_value);                                       \
    }                                                                                              \
    template <::checkedval::bounded::BoundedInteger U>                                             \
    friend Self operator sym(const Self &lhs, U rhs)                                               \
    {                                                                                              \
        return Self::from_op_(op, lhs.m_value, ::checkedval::bounded::widen(rhs));                 \
    }                                                                                              \
    template <::checkedval::bounded::BoundedInteger U>                                             \
    friend Self operator sym(U lhs, const Self &rhs)                                               \
    {                                                                                              \
        return Self::from_op_(op, ::checkedval::bounded::widen(lhs), rhs.m_value);                 \
    }

#define CKV_DEFINE_CLAMP_OPERATORS(Self)                                                           \
    CKV_CLAMP_BINARY_OP_(Self, +, +=, ::checkedval::bounded::Op::Add)                              \
    CKV_CLAMP_BINARY_OP_(Self, -, -=, ::checkedval::bounded::Op::Sub)                              \
    CKV_CLAMP_BINARY_OP_(Self, *, *=, ::checkedval::bounded::Op::Mul)                              \
    CKV_CLAMP_BINARY_OP_(Self, /, /=, ::checkedval::bounded::Op::Div)                              \
    CKV_CLAMP_BINARY_OP_(Self, %, %=, ::checkedval::bounded::Op::Rem)                              \
    CKV_CLAMP_BINARY_OP_(Self, &, &=, ::checkedval::bounded::Op::BitAnd)                           \
    CKV_CLAMP_BINARY_OP_(Self, |, |=, ::checkedval::bounded::Op::BitOr)                            \
    CKV_CLAMP_BINARY_OP_(Self, ^, ^=, ::checkedval::bounded::Op::BitXor)                           \
    CKV_CLAMP_BINARY_OP_(Self, <<, <<=, ::checkedval::bounded::Op::Shl)                            \
    CKV_CLAMP_BINARY_OP_(Self, >>, >>=, ::checkedval::bounded::Op::Shr)                            \
    Self operator+() const { return *this; }                                                       \
    Self operator-() const { return negated_(); }                                                  \
    Self operator~() const { return complemented_(); }                                             \
    friend constexpr bool operator==(const Self &lhs, const Self &rhs) noexcept                    \
    {                                                                                              \
        return lhs.m_value == rhs.m_value;                                                         \
    }                                                                                              \
    friend constexpr auto operator<=>(const Self &lhs, const Self &rhs) noexcept                   \
    {                                                                                              \
        return lhs.m_value <=> rhs.m_value;                                                        \
    }                                                                                              \
    template <::checkedval::bounded::BoundedInteger U>                                             \
    friend constexpr bool operator==(const Self &lhs, U rhs) noexcept                              \
    {                                                                                              \
        return ::checkedval::bounded::widen(lhs.m_value) == ::checkedval::bounded::widen(rhs);     \
    }                                                                                              \
    template <::checkedval::bounded::BoundedInteger U>                                             \
    friend constexpr std::strong_ordering operator<=>(const Self &lhs, U rhs) noexcept             \
    {                                                                                              \
        return ::checkedval::bounded::detail::compare_wide(                                        \
            ::checkedval::bounded::widen(lhs.m_value), ::checkedval::bounded::widen(rhs));         \
    }
