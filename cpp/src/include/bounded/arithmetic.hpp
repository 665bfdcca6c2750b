#pragma once
/**
 * @file arithmetic.hpp
 * @brief Checked arithmetic shared by HardClamp and SoftClamp operators.
 *
 * Each operation runs in two stages:
 *  1. The raw result is computed exactly in a 128-bit intermediate. Division or
 *     remainder by zero, an intermediate that itself overflows, and a shift count
 *     outside [0, bits(T)) fail here regardless of Behavior.
 *  2. The exact result is mapped into the limits through the Behavior (`resolve`).
 *
 * Nothing ever wraps at the width of T.
 */
#include <string_view>

#include "bounded/behavior.hpp"

namespace checkedval::bounded
{

enum class Op
{
    Add,
    Sub,
    Mul,
    Div,
    Rem,
    BitAnd,
    BitOr,
    BitXor,
    Shl,
    Shr,
};

constexpr std::string_view to_string(Op op) noexcept
{
    switch (op)
    {
    case Op::Add:
        return "+";
    case Op::Sub:
        return "-";
    case Op::Mul:
        return "*";
    case Op::Div:
        return "/";
    case Op::Rem:
        return "%";
    case Op::BitAnd:
        return "&";
    case Op::BitOr:
        return "|";
    case Op::BitXor:
        return "^";
    case Op::Shl:
        return "<<";
    case Op::Shr:
        return ">>";
    }
    return "?";
}

namespace arithmetic
{

/**
 * @brief Stage 1: the exact result of `lhs op rhs`.
 *
 * Operands arrive widened, so a raw operand of any integer type is seen exactly; T only
 * fixes the shift width. Bitwise results are those of the infinite two's complement
 * representation, which for operands within T equal T's own bitwise results.
 */
template <BoundedInteger T>
[[nodiscard]] Result<wide_int, Error> raw_apply(Op op, wide_int a, wide_int b)
{
    using R = Result<wide_int, Error>;
    switch (op)
    {
    case Op::Add:
        return R::ok(a + b);
    case Op::Sub:
        return R::ok(a - b);
    case Op::Mul:
    {
        wide_int product = 0;
        if (__builtin_mul_overflow(a, b, &product))
            return R::error(Error::machine_overflow(to_string(op)));
        return R::ok(product);
    }
    case Op::Div:
        if (b == 0)
            return R::error(Error::divide_by_zero());
        return R::ok(a / b);
    case Op::Rem:
        if (b == 0)
            return R::error(Error::divide_by_zero());
        return R::ok(a % b);
    case Op::BitAnd:
        return R::ok(a & b);
    case Op::BitOr:
        return R::ok(a | b);
    case Op::BitXor:
        return R::ok(a ^ b);
    case Op::Shl:
    case Op::Shr:
    {
        constexpr wide_int bits = static_cast<wide_int>(std::numeric_limits<T>::digits +
                                                        (std::numeric_limits<T>::is_signed ? 1 : 0));
        if (b < 0 || b >= bits)
            return R::error(Error::machine_overflow(to_string(op)));
        const int count = static_cast<int>(b);
        // |a| < 2^64 and count < 64, so a shifted left stays below 2^127.
        return R::ok(op == Op::Shl ? a * (static_cast<wide_int>(1) << count) : a >> count);
    }
    }
    return R::error(Error::machine_overflow(to_string(op)));
}

/**
 * @brief Stage 1 and 2: `lhs op rhs` resolved into LimitsT through B.
 */
template <BehaviorPolicy B, typename LimitsT>
[[nodiscard]] Result<typename LimitsT::value_type, Error> apply(Op op, wide_int lhs, wide_int rhs)
{
    auto raw = raw_apply<typename LimitsT::value_type>(op, lhs, rhs);
    if (raw.is_error())
        return utils::fail(std::move(raw).error());
    return resolve<B, LimitsT>(raw.content());
}

/**
 * @brief Arithmetic negation resolved into LimitsT. Never overflows the intermediate.
 */
template <BehaviorPolicy B, typename LimitsT>
[[nodiscard]] Result<typename LimitsT::value_type, Error> negate(typename LimitsT::value_type value)
{
    return resolve<B, LimitsT>(-widen(value));
}

/**
 * @brief Bitwise complement within the width of T, resolved into LimitsT.
 */
template <BehaviorPolicy B, typename LimitsT>
[[nodiscard]] Result<typename LimitsT::value_type, Error>
complement(typename LimitsT::value_type value)
{
    using T = typename LimitsT::value_type;
    return resolve<B, LimitsT>(widen(static_cast<T>(~value)));
}

/**
 * @brief `lhs op rhs` with no limits applied; the result must still fit in T.
 *
 * This is the raw path used by SoftClamp::apply_raw.
 */
template <BoundedInteger T>
[[nodiscard]] Result<T, Error> apply_unbounded(Op op, wide_int lhs, wide_int rhs)
{
    auto raw = raw_apply<T>(op, lhs, rhs);
    if (raw.is_error())
        return utils::fail(std::move(raw).error());
    if (!fits_in<T>(raw.content()))
        return Result<T, Error>::error(Error::machine_overflow(to_string(op)));
    return Result<T, Error>::ok(static_cast<T>(raw.content()));
}

} // namespace arithmetic

} // namespace checkedval::bounded
