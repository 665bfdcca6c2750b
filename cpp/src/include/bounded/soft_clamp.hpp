#pragma once
/**
 * @file soft_clamp.hpp
 * @brief Integer carrying limits that are checked on request rather than enforced.
 *
 * A `SoftClamp` stores whatever it is given. `is_valid()` reports whether the current
 * value lies within [Lower, Upper]; it is recomputed on every call.
 *
 * Entry points fall in two groups:
 *  - resolving: `set`, and the arithmetic operators, map an out-of-range result through
 *    the Behavior exactly like HardClamp does;
 *  - raw: `set_unchecked`, `get_mut`, `apply_raw` and guard commits store the value
 *    verbatim. Only machine-level failures (division by zero, a result that does not fit
 *    in T) are reported on this path.
 *
 * @code
 *  using Gauge = SoftClamp<uint8_t, Saturating, 0, 10>;
 *  Gauge g = Gauge::create(5);
 *  g += 5;              // 10, valid
 *  g -= 15;             // 0, valid
 *  g.set_unchecked(30); // 30, is_valid() == false
 * @endcode
 */
#include <compare>
#include <limits>
#include <string_view>

#include <fmt/format.h>

#include "bounded/arithmetic.hpp"
#include "bounded/detail/clamp_operators.hpp"
#include "bounded/guard.hpp"
#include "bounded/lease.hpp"
#include "bounded/limits.hpp"
#include "bounded/parse.hpp"
#include "bounded/random_source.hpp"

namespace checkedval::bounded
{

template <BoundedInteger T, BehaviorPolicy B = Panicking, T Lower = std::numeric_limits<T>::min(),
          T Upper = std::numeric_limits<T>::max()>
class SoftClamp
{
  public:
    using value_type = T;
    using behavior_type = B;
    using limits_type = Limits<T, Lower, Upper>;
    using guard_type = Guard<SoftClamp>;

    SoftClamp() noexcept : m_value(limits_type::default_value()) {}

    /**
     * @brief Stores @p value verbatim, even out of range.
     *
     * The only value that cannot be stored is one T cannot represent; that raises an
     * OutOfBounds violation against the range of T instead of wrapping.
     */
    template <BoundedInteger U> explicit SoftClamp(U value) : m_value(representable_or_raise_(value))
    {
    }

    template <BoundedInteger U> [[nodiscard]] static SoftClamp create(U value)
    {
        return SoftClamp(value);
    }

    [[nodiscard]] static SoftClamp random()
    {
        const wide_int offset = static_cast<wide_int>(random_offset(limits_type::span()));
        return SoftClamp(static_cast<T>(widen(Lower) + offset));
    }

    /**
     * @brief Parses decimal text. Only malformed text fails; the range is not checked.
     */
    [[nodiscard]] static Result<SoftClamp, Error> parse(std::string_view text)
    {
        auto parsed = parse_integer<T>(text);
        if (parsed.is_error())
            return utils::fail(std::move(parsed).error());
        return Result<SoftClamp, Error>::ok(SoftClamp(parsed.content()));
    }

    template <BoundedInteger U> [[nodiscard]] static Result<T, Error> validate(U value)
    {
        return limits_type::validate(value);
    }

    static constexpr T lower() noexcept { return Lower; }
    static constexpr T upper() noexcept { return Upper; }

    // ====================================================================
    // Access
    // ====================================================================

    [[nodiscard]] bool is_valid() const noexcept { return limits_type::contains(m_value); }

    /**
     * @brief The current value if it lies within the limits, else OutOfBounds.
     */
    [[nodiscard]] Result<T, Error> get() const { return limits_type::validate(m_value); }

    [[nodiscard]] T get_unchecked() const noexcept { return m_value; }

    /**
     * @brief Direct write access to the value; no resolution is applied.
     * @throws std::logic_error if a guard is open.
     */
    [[nodiscard]] T &get_mut()
    {
        m_lease.ensure_released("get_mut");
        return m_value;
    }

    [[nodiscard]] T to_raw() const noexcept { return m_value; }

    /**
     * @brief Succeeds for every value of T; the Result keeps the signature shared with
     *        HardClamp and reports a @p raw that T cannot represent.
     */
    template <BoundedInteger U> [[nodiscard]] static Result<SoftClamp, Error> from_raw(U raw)
    {
        if (!fits_in<T>(widen(raw)))
            return Result<SoftClamp, Error>::error(representation_error_(raw));
        return Result<SoftClamp, Error>::ok(SoftClamp(static_cast<T>(raw)));
    }

    [[nodiscard]] bool is_zero() const noexcept { return m_value == T{0}; }
    [[nodiscard]] bool is_positive() const noexcept { return m_value > T{0}; }
    [[nodiscard]] bool is_negative() const noexcept { return m_value < T{0}; }

    // ====================================================================
    // Mutation
    // ====================================================================

    /**
     * @brief Stores @p value, resolving it through the Behavior when out of range.
     *
     * Saturating stores the violated bound. Panicking returns OutOfBounds and leaves
     * the value unchanged.
     */
    template <BoundedInteger U> [[nodiscard]] Result<void, Error> set(U value)
    {
        m_lease.ensure_released("set");
        auto resolved = resolve<B, limits_type>(widen(value));
        if (resolved.is_error())
            return utils::fail(std::move(resolved).error());
        m_value = resolved.content();
        return Result<void, Error>::ok();
    }

    /**
     * @brief Stores @p value verbatim; raises OutOfBounds only if T cannot represent it.
     */
    template <BoundedInteger U> void set_unchecked(U value)
    {
        m_lease.ensure_released("set_unchecked");
        m_value = representable_or_raise_(value);
    }

    /**
     * @brief `value = value op rhs` with no limits applied.
     *
     * Fails with DivideByZero, or MachineOverflow when the result does not fit in T;
     * the value is unchanged on failure.
     */
    template <BoundedInteger U> [[nodiscard]] Result<void, Error> apply_raw(Op op, U rhs)
    {
        m_lease.ensure_released(to_string(op));
        auto raw = arithmetic::apply_unbounded<T>(op, widen(m_value), widen(rhs));
        if (raw.is_error())
            return utils::fail(std::move(raw).error());
        m_value = raw.content();
        return Result<void, Error>::ok();
    }

    // ====================================================================
    // Staged mutation
    // ====================================================================

    [[nodiscard]] guard_type modify() &
    {
        m_lease.ensure_released("modify");
        return guard_type(*this);
    }

    [[nodiscard]] Result<guard_type, Error> try_modify() &
    {
        if (m_lease.held())
            return Result<guard_type, Error>::error(Error::lease_held());
        return Result<guard_type, Error>::ok(guard_type(*this));
    }

    // A guard must not outlive its owner.
    guard_type modify() && = delete;
    Result<guard_type, Error> try_modify() && = delete;

    [[nodiscard]] bool has_open_guard() const noexcept { return m_lease.held(); }

    CKV_DEFINE_CLAMP_OPERATORS(SoftClamp)

  private:
    friend class Guard<SoftClamp>;

    template <BoundedInteger U> static Error representation_error_(U value)
    {
        return Error::out_of_bounds(value, std::numeric_limits<T>::min(),
                                    std::numeric_limits<T>::max());
    }

    template <BoundedInteger U> static T representable_or_raise_(U value)
    {
        if (!fits_in<T>(widen(value)))
            raise_violation(representation_error_(value));
        return static_cast<T>(value);
    }

    const T &committed_() const noexcept { return m_value; }
    // Soft commits are never rejected.
    [[nodiscard]] Result<void, Error> admit_(const T &) const { return Result<void, Error>::ok(); }
    void store_(T &&value) noexcept { m_value = value; }

    static T resolved_or_raise_(Result<T, Error> &&resolved)
    {
        if (resolved.is_error())
            raise_violation(std::move(resolved).error());
        return resolved.content();
    }

    void apply_in_place_(Op op, wide_int rhs)
    {
        m_lease.ensure_released(to_string(op));
        m_value = resolved_or_raise_(arithmetic::apply<B, limits_type>(op, m_value, rhs));
    }

    static SoftClamp from_op_(Op op, wide_int lhs, wide_int rhs)
    {
        return SoftClamp(resolved_or_raise_(arithmetic::apply<B, limits_type>(op, lhs, rhs)));
    }

    SoftClamp negated_() const
    {
        return SoftClamp(resolved_or_raise_(arithmetic::negate<B, limits_type>(m_value)));
    }

    SoftClamp complemented_() const
    {
        return SoftClamp(resolved_or_raise_(arithmetic::complement<B, limits_type>(m_value)));
    }

    GuardLease m_lease;
    T m_value;
};

} // namespace checkedval::bounded

template <checkedval::bounded::BoundedInteger T, checkedval::bounded::BehaviorPolicy B, T Lower,
          T Upper>
struct fmt::formatter<checkedval::bounded::SoftClamp<T, B, Lower, Upper>> : fmt::formatter<T>
{
    template <typename FormatContext>
    auto format(const checkedval::bounded::SoftClamp<T, B, Lower, Upper> &clamp,
                FormatContext &ctx) const -> decltype(ctx.out())
    {
        return fmt::formatter<T>::format(clamp.get_unchecked(), ctx);
    }
};
