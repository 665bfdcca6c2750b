#pragma once
/**
 * @file hard_clamp.hpp
 * @brief Integer whose observable value always lies within its limits.
 *
 * `HardClamp<T, B, Lower, Upper>` can only be created from an in-range value, only
 * accepts in-range values through `set` and guard commits, and routes every
 * arithmetic result outside [Lower, Upper] through the Behavior `B`:
 *
 * @code
 *  using Level = HardClamp<uint8_t, Saturating, 0, 10>;
 *  auto level = Level::create(5).content();
 *  level += 5;  // 10
 *  level -= 15; // 0
 *  level += 20; // 10
 * @endcode
 *
 * With `Panicking`, an out-of-range result raises `ViolationError` (see error.hpp)
 * and leaves the value unchanged. Division by zero and intermediate overflow are raised
 * under either Behavior. Types with a different Behavior or different limits are
 * distinct and do not convert into each other implicitly (see `clamp_cast`).
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
class HardClamp
{
  public:
    using value_type = T;
    using behavior_type = B;
    using limits_type = Limits<T, Lower, Upper>;
    using guard_type = Guard<HardClamp>;

    /**
     * @brief Holds the limits' default value: zero if in range, else the lower bound.
     */
    HardClamp() noexcept : m_value(limits_type::default_value()) {}

    // ====================================================================
    // Construction
    // ====================================================================

    /**
     * @brief Fails with OutOfBounds iff @p value is outside the limits. Never clamps.
     *
     * @p value may be of any integer type; it is compared exactly, so a value that T
     * cannot represent is out of bounds rather than wrapped into range.
     */
    template <BoundedInteger U> [[nodiscard]] static Result<HardClamp, Error> create(U value)
    {
        if (!limits_type::contains(value))
            return Result<HardClamp, Error>::error(Error::out_of_bounds(value, Lower, Upper));
        return Result<HardClamp, Error>::ok(HardClamp(static_cast<T>(value)));
    }

    /**
     * @brief Like create(), but raises the violation instead of returning it.
     */
    template <BoundedInteger U> [[nodiscard]] static HardClamp create_or_throw(U value)
    {
        auto created = create(value);
        if (created.is_error())
            raise_violation(std::move(created).error());
        return std::move(created).content();
    }

    /**
     * @brief Clamps @p value into the limits.
     */
    template <BoundedInteger U>
    [[nodiscard]] static HardClamp create_saturated(U value)
        requires std::same_as<B, Saturating>
    {
        return HardClamp(resolve<B, limits_type>(widen(value)).content());
    }

    /**
     * @brief Uniformly samples the limits using the process-wide random source.
     */
    [[nodiscard]] static HardClamp random()
    {
        const wide_int offset = static_cast<wide_int>(random_offset(limits_type::span()));
        return HardClamp(static_cast<T>(widen(Lower) + offset));
    }

    /**
     * @brief Parses decimal text, then applies the same check as create().
     *
     * Malformed text gives ParseFailed; a well-formed value outside the limits gives
     * OutOfBounds.
     */
    [[nodiscard]] static Result<HardClamp, Error> parse(std::string_view text)
    {
        auto parsed = parse_integer<T>(text);
        if (parsed.is_error())
            return utils::fail(std::move(parsed).error());
        return create(parsed.content());
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

    [[nodiscard]] T get() const noexcept { return m_value; }

    [[nodiscard]] T to_raw() const noexcept { return m_value; }
    template <BoundedInteger U> [[nodiscard]] static Result<HardClamp, Error> from_raw(U raw)
    {
        return create(raw);
    }

    [[nodiscard]] bool is_zero() const noexcept { return m_value == T{0}; }
    [[nodiscard]] bool is_positive() const noexcept { return m_value > T{0}; }
    [[nodiscard]] bool is_negative() const noexcept { return m_value < T{0}; }

    /**
     * @brief Replaces the value if @p value is within the limits; otherwise unchanged.
     * @throws std::logic_error if a guard is open.
     */
    template <BoundedInteger U> [[nodiscard]] Result<void, Error> set(U value)
    {
        m_lease.ensure_released("set");
        if (!limits_type::contains(value))
            return Result<void, Error>::error(Error::out_of_bounds(value, Lower, Upper));
        m_value = static_cast<T>(value);
        return Result<void, Error>::ok();
    }

    // ====================================================================
    // Staged mutation
    // ====================================================================

    /**
     * @throws std::logic_error if a guard is already open.
     */
    [[nodiscard]] guard_type modify() &
    {
        m_lease.ensure_released("modify");
        return guard_type(*this);
    }

    /**
     * @brief Like modify(), but reports an open guard as LeaseHeld.
     */
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

    // ====================================================================
    // Arithmetic and comparison
    // ====================================================================

    CKV_DEFINE_CLAMP_OPERATORS(HardClamp)

  private:
    friend class Guard<HardClamp>;

    explicit HardClamp(T value) noexcept : m_value(value) {}

    // Guard protocol
    const T &committed_() const noexcept { return m_value; }
    [[nodiscard]] Result<void, Error> admit_(const T &candidate) const
    {
        if (limits_type::contains(candidate))
            return Result<void, Error>::ok();
        return Result<void, Error>::error(Error::out_of_bounds(candidate, Lower, Upper));
    }
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

    static HardClamp from_op_(Op op, wide_int lhs, wide_int rhs)
    {
        return HardClamp(resolved_or_raise_(arithmetic::apply<B, limits_type>(op, lhs, rhs)));
    }

    HardClamp negated_() const
    {
        return HardClamp(resolved_or_raise_(arithmetic::negate<B, limits_type>(m_value)));
    }

    HardClamp complemented_() const
    {
        return HardClamp(resolved_or_raise_(arithmetic::complement<B, limits_type>(m_value)));
    }

    GuardLease m_lease; // first member: see lease.hpp
    T m_value;
};

} // namespace checkedval::bounded

template <checkedval::bounded::BoundedInteger T, checkedval::bounded::BehaviorPolicy B, T Lower,
          T Upper>
struct fmt::formatter<checkedval::bounded::HardClamp<T, B, Lower, Upper>> : fmt::formatter<T>
{
    template <typename FormatContext>
    auto format(const checkedval::bounded::HardClamp<T, B, Lower, Upper> &clamp,
                FormatContext &ctx) const -> decltype(ctx.out())
    {
        return fmt::formatter<T>::format(clamp.get(), ctx);
    }
};
