#pragma once
/**
 * @file view.hpp
 * @brief A value paired with the Validator that decides whether it is acceptable.
 *
 * A View never rejects its item on construction or direct mutation; validity is
 * checked on demand (`is_valid`, `check`) and enforced in two places only: guard
 * commits, and the consuming `try_unwrap` / `unwrap`.
 *
 * @code
 *  auto not_seven = make_validator("must not equal 7", [](int v) { return v != 7; });
 *  View view(3, not_seven);
 *
 *  auto guard = view.modify();
 *  *guard = 7;
 *  auto committed = guard.commit(); // ValidationFailed, view.get() is still 3
 *  guard.cancel();
 *
 *  auto unwrapped = std::move(view).try_unwrap();
 *  if (unwrapped.is_error())
 *  {
 *      auto rejected = std::move(unwrapped).error(); // item and validator intact
 *      std::move(rejected).cancel();
 *  }
 * @endcode
 */
#include <concepts>
#include <type_traits>
#include <utility>

#include "bounded/guard.hpp"
#include "bounded/lease.hpp"
#include "bounded/validator.hpp"

namespace checkedval::bounded
{

template <typename T, typename V = AnyValidator<T>>
    requires ValidatorFor<V, T>
class View
{
  public:
    using value_type = T;
    using validator_type = V;
    using guard_type = Guard<View>;

    /**
     * @brief Pairs @p item with a default-constructed validator.
     */
    explicit View(T item)
        requires std::default_initializable<V>
        : m_item(std::move(item)), m_validator()
    {
    }

    View(T item, V validator) : m_item(std::move(item)), m_validator(std::move(validator)) {}

    [[nodiscard]] static View with_validator(T item, V validator)
    {
        return View(std::move(item), std::move(validator));
    }

    // ====================================================================
    // Inspection
    // ====================================================================

    [[nodiscard]] bool is_valid() const { return m_validator.validate(m_item).is_ok(); }

    [[nodiscard]] Result<void, Error> check() const { return m_validator.validate(m_item); }

    [[nodiscard]] const T &get() const noexcept { return m_item; }

    /**
     * @brief Unvalidated write access to the item.
     * @throws std::logic_error if a guard is open.
     */
    [[nodiscard]] T &get_mut()
    {
        m_lease.ensure_released("get_mut");
        return m_item;
    }

    [[nodiscard]] const V &validator() const noexcept { return m_validator; }

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

    // ====================================================================
    // Consumption
    // ====================================================================

    /**
     * @brief The item if it is currently valid; otherwise the view itself, unchanged.
     */
    [[nodiscard]] Result<T, View> try_unwrap() &&
    {
        m_lease.ensure_released("try_unwrap");
        if (is_valid())
            return Result<T, View>::ok(std::move(m_item));
        return Result<T, View>::error(std::move(*this));
    }

    /**
     * @brief The item if it is currently valid.
     *
     * Raises the validator's error otherwise (see raise_violation).
     */
    [[nodiscard]] T unwrap() &&
    {
        m_lease.ensure_released("unwrap");
        auto checked = check();
        if (checked.is_error())
            raise_violation(std::move(checked).error());
        return std::move(m_item);
    }

    /**
     * @brief Discards the item, valid or not.
     */
    void cancel() &&
    {
        m_lease.ensure_released("cancel");
        T discarded = std::move(m_item);
        (void)discarded;
    }

  private:
    friend class Guard<View>;

    const T &committed_() const noexcept { return m_item; }
    [[nodiscard]] Result<void, Error> admit_(const T &candidate) const
    {
        return m_validator.validate(candidate);
    }
    void store_(T &&item) noexcept { m_item = std::move(item); }

    GuardLease m_lease;
    T m_item;
    V m_validator;
};

} // namespace checkedval::bounded

// Formats the item; the validator is not part of the output.
template <typename T, typename V>
    requires fmt::is_formattable<T>::value
struct fmt::formatter<checkedval::bounded::View<T, V>> : fmt::formatter<T>
{
    template <typename FormatContext>
    auto format(const checkedval::bounded::View<T, V> &view, FormatContext &ctx) const
        -> decltype(ctx.out())
    {
        return fmt::formatter<T>::format(view.get(), ctx);
    }
};
