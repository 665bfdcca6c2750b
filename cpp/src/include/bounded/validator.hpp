#pragma once
/**
 * @file validator.hpp
 * @brief Validators: pure predicates deciding whether a View's item is acceptable.
 *
 * Any type with `validate(const T&) const -> Result<void, Error>` models
 * `ValidatorFor<V, T>`. A validator must be side-effect free; a View calls it as often as
 * it likes and expects the same answer for the same item.
 *
 * Static dispatch is the default (View is templated on its validator). `AnyValidator<T>`
 * erases the concrete type when validators are chosen at run time.
 */
#include <concepts>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include "bounded/limits.hpp"

namespace checkedval::bounded
{

template <typename V, typename T>
concept ValidatorFor = requires(const V &validator, const T &item) {
    { validator.validate(item) } -> std::same_as<Result<void, Error>>;
};

/**
 * @brief Accepts integers within the compile-time range [Lower, Upper].
 */
template <BoundedInteger T, T Lower = std::numeric_limits<T>::min(),
          T Upper = std::numeric_limits<T>::max()>
struct ClampValidator
{
    using limits_type = Limits<T, Lower, Upper>;

    [[nodiscard]] Result<void, Error> validate(const T &item) const
    {
        if (limits_type::contains(item))
            return Result<void, Error>::ok();
        return Result<void, Error>::error(Error::out_of_bounds(item, Lower, Upper));
    }
};

/**
 * @brief Accepts integers within a range fixed at run time.
 *
 * Default-constructed, it accepts every value of T.
 */
template <BoundedInteger T>
class RangeValidator
{
  public:
    RangeValidator() noexcept : m_limits(RuntimeLimits<T>::full_range()) {}
    explicit RangeValidator(RuntimeLimits<T> limits) noexcept : m_limits(limits) {}

    [[nodiscard]] const RuntimeLimits<T> &limits() const noexcept { return m_limits; }

    [[nodiscard]] Result<void, Error> validate(const T &item) const
    {
        if (m_limits.contains(item))
            return Result<void, Error>::ok();
        return Result<void, Error>::error(
            Error::out_of_bounds(item, m_limits.lower(), m_limits.upper()));
    }

  private:
    RuntimeLimits<T> m_limits;
};

/**
 * @brief Adapts a boolean predicate; rejections carry a fixed reason.
 */
template <typename Pred>
class PredicateValidator
{
  public:
    PredicateValidator(std::string reason, Pred pred)
        : m_reason(std::move(reason)), m_pred(std::move(pred))
    {
    }

    [[nodiscard]] const std::string &reason() const noexcept { return m_reason; }

    template <typename T>
        requires std::predicate<const Pred &, const T &>
    [[nodiscard]] Result<void, Error> validate(const T &item) const
    {
        if (std::invoke(m_pred, item))
            return Result<void, Error>::ok();
        return Result<void, Error>::error(Error::validation_failed(m_reason));
    }

  private:
    std::string m_reason;
    Pred m_pred;
};

/**
 * @brief Builds a PredicateValidator.
 *
 * @code
 *  auto not_seven = make_validator("must not equal 7", [](int v) { return v != 7; });
 * @endcode
 */
template <typename Pred>
[[nodiscard]] PredicateValidator<std::decay_t<Pred>> make_validator(std::string reason, Pred &&pred)
{
    return PredicateValidator<std::decay_t<Pred>>(std::move(reason), std::forward<Pred>(pred));
}

/**
 * @brief Type-erased validator for items of type T.
 *
 * Default-constructed, it accepts every item.
 */
template <typename T>
class AnyValidator
{
  public:
    using function_type = std::function<Result<void, Error>(const T &)>;

    AnyValidator() : m_fn([](const T &) { return Result<void, Error>::ok(); }) {}

    template <typename V>
        requires(!std::same_as<std::remove_cvref_t<V>, AnyValidator> &&
                 ValidatorFor<std::remove_cvref_t<V>, T>)
    AnyValidator(V &&validator) // NOLINT(google-explicit-constructor)
        : m_fn([v = std::forward<V>(validator)](const T &item) { return v.validate(item); })
    {
    }

    [[nodiscard]] Result<void, Error> validate(const T &item) const { return m_fn(item); }

  private:
    function_type m_fn;
};

} // namespace checkedval::bounded
