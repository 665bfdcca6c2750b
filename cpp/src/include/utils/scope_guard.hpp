#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace checkedval::basics
{

/**
 * @class ScopeGuard
 * @brief Runs a callable when the enclosing scope exits, normally or by exception.
 *
 * The bounded runtime uses it to release an owner's guard lease on every exit path
 * of a commit or cancel, so a throwing assignment can never leave the lease dangling.
 *
 * @code
 *  owner.m_lease.acquire();
 *  auto release = checkedval::basics::make_scope_guard([&]() noexcept { owner.m_lease.release(); });
 *  owner.m_value = std::move(staged); // lease is released even if this throws
 * @endcode
 *
 * Movable, not copyable; a moved-from guard is inert. The destructor is `noexcept`
 * and swallows anything the callable throws, so cleanup actions should not throw.
 * Not thread-safe.
 *
 * @tparam Callable Decayed callable type, invocable as an lvalue with no arguments.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_move_constructible_v<Callable> || std::is_copy_constructible_v<Callable>,
                  "ScopeGuard's callable must be move- or copy-constructible.");

    /**
     * @brief Checks if the guard is still armed.
     */
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            try
            {
                std::invoke(m_func);
            }
            catch (...)
            {
                // Destructors must not throw; cleanup failures are dropped here.
            }
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /**
     * @brief Disarms the guard; the callable will not run.
     */
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Runs the callable now (at most once) and disarms the guard.
     *
     * Unlike the destructor, exceptions from the callable propagate.
     */
    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false; // Must dismiss before invoke to prevent double execution.
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard holding a decayed copy of @p f.
 *
 * References captured by @p f must outlive the returned guard.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace checkedval::basics
