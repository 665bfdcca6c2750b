#pragma once
/**
 * @file guard.hpp
 * @brief Staged mutation of a HardClamp, SoftClamp or View.
 *
 * `owner.modify()` copies the owner's value into a guard and leases the owner (see
 * lease.hpp). Edits go to the guard's staged copy through `*guard` or `guard->`;
 * nothing reaches the owner until `commit()`:
 *
 * @code
 *  auto guard = clamp.modify();
 *  *guard = 15;
 *  if (guard.check() == GuardState::Changed)
 *  {
 *      auto committed = guard.commit();
 *      if (committed.is_error())
 *          guard.cancel(); // clamp still holds its old value
 *  }
 * @endcode
 *
 * ### States
 * - Open, with a derived sub-state: `Unchanged` iff staged == snapshot, else `Changed`.
 * - `Committed`: the staged value passed the owner's admission check and replaced the
 *   owner's value. Terminal.
 * - `Cancelled`: the staged value was discarded. Terminal.
 *
 * A failed commit leaves the owner untouched and the guard open, so the caller may
 * edit and retry or cancel. The admission check is the limits for HardClamp, the
 * validator for View, and none for SoftClamp.
 *
 * A guard destroyed while open is cancelled implicitly. Debug builds log a warning when
 * the discarded staged value differs from the snapshot. Any use of a guard after it
 * reached a terminal state, or after it was moved from, throws `std::logic_error`.
 */
#include <concepts>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "bounded/error.hpp"
#include "bounded/lease.hpp"

namespace checkedval::bounded
{

enum class GuardState
{
    Unchanged,
    Changed,
};

enum class GuardOutcome
{
    Open,
    Committed,
    Cancelled,
};

constexpr const char *to_string(GuardState state) noexcept
{
    return state == GuardState::Changed ? "Changed" : "Unchanged";
}

constexpr const char *to_string(GuardOutcome outcome) noexcept
{
    switch (outcome)
    {
    case GuardOutcome::Open:
        return "Open";
    case GuardOutcome::Committed:
        return "Committed";
    case GuardOutcome::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

template <typename Owner>
class Guard
{
  public:
    using owner_type = Owner;
    using value_type = typename Owner::value_type;

    static_assert(std::is_nothrow_move_assignable_v<value_type>,
                  "committing a guard must not be able to fail half-way");

    Guard(Guard &&other) noexcept(std::is_nothrow_move_constructible_v<value_type>)
        : m_owner(std::exchange(other.m_owner, nullptr)), m_snapshot(std::move(other.m_snapshot)),
          m_staged(std::move(other.m_staged)), m_outcome(other.m_outcome)
    {
    }

    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    Guard &operator=(Guard &&) = delete;

    ~Guard()
    {
        if (m_owner == nullptr || m_outcome != GuardOutcome::Open)
            return;
#ifndef NDEBUG
        if constexpr (std::equality_comparable<value_type>)
        {
            if (!(m_staged == m_snapshot))
            {
                LOGGER_WARN("Guard destroyed without commit or cancel; staged change discarded");
            }
        }
#endif
        finish(GuardOutcome::Cancelled);
    }

    // ====================================================================
    // Staged value access
    // ====================================================================

    [[nodiscard]] value_type &operator*()
    {
        ensure_open("operator*");
        return m_staged;
    }

    [[nodiscard]] const value_type &operator*() const
    {
        ensure_open("operator*");
        return m_staged;
    }

    value_type *operator->()
    {
        ensure_open("operator->");
        return &m_staged;
    }

    const value_type *operator->() const
    {
        ensure_open("operator->");
        return &m_staged;
    }

    [[nodiscard]] value_type &staged()
    {
        ensure_open("staged");
        return m_staged;
    }

    /**
     * @brief The owner's value when the guard was opened.
     */
    [[nodiscard]] const value_type &snapshot() const
    {
        ensure_open("snapshot");
        return m_snapshot;
    }

    // ====================================================================
    // State
    // ====================================================================

    [[nodiscard]] GuardState check() const
        requires std::equality_comparable<value_type>
    {
        ensure_open("check");
        return m_staged == m_snapshot ? GuardState::Unchanged : GuardState::Changed;
    }

    [[nodiscard]] bool is_changed() const
        requires std::equality_comparable<value_type>
    {
        return check() == GuardState::Changed;
    }

    /**
     * @brief Runs the commit-time admission check on the staged value without committing.
     */
    [[nodiscard]] Result<void, Error> verify() const
    {
        ensure_open("verify");
        return m_owner->admit_(m_staged);
    }

    [[nodiscard]] GuardOutcome outcome() const noexcept { return m_outcome; }

    [[nodiscard]] bool is_open() const noexcept
    {
        return m_owner != nullptr && m_outcome == GuardOutcome::Open;
    }

    // ====================================================================
    // Terminal transitions
    // ====================================================================

    /**
     * @brief Replaces the owner's value with the staged value if the owner admits it.
     *
     * On error the owner is unchanged and the guard stays open.
     */
    [[nodiscard]] Result<void, Error> commit()
    {
        ensure_open("commit");
        auto admitted = m_owner->admit_(m_staged);
        if (admitted.is_error())
        {
            LOGGER_DEBUG("guard commit rejected: {}", admitted.error());
            return admitted;
        }
        auto release = basics::make_scope_guard([this]() noexcept { finish(GuardOutcome::Committed); });
        m_owner->store_(std::move(m_staged));
        return Result<void, Error>::ok();
    }

    /**
     * @brief Discards the staged value; the owner is unchanged.
     */
    void cancel()
    {
        ensure_open("cancel");
        finish(GuardOutcome::Cancelled);
    }

  private:
    friend Owner;

    explicit Guard(Owner &owner) : m_owner(&owner), m_snapshot(owner.committed_()), m_staged(m_snapshot)
    {
        if (!owner.m_lease.try_acquire())
        {
            throw std::logic_error("Guard: the owner already has an open guard");
        }
    }

    void ensure_open(const char *operation) const
    {
        if (m_owner == nullptr)
        {
            throw std::logic_error(fmt::format("Guard::{} on a moved-from guard", operation));
        }
        if (m_outcome != GuardOutcome::Open)
        {
            throw std::logic_error(fmt::format("Guard::{} on a guard that was already {}",
                                               operation, to_string(m_outcome)));
        }
    }

    void finish(GuardOutcome outcome) noexcept
    {
        m_owner->m_lease.release();
        m_outcome = outcome;
    }

    Owner *m_owner;
    value_type m_snapshot;
    value_type m_staged;
    GuardOutcome m_outcome{GuardOutcome::Open};
};

} // namespace checkedval::bounded

/**
 * @brief Commits @p guard, returning its error from the enclosing function on failure.
 *
 * The enclosing function must return a `Result<..., checkedval::bounded::Error>`.
 */
#define CKV_COMMIT_OR_RETURN(guard)                                                                \
    do                                                                                             \
    {                                                                                              \
        auto ckv_commit_result_ = (guard).commit();                                                \
        if (ckv_commit_result_.is_error())                                                         \
            return ::checkedval::utils::fail(std::move(ckv_commit_result_).error());               \
    } while (0)
