#pragma once
/**
 * @file lease.hpp
 * @brief Outstanding-guard flag embedded in every guardable owner.
 *
 * While a Guard is open its owner is leased: a second guard is refused, and every
 * mutation of the owner outside the guard throws `std::logic_error`. Reads keep
 * returning the last committed value.
 *
 * The lease describes an owner object, not a value. Copying an owner yields a new,
 * unleased owner. Moving from a leased owner, or assigning into one, throws before any
 * member is changed because the lease is declared as the owner's first member; the
 * open guard keeps pointing at a live, intact owner.
 *
 * Not thread-safe: a lease enforces exclusivity within a single thread of control.
 */
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

namespace checkedval::bounded
{

class GuardLease
{
  public:
    GuardLease() noexcept = default;

    GuardLease(const GuardLease &) noexcept {}
    GuardLease(GuardLease &&other) { other.ensure_released("move"); }

    GuardLease &operator=(const GuardLease &)
    {
        ensure_released("assignment");
        return *this;
    }

    GuardLease &operator=(GuardLease &&other)
    {
        ensure_released("assignment");
        other.ensure_released("move");
        return *this;
    }

    ~GuardLease() = default;

    [[nodiscard]] bool held() const noexcept { return m_held; }

    /**
     * @return false if the lease was already held.
     */
    [[nodiscard]] bool try_acquire() noexcept
    {
        if (m_held)
            return false;
        m_held = true;
        return true;
    }

    void release() noexcept { m_held = false; }

    /**
     * @throws std::logic_error naming @p operation if a guard is open.
     */
    void ensure_released(std::string_view operation) const
    {
        if (m_held)
        {
            throw std::logic_error(
                fmt::format("'{}' on a value with an open guard; commit or cancel the guard first",
                            operation));
        }
    }

  private:
    bool m_held{false};
};

} // namespace checkedval::bounded
