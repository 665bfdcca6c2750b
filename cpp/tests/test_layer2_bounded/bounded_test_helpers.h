// tests/test_layer2_bounded/bounded_test_helpers.h
#pragma once
/**
 * @file bounded_test_helpers.h
 * @brief Matchers shared by the bounded runtime tests.
 */
#include "ckv_bounded.hpp"

#include <gmock/gmock.h>

namespace checkedval::tests::helper
{

/**
 * @brief Matches a callable that throws ViolationError of the given kind.
 *
 * @code
 *  EXPECT_THAT([&] { clamp /= 0; }, ThrowsViolation(ErrorKind::DivideByZero));
 * @endcode
 */
inline auto ThrowsViolation(bounded::ErrorKind kind)
{
    return ::testing::Throws<bounded::ViolationError>(
        ::testing::Property(&bounded::ViolationError::kind, kind));
}

/**
 * @brief Matches an error Result of the given kind.
 */
MATCHER_P(IsErrorOfKind, kind, "")
{
    if (arg.is_ok())
    {
        *result_listener << "which is ok";
        return false;
    }
    *result_listener << "which is " << arg.error().describe();
    return arg.error().kind == kind;
}

MATCHER(IsOk, "")
{
    if (arg.is_error())
    {
        *result_listener << "which failed with " << arg.error().describe();
        return false;
    }
    return true;
}

} // namespace checkedval::tests::helper
