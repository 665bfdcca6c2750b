/**
 * @file test_panic_mode.cpp
 * @brief Tests for programs built with CKV_PANIC_ON_VIOLATION, where a rejected
 *        result aborts the process instead of throwing ViolationError.
 *
 * The build defines CKV_PANIC_ON_VIOLATION for every translation unit of this executable.
 */
#include "ckv_bounded.hpp"

#include <cstdint>

#include <gtest/gtest.h>

#if !defined(CKV_PANIC_ON_VIOLATION)
#error "test_panic_mode must be compiled with CKV_PANIC_ON_VIOLATION"
#endif

using namespace checkedval::bounded;

namespace
{
using Small = HardClamp<std::int8_t, Panicking, -10, 10>;
using Level = HardClamp<std::uint8_t, Saturating, 0, 10>;
using Gauge = SoftClamp<std::uint8_t, Panicking, 0, 10>;

auto positive()
{
    return make_validator("must be positive", [](int v) { return v > 0; });
}
} // namespace

TEST(PanicModeDeathTest, PanickingOverflowAborts)
{
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    auto nine = Small::create(9).content();
    EXPECT_DEATH(
        {
            auto sum = nine + Small::create(5).content();
            (void)sum;
        },
        "\\[PANIC\\].*bounds violation: OutOfBounds");
}

TEST(PanicModeDeathTest, DivideByZeroAborts)
{
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    EXPECT_DEATH(
        {
            auto q = Level::create(4).content() / Level::create(0).content();
            (void)q;
        },
        "bounds violation: DivideByZero");
}

TEST(PanicModeDeathTest, SoftOperatorAbortsOnPanickingBehavior)
{
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    EXPECT_DEATH(
        {
            auto g = Gauge::create(8) + Gauge::create(8);
            (void)g;
        },
        "bounds violation");
}

TEST(PanicModeDeathTest, UnwrappingInvalidViewAborts)
{
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    EXPECT_DEATH(
        {
            View view(-1, positive());
            (void)std::move(view).unwrap();
        },
        "ValidationFailed: must be positive");
}

TEST(PanicModeTest, SaturatingAndResultPathsDoNotAbort)
{
    auto level = Level::create(9).content();
    level += Level::create(9).content();
    EXPECT_EQ(level.get(), 10);

    // Result-returning entry points report, they never raise.
    EXPECT_TRUE(Small::create(42).is_error());
    EXPECT_TRUE(Small::parse("nope").is_error());
}
