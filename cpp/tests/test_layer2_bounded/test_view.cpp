/**
 * @file test_view.cpp
 * @brief Layer 2 tests for validators and View.
 */
#include "ckv_bounded.hpp"
#include "bounded_test_helpers.h"

#include <limits>
#include <string>
#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace checkedval::bounded;
using namespace checkedval::tests::helper;
using namespace ::testing;

namespace
{
/// Accepts zero, odd values other than 7, and anything above 10.
struct CheckedIntValidator
{
    Result<void, Error> validate(const int &item) const
    {
        if (item < 0)
            return Result<void, Error>::error(Error::validation_failed("value must be positive"));
        if (item % 2 == 0 && item != 0 && item <= 10)
            return Result<void, Error>::error(
                Error::validation_failed("value must be odd, or zero, or greater than 10"));
        if (item == 7)
            return Result<void, Error>::error(Error::validation_failed("value must not be 7"));
        return Result<void, Error>::ok();
    }
};

using CheckedInt = View<int, CheckedIntValidator>;

auto not_seven()
{
    return make_validator("must not equal 7", [](int v) { return v != 7; });
}
} // namespace

static_assert(ValidatorFor<CheckedIntValidator, int>);
static_assert(ValidatorFor<ClampValidator<int, 0, 10>, int>);
static_assert(ValidatorFor<RangeValidator<long>, long>);
static_assert(ValidatorFor<AnyValidator<std::string>, std::string>);
static_assert(!ValidatorFor<CheckedIntValidator, std::string>);

// ============================================================================
// Validators
// ============================================================================

TEST(ValidatorTest, ClampValidatorChecksCompileTimeRange)
{
    ClampValidator<int, 0, 10> v;
    EXPECT_THAT(v.validate(10), IsOk());
    EXPECT_THAT(v.validate(11), IsErrorOfKind(ErrorKind::OutOfBounds));
}

TEST(ValidatorTest, RangeValidatorChecksConfiguredRange)
{
    RangeValidator<int> v(RuntimeLimits<int>::create(-5, 5).content());
    EXPECT_THAT(v.validate(-5), IsOk());
    EXPECT_THAT(v.validate(6), IsErrorOfKind(ErrorKind::OutOfBounds));
    EXPECT_EQ(v.limits().upper(), 5);

    RangeValidator<int> everything;
    EXPECT_THAT(everything.validate(std::numeric_limits<int>::min()), IsOk());
}

TEST(ValidatorTest, PredicateValidatorCarriesReason)
{
    auto v = not_seven();
    EXPECT_THAT(v.validate(6), IsOk());
    auto rejected = v.validate(7);
    ASSERT_THAT(rejected, IsErrorOfKind(ErrorKind::ValidationFailed));
    EXPECT_EQ(rejected.error().message, "must not equal 7");
    EXPECT_EQ(v.reason(), "must not equal 7");
}

TEST(ValidatorTest, AnyValidatorErasesConcreteType)
{
    AnyValidator<int> erased = not_seven();
    EXPECT_THAT(erased.validate(7), IsErrorOfKind(ErrorKind::ValidationFailed));

    erased = AnyValidator<int>(ClampValidator<int, 0, 3>{});
    EXPECT_THAT(erased.validate(7), IsErrorOfKind(ErrorKind::OutOfBounds));

    AnyValidator<int> accept_all;
    EXPECT_THAT(accept_all.validate(-1000), IsOk());
}

// ============================================================================
// View: inspection and direct mutation
// ============================================================================

TEST(ViewTest, ValidityIsCheckedOnDemandNeverEnforced)
{
    auto item = CheckedInt::with_validator(0, CheckedIntValidator{});
    EXPECT_EQ(item.get(), 0);
    EXPECT_TRUE(item.is_valid());

    item.get_mut() = 1;
    EXPECT_EQ(item.get(), 1);
    EXPECT_THAT(item.check(), IsOk());

    item.get_mut() = -1;
    EXPECT_EQ(item.get(), -1);
    EXPECT_THAT(item.check(), IsErrorOfKind(ErrorKind::ValidationFailed));

    item.get_mut() = 12;
    EXPECT_THAT(item.check(), IsOk());

    item.get_mut() = 4;
    auto even = item.check();
    ASSERT_THAT(even, IsErrorOfKind(ErrorKind::ValidationFailed));
    EXPECT_THAT(even.error().message, HasSubstr("odd"));
}

TEST(ViewTest, ConstructionNeverRejects)
{
    CheckedInt invalid(7);
    EXPECT_FALSE(invalid.is_valid());
    EXPECT_EQ(invalid.get(), 7);

    View<int> unconstrained(-3);
    EXPECT_TRUE(unconstrained.is_valid());
}

// ============================================================================
// View: guard protocol
// ============================================================================

TEST(ViewTest, GuardCommitDelegatesToValidator)
{
    View view(3, not_seven());
    {
        auto guard = view.modify();
        *guard = 7;
        EXPECT_EQ(guard.check(), GuardState::Changed);
        auto committed = guard.commit();
        ASSERT_THAT(committed, IsErrorOfKind(ErrorKind::ValidationFailed));
        EXPECT_EQ(committed.error().message, "must not equal 7");
        guard.cancel();
    }
    EXPECT_EQ(view.get(), 3);

    {
        auto guard = view.modify();
        *guard = 8;
        EXPECT_THAT(guard.commit(), IsOk());
    }
    EXPECT_EQ(view.get(), 8);
}

TEST(ViewTest, GuardOverNonIntegralItem)
{
    auto non_empty = make_validator("must not be empty", [](const std::string &s) { return !s.empty(); });
    View<std::string, decltype(non_empty)> name(std::string("ada"), non_empty);

    auto guard = name.modify();
    guard->append(" lovelace");
    EXPECT_EQ(guard.check(), GuardState::Changed);
    guard->clear();
    EXPECT_THAT(guard.commit(), IsErrorOfKind(ErrorKind::ValidationFailed));
    *guard = "grace";
    EXPECT_THAT(guard.commit(), IsOk());
    EXPECT_EQ(name.get(), "grace");
}

TEST(ViewTest, LeaseBlocksDirectMutationAndSecondGuard)
{
    CheckedInt item(1);
    auto guard = item.modify();
    EXPECT_THROW((void)item.get_mut(), std::logic_error);
    EXPECT_THROW((void)item.modify(), std::logic_error);
    EXPECT_THAT(item.try_modify(), IsErrorOfKind(ErrorKind::LeaseHeld));
    EXPECT_THROW((void)std::move(item).try_unwrap(), std::logic_error);
    EXPECT_EQ(item.get(), 1);
    guard.cancel();
}

// ============================================================================
// View: consumption
// ============================================================================

TEST(ViewTest, TryUnwrapReturnsItemWhenValid)
{
    CheckedInt item(11);
    auto unwrapped = std::move(item).try_unwrap();
    ASSERT_TRUE(unwrapped.is_ok());
    EXPECT_EQ(unwrapped.content(), 11);
}

TEST(ViewTest, TryUnwrapReturnsViewUnchangedWhenInvalid)
{
    View<std::string, AnyValidator<std::string>> view(
        std::string("x"), make_validator("too short", [](const std::string &s) { return s.size() > 3; }));

    auto unwrapped = std::move(view).try_unwrap();
    ASSERT_TRUE(unwrapped.is_error());
    auto returned = std::move(unwrapped).error();
    EXPECT_EQ(returned.get(), "x");
    EXPECT_THAT(returned.check(), IsErrorOfKind(ErrorKind::ValidationFailed));

    {
        auto guard = returned.modify();
        *guard = "long enough";
        ASSERT_THAT(guard.commit(), IsOk());
    }
    auto repaired = std::move(returned).try_unwrap();
    ASSERT_TRUE(repaired.is_ok());
    EXPECT_EQ(repaired.content(), "long enough");
}

TEST(ViewTest, InvalidItemCanBeDiscardedWithCancel)
{
    CheckedInt item(0);
    item.get_mut() = 7;

    auto unwrapped = std::move(item).try_unwrap();
    ASSERT_TRUE(unwrapped.is_error());
    auto returned = std::move(unwrapped).error();
    EXPECT_EQ(returned.get(), 7);
    EXPECT_NO_THROW(std::move(returned).cancel());
}

TEST(ViewTest, UnwrapRaisesTheValidationError)
{
    CheckedInt valid(9);
    EXPECT_EQ(std::move(valid).unwrap(), 9);

    CheckedInt invalid(7);
    EXPECT_THAT([&] { (void)std::move(invalid).unwrap(); },
                ThrowsViolation(ErrorKind::ValidationFailed));
}

TEST(ViewTest, ValidatorAccessor)
{
    auto v = not_seven();
    View view(1, v);
    EXPECT_EQ(view.validator().reason(), "must not equal 7");
}

TEST(ViewTest, FormatsTheItemOnly)
{
    EXPECT_EQ(fmt::format("{}", CheckedInt(7)), "7");
    EXPECT_EQ(fmt::format("{:>4}", View<std::string>(std::string("ok"))), "  ok");
}
