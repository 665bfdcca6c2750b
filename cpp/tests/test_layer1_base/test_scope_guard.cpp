/**
 * @file test_scope_guard.cpp
 * @brief Layer 1 tests for checkedval::basics::ScopeGuard.
 */
#include "ckv_base.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

using checkedval::basics::make_scope_guard;

TEST(ScopeGuardTest, RunsOnScopeExit)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&]() noexcept { ++calls; });
        EXPECT_TRUE(static_cast<bool>(guard));
        EXPECT_EQ(calls, 0);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, RunsDuringExceptionUnwinding)
{
    int calls = 0;
    try
    {
        auto guard = make_scope_guard([&]() noexcept { ++calls; });
        throw std::runtime_error("unwind");
    }
    catch (const std::runtime_error &)
    {
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, DismissPreventsExecution)
{
    int calls = 0;
    {
        auto guard = make_scope_guard([&]() noexcept { ++calls; });
        guard.dismiss();
        EXPECT_FALSE(static_cast<bool>(guard));
    }
    EXPECT_EQ(calls, 0);
}

TEST(ScopeGuardTest, MovedFromGuardIsInert)
{
    int calls = 0;
    {
        auto first = make_scope_guard([&]() noexcept { ++calls; });
        auto second = std::move(first);
        EXPECT_FALSE(static_cast<bool>(first));
        EXPECT_TRUE(static_cast<bool>(second));
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, InvokeAndRethrowRunsOnceAndPropagates)
{
    int calls = 0;
    auto guard = make_scope_guard([&]() {
        ++calls;
        throw std::runtime_error("cleanup failed");
    });
    EXPECT_THROW(guard.invoke_and_rethrow(), std::runtime_error);
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(static_cast<bool>(guard));
    EXPECT_NO_THROW(guard.invoke_and_rethrow());
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTest, DestructorSwallowsCallableException)
{
    int calls = 0;
    EXPECT_NO_THROW({
        auto guard = make_scope_guard([&]() {
            ++calls;
            throw std::runtime_error("ignored");
        });
    });
    EXPECT_EQ(calls, 1);
}
