/**
 * @file test_scope_guard.cpp
 * @brief Unit tests for hublink::basics::ScopeGuard.
 *
 * Covers execution on scope exit, dismissal, explicit invocation, move
 * semantics and exception handling.
 */
#include "hbl_base.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <stdexcept>

using hublink::basics::make_scope_guard;
using hublink::basics::ScopeGuard;

class ScopeGuardTest : public hublink::tests::PureApiTest
{
};

TEST_F(ScopeGuardTest, ExecutesOnScopeExit)
{
    bool executed = false;
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        ASSERT_FALSE(executed);
    }
    ASSERT_TRUE(executed);
}

TEST_F(ScopeGuardTest, ExecutesWithLvalueLambda)
{
    int calls = 0;
    auto cleanup = [&]() { ++calls; };
    {
        auto guard = make_scope_guard(cleanup);
    }
    cleanup();
    ASSERT_EQ(calls, 2);
}

TEST_F(ScopeGuardTest, DismissedGuardDoesNotRun)
{
    bool executed = false;
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        guard.dismiss();
        guard.dismiss();
        EXPECT_FALSE(static_cast<bool>(guard));
    }
    ASSERT_FALSE(executed);
}

TEST_F(ScopeGuardTest, InvokeRunsOnce)
{
    int count = 0;
    {
        auto guard = make_scope_guard([&]() { ++count; });
        guard.invoke();
        ASSERT_EQ(count, 1);
        guard.invoke();
    }
    ASSERT_EQ(count, 1);
}

TEST_F(ScopeGuardTest, MoveTransfersOwnership)
{
    int count = 0;
    {
        auto guard1 = make_scope_guard([&]() { ++count; });
        {
            ScopeGuard guard2(std::move(guard1));
            EXPECT_FALSE(static_cast<bool>(guard1));
            EXPECT_EQ(count, 0);
        }
        EXPECT_EQ(count, 1);
    }
    ASSERT_EQ(count, 1);
}

TEST_F(ScopeGuardTest, ExceptionInDestructorDoesNotEscape)
{
    auto make_and_destroy = []()
    { auto guard = make_scope_guard([]() { throw std::runtime_error("cleanup failed"); }); };
    EXPECT_NO_THROW(make_and_destroy());
}

TEST_F(ScopeGuardTest, InvokeAndRethrowPropagates)
{
    auto guard = make_scope_guard([]() { throw std::runtime_error("cleanup failed"); });
    EXPECT_THROW(guard.invoke_and_rethrow(), std::runtime_error);
    // Dismissed before the call: the destructor must not run it again.
    EXPECT_FALSE(static_cast<bool>(guard));
}
