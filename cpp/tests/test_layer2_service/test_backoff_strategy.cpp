/**
 * @file test_backoff_strategy.cpp
 * @brief Layer 2 tests for backoff_strategy.hpp.
 *
 * ExponentialBackoff drives the reconnect loop, ConstantBackoff the command
 * retry delay. Both are checked through `delay_for()`; only one test sleeps.
 */
#include "hbl_service.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <limits>

using namespace hublink::utils;
using namespace std::chrono_literals;

static_assert(BackoffStrategy<ExponentialBackoff>);
static_assert(BackoffStrategy<ConstantBackoff>);

// ============================================================================
// ExponentialBackoff
// ============================================================================

TEST(BackoffStrategyTest, Exponential_DefaultSequenceDoublesUpToCap)
{
    ExponentialBackoff backoff;
    EXPECT_EQ(backoff.delay_for(0), 1000ms);
    EXPECT_EQ(backoff.delay_for(1), 2000ms);
    EXPECT_EQ(backoff.delay_for(2), 4000ms);
    EXPECT_EQ(backoff.delay_for(3), 8000ms);
    EXPECT_EQ(backoff.delay_for(4), 10000ms);
    EXPECT_EQ(backoff.delay_for(5), 10000ms);
}

TEST(BackoffStrategyTest, Exponential_LargeAttemptDoesNotOverflow)
{
    ExponentialBackoff backoff{250ms, 3s};
    EXPECT_EQ(backoff.delay_for(1000), 3000ms);
    EXPECT_EQ(backoff.delay_for(std::numeric_limits<int>::max()), 3000ms);
}

TEST(BackoffStrategyTest, Exponential_NegativeAttemptUsesBase)
{
    ExponentialBackoff backoff{50ms, 1s};
    EXPECT_EQ(backoff.delay_for(-3), 50ms);
}

TEST(BackoffStrategyTest, Exponential_ZeroBaseMeansNoDelay)
{
    ExponentialBackoff backoff{0ms, 10s};
    for (int i = 0; i < 8; ++i)
        EXPECT_EQ(backoff.delay_for(i), 0ms) << "attempt " << i;
}

TEST(BackoffStrategyTest, Exponential_BaseAboveCapIsClamped)
{
    ExponentialBackoff backoff{5s, 2s};
    EXPECT_EQ(backoff.delay_for(0), 2000ms);
}

TEST(BackoffStrategyTest, Exponential_CallOperatorSleeps)
{
    ExponentialBackoff backoff{20ms, 40ms};
    auto start = std::chrono::steady_clock::now();
    backoff(1);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 40ms);
}

// ============================================================================
// ConstantBackoff
// ============================================================================

TEST(BackoffStrategyTest, Constant_SameDelayForEveryAttempt)
{
    ConstantBackoff backoff;
    EXPECT_EQ(backoff.delay_for(0), 100ms);
    EXPECT_EQ(backoff.delay_for(7), 100ms);

    ConstantBackoff custom{15ms};
    EXPECT_EQ(custom.delay_for(3), 15ms);
}
