#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Header-only delay strategies for retry loops.
 *
 * Each strategy maps a 0-based attempt number to the delay that precedes the
 * next attempt. Callers that must remain interruptible (reconnect loop, command
 * retry) use `delay_for()` with a condition-variable wait; simple callers may
 * invoke the strategy directly, which sleeps the calling thread.
 *
 * Usage Scenarios:
 * - ConnectionManager reconnect-on-drop: ExponentialBackoff (1s, 2s, 4s ... capped)
 * - CommandQueue inter-attempt delay: ConstantBackoff (100ms)
 */
#include <algorithm>
#include <chrono>
#include <concepts>
#include <thread>

namespace hublink::utils
{

// ============================================================================
// Backoff Strategies
// ============================================================================

/**
 * @brief Doubling delay: `base * 2^attempt`, never exceeding `cap`.
 *
 * Attempt 0 waits `base`. With the defaults (1s base, 10s cap) the sequence is
 * 1s, 2s, 4s, 8s, 10s, 10s ...
 *
 * @example
 * ExponentialBackoff backoff{std::chrono::seconds(1), std::chrono::seconds(10)};
 * for (int attempt = 0; attempt < 3; ++attempt) {
 *     if (try_reconnect()) break;
 *     backoff(attempt);
 * }
 */
struct ExponentialBackoff
{
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{10000};

    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt) const noexcept
    {
        if (base.count() <= 0)
            return std::chrono::milliseconds{0};
        // Shift in steps so a large attempt number cannot overflow.
        auto delay = base;
        for (int i = 0; i < attempt && delay < cap; ++i)
        {
            delay *= 2;
        }
        return std::min(delay, cap);
    }

    void operator()(int attempt) const { std::this_thread::sleep_for(delay_for(attempt)); }
};

/**
 * @brief Fixed delay between attempts regardless of the attempt number.
 */
struct ConstantBackoff
{
    std::chrono::milliseconds delay{100};

    [[nodiscard]] std::chrono::milliseconds delay_for(int /*attempt*/) const noexcept
    {
        return delay;
    }

    void operator()(int attempt) const { std::this_thread::sleep_for(delay_for(attempt)); }
};

/**
 * @brief Anything exposing `delay_for(int) -> milliseconds`.
 */
template <typename B>
concept BackoffStrategy = requires(const B &b, int attempt) {
    { b.delay_for(attempt) } -> std::convertible_to<std::chrono::milliseconds>;
};

} // namespace hublink::utils
