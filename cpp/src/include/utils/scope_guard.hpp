#pragma once

#include <concepts>
#include <cstdio>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace hublink::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * The cleanup action runs when the current scope is exited, whether by normal
 * execution or by an exception. It is movable but not copyable, enforcing unique
 * ownership of the cleanup action.
 *
 * @code
 *  void DiscoveryCoordinator::run_round() {
 *      transport.start(...);
 *      auto stop_guard = hublink::basics::make_scope_guard([&] { stop_transport_once(); });
 *      wait_for_window();
 *  } // the listener is stopped here on every exit path
 * @endcode
 *
 * ### Exceptions
 *
 * The destructor is `noexcept`. A `std::exception` escaping the callable during
 * destruction is reported on stderr and not rethrown, since rethrowing while
 * unwinding would terminate the process. Use `invoke_and_rethrow()` when the
 * caller needs to observe a cleanup failure.
 *
 * ### Thread Safety
 *
 * Not thread-safe. A single guard must not be shared between threads.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

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

    ~ScopeGuard() noexcept { invoke(); }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /**
     * @brief Deactivates the guard, preventing the callable from being executed.
     */
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Executes the callable now if active, then dismisses the guard.
     *
     * A `std::exception` thrown by the callable is reported on stderr.
     */
    void invoke() noexcept
    {
        if (!m_active)
            return;
        m_active = false; // Must dismiss before invoke to prevent double execution.
        if constexpr (std::is_nothrow_invocable_v<Callable &>)
        {
            std::invoke(m_func);
        }
        else
        {
            try
            {
                std::invoke(m_func);
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[hublink] ScopeGuard cleanup threw: {}\n", e.what());
            }
        }
    }

    /**
     * @brief Executes the callable now if active, then dismisses the guard.
     *
     * Exceptions thrown by the callable propagate to the caller.
     */
    void invoke_and_rethrow()
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Factory for ScopeGuard. Always stores the callable by value.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace hublink::basics
