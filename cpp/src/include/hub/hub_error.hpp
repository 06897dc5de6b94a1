#pragma once
/**
 * @file hub_error.hpp
 * @brief Error taxonomy of the hub engine.
 *
 * Every terminal failure the engine reports is a `HubError`. It carries enough
 * structure for a presentation layer to choose a retry / reconnect / clear-cache
 * affordance without parsing message text:
 *
 *  - `category()`   which subsystem failed (see ErrorCategory)
 *  - `operation()`  the engine operation that failed ("connect", "execute_command" ...)
 *  - `attempts()`   how many attempts were made before giving up (0 = not retried)
 *  - `cause()`      message of the underlying error, empty if there was none
 *  - `cause_category()` category of the underlying error when it was itself a HubError
 *
 * `recovery_action()` maps an error to the suggested affordance.
 */
#include "hublink_core_export.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace hublink::hub
{

enum class ErrorCategory
{
    Discovery,  ///< listener failed to start, network unreachable
    Connection, ///< unreachable host, handshake failure, liveness-check failure
    Command,    ///< send failure, timeout, retries exhausted
    Queue,      ///< capacity exceeded, queue shut down
    Cache,      ///< snapshot (de)serialization failure
    Storage,    ///< persistent store failure
    Validation, ///< bad input or configuration
};

enum class RecoveryAction
{
    Retry,
    Reconnect,
    ClearCache,
    Manual,
};

[[nodiscard]] HUBLINK_CORE_EXPORT const char *to_string(ErrorCategory category) noexcept;
[[nodiscard]] HUBLINK_CORE_EXPORT const char *to_string(RecoveryAction action) noexcept;

class HUBLINK_CORE_EXPORT HubError : public std::runtime_error
{
  public:
    HubError(ErrorCategory category, std::string operation, const std::string &message,
             std::string cause = {}, int attempts = 0);

    [[nodiscard]] ErrorCategory category() const noexcept { return m_category; }
    [[nodiscard]] const std::string &operation() const noexcept { return m_operation; }
    [[nodiscard]] const std::string &cause() const noexcept { return m_cause; }
    [[nodiscard]] int attempts() const noexcept { return m_attempts; }
    [[nodiscard]] std::optional<ErrorCategory> cause_category() const noexcept
    {
        return m_cause_category;
    }

    /// Discovery, Connection, Command and Queue failures are transient.
    [[nodiscard]] bool retryable() const noexcept;

    /// Records the category of the HubError this one wraps.
    HubError &caused_by(ErrorCategory inner) noexcept
    {
        m_cause_category = inner;
        return *this;
    }

    /**
     * @brief Multi-line description for logs:
     * @code
     *   Connection error in 'connect': hub 'Living Room' unreachable
     *     attempts: 3
     *     cause: Connection refused
     * @endcode
     */
    [[nodiscard]] std::string describe() const;

  private:
    ErrorCategory m_category;
    std::string m_operation;
    std::string m_cause;
    int m_attempts{0};
    std::optional<ErrorCategory> m_cause_category;
};

/**
 * @brief Suggested affordance for a terminal error.
 *
 * Discovery -> Retry, Connection -> Reconnect, Command -> Retry (Reconnect when the
 * command failed because the connection failed), Queue -> Retry,
 * Cache / Storage -> ClearCache, Validation -> Manual.
 */
[[nodiscard]] HUBLINK_CORE_EXPORT RecoveryAction recovery_action(const HubError &error) noexcept;

} // namespace hublink::hub
