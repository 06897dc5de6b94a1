#include "hbl_hub.hpp"

namespace hublink::hub
{

const char *to_string(ErrorCategory category) noexcept
{
    switch (category)
    {
    case ErrorCategory::Discovery:  return "Discovery";
    case ErrorCategory::Connection: return "Connection";
    case ErrorCategory::Command:    return "Command";
    case ErrorCategory::Queue:      return "Queue";
    case ErrorCategory::Cache:      return "Cache";
    case ErrorCategory::Storage:    return "Storage";
    case ErrorCategory::Validation: return "Validation";
    }
    return "Unknown";
}

const char *to_string(RecoveryAction action) noexcept
{
    switch (action)
    {
    case RecoveryAction::Retry:      return "retry";
    case RecoveryAction::Reconnect:  return "reconnect";
    case RecoveryAction::ClearCache: return "clear_cache";
    case RecoveryAction::Manual:     return "manual";
    }
    return "manual";
}

HubError::HubError(ErrorCategory category, std::string operation, const std::string &message,
                   std::string cause, int attempts)
    : std::runtime_error(message), m_category(category), m_operation(std::move(operation)),
      m_cause(std::move(cause)), m_attempts(attempts)
{
}

bool HubError::retryable() const noexcept
{
    switch (m_category)
    {
    case ErrorCategory::Discovery:
    case ErrorCategory::Connection:
    case ErrorCategory::Command:
    case ErrorCategory::Queue:
        return true;
    default:
        return false;
    }
}

std::string HubError::describe() const
{
    std::string out = fmt::format("{} error in '{}': {}", to_string(m_category), m_operation, what());
    if (m_attempts > 0)
        out += fmt::format("\n  attempts: {}", m_attempts);
    if (!m_cause.empty())
        out += fmt::format("\n  cause: {}", m_cause);
    if (m_cause_category)
        out += fmt::format("\n  cause category: {}", to_string(*m_cause_category));
    out += fmt::format("\n  suggested action: {}", to_string(recovery_action(*this)));
    return out;
}

RecoveryAction recovery_action(const HubError &error) noexcept
{
    switch (error.category())
    {
    case ErrorCategory::Discovery:
        return RecoveryAction::Retry;
    case ErrorCategory::Connection:
        return RecoveryAction::Reconnect;
    case ErrorCategory::Command:
        return error.cause_category() == ErrorCategory::Connection ? RecoveryAction::Reconnect
                                                                   : RecoveryAction::Retry;
    case ErrorCategory::Queue:
        return RecoveryAction::Retry;
    case ErrorCategory::Cache:
    case ErrorCategory::Storage:
        return RecoveryAction::ClearCache;
    case ErrorCategory::Validation:
        return RecoveryAction::Manual;
    }
    return RecoveryAction::Manual;
}

} // namespace hublink::hub
