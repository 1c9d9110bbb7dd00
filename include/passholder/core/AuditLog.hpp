#ifndef INCLUDE_PASSHOLDER_CORE_AUDITLOG_HPP
#define INCLUDE_PASSHOLDER_CORE_AUDITLOG_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace passholder::core
{

enum class AuditLevel : std::uint8_t
{
    Info,
    Warning,
    Error,
};

[[nodiscard]] std::string_view toString(AuditLevel level) noexcept;

// One security-relevant event. Never carries secrets, passwords or verifier strings.
struct AuditEvent final
{
    AuditLevel level{ AuditLevel::Info };
    std::string event;
    std::string outcome;
    std::string message;
};

using AuditSink = std::function<void(const AuditEvent&)>;

} // namespace passholder::core

#endif // INCLUDE_PASSHOLDER_CORE_AUDITLOG_HPP
