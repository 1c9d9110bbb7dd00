#include "passholder/core/AuditLog.hpp"

namespace passholder::core
{

[[nodiscard]] std::string_view toString(AuditLevel level) noexcept
{
    switch (level)
    {
    case AuditLevel::Info:
        return "INFO";
    case AuditLevel::Warning:
        return "WARN";
    case AuditLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace passholder::core
