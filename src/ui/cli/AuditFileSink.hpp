#ifndef PASSHOLDER_UI_CLI_AUDITFILESINK_HPP
#define PASSHOLDER_UI_CLI_AUDITFILESINK_HPP

#include "passholder/core/AuditLog.hpp"
#include <filesystem>
#include <string>

namespace passholder::ui::cli
{

// "timestamp | level | event=.. | outcome=.. | message", newlines flattened.
[[nodiscard]] std::string formatAuditLine(const passholder::core::AuditEvent& event, const std::string& timestamp);

// Appends each event to `logPath` (created 0600) and fsyncs it. Write failures are dropped.
[[nodiscard]] passholder::core::AuditSink makeAuditFileSink(std::filesystem::path logPath);

} // namespace passholder::ui::cli

#endif // PASSHOLDER_UI_CLI_AUDITFILESINK_HPP
