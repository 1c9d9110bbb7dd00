#include "AuditFileSink.hpp"

#include <cstdio>
#include <ctime>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace passholder::ui::cli
{
namespace
{

[[nodiscard]] std::string sanitize(std::string s)
{
    for (char& c : s)
    {
        if (c == '\n' || c == '\r')
        {
            c = ' ';
        }
    }
    return s;
}

[[nodiscard]] std::string localTimestamp()
{
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    ::localtime_r(&t, &tm);

    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0U)
    {
        return "0000-00-00 00:00:00";
    }
    return std::string{ buf };
}

void appendLine(const std::filesystem::path& logPath, const std::string& line) noexcept
{
    const int fd = ::open(logPath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC | O_NOFOLLOW, S_IRUSR | S_IWUSR);
    if (fd < 0)
    {
        return;
    }
    (void)::fchmod(fd, S_IRUSR | S_IWUSR);
    std::size_t done = 0U;
    while (done < line.size())
    {
        const ssize_t w = ::write(fd, line.data() + done, line.size() - done);
        if (w <= 0)
        {
            break;
        }
        done += static_cast<std::size_t>(w);
    }
    (void)::fsync(fd);
    (void)::close(fd);
}

} // namespace

std::string formatAuditLine(const passholder::core::AuditEvent& event, const std::string& timestamp)
{
    std::string line{ timestamp };
    line += " | ";
    line += passholder::core::toString(event.level);
    line += " | event=";
    line += sanitize(event.event);
    line += " | outcome=";
    line += sanitize(event.outcome);
    line += " | ";
    line += sanitize(event.message);
    line += '\n';
    return line;
}

passholder::core::AuditSink makeAuditFileSink(std::filesystem::path logPath)
{
    return [path = std::move(logPath)](const passholder::core::AuditEvent& event) {
        std::error_code ec{};
        if (!std::filesystem::is_directory(path.parent_path(), ec))
        {
            return;
        }
        appendLine(path, formatAuditLine(event, localTimestamp()));
    };
}

} // namespace passholder::ui::cli
