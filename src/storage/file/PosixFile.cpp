#include "PosixFile.hpp"

#include "passholder/storage/StorageErrors.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace passholder::storage::detail
{

void UniqueFd::reset(int fd) noexcept
{
    if (m_fd >= 0)
    {
        (void)::close(m_fd);
    }
    m_fd = fd;
}

bool UniqueFd::close() noexcept
{
    if (m_fd < 0)
    {
        return true;
    }
    const int rc{ ::close(m_fd) };
    m_fd = -1;
    return rc == 0;
}

[[nodiscard]] std::string errnoMessage(const char* prefix)
{
    std::string out{ prefix };
    out.append(": ");
    out.append(std::strerror(errno));
    return out;
}

void writeAll(int fd, std::span<const std::uint8_t> bytes, const char* what)
{
    std::size_t done{ 0U };
    while (done < bytes.size())
    {
        const ssize_t w{ ::write(fd, bytes.data() + done, bytes.size() - done) };
        if (w < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw passholder::storage::StorageError(errnoMessage(what));
        }
        if (w == 0)
        {
            throw passholder::storage::StorageError(std::string{ what } + ": short write");
        }
        done += static_cast<std::size_t>(w);
    }
}

void syncDirectory(const std::filesystem::path& dir)
{
    UniqueFd fd{ ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC) };
    if (!fd)
    {
        throw passholder::storage::StorageError(errnoMessage("storage: open directory failed"));
    }
    if (::fsync(fd.get()) != 0)
    {
        throw passholder::storage::StorageError(errnoMessage("storage: directory fsync failed"));
    }
}

} // namespace passholder::storage::detail
