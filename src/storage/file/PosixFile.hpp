#ifndef PASSHOLDER_SRC_STORAGE_FILE_POSIXFILE_HPP
#define PASSHOLDER_SRC_STORAGE_FILE_POSIXFILE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace passholder::storage::detail
{

// Owns a POSIX file descriptor.
class UniqueFd final
{
public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : m_fd{ fd }
    {
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : m_fd{ other.release() }
    {
    }
    UniqueFd& operator=(UniqueFd&& other) noexcept
    {
        if (this != &other)
        {
            reset(other.release());
        }
        return *this;
    }
    ~UniqueFd() noexcept
    {
        reset();
    }

    [[nodiscard]] int get() const noexcept
    {
        return m_fd;
    }
    [[nodiscard]] explicit operator bool() const noexcept
    {
        return m_fd >= 0;
    }
    [[nodiscard]] int release() noexcept
    {
        const int fd{ m_fd };
        m_fd = -1;
        return fd;
    }
    void reset(int fd = -1) noexcept;

    // Closes and reports failure, unlike the destructor.
    [[nodiscard]] bool close() noexcept;

private:
    int m_fd{ -1 };
};

[[nodiscard]] std::string errnoMessage(const char* prefix);

// Loops over short writes and EINTR. Throws StorageError.
void writeAll(int fd, std::span<const std::uint8_t> bytes, const char* what);

// fsync on the directory so a preceding rename is durable. Throws StorageError.
void syncDirectory(const std::filesystem::path& dir);

} // namespace passholder::storage::detail

#endif // PASSHOLDER_SRC_STORAGE_FILE_POSIXFILE_HPP
