#include "passholder/storage/ScratchSpace.hpp"

#include "PosixFile.hpp"
#include "passholder/security/SecureRandom.hpp"
#include "passholder/storage/StorageErrors.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <span>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace passholder::storage
{
namespace
{

using passholder::storage::detail::UniqueFd;

constexpr std::size_t g_kScratchNameBytes{ 16U };
constexpr const char* g_kScratchPrefix{ "passholder-" };
constexpr const char* g_kWorkingCopyName{ "working.db" };
constexpr std::size_t g_kWipeChunkBytes{ 4096U };

// Fixed storage so the signal handler never allocates.
constexpr std::size_t g_kMaxScratchSlots{ 8U };
constexpr std::size_t g_kSlotPathBytes{ 1024U };

struct ScratchSlot
{
    volatile std::sig_atomic_t used;
    char file[g_kSlotPathBytes];
    char dir[g_kSlotPathBytes];
};

ScratchSlot g_scratchSlots[g_kMaxScratchSlots]{};
volatile std::sig_atomic_t g_handlersInstalled{ 0 };

constexpr std::array<int, 4> g_kPurgeSignals{ SIGINT, SIGTERM, SIGHUP, SIGQUIT };

[[nodiscard]] int registerSlot(const std::filesystem::path& file, const std::filesystem::path& dir) noexcept
{
    const std::string& f = file.native();
    const std::string& d = dir.native();
    if (f.size() >= g_kSlotPathBytes || d.size() >= g_kSlotPathBytes)
    {
        return -1;
    }

    for (std::size_t i{}; i < g_kMaxScratchSlots; ++i)
    {
        ScratchSlot& slot = g_scratchSlots[i];
        if (slot.used == 0)
        {
            std::memcpy(slot.file, f.c_str(), f.size() + 1U);
            std::memcpy(slot.dir, d.c_str(), d.size() + 1U);
            slot.used = 1;
            return static_cast<int>(i);
        }
    }
    return -1;
}

void releaseSlot(int index) noexcept
{
    if (index < 0 || static_cast<std::size_t>(index) >= g_kMaxScratchSlots)
    {
        return;
    }
    g_scratchSlots[index].used = 0;
}

void purgeScratchOnSignal(int sig)
{
    for (ScratchSlot& slot : g_scratchSlots)
    {
        if (slot.used != 0)
        {
            (void)::unlink(slot.file);
            (void)::rmdir(slot.dir);
            slot.used = 0;
        }
    }

    struct sigaction dfl{};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    (void)::sigaction(sig, &dfl, nullptr);
    (void)::raise(sig);
}

// Overwrites the file's current length with zeros before it is unlinked.
void zeroFile(const std::filesystem::path& file) noexcept
{
    UniqueFd fd{ ::open(file.c_str(), O_WRONLY | O_CLOEXEC | O_NOFOLLOW) };
    if (!fd)
    {
        return;
    }
    struct stat st{};
    if (::fstat(fd.get(), &st) != 0 || st.st_size <= 0)
    {
        return;
    }

    const std::array<std::uint8_t, g_kWipeChunkBytes> zeros{};
    auto remaining = static_cast<std::size_t>(st.st_size);
    while (remaining > 0U)
    {
        const std::size_t chunk{ remaining < zeros.size() ? remaining : zeros.size() };
        const ssize_t w{ ::write(fd.get(), zeros.data(), chunk) };
        if (w <= 0)
        {
            if (w < 0 && errno == EINTR)
            {
                continue;
            }
            break;
        }
        remaining -= static_cast<std::size_t>(w);
    }
    (void)::fsync(fd.get());
}

} // namespace

ScratchSpace::ScratchSpace(const std::filesystem::path& root)
{
    std::error_code ec{};
    if (!std::filesystem::is_directory(root, ec))
    {
        throw passholder::storage::StorageError("scratch: root is not a directory");
    }

    const auto name = passholder::security::secureRandomHex(g_kScratchNameBytes);
    if (!name)
    {
        throw passholder::storage::StorageError("scratch: CSPRNG failure");
    }

    m_dir = root / (std::string{ g_kScratchPrefix } + *name);
    if (::mkdir(m_dir.c_str(), S_IRWXU) != 0)
    {
        throw passholder::storage::StorageError(passholder::storage::detail::errnoMessage("scratch: mkdir failed"));
    }
    m_file = m_dir / g_kWorkingCopyName;
    m_slot = registerSlot(m_file, m_dir);
    m_active = true;
}

ScratchSpace::~ScratchSpace() noexcept
{
    discard();
}

const std::filesystem::path& ScratchSpace::directory() const noexcept
{
    return m_dir;
}

const std::filesystem::path& ScratchSpace::workingCopyPath() const noexcept
{
    return m_file;
}

void ScratchSpace::materialize(std::span<const std::uint8_t> plaintext)
{
    if (!m_active)
    {
        throw passholder::storage::StorageError("scratch: already discarded");
    }

    UniqueFd fd{ ::open(m_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, S_IRUSR | S_IWUSR) };
    if (!fd)
    {
        throw passholder::storage::StorageError(
            passholder::storage::detail::errnoMessage("scratch: open working copy failed"));
    }
    passholder::storage::detail::writeAll(fd.get(), plaintext, "scratch: write working copy failed");
    if (::fsync(fd.get()) != 0)
    {
        throw passholder::storage::StorageError(passholder::storage::detail::errnoMessage("scratch: fsync failed"));
    }
    if (!fd.close())
    {
        throw passholder::storage::StorageError(passholder::storage::detail::errnoMessage("scratch: close failed"));
    }
}

void ScratchSpace::discard() noexcept
{
    if (!m_active)
    {
        return;
    }

    std::error_code ec{};
    std::filesystem::directory_iterator it{ m_dir, ec };
    for (; !ec && it != std::filesystem::directory_iterator{}; it.increment(ec))
    {
        const std::filesystem::path path{ it->path() };
        if (it->is_regular_file(ec))
        {
            zeroFile(path);
        }
        (void)::unlink(path.c_str());
    }
    (void)::rmdir(m_dir.c_str());

    releaseSlot(m_slot);
    m_slot = -1;
    m_active = false;
}

bool ScratchSpace::active() const noexcept
{
    return m_active;
}

[[nodiscard]] std::filesystem::path defaultScratchRoot()
{
    if (const char* runtimeDir = std::getenv("XDG_RUNTIME_DIR"); runtimeDir != nullptr && *runtimeDir != '\0')
    {
        std::error_code ec{};
        const std::filesystem::path candidate{ runtimeDir };
        if (std::filesystem::is_directory(candidate, ec))
        {
            return candidate;
        }
    }
    return std::filesystem::temp_directory_path();
}

void installScratchSignalHandlers() noexcept
{
    if (g_handlersInstalled != 0)
    {
        return;
    }

    struct sigaction sa{};
    sa.sa_handler = purgeScratchOnSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    for (const int sig : g_kPurgeSignals)
    {
        (void)::sigaction(sig, &sa, nullptr);
    }
    g_handlersInstalled = 1;
}

} // namespace passholder::storage
