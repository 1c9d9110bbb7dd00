#ifndef INCLUDE_PASSHOLDER_STORAGE_SCRATCHSPACE_HPP
#define INCLUDE_PASSHOLDER_STORAGE_SCRATCHSPACE_HPP

#include <cstdint>
#include <filesystem>
#include <span>

namespace passholder::storage
{

// Private directory holding the plaintext working copy while a vault is open.
// The directory is 0700 with an unpredictable name; the working copy is 0600.
class ScratchSpace final
{
public:
    // Throws StorageError if the directory cannot be created.
    explicit ScratchSpace(const std::filesystem::path& root);

    ScratchSpace(const ScratchSpace&) = delete;
    ScratchSpace& operator=(const ScratchSpace&) = delete;
    ScratchSpace(ScratchSpace&&) = delete;
    ScratchSpace& operator=(ScratchSpace&&) = delete;
    ~ScratchSpace() noexcept;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept;
    [[nodiscard]] const std::filesystem::path& workingCopyPath() const noexcept;

    // Writes `plaintext` as the working copy (0600, fsynced). An empty span creates an empty file.
    void materialize(std::span<const std::uint8_t> plaintext);

    // Overwrites the working copy with zeros, unlinks it and removes the directory. Idempotent.
    void discard() noexcept;

    [[nodiscard]] bool active() const noexcept;

private:
    std::filesystem::path m_dir;
    std::filesystem::path m_file;
    int m_slot{ -1 };
    bool m_active{ false };
};

// $XDG_RUNTIME_DIR when usable, else the system temporary directory.
[[nodiscard]] std::filesystem::path defaultScratchRoot();

// Best effort: on SIGINT, SIGTERM, SIGHUP and SIGQUIT unlink every live working copy, then re-raise.
void installScratchSignalHandlers() noexcept;

} // namespace passholder::storage

#endif // INCLUDE_PASSHOLDER_STORAGE_SCRATCHSPACE_HPP
