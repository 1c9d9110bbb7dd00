#include "passholder/storage/file/FileVaultRepositoryFactory.hpp"

#include "PosixFile.hpp"
#include "passholder/crypto/KdfParams.hpp"
#include "passholder/security/SecureRandom.hpp"
#include "passholder/storage/IVaultRepository.hpp"
#include "passholder/storage/StorageErrors.hpp"
#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace passholder::storage::file
{
namespace
{

using passholder::storage::detail::UniqueFd;

void ensureVaultDir(const std::filesystem::path& dir)
{
    std::error_code ec{};
    if (std::filesystem::exists(dir, ec))
    {
        if (!std::filesystem::is_directory(dir, ec))
        {
            throw passholder::storage::StorageError("storage: vault path is not a directory");
        }
        return;
    }

    if (!std::filesystem::create_directories(dir, ec) || ec)
    {
        throw passholder::storage::StorageError("storage: failed to create vault directory");
    }
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        throw passholder::storage::StorageError("storage: failed to restrict vault directory permissions");
    }
}

[[nodiscard]] bool regularFileExists(const std::filesystem::path& path) noexcept
{
    std::error_code ec{};
    return std::filesystem::is_regular_file(path, ec);
}

[[nodiscard]] std::vector<std::uint8_t> readWholeFile(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        throw passholder::storage::StorageError("storage: failed to open " + path.filename().string());
    }
    std::vector<std::uint8_t> out{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    if (in.bad())
    {
        throw passholder::storage::StorageError("storage: failed to read " + path.filename().string());
    }
    return out;
}

// Temp file in the same directory, fsync, rename over the target, fsync the directory.
void atomicWriteFile(const std::filesystem::path& path, std::span<const std::uint8_t> bytes)
{
    std::string tmpl{ path.string() + ".tmpXXXXXX" };
    std::vector<char> temp(tmpl.begin(), tmpl.end());
    temp.push_back('\0');

    UniqueFd fd{ ::mkostemp(temp.data(), O_CLOEXEC) };
    if (!fd)
    {
        throw passholder::storage::StorageError(passholder::storage::detail::errnoMessage("storage: mkostemp failed"));
    }
    const std::filesystem::path tempPath{ temp.data() };

    try
    {
        if (::fchmod(fd.get(), S_IRUSR | S_IWUSR) != 0)
        {
            throw passholder::storage::StorageError(
                passholder::storage::detail::errnoMessage("storage: fchmod failed"));
        }
        passholder::storage::detail::writeAll(fd.get(), bytes, "storage: write failed");
        if (::fsync(fd.get()) != 0)
        {
            throw passholder::storage::StorageError(passholder::storage::detail::errnoMessage("storage: fsync failed"));
        }
        if (!fd.close())
        {
            throw passholder::storage::StorageError(passholder::storage::detail::errnoMessage("storage: close failed"));
        }
        if (::rename(tempPath.c_str(), path.c_str()) != 0)
        {
            throw passholder::storage::StorageError(
                passholder::storage::detail::errnoMessage("storage: rename failed"));
        }
    }
    catch (const passholder::storage::StorageError&)
    {
        fd.reset();
        (void)::unlink(tempPath.c_str());
        throw;
    }

    passholder::storage::detail::syncDirectory(path.has_parent_path() ? path.parent_path()
                                                                      : std::filesystem::path{ "." });
}

class FileVaultRepository final : public passholder::storage::IVaultRepository
{
public:
    [[nodiscard]] bool vaultExists(const passholder::storage::VaultLocation& loc) const override
    {
        return regularFileExists(loc.vaultPath());
    }

    [[nodiscard]] std::vector<std::uint8_t> loadOrCreateSalt(const passholder::storage::VaultLocation& loc) override
    {
        const auto saltPath = loc.saltPath();
        if (regularFileExists(saltPath))
        {
            auto salt = readWholeFile(saltPath);
            if (salt.size() != passholder::crypto::g_kVaultSaltBytes)
            {
                throw passholder::storage::MissingSalt("salt file has an unexpected size");
            }
            return salt;
        }

        if (vaultExists(loc))
        {
            throw passholder::storage::MissingSalt("salt file is missing for an existing vault");
        }

        ensureVaultDir(loc.dir);
        std::vector<std::uint8_t> salt(passholder::crypto::g_kVaultSaltBytes);
        if (!passholder::security::secureRandomFill(std::span<std::uint8_t>{ salt }))
        {
            throw passholder::storage::StorageError("storage: CSPRNG failure while creating salt");
        }
        atomicWriteFile(saltPath, salt);
        return salt;
    }

    [[nodiscard]] std::vector<std::uint8_t> loadVault(const passholder::storage::VaultLocation& loc) const override
    {
        const auto vaultPath = loc.vaultPath();
        if (!regularFileExists(vaultPath))
        {
            throw passholder::storage::VaultNotFound("vault file does not exist");
        }
        return readWholeFile(vaultPath);
    }

    void storeVaultAtomic(const passholder::storage::VaultLocation& loc, std::span<const std::uint8_t> bytes) override
    {
        ensureVaultDir(loc.dir);
        atomicWriteFile(loc.vaultPath(), bytes);
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<passholder::storage::IVaultRepository> makeFileVaultRepository()
{
    return std::make_unique<FileVaultRepository>();
}

} // namespace passholder::storage::file
