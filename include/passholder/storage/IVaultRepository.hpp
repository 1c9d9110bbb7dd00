#ifndef INCLUDE_PASSHOLDER_STORAGE_IVAULTREPOSITORY_HPP
#define INCLUDE_PASSHOLDER_STORAGE_IVAULTREPOSITORY_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace passholder::storage
{

struct VaultLocation final
{
    std::filesystem::path dir;
    std::string saltFileName{ "salt.key" };
    std::string vaultFileName{ "secrets.db.enc" };

    [[nodiscard]] std::filesystem::path saltPath() const
    {
        return dir / saltFileName;
    }
    [[nodiscard]] std::filesystem::path vaultPath() const
    {
        return dir / vaultFileName;
    }
};

// Persisted state of a vault directory: the salt-file and the encrypted vault-file.
class IVaultRepository
{
public:
    IVaultRepository() = default;
    IVaultRepository(const IVaultRepository&) = delete;
    IVaultRepository& operator=(const IVaultRepository&) = delete;
    IVaultRepository(IVaultRepository&&) = delete;
    IVaultRepository& operator=(IVaultRepository&&) = delete;
    virtual ~IVaultRepository() = default;

    [[nodiscard]] virtual bool vaultExists(const VaultLocation& loc) const = 0;

    // Returns the existing salt. A new one is generated only while no vault-file exists;
    // otherwise a missing or malformed salt throws MissingSalt.
    [[nodiscard]] virtual std::vector<std::uint8_t> loadOrCreateSalt(const VaultLocation& loc) = 0;

    // Throws VaultNotFound if the vault-file does not exist.
    [[nodiscard]] virtual std::vector<std::uint8_t> loadVault(const VaultLocation& loc) const = 0;

    // Replaces the vault-file so that readers observe either the old or the new content.
    virtual void storeVaultAtomic(const VaultLocation& loc, std::span<const std::uint8_t> bytes) = 0;
};

} // namespace passholder::storage

#endif // INCLUDE_PASSHOLDER_STORAGE_IVAULTREPOSITORY_HPP
