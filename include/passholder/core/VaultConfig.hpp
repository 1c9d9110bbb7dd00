#ifndef INCLUDE_PASSHOLDER_CORE_VAULTCONFIG_HPP
#define INCLUDE_PASSHOLDER_CORE_VAULTCONFIG_HPP

#include "passholder/crypto/KdfParams.hpp"
#include "passholder/storage/IVaultRepository.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace passholder::core
{

struct VaultConfig final
{
    std::filesystem::path vaultDir;
    std::string saltFileName{ "salt.key" };
    std::string vaultFileName{ "secrets.db.enc" };
    // Where working copies are materialized; empty selects defaultScratchRoot().
    std::filesystem::path scratchRoot{};
    // Key derivation parameters for vaults created with this config. Existing vaults keep their own.
    passholder::crypto::Argon2idParams kdf{ passholder::crypto::g_kArgon2idDefaultParams };
    passholder::crypto::Argon2idParams verifier{ .iterations = 3U, .memoryKiB = 64U * 1024U, .parallelism = 4U };
    // 0 disables the idle timeout.
    std::chrono::seconds idleTimeout{ 300 };
    std::chrono::seconds clipboardClearAfter{ 30 };

    [[nodiscard]] passholder::storage::VaultLocation location() const
    {
        return passholder::storage::VaultLocation{ .dir = vaultDir,
                                                   .saltFileName = saltFileName,
                                                   .vaultFileName = vaultFileName };
    }
};

// Vault directory from $PASSHOLDER_HOME, else $HOME/passholder. Throws std::runtime_error if neither is set.
[[nodiscard]] VaultConfig defaultVaultConfig();

} // namespace passholder::core

#endif // INCLUDE_PASSHOLDER_CORE_VAULTCONFIG_HPP
