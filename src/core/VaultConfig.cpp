#include "passholder/core/VaultConfig.hpp"

#include "passholder/core/KdfPolicy.hpp"
#include <cstdlib>
#include <stdexcept>

namespace passholder::core
{

[[nodiscard]] VaultConfig defaultVaultConfig()
{
    VaultConfig cfg{};
    cfg.kdf = defaultArgon2idParams();
    cfg.verifier = defaultVerifierParams();

    if (const char* home = std::getenv("PASSHOLDER_HOME"); home != nullptr && *home != '\0')
    {
        cfg.vaultDir = std::filesystem::path{ home };
        return cfg;
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0')
    {
        cfg.vaultDir = std::filesystem::path{ home } / "passholder";
        return cfg;
    }
    throw std::runtime_error("cannot determine vault directory: set PASSHOLDER_HOME or HOME");
}

} // namespace passholder::core
