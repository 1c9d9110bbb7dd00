#ifndef INCLUDE_PASSHOLDER_CORE_KDFPOLICY_HPP
#define INCLUDE_PASSHOLDER_CORE_KDFPOLICY_HPP

#include "passholder/crypto/KdfParams.hpp"

namespace passholder::core
{

// Work factor for the vault key of newly created vaults.
[[nodiscard]] passholder::crypto::Argon2idParams defaultArgon2idParams() noexcept;

// Work factor for the stored master-password verifier.
[[nodiscard]] passholder::crypto::Argon2idParams defaultVerifierParams() noexcept;

} // namespace passholder::core

#endif // INCLUDE_PASSHOLDER_CORE_KDFPOLICY_HPP
