#ifndef INCLUDE_PASSHOLDER_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_PASSHOLDER_CRYPTO_KEYDERIVATION_HPP

#include "passholder/crypto/KdfParams.hpp"
#include "passholder/security/SecureMemory.hpp"
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace passholder::crypto
{

// Argon2id(password, salt) -> 32-byte key. Deterministic for equal inputs.
[[nodiscard]] passholder::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> password,
                                                                  std::span<const std::byte> salt,
                                                                  Argon2idParams params);

[[nodiscard]] passholder::security::SecureBuffer deriveKeyArgon2idDefault(std::span<const std::byte> password,
                                                                         std::span<const std::byte> salt);

// Salted Argon2id hash of the master password, encoded as a PHC string. Only used to confirm a password,
// never to derive keys. Throws std::runtime_error if the CSPRNG fails.
[[nodiscard]] std::string hashForVerification(std::span<const std::byte> password, Argon2idParams params);

// Recomputes the hash with the salt and parameters embedded in `verifier` and compares in constant time.
// Throws std::invalid_argument if `verifier` is not a well-formed argon2id PHC string.
[[nodiscard]] bool verifyPassword(std::string_view verifier, std::span<const std::byte> candidate);

} // namespace passholder::crypto

#endif // INCLUDE_PASSHOLDER_CRYPTO_KEYDERIVATION_HPP
