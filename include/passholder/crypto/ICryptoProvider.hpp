#ifndef INCLUDE_PASSHOLDER_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_PASSHOLDER_CRYPTO_ICRYPTOPROVIDER_HPP

#include "passholder/crypto/KdfParams.hpp"
#include "passholder/security/SecureMemory.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace passholder::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Argon2id key derivation. Contract violations (empty password, short salt, unsafe params)
    // throw std::invalid_argument.
    [[nodiscard]] virtual passholder::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                                      std::span<const std::byte> salt,
                                                                      const Argon2idParams& params) const = 0;

    // PHC-encoded Argon2id verifier with a fresh random salt.
    [[nodiscard]] virtual std::string hashForVerification(std::span<const std::byte> password,
                                                          const Argon2idParams& params) = 0;

    // Throws std::invalid_argument for a malformed verifier.
    [[nodiscard]] virtual bool verifyPassword(std::string_view verifier,
                                              std::span<const std::byte> candidate) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // AEAD: ChaCha20-Poly1305 (IETF, 12-byte nonce).
    // Returns std::nullopt on authentication failure.
    [[nodiscard]] virtual AeadBox aeadEncrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) = 0;

    [[nodiscard]] virtual std::optional<passholder::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const AeadBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace passholder::crypto

#endif // INCLUDE_PASSHOLDER_CRYPTO_ICRYPTOPROVIDER_HPP
