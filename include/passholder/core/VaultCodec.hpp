#ifndef INCLUDE_PASSHOLDER_CORE_VAULTCODEC_HPP
#define INCLUDE_PASSHOLDER_CORE_VAULTCODEC_HPP

#include "passholder/crypto/ICryptoProvider.hpp"
#include "passholder/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace passholder::core
{

constexpr std::size_t g_vaultCodecOverheadBytes{ passholder::crypto::g_aeadNonceBytes +
                                                 passholder::crypto::g_aeadTagBytes };

// ChaCha20-Poly1305 sealing of a whole serialized working copy: nonce(12) || ciphertext || tag(16).
class VaultCodec final
{
public:
    explicit VaultCodec(passholder::crypto::ICryptoProvider& crypto) noexcept;

    // Fresh random nonce per call. Throws std::runtime_error if the CSPRNG fails.
    [[nodiscard]] std::vector<std::uint8_t> encrypt(std::span<const std::uint8_t> key,
                                                    std::span<const std::byte> plainText,
                                                    std::span<const std::byte> associatedData) const;

    // Throws IntegrityError on truncation, tampering, wrong key or wrong associated data.
    [[nodiscard]] passholder::security::SecureBuffer decrypt(std::span<const std::uint8_t> key,
                                                             std::span<const std::uint8_t> sealed,
                                                             std::span<const std::byte> associatedData) const;

private:
    passholder::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace passholder::core

#endif // INCLUDE_PASSHOLDER_CORE_VAULTCODEC_HPP
