#include "passholder/crypto/KeyDerivation.hpp"
#include "passholder/crypto/providers/NativeProviderFactory.hpp"
#include "passholder/security/SecureMemory.hpp"
#include "passholder/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace passholder::crypto::providers
{
namespace
{

std::span<const std::uint8_t> asU8(std::span<const std::byte> s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

class NativeCryptoProvider final : public passholder::crypto::ICryptoProvider
{
public:
    [[nodiscard]] passholder::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                              std::span<const std::byte> salt,
                                                              const passholder::crypto::Argon2idParams& params) const override
    {
        return passholder::crypto::deriveKeyArgon2id(password, salt, params);
    }

    [[nodiscard]] std::string hashForVerification(std::span<const std::byte> password,
                                                  const passholder::crypto::Argon2idParams& params) override
    {
        return passholder::crypto::hashForVerification(password, params);
    }

    [[nodiscard]] bool verifyPassword(std::string_view verifier, std::span<const std::byte> candidate) const override
    {
        return passholder::crypto::verifyPassword(verifier, candidate);
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return passholder::security::secureRandomFill(out);
    }

    [[nodiscard]] passholder::crypto::AeadBox aeadEncrypt(std::span<const std::uint8_t> key,
                                                          std::span<const std::byte> plainText,
                                                          std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, passholder::crypto::g_aeadKeyBytes, "aeadEncrypt: key");

        passholder::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        box.cipherText.resize(plainText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx = passholder::security::scopeWipe(std::span{ &ctx, 1 });
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        crypto_aead_write(&ctx, box.cipherText.data(), box.tag.data(), asU8(associatedData).data(),
                          associatedData.size(), asU8(plainText).data(), plainText.size());

        return box;
    }

    [[nodiscard]] std::optional<passholder::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const passholder::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, passholder::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        if (box.cipherText.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::invalid_argument("aeadDecrypt: cipherText too large");
        }

        passholder::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());

        crypto_aead_ctx ctx{};
        auto wipeCtx = passholder::security::scopeWipe(std::span{ &ctx, 1 });
        crypto_aead_init_ietf(&ctx, key.data(), box.nonce.data());
        const int ok = crypto_aead_read(&ctx, plainText.data(), box.tag.data(), asU8(associatedData).data(),
                                        associatedData.size(), box.cipherText.data(), box.cipherText.size());
        if (ok != 0)
        {
            passholder::security::secureRelease(plainText);
            return std::nullopt;
        }

        return plainText;
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<passholder::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace passholder::crypto::providers
