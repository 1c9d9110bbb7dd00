#include "passholder/crypto/KdfParams.hpp"
#include "passholder/crypto/VerifierFormat.hpp"
#include "passholder/crypto/providers/OpenSslProviderFactory.hpp"
#include "passholder/security/SecureMemory.hpp"
#include "passholder/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace passholder::crypto::providers
{
namespace
{

constexpr const char* g_kKdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kKdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kKdfParamThreads{ "threads" };
constexpr const char* g_kKdfParamArgon2Version{ "version" };

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

EvpKdfPtr fetchArgon2idKdf()
{
    if (EVP_KDF * kdf{ EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr) }; kdf != nullptr)
    {
        return EvpKdfPtr{ kdf, &EVP_KDF_free };
    }
    return EvpKdfPtr{ nullptr, &EVP_KDF_free };
}

class OpenSslCryptoProvider final : public passholder::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_argon2idKdf{ fetchArgon2idKdf() }
    {
    }

    [[nodiscard]] passholder::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                              std::span<const std::byte> salt,
                                                              const passholder::crypto::Argon2idParams& params) const override
    {
        if (password.empty())
        {
            throw std::invalid_argument("deriveKey: empty password");
        }
        if (salt.size() < passholder::crypto::g_kMinSaltBytes)
        {
            throw std::invalid_argument("deriveKey: invalid salt size");
        }
        passholder::crypto::requireArgon2idParamsSafe(params);

        passholder::security::SecureBuffer out{};
        out.resize(passholder::crypto::g_kDerivedKeyBytes);
        argon2id(std::span<std::uint8_t>{ out }, password, salt, params);
        return out;
    }

    [[nodiscard]] std::string hashForVerification(std::span<const std::byte> password,
                                                  const passholder::crypto::Argon2idParams& params) override
    {
        if (password.empty())
        {
            throw std::invalid_argument("hashForVerification: empty password");
        }
        passholder::crypto::requireArgon2idParamsSafe(params);

        std::array<std::uint8_t, passholder::crypto::g_kVerifierSaltBytes> salt{};
        if (!randomBytes(std::span<std::uint8_t>{ salt }))
        {
            throw std::runtime_error("hashForVerification: CSPRNG failure");
        }

        std::array<std::uint8_t, passholder::crypto::g_kVerifierTagBytes> tag{};
        auto wipeTag = passholder::security::scopeWipe(std::span<std::uint8_t>{ tag });
        argon2id(std::span<std::uint8_t>{ tag }, password, std::as_bytes(std::span<const std::uint8_t>{ salt }),
                 params);
        return passholder::crypto::encodeVerifier(params, salt, tag);
    }

    [[nodiscard]] bool verifyPassword(std::string_view verifier, std::span<const std::byte> candidate) const override
    {
        const auto record = passholder::crypto::decodeVerifier(verifier);
        if (!record)
        {
            throw std::invalid_argument("verifyPassword: malformed verifier");
        }
        if (candidate.empty())
        {
            return false;
        }
        passholder::crypto::requireArgon2idParamsSafe(record->params);

        passholder::security::SecureBuffer recomputed{};
        recomputed.resize(record->hash.size());
        argon2id(std::span<std::uint8_t>{ recomputed }, candidate,
                 std::as_bytes(std::span<const std::uint8_t>{ record->salt }), record->params);
        return passholder::security::secureEquals(std::span<const std::uint8_t>{ recomputed },
                                                  std::span<const std::uint8_t>{ record->hash });
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
        if (plainText.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("aeadEncrypt: plainText too large");
        }
        if (associatedData.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("aeadEncrypt: associatedData too large");
        }

        passholder::crypto::AeadBox box{};
        if (!randomBytes(std::span<std::uint8_t>{ box.nonce }))
        {
            throw std::runtime_error("aeadEncrypt: CSPRNG failure");
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadEncrypt: EVP_CIPHER_CTX_new failed");
        }

        if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: EVP_EncryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set ivlen failed");
        }
        if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadEncrypt: set key/nonce failed");
        }

        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aeadEncrypt: add aad failed");
        }

        box.cipherText.resize(plainText.size());
        int outLen{ 0 };
        const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
        auto* ctPtr{ box.cipherText.empty() ? nullptr : box.cipherText.data() };
        if (EVP_EncryptUpdate(ctx.get(), ctPtr, &outLen, ptPtr, static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("aeadEncrypt: encrypt update failed");
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > box.cipherText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }
        int finalLen{ 0 };
        auto* ctFinalPtr{ box.cipherText.empty() ? nullptr : (box.cipherText.data() + outLen) };
        if (EVP_EncryptFinal_ex(ctx.get(), ctFinalPtr, &finalLen) != 1)
        {
            throw std::runtime_error("aeadEncrypt: encrypt final failed");
        }
        if (finalLen < 0)
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }
        const std::size_t totalBytes{ static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) };
        if (totalBytes > box.cipherText.size())
        {
            throw std::runtime_error("aeadEncrypt: invalid output length");
        }
        box.cipherText.resize(totalBytes);

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(box.tag.size()), box.tag.data()) !=
            1)
        {
            throw std::runtime_error("aeadEncrypt: get tag failed");
        }

        return box;
    }

    [[nodiscard]] std::optional<passholder::security::SecureBuffer>
    aeadDecrypt(std::span<const std::uint8_t> key, const passholder::crypto::AeadBox& box,
                std::span<const std::byte> associatedData) override
    {
        requireExactSize(key, passholder::crypto::g_aeadKeyBytes, "aeadDecrypt: key");
        if (associatedData.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("aeadDecrypt: associatedData too large");
        }
        if (box.cipherText.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
        {
            throw std::invalid_argument("aeadDecrypt: cipherText too large");
        }

        EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("aeadDecrypt: EVP_CIPHER_CTX_new failed");
        }

        if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: EVP_DecryptInit_ex failed");
        }
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(box.nonce.size()), nullptr) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set ivlen failed");
        }
        if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), box.nonce.data()) != 1)
        {
            throw std::runtime_error("aeadDecrypt: set key/nonce failed");
        }

        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("aeadDecrypt: add aad failed");
        }

        passholder::security::SecureBuffer plainText{};
        plainText.resize(box.cipherText.size());

        int outLen{ 0 };
        const auto* ctPtr{ box.cipherText.empty() ? nullptr : box.cipherText.data() };
        auto* ptPtr{ plainText.empty() ? nullptr : plainText.data() };
        if (EVP_DecryptUpdate(ctx.get(), ptPtr, &outLen, ctPtr, static_cast<int>(box.cipherText.size())) != 1)
        {
            passholder::security::secureRelease(plainText);
            return std::nullopt;
        }
        if (outLen < 0 || static_cast<std::size_t>(outLen) > plainText.size())
        {
            passholder::security::secureRelease(plainText);
            return std::nullopt;
        }

        std::array<std::uint8_t, passholder::crypto::g_aeadTagBytes> tagCopy{ box.tag };
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(tagCopy.size()), tagCopy.data()) !=
            1)
        {
            throw std::runtime_error("aeadDecrypt: set tag failed");
        }

        int finalLen{ 0 };
        auto* ptFinalPtr{ plainText.empty() ? nullptr : (plainText.data() + outLen) };
        if (EVP_DecryptFinal_ex(ctx.get(), ptFinalPtr, &finalLen) != 1)
        {
            passholder::security::secureRelease(plainText);
            return std::nullopt;
        }
        if (finalLen < 0)
        {
            passholder::security::secureRelease(plainText);
            return std::nullopt;
        }
        const std::size_t totalBytes{ static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) };
        if (totalBytes > plainText.size())
        {
            passholder::security::secureRelease(plainText);
            return std::nullopt;
        }
        plainText.resize(totalBytes);

        return plainText;
    }

private:
    void argon2id(std::span<std::uint8_t> out, std::span<const std::byte> password, std::span<const std::byte> salt,
                  const passholder::crypto::Argon2idParams& params) const
    {
        if (!m_argon2idKdf)
        {
            throw std::runtime_error("argon2id: OpenSSL Argon2id KDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_argon2idKdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("argon2id: EVP_KDF_CTX_new failed");
        }

        std::uint32_t iter{ params.iterations };
        std::uint32_t memcostKiB{ params.memoryKiB };
        std::uint32_t lanes{ params.parallelism };
        // Lanes are computed sequentially unless a thread pool has been configured with OSSL_set_max_threads.
        std::uint32_t threads{ 1U };
        std::uint32_t version{ passholder::crypto::g_kArgon2VersionV13 };

        // OSSL_PARAM takes non-const pointers even for read-only inputs; pass private copies.
        passholder::security::SecureBuffer passwordCopy{ passholder::security::secureBufferFrom(password) };
        passholder::security::SecureBuffer saltCopy{ passholder::security::secureBufferFrom(salt) };

        OSSL_PARAM ossl[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kKdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };

        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), ossl) <= 0)
        {
            throw std::runtime_error("argon2id: EVP_KDF_derive failed");
        }
    }

    EvpKdfPtr m_argon2idKdf{ nullptr, &EVP_KDF_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<passholder::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace passholder::crypto::providers
