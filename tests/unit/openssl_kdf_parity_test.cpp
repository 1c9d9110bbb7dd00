#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string_view>

#include "passholder/core/VaultCodec.hpp"
#include "passholder/crypto/providers/NativeProviderFactory.hpp"
#include "passholder/crypto/providers/OpenSslProviderFactory.hpp"
#include "passholder/security/SecureMemory.hpp"

namespace
{

using passholder::security::asBytes;

constexpr passholder::crypto::Argon2idParams g_kFastParams{ .iterations = 1U, .memoryKiB = 8U, .parallelism = 1U };
constexpr std::string_view g_kPassword{ "strongPassword" };

[[nodiscard]] std::array<std::byte, passholder::crypto::g_kVaultSaltBytes> testSalt()
{
    std::array<std::byte, passholder::crypto::g_kVaultSaltBytes> salt{};
    salt[0] = std::byte{ 0x42 };
    salt[1] = std::byte{ 0x99 };
    return salt;
}

} // namespace

TEST(CryptoProviderParity, DeriveKeyNativeEqualsOpenSsl)
{
    auto native{ passholder::crypto::providers::makeNativeCryptoProvider() };
    auto openssl{ passholder::crypto::providers::makeOpenSslCryptoProvider() };
    const auto salt = testSalt();

    const auto nativeKey{ native->deriveKey(asBytes(g_kPassword), std::span{ salt }, g_kFastParams) };

    passholder::security::SecureBuffer opensslKey{};
    try
    {
        opensslKey = openssl->deriveKey(asBytes(g_kPassword), std::span{ salt }, g_kFastParams);
    }
    catch (const std::runtime_error& e)
    {
        GTEST_SKIP() << e.what();
    }

    ASSERT_EQ(nativeKey.size(), passholder::crypto::g_kDerivedKeyBytes);
    ASSERT_EQ(opensslKey.size(), passholder::crypto::g_kDerivedKeyBytes);
    EXPECT_TRUE(passholder::security::secureEquals(nativeKey, opensslKey));
}

TEST(CryptoProviderParity, MultiLaneDeriveKeyNativeEqualsOpenSsl)
{
    auto native{ passholder::crypto::providers::makeNativeCryptoProvider() };
    auto openssl{ passholder::crypto::providers::makeOpenSslCryptoProvider() };
    const auto salt = testSalt();
    constexpr passholder::crypto::Argon2idParams kLanes{ .iterations = 2U, .memoryKiB = 32U, .parallelism = 4U };

    const auto nativeKey{ native->deriveKey(asBytes(g_kPassword), std::span{ salt }, kLanes) };

    passholder::security::SecureBuffer opensslKey{};
    try
    {
        opensslKey = openssl->deriveKey(asBytes(g_kPassword), std::span{ salt }, kLanes);
    }
    catch (const std::runtime_error& e)
    {
        GTEST_SKIP() << e.what();
    }
    EXPECT_TRUE(passholder::security::secureEquals(nativeKey, opensslKey));
}

TEST(CryptoProviderParity, VerifierIsInterchangeable)
{
    auto native{ passholder::crypto::providers::makeNativeCryptoProvider() };
    auto openssl{ passholder::crypto::providers::makeOpenSslCryptoProvider() };

    std::string verifier{};
    try
    {
        verifier = openssl->hashForVerification(asBytes(g_kPassword), g_kFastParams);
    }
    catch (const std::runtime_error& e)
    {
        GTEST_SKIP() << e.what();
    }
    EXPECT_TRUE(native->verifyPassword(verifier, asBytes(g_kPassword)));
    EXPECT_FALSE(native->verifyPassword(verifier, asBytes(std::string_view{ "other" })));

    const auto nativeVerifier = native->hashForVerification(asBytes(g_kPassword), g_kFastParams);
    EXPECT_TRUE(openssl->verifyPassword(nativeVerifier, asBytes(g_kPassword)));
}

TEST(CryptoProviderParity, AeadIsInterchangeable)
{
    auto native{ passholder::crypto::providers::makeNativeCryptoProvider() };
    auto openssl{ passholder::crypto::providers::makeOpenSslCryptoProvider() };

    std::array<std::uint8_t, passholder::crypto::g_aeadKeyBytes> key{};
    key[0] = 0x01U;
    constexpr std::string_view kAd{ "PHVAULT1" };
    constexpr std::string_view kPlain{ "sqlite image bytes" };

    const passholder::core::VaultCodec nativeCodec{ *native };
    const passholder::core::VaultCodec opensslCodec{ *openssl };

    const auto sealedByNative = nativeCodec.encrypt(key, asBytes(kPlain), asBytes(kAd));
    EXPECT_EQ(passholder::security::asStringView(opensslCodec.decrypt(key, sealedByNative, asBytes(kAd))), kPlain);

    const auto sealedByOpenSsl = opensslCodec.encrypt(key, asBytes(kPlain), asBytes(kAd));
    EXPECT_EQ(passholder::security::asStringView(nativeCodec.decrypt(key, sealedByOpenSsl, asBytes(kAd))), kPlain);
}

TEST(CryptoProviderParity, OpenSslAeadTamperFails)
{
    auto openssl{ passholder::crypto::providers::makeOpenSslCryptoProvider() };
    std::array<std::uint8_t, passholder::crypto::g_aeadKeyBytes> key{};

    auto box = openssl->aeadEncrypt(key, asBytes("payload"), asBytes("ad"));
    box.tag[3] ^= 0x10U;
    EXPECT_FALSE(openssl->aeadDecrypt(key, box, asBytes("ad")).has_value());
}
