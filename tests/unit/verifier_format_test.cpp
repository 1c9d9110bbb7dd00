#include "passholder/crypto/VerifierFormat.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace
{

using passholder::crypto::decodeBase64;
using passholder::crypto::decodeVerifier;
using passholder::crypto::encodeBase64;

[[nodiscard]] std::vector<std::uint8_t> bytesOf(std::string_view s)
{
    return { s.begin(), s.end() };
}

// Produced by argon2-cffi with its default parameters.
constexpr std::string_view g_kCffiVerifier{
    "$argon2id$v=19$m=65536,t=3,p=4$MIIRqgvgQbgj220jfp0MPA$YfwJSVjtjSU0zzV/P3S9nnQ/USre2wvJMjfCIjrTQbg"
};

} // namespace

TEST(Base64, EncodesWithoutPadding)
{
    EXPECT_EQ(encodeBase64(bytesOf("")), "");
    EXPECT_EQ(encodeBase64(bytesOf("f")), "Zg");
    EXPECT_EQ(encodeBase64(bytesOf("fo")), "Zm8");
    EXPECT_EQ(encodeBase64(bytesOf("foo")), "Zm9v");
    EXPECT_EQ(encodeBase64(bytesOf("hello")), "aGVsbG8");
}

TEST(Base64, DecodesUnpaddedInput)
{
    const auto decoded = decodeBase64("aGVsbG8");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytesOf("hello"));
}

TEST(Base64, RejectsPaddingAndForeignCharacters)
{
    EXPECT_FALSE(decodeBase64("Zg==").has_value());
    EXPECT_FALSE(decodeBase64("Zm9v-").has_value());
    EXPECT_FALSE(decodeBase64("Zm9v_A").has_value());
}

TEST(Base64, RejectsImpossibleLengthAndStrayBits)
{
    EXPECT_FALSE(decodeBase64("Zm9vY").has_value());
    // "Zh" carries non-zero bits beyond the single encoded byte.
    EXPECT_FALSE(decodeBase64("Zh").has_value());
}

TEST(Base64, UsesStandardAlphabet)
{
    const std::vector<std::uint8_t> bytes{ 0xFBU, 0xEFU, 0xFFU, 0x00U, 0x10U, 0x83U };
    EXPECT_EQ(encodeBase64(bytes), "++//ABCD");

    const auto decoded = decodeBase64("++//ABCD");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, bytes);
    EXPECT_FALSE(decodeBase64("--__ABCD").has_value());
}

TEST(VerifierFormat, DecodesForeignVerifier)
{
    const auto record = decodeVerifier(g_kCffiVerifier);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->params.memoryKiB, 65536U);
    EXPECT_EQ(record->params.iterations, 3U);
    EXPECT_EQ(record->params.parallelism, 4U);
    EXPECT_EQ(record->salt.size(), 16U);
    EXPECT_EQ(record->hash.size(), 32U);
}

TEST(VerifierFormat, EncodeMatchesDecode)
{
    const auto record = decodeVerifier(g_kCffiVerifier);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(passholder::crypto::encodeVerifier(record->params, record->salt, record->hash), g_kCffiVerifier);
}

TEST(VerifierFormat, RejectsOtherVariantsAndVersions)
{
    EXPECT_FALSE(decodeVerifier("$argon2i$v=19$m=65536,t=3,p=4$MIIRqgvgQbgj220jfp0MPA$"
                                "YfwJSVjtjSU0zzV/P3S9nnQ/USre2wvJMjfCIjrTQbg")
                     .has_value());
    EXPECT_FALSE(decodeVerifier("$argon2id$v=16$m=65536,t=3,p=4$MIIRqgvgQbgj220jfp0MPA$"
                                "YfwJSVjtjSU0zzV/P3S9nnQ/USre2wvJMjfCIjrTQbg")
                     .has_value());
}

TEST(VerifierFormat, RejectsMalformedParameters)
{
    const std::string tail{ "$MIIRqgvgQbgj220jfp0MPA$YfwJSVjtjSU0zzV/P3S9nnQ/USre2wvJMjfCIjrTQbg" };
    EXPECT_FALSE(decodeVerifier("$argon2id$v=19$t=3,m=65536,p=4" + tail).has_value());
    EXPECT_FALSE(decodeVerifier("$argon2id$v=19$m=065536,t=3,p=4" + tail).has_value());
    EXPECT_FALSE(decodeVerifier("$argon2id$v=19$m=65536,t=3" + tail).has_value());
    EXPECT_FALSE(decodeVerifier("$argon2id$v=19$m=65536,t=x,p=4" + tail).has_value());
    EXPECT_FALSE(decodeVerifier("$argon2id$v=19$m=99999999999,t=3,p=4" + tail).has_value());
}

TEST(VerifierFormat, RejectsShortSaltOrHash)
{
    EXPECT_FALSE(decodeVerifier("$argon2id$v=19$m=8,t=1,p=1$c2FsdA$YfwJSVjtjSU0zzV/P3S9nnQ/USre2wvJMjfCIjrTQbg")
                     .has_value());
    EXPECT_FALSE(decodeVerifier("$argon2id$v=19$m=8,t=1,p=1$MIIRqgvgQbgj220jfp0MPA$aGFzaA").has_value());
    EXPECT_FALSE(decodeVerifier("$argon2id$v=19$m=8,t=1,p=1$MIIRqgvgQbgj220jfp0MPA").has_value());
}
