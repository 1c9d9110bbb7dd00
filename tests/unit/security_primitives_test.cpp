#include "passholder/security/SecureMemory.hpp"
#include "passholder/security/SecureRandom.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace
{

using namespace passholder::security;

TEST(SecureEqualsTest, MismatchedSizesReturnFalse)
{
    std::vector<std::byte> a(10);
    std::vector<std::byte> b(5);
    EXPECT_FALSE(secureEquals(std::span{ a }, std::span{ b }));
}

TEST(SecureEqualsTest, SameSizeDifferentContentReturnsFalse)
{
    std::vector<std::byte> a(10, std::byte{ 1 });
    std::vector<std::byte> b(10, std::byte{ 2 });
    EXPECT_FALSE(secureEquals(std::span{ a }, std::span{ b }));
}

TEST(SecureEqualsTest, SameSizeSameContentReturnsTrue)
{
    std::vector<std::byte> a(10, std::byte{ 1 });
    std::vector<std::byte> b(10, std::byte{ 1 });
    EXPECT_TRUE(secureEquals(std::span{ a }, std::span{ b }));
}

TEST(SecureEqualsTest, SecureTypesCompareByContent)
{
    SecureBuffer sb1(5);
    SecureBuffer sb2(5);
    EXPECT_TRUE(secureEquals(sb1, sb2));

    auto ss1 = secureStringFrom("abc");
    auto ss2 = secureStringFrom("abc");
    auto ss3 = secureStringFrom("def");
    EXPECT_TRUE(secureEquals(asBytes(ss1), asBytes(ss2)));
    EXPECT_FALSE(secureEquals(asBytes(ss1), asBytes(ss3)));
}

TEST(SecureWipeTest, ZeroesBufferInPlace)
{
    std::array<std::uint8_t, 16> bytes{};
    bytes.fill(0xAAU);
    secureWipe(std::span<std::uint8_t>{ bytes });
    EXPECT_TRUE(std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0U; }));
}

TEST(SecureWipeTest, StdStringIsZeroedAndEmptied)
{
    std::string s{ "hunter2" };
    secureWipe(s);
    EXPECT_TRUE(s.empty());
}

TEST(SecureReleaseTest, LeavesContainerEmpty)
{
    auto s = secureStringFrom("Secr3t!");
    secureRelease(s);
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.capacity(), 0U);

    SecureBuffer b(32, 0x11U);
    secureRelease(b);
    EXPECT_TRUE(b.empty());
}

TEST(ScopeWipeTest, WipesOnScopeExit)
{
    auto s = secureStringFrom("hunter2");
    {
        auto guard = scopeWipe(s);
    }
    ASSERT_EQ(s.size(), 7U);
    EXPECT_TRUE(std::all_of(s.begin(), s.end(), [](char c) { return c == '\0'; }));
}

TEST(ScopeWipeTest, ReleaseKeepsContent)
{
    auto s = secureStringFrom("hunter2");
    {
        auto guard = scopeWipe(s);
        guard.release();
    }
    EXPECT_EQ(asStringView(s), "hunter2");
}

TEST(ScopeWipeTest, MovedFromGuardDoesNotWipe)
{
    SecureBuffer b(4, 0x7FU);
    {
        auto first = scopeWipe(b);
        auto second = std::move(first);
        second.release();
    }
    EXPECT_EQ(b[0], 0x7FU);
}

TEST(ZeroAllocatorTest, SupportsGrowth)
{
    SecureString s{};
    for (int i = 0; i < 1000; ++i)
    {
        s.push_back('x');
    }
    EXPECT_EQ(s.size(), 1000U);
    EXPECT_EQ(asStringView(s), std::string(1000U, 'x'));
}

TEST(SecureBufferTest, FromBytesCopiesContent)
{
    const auto b = secureBufferFrom(asBytes(std::string_view{ "abc" }));
    ASSERT_EQ(b.size(), 3U);
    EXPECT_EQ(asStringView(b), "abc");
}

TEST(SecureRandomTest, FillEmptySpanSucceeds)
{
    std::span<std::uint8_t> s{};
    EXPECT_TRUE(secureRandomFill(s));
}

TEST(SecureRandomTest, FillProducesDistinctOutputs)
{
    std::array<std::uint8_t, 32> a{};
    std::array<std::uint8_t, 32> b{};
    ASSERT_TRUE(secureRandomFill(a));
    ASSERT_TRUE(secureRandomFill(b));
    EXPECT_NE(a, b);
}

TEST(SecureRandomTest, HexHasTwoCharactersPerByte)
{
    const auto hex = secureRandomHex(16U);
    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(hex->size(), 32U);
    EXPECT_EQ(hex->find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(SecureRandomTest, ToHexIsLowercase)
{
    const std::array<std::uint8_t, 3> bytes{ 0x00U, 0xABU, 0x7FU };
    EXPECT_EQ(toHex(bytes), "00ab7f");
}

} // namespace
