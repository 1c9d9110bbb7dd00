#ifndef INCLUDE_PASSHOLDER_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_PASSHOLDER_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace passholder::crypto
{

constexpr std::size_t g_kVaultSaltBytes{ 32 };
constexpr std::size_t g_kVerifierSaltBytes{ 16 };
constexpr std::size_t g_kMinSaltBytes{ 8 };
constexpr std::size_t g_kDerivedKeyBytes{ 32 };
constexpr std::size_t g_kVerifierTagBytes{ 32 };

// Argon2 version v1.3 (0x13). Monocypher is hardcoded to this.
constexpr std::uint32_t g_kArgon2VersionV13{ 0x13 };

enum class KdfAlgorithm : std::uint32_t
{
    Argon2id = 1U,
};

struct Argon2idParams final
{
    std::uint32_t iterations;
    std::uint32_t memoryKiB;
    std::uint32_t parallelism;
};

constexpr Argon2idParams g_kArgon2idDefaultParams{ .iterations = 3U, .memoryKiB = 64U * 1024U, .parallelism = 1U };

[[nodiscard]] constexpr bool operator==(const Argon2idParams& a, const Argon2idParams& b) noexcept
{
    return a.iterations == b.iterations && a.memoryKiB == b.memoryKiB && a.parallelism == b.parallelism;
}

// Throws std::invalid_argument for zero, inconsistent or unsafe (DoS-sized) parameters.
void requireArgon2idParamsSafe(const Argon2idParams& params);

} // namespace passholder::crypto

#endif // INCLUDE_PASSHOLDER_CRYPTO_KDFPARAMS_HPP
