#include "passholder/crypto/KeyDerivation.hpp"

#include "passholder/crypto/VerifierFormat.hpp"
#include "passholder/security/SecureMemory.hpp"
#include "passholder/security/SecureRandom.hpp"
#include "monocypher.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace passholder::crypto
{
namespace
{

// Raw Argon2id over arbitrary salt; callers validate inputs.
void argon2idRaw(std::span<std::uint8_t> out, std::span<const std::byte> password, std::span<const std::byte> salt,
                 const Argon2idParams& params)
{
    constexpr std::size_t kU64WordsPerKiB{ 128U }; // 1024 / sizeof(uint64_t)
    if (params.memoryKiB > (std::numeric_limits<std::size_t>::max() / kU64WordsPerKiB))
    {
        throw std::bad_alloc{};
    }
    const std::size_t workWords{ static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerKiB };
    std::vector<std::uint64_t, passholder::security::ZeroAllocator<std::uint64_t>> workArea(workWords);

    const crypto_argon2_config cfg{ .algorithm = CRYPTO_ARGON2_ID,
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.iterations,
                                    .nb_lanes = params.parallelism };

    const crypto_argon2_inputs inputs{ .pass = reinterpret_cast<const std::uint8_t*>(password.data()),
                                       .salt = reinterpret_cast<const std::uint8_t*>(salt.data()),
                                       .pass_size = static_cast<std::uint32_t>(password.size()),
                                       .salt_size = static_cast<std::uint32_t>(salt.size()) };

    crypto_argon2(out.data(), static_cast<std::uint32_t>(out.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);
}

void requirePasswordUsable(std::span<const std::byte> password, const char* what)
{
    if (password.empty())
    {
        throw std::invalid_argument(what);
    }
    if (password.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("argon2id: password too large");
    }
}

} // namespace

[[nodiscard]] passholder::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> password,
                                                                  std::span<const std::byte> salt,
                                                                  Argon2idParams params)
{
    requirePasswordUsable(password, "deriveKeyArgon2id: empty password");
    if (salt.size() < g_kMinSaltBytes || salt.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveKeyArgon2id: invalid salt size");
    }
    requireArgon2idParamsSafe(params);

    passholder::security::SecureBuffer key{};
    key.resize(g_kDerivedKeyBytes);
    argon2idRaw(std::span<std::uint8_t>{ key }, password, salt, params);
    return key;
}

[[nodiscard]] passholder::security::SecureBuffer deriveKeyArgon2idDefault(std::span<const std::byte> password,
                                                                         std::span<const std::byte> salt)
{
    return deriveKeyArgon2id(password, salt, g_kArgon2idDefaultParams);
}

[[nodiscard]] std::string hashForVerification(std::span<const std::byte> password, Argon2idParams params)
{
    requirePasswordUsable(password, "hashForVerification: empty password");
    requireArgon2idParamsSafe(params);

    std::array<std::uint8_t, g_kVerifierSaltBytes> salt{};
    if (!passholder::security::secureRandomFill(std::span<std::uint8_t>{ salt }))
    {
        throw std::runtime_error("hashForVerification: CSPRNG failure");
    }

    std::array<std::uint8_t, g_kVerifierTagBytes> tag{};
    auto wipeTag = passholder::security::scopeWipe(std::span<std::uint8_t>{ tag });
    argon2idRaw(std::span<std::uint8_t>{ tag }, password, std::as_bytes(std::span<const std::uint8_t>{ salt }),
                params);

    return encodeVerifier(params, salt, tag);
}

[[nodiscard]] bool verifyPassword(std::string_view verifier, std::span<const std::byte> candidate)
{
    const auto record = decodeVerifier(verifier);
    if (!record)
    {
        throw std::invalid_argument("verifyPassword: malformed verifier");
    }
    if (candidate.empty())
    {
        return false;
    }
    requirePasswordUsable(candidate, "verifyPassword: empty password");
    requireArgon2idParamsSafe(record->params);

    std::vector<std::uint8_t, passholder::security::ZeroAllocator<std::uint8_t>> recomputed(record->hash.size());
    argon2idRaw(std::span<std::uint8_t>{ recomputed }, candidate,
                std::as_bytes(std::span<const std::uint8_t>{ record->salt }), record->params);

    return passholder::security::secureEquals(std::span<const std::uint8_t>{ recomputed },
                                              std::span<const std::uint8_t>{ record->hash });
}

} // namespace passholder::crypto
