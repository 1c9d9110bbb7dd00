#include "passholder/core/KdfPolicy.hpp"

#include <cstdint>

namespace passholder::core
{

[[nodiscard]] passholder::crypto::Argon2idParams defaultArgon2idParams() noexcept
{
    constexpr std::uint32_t kDefaultIterations{ 3U };
    constexpr std::uint32_t kDefaultMemoryMiB{ 64U };
    constexpr std::uint32_t kKiBPerMiB{ 1024U };
    constexpr std::uint32_t kDefaultParallelism{ 1U };

    return passholder::crypto::Argon2idParams{
        .iterations = kDefaultIterations,
        .memoryKiB = kDefaultMemoryMiB * kKiBPerMiB,
        .parallelism = kDefaultParallelism,
    };
}

[[nodiscard]] passholder::crypto::Argon2idParams defaultVerifierParams() noexcept
{
    constexpr std::uint32_t kVerifierParallelism{ 4U };

    auto params = defaultArgon2idParams();
    params.parallelism = kVerifierParallelism;
    return params;
}

} // namespace passholder::core
