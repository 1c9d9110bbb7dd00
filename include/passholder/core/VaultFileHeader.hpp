#ifndef INCLUDE_PASSHOLDER_CORE_VAULTFILEHEADER_HPP
#define INCLUDE_PASSHOLDER_CORE_VAULTFILEHEADER_HPP

#include "passholder/crypto/KdfParams.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace passholder::core
{

constexpr std::size_t g_vaultMagicBytes{ 8U };
constexpr std::uint32_t g_vaultFormatVersionV1{ 1U };
constexpr std::uint32_t g_vaultFormatVersionCurrent{ g_vaultFormatVersionV1 };

// magic || version || algorithm || iterations || memoryKiB || parallelism, all u32 little-endian.
constexpr std::size_t g_vaultFileHeaderBytes{ g_vaultMagicBytes + 5U * 4U };

// Plaintext prefix of the vault-file; also the AEAD associated data of the body.
struct VaultFileHeader final
{
    std::uint32_t formatVersion{ g_vaultFormatVersionCurrent };
    passholder::crypto::KdfAlgorithm algorithm{ passholder::crypto::KdfAlgorithm::Argon2id };
    passholder::crypto::Argon2idParams kdf{ passholder::crypto::g_kArgon2idDefaultParams };
};

[[nodiscard]] std::array<std::byte, g_vaultFileHeaderBytes> encodeVaultFileHeader(const VaultFileHeader& header) noexcept;

// Rejects short input, unknown magic, unknown version and unknown algorithm.
[[nodiscard]] std::optional<VaultFileHeader> decodeVaultFileHeader(std::span<const std::byte> bytes) noexcept;

} // namespace passholder::core

#endif // INCLUDE_PASSHOLDER_CORE_VAULTFILEHEADER_HPP
