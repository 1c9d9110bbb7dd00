#include "passholder/core/VaultFileHeader.hpp"

#include "LittleEndian.hpp"
#include <algorithm>
#include <cstddef>
#include <span>

namespace passholder::core
{
namespace
{

constexpr std::array<std::byte, g_vaultMagicBytes> g_kMagic{
    static_cast<std::byte>('P'), static_cast<std::byte>('H'), static_cast<std::byte>('V'), static_cast<std::byte>('A'),
    static_cast<std::byte>('U'), static_cast<std::byte>('L'), static_cast<std::byte>('T'), static_cast<std::byte>('1'),
};

constexpr std::size_t g_kU32Bytes{ passholder::core::detail::g_kU32Bytes };

// Sequential u32 writer/reader over the fixed-size header.
class FieldCursor final
{
public:
    explicit FieldCursor(std::size_t offset) noexcept : m_offset{ offset }
    {
    }

    void put(std::span<std::byte> out, std::uint32_t v) noexcept
    {
        passholder::core::detail::writeU32LE(std::span<std::byte, g_kU32Bytes>{ out.data() + m_offset, g_kU32Bytes },
                                             v);
        m_offset += g_kU32Bytes;
    }

    [[nodiscard]] std::uint32_t take(std::span<const std::byte> in) noexcept
    {
        const std::uint32_t v{ passholder::core::detail::readU32LE(
            std::span<const std::byte, g_kU32Bytes>{ in.data() + m_offset, g_kU32Bytes }) };
        m_offset += g_kU32Bytes;
        return v;
    }

private:
    std::size_t m_offset;
};

} // namespace

[[nodiscard]] std::array<std::byte, g_vaultFileHeaderBytes> encodeVaultFileHeader(const VaultFileHeader& header) noexcept
{
    std::array<std::byte, g_vaultFileHeaderBytes> out{};
    std::copy(g_kMagic.begin(), g_kMagic.end(), out.begin());

    FieldCursor cursor{ g_kMagic.size() };
    cursor.put(out, header.formatVersion);
    cursor.put(out, static_cast<std::uint32_t>(header.algorithm));
    cursor.put(out, header.kdf.iterations);
    cursor.put(out, header.kdf.memoryKiB);
    cursor.put(out, header.kdf.parallelism);
    return out;
}

[[nodiscard]] std::optional<VaultFileHeader> decodeVaultFileHeader(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() < g_vaultFileHeaderBytes)
    {
        return std::nullopt;
    }
    if (!std::equal(g_kMagic.begin(), g_kMagic.end(), bytes.begin()))
    {
        return std::nullopt;
    }

    FieldCursor cursor{ g_kMagic.size() };
    VaultFileHeader header{};
    header.formatVersion = cursor.take(bytes);
    if (header.formatVersion != g_vaultFormatVersionV1)
    {
        return std::nullopt;
    }
    if (cursor.take(bytes) != static_cast<std::uint32_t>(passholder::crypto::KdfAlgorithm::Argon2id))
    {
        return std::nullopt;
    }
    header.algorithm = passholder::crypto::KdfAlgorithm::Argon2id;
    header.kdf.iterations = cursor.take(bytes);
    header.kdf.memoryKiB = cursor.take(bytes);
    header.kdf.parallelism = cursor.take(bytes);
    return header;
}

} // namespace passholder::core
