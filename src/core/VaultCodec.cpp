#include "passholder/core/VaultCodec.hpp"

#include "passholder/core/VaultErrors.hpp"
#include <algorithm>
#include <utility>

namespace passholder::core
{

VaultCodec::VaultCodec(passholder::crypto::ICryptoProvider& crypto) noexcept : m_crypto{ &crypto }
{
}

std::vector<std::uint8_t> VaultCodec::encrypt(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                              std::span<const std::byte> associatedData) const
{
    const auto box = m_crypto->aeadEncrypt(key, plainText, associatedData);

    std::vector<std::uint8_t> out{};
    out.reserve(box.nonce.size() + box.cipherText.size() + box.tag.size());
    out.insert(out.end(), box.nonce.begin(), box.nonce.end());
    out.insert(out.end(), box.cipherText.begin(), box.cipherText.end());
    out.insert(out.end(), box.tag.begin(), box.tag.end());
    return out;
}

passholder::security::SecureBuffer VaultCodec::decrypt(std::span<const std::uint8_t> key,
                                                       std::span<const std::uint8_t> sealed,
                                                       std::span<const std::byte> associatedData) const
{
    if (sealed.size() < g_vaultCodecOverheadBytes)
    {
        throw IntegrityError("vault ciphertext is truncated");
    }
    if (key.size() != passholder::crypto::g_aeadKeyBytes)
    {
        throw IntegrityError("vault key has the wrong size");
    }

    passholder::crypto::AeadBox box{};
    const auto nonce = sealed.first(passholder::crypto::g_aeadNonceBytes);
    const auto tag = sealed.last(passholder::crypto::g_aeadTagBytes);
    const auto body = sealed.subspan(nonce.size(), sealed.size() - nonce.size() - tag.size());
    std::copy(nonce.begin(), nonce.end(), box.nonce.begin());
    std::copy(tag.begin(), tag.end(), box.tag.begin());
    box.cipherText.assign(body.begin(), body.end());

    auto plain = m_crypto->aeadDecrypt(key, box, associatedData);
    if (!plain)
    {
        throw IntegrityError("vault ciphertext failed authentication");
    }
    return std::move(*plain);
}

} // namespace passholder::core
