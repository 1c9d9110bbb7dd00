#ifndef INCLUDE_PASSHOLDER_CRYPTO_VERIFIERFORMAT_HPP
#define INCLUDE_PASSHOLDER_CRYPTO_VERIFIERFORMAT_HPP

#include "passholder/crypto/KdfParams.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace passholder::crypto
{

// Decoded form of "$argon2id$v=19$m=<KiB>,t=<passes>,p=<lanes>$<salt>$<hash>".
struct VerifierRecord final
{
    Argon2idParams params{};
    std::vector<std::uint8_t> salt;
    std::vector<std::uint8_t> hash;
};

// Unpadded standard Base64, as used by PHC strings.
[[nodiscard]] std::string encodeBase64(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> decodeBase64(std::string_view text);

[[nodiscard]] std::string encodeVerifier(const Argon2idParams& params, std::span<const std::uint8_t> salt,
                                         std::span<const std::uint8_t> hash);

[[nodiscard]] std::optional<VerifierRecord> decodeVerifier(std::string_view verifier);

} // namespace passholder::crypto

#endif // INCLUDE_PASSHOLDER_CRYPTO_VERIFIERFORMAT_HPP
