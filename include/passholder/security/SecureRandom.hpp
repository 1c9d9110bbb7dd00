#ifndef INCLUDE_PASSHOLDER_SECURITY_SECURERANDOM_HPP
#define INCLUDE_PASSHOLDER_SECURITY_SECURERANDOM_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace passholder::security
{

// Fills `out` from the kernel CSPRNG. Returns false if the kernel could not satisfy the request.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Lowercase hex of `byteCount` random bytes; used for unpredictable file and directory names.
[[nodiscard]] std::optional<std::string> secureRandomHex(std::size_t byteCount);

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

} // namespace passholder::security

#endif // INCLUDE_PASSHOLDER_SECURITY_SECURERANDOM_HPP
