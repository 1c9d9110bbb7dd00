#ifndef INCLUDE_PASSHOLDER_CORE_VAULTERRORS_HPP
#define INCLUDE_PASSHOLDER_CORE_VAULTERRORS_HPP

#include "passholder/storage/SecretRecord.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace passholder::core
{

enum class VaultError : std::uint8_t
{
    Validation,
    AuthFailed,
    NotFound,
    AmbiguousMatch,
    Integrity,
    Persistence,
    InvalidState,
    RandomFailed,
    StorageError,
    UnsupportedKdfMetadata,
    ClipboardError,
};

[[nodiscard]] std::string_view toString(VaultError error) noexcept;

struct VaultFailure final
{
    VaultError code{ VaultError::StorageError };
    std::string message;
    // Filled only for AmbiguousMatch.
    std::vector<passholder::storage::RecordSummary> candidates{};
};

template <class T> using VaultResult = std::variant<T, VaultFailure>;

template <class T> [[nodiscard]] bool succeeded(const VaultResult<T>& result) noexcept
{
    return std::holds_alternative<T>(result);
}

// Authenticated decryption failed: wrong key, wrong associated data, truncation or tampering.
class IntegrityError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace passholder::core

#endif // INCLUDE_PASSHOLDER_CORE_VAULTERRORS_HPP
