#include "passholder/core/VaultErrors.hpp"

namespace passholder::core
{

[[nodiscard]] std::string_view toString(VaultError error) noexcept
{
    switch (error)
    {
    case VaultError::Validation:
        return "Validation";
    case VaultError::AuthFailed:
        return "AuthFailed";
    case VaultError::NotFound:
        return "NotFound";
    case VaultError::AmbiguousMatch:
        return "AmbiguousMatch";
    case VaultError::Integrity:
        return "Integrity";
    case VaultError::Persistence:
        return "Persistence";
    case VaultError::InvalidState:
        return "InvalidState";
    case VaultError::RandomFailed:
        return "RandomFailed";
    case VaultError::StorageError:
        return "StorageError";
    case VaultError::UnsupportedKdfMetadata:
        return "UnsupportedKdfMetadata";
    case VaultError::ClipboardError:
        return "ClipboardError";
    }
    return "Unknown";
}

} // namespace passholder::core
