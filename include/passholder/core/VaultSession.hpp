#ifndef INCLUDE_PASSHOLDER_CORE_VAULTSESSION_HPP
#define INCLUDE_PASSHOLDER_CORE_VAULTSESSION_HPP

#include "passholder/core/AuditLog.hpp"
#include "passholder/core/ClipboardBridge.hpp"
#include "passholder/core/VaultConfig.hpp"
#include "passholder/core/VaultErrors.hpp"
#include "passholder/core/VaultFileHeader.hpp"
#include "passholder/crypto/ICryptoProvider.hpp"
#include "passholder/security/SecureMemory.hpp"
#include "passholder/storage/IRecordStore.hpp"
#include "passholder/storage/IVaultRepository.hpp"
#include "passholder/storage/ScratchSpace.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace passholder::core
{

enum class SessionState : std::uint8_t
{
    Closed,
    Authenticating,
    Open,
    Persisting,
};

[[nodiscard]] std::string_view toString(SessionState state) noexcept;

struct ById final
{
    passholder::storage::RecordId id{};
};

struct ByServiceAndUsername final
{
    std::string service;
    std::string username;
};

struct ByService final
{
    std::string service;
};

using RecordSelector = std::variant<ById, ByServiceAndUsername, ByService>;

// One unlocked vault: key in memory, plaintext working copy in scratch space.
// Every mutation is re-encrypted and persisted before it returns.
class VaultSession final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using NowProvider = std::function<TimePoint()>;

    VaultSession(passholder::crypto::ICryptoProvider& crypto, passholder::storage::IVaultRepository& repository,
                 passholder::storage::RecordStoreOpener openStore, IClipboardBridge& clipboard, VaultConfig config,
                 AuditSink audit = {}, NowProvider nowProvider = Clock::now);

    VaultSession(const VaultSession&) = delete;
    VaultSession& operator=(const VaultSession&) = delete;
    VaultSession(VaultSession&&) = delete;
    VaultSession& operator=(VaultSession&&) = delete;
    ~VaultSession() noexcept;

    [[nodiscard]] static bool vaultExists(const VaultConfig& config) noexcept;

    // Creates the vault on first use, otherwise authenticates against it.
    [[nodiscard]] VaultResult<std::monostate> open(const passholder::security::SecureString& masterPassword) noexcept;

    [[nodiscard]] VaultResult<passholder::storage::RecordId> insert(const passholder::storage::NewRecord& record) noexcept;

    [[nodiscard]] VaultResult<std::vector<passholder::storage::SecretRecord>> queryAll() noexcept;
    [[nodiscard]] VaultResult<std::vector<passholder::storage::SecretRecord>>
    queryByService(std::string_view service) noexcept;
    [[nodiscard]] VaultResult<passholder::storage::SecretRecord> queryById(passholder::storage::RecordId id) noexcept;

    [[nodiscard]] VaultResult<passholder::storage::RecordSummary> deleteById(passholder::storage::RecordId id) noexcept;

    // Exactly one match, else NotFound or AmbiguousMatch with the candidates.
    [[nodiscard]] VaultResult<passholder::storage::SecretRecord> resolve(const RecordSelector& selector) noexcept;

    // Returns the confirmation message; the password is never part of it.
    [[nodiscard]] VaultResult<std::string> copyToClipboard(const RecordSelector& selector) noexcept;

    // Retries persistence after a failed write-through.
    [[nodiscard]] VaultResult<std::monostate> flush() noexcept;

    // Wipes the key, closes the store and purges scratch space. Idempotent.
    void close() noexcept;

    [[nodiscard]] SessionState state() const noexcept;
    [[nodiscard]] bool isSynced() const noexcept;

    void touch() noexcept;
    [[nodiscard]] bool isExpired() const noexcept;

private:
    void createVault(const passholder::security::SecureString& masterPassword, std::span<const std::uint8_t> key,
                     const VaultFileHeader& header);
    [[nodiscard]] VaultResult<std::monostate> persist() noexcept;
    [[nodiscard]] std::optional<VaultFailure> requireOpen() const;
    void releaseUnlocked() noexcept;
    void audit(AuditLevel level, std::string_view event, std::string_view outcome, std::string message) const noexcept;

    passholder::crypto::ICryptoProvider* m_crypto{ nullptr };
    passholder::storage::IVaultRepository* m_repository{ nullptr };
    passholder::storage::RecordStoreOpener m_openStore;
    IClipboardBridge* m_clipboard{ nullptr };
    VaultConfig m_config;
    passholder::storage::VaultLocation m_location;
    AuditSink m_audit;
    NowProvider m_now;
    TimePoint m_lastActivity{};

    SessionState m_state{ SessionState::Closed };
    bool m_synced{ true };
    VaultFileHeader m_header{};
    passholder::security::SecureBuffer m_key;
    std::unique_ptr<passholder::storage::ScratchSpace> m_scratch;
    std::unique_ptr<passholder::storage::IRecordStore> m_store;
};

} // namespace passholder::core

#endif // INCLUDE_PASSHOLDER_CORE_VAULTSESSION_HPP
