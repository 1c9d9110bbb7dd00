#include "passholder/core/VaultSession.hpp"

#include "passholder/core/VaultCodec.hpp"
#include "passholder/storage/StorageErrors.hpp"
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <type_traits>
#include <utility>

namespace passholder::core
{
namespace
{

constexpr std::string_view g_kInvalidMasterPassword{ "invalid master password" };

[[nodiscard]] VaultFailure failure(VaultError code, std::string message)
{
    return VaultFailure{ .code = code, .message = std::move(message) };
}

[[nodiscard]] std::string describe(std::string_view service, std::string_view username)
{
    std::string out{ "'" };
    out.append(service);
    out.append("'");
    if (!username.empty())
    {
        out.append(" (");
        out.append(username);
        out.append(")");
    }
    return out;
}

[[nodiscard]] std::vector<std::uint8_t> withHeader(const VaultFileHeader& header, std::span<const std::uint8_t> sealed)
{
    const auto headerBytes = encodeVaultFileHeader(header);
    std::vector<std::uint8_t> out{};
    out.reserve(headerBytes.size() + sealed.size());
    for (const std::byte b : headerBytes)
    {
        out.push_back(std::to_integer<std::uint8_t>(b));
    }
    out.insert(out.end(), sealed.begin(), sealed.end());
    return out;
}

// Persistent failures thrown below the session, mapped to stable codes.
[[nodiscard]] VaultFailure failureFromException(const std::exception& e)
{
    if (dynamic_cast<const passholder::storage::ValidationError*>(&e) != nullptr)
    {
        return failure(VaultError::Validation, e.what());
    }
    if (dynamic_cast<const passholder::storage::RecordNotFound*>(&e) != nullptr ||
        dynamic_cast<const passholder::storage::VaultNotFound*>(&e) != nullptr)
    {
        return failure(VaultError::NotFound, e.what());
    }
    if (dynamic_cast<const IntegrityError*>(&e) != nullptr)
    {
        return failure(VaultError::Integrity, e.what());
    }
    return failure(VaultError::StorageError, e.what());
}

} // namespace

[[nodiscard]] std::string_view toString(SessionState state) noexcept
{
    switch (state)
    {
    case SessionState::Closed:
        return "Closed";
    case SessionState::Authenticating:
        return "Authenticating";
    case SessionState::Open:
        return "Open";
    case SessionState::Persisting:
        return "Persisting";
    }
    return "Unknown";
}

VaultSession::VaultSession(passholder::crypto::ICryptoProvider& crypto, passholder::storage::IVaultRepository& repository,
                           passholder::storage::RecordStoreOpener openStore, IClipboardBridge& clipboard,
                           VaultConfig config, AuditSink audit, NowProvider nowProvider)
    : m_crypto{ &crypto }, m_repository{ &repository }, m_openStore{ std::move(openStore) }, m_clipboard{ &clipboard },
      m_config{ std::move(config) }, m_location{ m_config.location() }, m_audit{ std::move(audit) },
      m_now{ std::move(nowProvider) }
{
    if (m_config.scratchRoot.empty())
    {
        m_config.scratchRoot = passholder::storage::defaultScratchRoot();
    }
    m_lastActivity = m_now();
}

VaultSession::~VaultSession() noexcept
{
    close();
}

bool VaultSession::vaultExists(const VaultConfig& config) noexcept
{
    std::error_code ec{};
    return std::filesystem::is_regular_file(config.location().vaultPath(), ec);
}

VaultResult<std::monostate> VaultSession::open(const passholder::security::SecureString& masterPassword) noexcept
{
    if (m_state != SessionState::Closed)
    {
        return failure(VaultError::InvalidState, "vault is already open");
    }
    if (masterPassword.empty())
    {
        return failure(VaultError::Validation, "master password must not be empty");
    }

    m_state = SessionState::Authenticating;
    const auto password = passholder::security::asBytes(masterPassword);
    bool firstRun{ false };

    try
    {
        const auto salt = m_repository->loadOrCreateSalt(m_location);
        firstRun = !m_repository->vaultExists(m_location);

        std::vector<std::uint8_t> stored{};
        VaultFileHeader header{};
        if (firstRun)
        {
            header.kdf = m_config.kdf;
        }
        else
        {
            stored = m_repository->loadVault(m_location);
            const auto decoded = decodeVaultFileHeader(std::as_bytes(std::span<const std::uint8_t>{ stored }));
            if (!decoded)
            {
                m_state = SessionState::Closed;
                audit(AuditLevel::Warning, "open", "failure", "unrecognized vault-file header");
                return failure(VaultError::AuthFailed, std::string{ g_kInvalidMasterPassword });
            }
            header = *decoded;
        }

        try
        {
            passholder::crypto::requireArgon2idParamsSafe(header.kdf);
        }
        catch (const std::invalid_argument& e)
        {
            m_state = SessionState::Closed;
            if (!firstRun)
            {
                // A damaged header reads the same as a wrong password.
                audit(AuditLevel::Warning, "open", "failure", std::string{ "vault-file header rejected: " } + e.what());
                return failure(VaultError::AuthFailed, std::string{ g_kInvalidMasterPassword });
            }
            audit(AuditLevel::Error, "open", "failure", e.what());
            return failure(VaultError::UnsupportedKdfMetadata, e.what());
        }

        auto key = m_crypto->deriveKey(password, std::as_bytes(std::span<const std::uint8_t>{ salt }), header.kdf);
        auto wipeKeyOnExit = passholder::security::scopeWipe(key);

        if (firstRun)
        {
            createVault(masterPassword, key, header);
            stored = m_repository->loadVault(m_location);
        }

        const auto headerBytes = encodeVaultFileHeader(header);
        const VaultCodec codec{ *m_crypto };
        passholder::security::SecureBuffer plain{};
        try
        {
            plain = codec.decrypt(key, std::span<const std::uint8_t>{ stored }.subspan(g_vaultFileHeaderBytes),
                                  headerBytes);
        }
        catch (const IntegrityError&)
        {
            m_state = SessionState::Closed;
            audit(AuditLevel::Warning, "open", "failure", "vault-file failed authentication");
            return failure(VaultError::AuthFailed, std::string{ g_kInvalidMasterPassword });
        }

        auto scratch = std::make_unique<passholder::storage::ScratchSpace>(m_config.scratchRoot);
        scratch->materialize(std::span<const std::uint8_t>{ plain });
        passholder::security::secureRelease(plain);

        auto store = m_openStore(scratch->workingCopyPath());
        const auto verifier = store->loadVerifier();
        bool verified{ false };
        if (verifier)
        {
            try
            {
                verified = m_crypto->verifyPassword(*verifier, password);
            }
            catch (const std::invalid_argument&)
            {
                verified = false;
            }
        }
        if (!verified)
        {
            store.reset();
            scratch->discard();
            m_state = SessionState::Closed;
            audit(AuditLevel::Warning, "open", "failure", "master password verification failed");
            return failure(VaultError::AuthFailed, std::string{ g_kInvalidMasterPassword });
        }

        wipeKeyOnExit.release();
        m_key = std::move(key);
        m_header = header;
        m_scratch = std::move(scratch);
        m_store = std::move(store);
        m_synced = true;
        m_state = SessionState::Open;
        touch();
        audit(AuditLevel::Info, "open", "success", firstRun ? "vault created and opened" : "vault opened");
        return std::monostate{};
    }
    catch (const passholder::storage::MissingSalt& e)
    {
        m_state = SessionState::Closed;
        audit(AuditLevel::Error, "open", "failure", e.what());
        return failure(VaultError::StorageError, e.what());
    }
    catch (const std::invalid_argument& e)
    {
        m_state = SessionState::Closed;
        audit(AuditLevel::Error, "open", "failure", e.what());
        if (!firstRun)
        {
            return failure(VaultError::AuthFailed, std::string{ g_kInvalidMasterPassword });
        }
        return failure(VaultError::UnsupportedKdfMetadata, e.what());
    }
    catch (const std::exception& e)
    {
        m_state = SessionState::Closed;
        audit(AuditLevel::Error, "open", "failure", e.what());
        return failureFromException(e);
    }
}

void VaultSession::createVault(const passholder::security::SecureString& masterPassword,
                               std::span<const std::uint8_t> key, const VaultFileHeader& header)
{
    passholder::storage::ScratchSpace scratch{ m_config.scratchRoot };
    auto store = m_openStore(scratch.workingCopyPath());

    store->storeVerifier(
        m_crypto->hashForVerification(passholder::security::asBytes(masterPassword), m_config.verifier));
    auto image = store->snapshot();
    auto wipeImage = passholder::security::scopeWipe(image);
    store.reset();

    const auto headerBytes = encodeVaultFileHeader(header);
    const VaultCodec codec{ *m_crypto };
    const auto sealed = codec.encrypt(key, passholder::security::asBytes(image), headerBytes);
    m_repository->storeVaultAtomic(m_location, withHeader(header, sealed));
    scratch.discard();

    audit(AuditLevel::Info, "create", "success", "new vault written to " + m_location.vaultPath().string());
}

VaultResult<std::monostate> VaultSession::persist() noexcept
{
    m_state = SessionState::Persisting;
    try
    {
        auto image = m_store->snapshot();
        auto wipeImage = passholder::security::scopeWipe(image);

        const auto headerBytes = encodeVaultFileHeader(m_header);
        const VaultCodec codec{ *m_crypto };
        const auto sealed = codec.encrypt(m_key, passholder::security::asBytes(image), headerBytes);
        m_repository->storeVaultAtomic(m_location, withHeader(m_header, sealed));

        m_synced = true;
        m_state = SessionState::Open;
        return std::monostate{};
    }
    catch (const std::exception& e)
    {
        m_synced = false;
        m_state = SessionState::Open;
        audit(AuditLevel::Error, "persist", "failure", e.what());
        return failure(VaultError::Persistence, std::string{ "failed to persist vault: " } + e.what());
    }
}

std::optional<VaultFailure> VaultSession::requireOpen() const
{
    if (m_state != SessionState::Open || !m_store)
    {
        return failure(VaultError::InvalidState, "vault is locked");
    }
    return std::nullopt;
}

VaultResult<passholder::storage::RecordId> VaultSession::insert(const passholder::storage::NewRecord& record) noexcept
{
    try
    {
        if (auto locked = requireOpen())
        {
            return std::move(*locked);
        }
        touch();

        if (record.service.empty())
        {
            return failure(VaultError::Validation, "service must not be empty");
        }
        if (record.password.empty())
        {
            return failure(VaultError::Validation, "password must not be empty");
        }

        const auto id = m_store->insert(record);
        if (auto persisted = persist(); !succeeded(persisted))
        {
            return std::get<VaultFailure>(std::move(persisted));
        }
        audit(AuditLevel::Info, "insert", "success",
              "added record " + std::to_string(id) + " for " + describe(record.service, record.username));
        return id;
    }
    catch (const std::exception& e)
    {
        return failureFromException(e);
    }
}

VaultResult<std::vector<passholder::storage::SecretRecord>> VaultSession::queryAll() noexcept
{
    try
    {
        if (auto locked = requireOpen())
        {
            return std::move(*locked);
        }
        touch();
        return m_store->queryAll();
    }
    catch (const std::exception& e)
    {
        return failureFromException(e);
    }
}

VaultResult<std::vector<passholder::storage::SecretRecord>> VaultSession::queryByService(std::string_view service) noexcept
{
    try
    {
        if (auto locked = requireOpen())
        {
            return std::move(*locked);
        }
        touch();
        return m_store->queryByService(service);
    }
    catch (const std::exception& e)
    {
        return failureFromException(e);
    }
}

VaultResult<passholder::storage::SecretRecord> VaultSession::queryById(passholder::storage::RecordId id) noexcept
{
    try
    {
        if (auto locked = requireOpen())
        {
            return std::move(*locked);
        }
        touch();
        auto found = m_store->queryById(id);
        if (!found)
        {
            return failure(VaultError::NotFound, "no record with id " + std::to_string(id));
        }
        return std::move(*found);
    }
    catch (const std::exception& e)
    {
        return failureFromException(e);
    }
}

VaultResult<passholder::storage::RecordSummary> VaultSession::deleteById(passholder::storage::RecordId id) noexcept
{
    try
    {
        if (auto locked = requireOpen())
        {
            return std::move(*locked);
        }
        touch();

        auto removed = m_store->deleteById(id);
        if (auto persisted = persist(); !succeeded(persisted))
        {
            return std::get<VaultFailure>(std::move(persisted));
        }
        audit(AuditLevel::Info, "delete", "success",
              "deleted record " + std::to_string(id) + " for " + describe(removed.service, removed.username));
        return removed;
    }
    catch (const std::exception& e)
    {
        return failureFromException(e);
    }
}

VaultResult<passholder::storage::SecretRecord> VaultSession::resolve(const RecordSelector& selector) noexcept
{
    try
    {
        if (auto locked = requireOpen())
        {
            return std::move(*locked);
        }
        touch();

        if (const auto* byId = std::get_if<ById>(&selector))
        {
            auto found = m_store->queryById(byId->id);
            if (!found)
            {
                return failure(VaultError::NotFound, "no record with id " + std::to_string(byId->id));
            }
            return std::move(*found);
        }

        std::vector<passholder::storage::SecretRecord> matches{};
        std::string what{};
        if (const auto* byUser = std::get_if<ByServiceAndUsername>(&selector))
        {
            matches = m_store->queryByServiceAndUsername(byUser->service, byUser->username);
            what = "'" + byUser->service + "' with username '" + byUser->username + "'";
        }
        else
        {
            const auto& byService = std::get<ByService>(selector);
            matches = m_store->queryByService(byService.service);
            what = "'" + byService.service + "'";
        }

        if (matches.empty())
        {
            return failure(VaultError::NotFound, "no record found for " + what);
        }
        if (matches.size() > 1U)
        {
            VaultFailure ambiguous = failure(VaultError::AmbiguousMatch, "multiple records found for " + what);
            ambiguous.candidates.reserve(matches.size());
            for (const auto& m : matches)
            {
                ambiguous.candidates.push_back(passholder::storage::summarize(m));
            }
            return ambiguous;
        }
        return std::move(matches.front());
    }
    catch (const std::exception& e)
    {
        return failureFromException(e);
    }
}

VaultResult<std::string> VaultSession::copyToClipboard(const RecordSelector& selector) noexcept
{
    auto resolved = resolve(selector);
    if (!succeeded(resolved))
    {
        return std::get<VaultFailure>(std::move(resolved));
    }

    auto& record = std::get<passholder::storage::SecretRecord>(resolved);
    auto wipePassword = passholder::security::scopeWipe(record.password);
    try
    {
        if (!m_clipboard->setText(passholder::security::asStringView(record.password)))
        {
            audit(AuditLevel::Warning, "copy", "failure", "clipboard refused the text");
            return failure(VaultError::ClipboardError, "clipboard is unavailable");
        }
        audit(AuditLevel::Info, "copy", "success", "copied record " + std::to_string(record.id));
        return "Copied password for " + describe(record.service, record.username) + " to clipboard";
    }
    catch (const std::exception& e)
    {
        return failure(VaultError::ClipboardError, e.what());
    }
}

VaultResult<std::monostate> VaultSession::flush() noexcept
{
    if (auto locked = requireOpen())
    {
        return std::move(*locked);
    }
    touch();
    return persist();
}

void VaultSession::close() noexcept
{
    if (m_state == SessionState::Closed && !m_store && !m_scratch && m_key.empty())
    {
        return;
    }
    const bool wasSynced{ m_synced };
    releaseUnlocked();
    m_state = SessionState::Closed;
    audit(wasSynced ? AuditLevel::Info : AuditLevel::Warning, "close", wasSynced ? "success" : "unsynced",
          wasSynced ? "vault closed" : "vault closed with unpersisted changes");
}

void VaultSession::releaseUnlocked() noexcept
{
    m_store.reset();
    if (m_scratch)
    {
        m_scratch->discard();
        m_scratch.reset();
    }
    passholder::security::secureRelease(m_key);
    m_header = {};
    m_synced = true;
}

SessionState VaultSession::state() const noexcept
{
    return m_state;
}

bool VaultSession::isSynced() const noexcept
{
    return m_synced;
}

void VaultSession::touch() noexcept
{
    m_lastActivity = m_now();
}

bool VaultSession::isExpired() const noexcept
{
    if (m_state == SessionState::Closed || m_config.idleTimeout.count() <= 0)
    {
        return false;
    }
    return (m_now() - m_lastActivity) > m_config.idleTimeout;
}

void VaultSession::audit(AuditLevel level, std::string_view event, std::string_view outcome,
                         std::string message) const noexcept
{
    if (!m_audit)
    {
        return;
    }
    try
    {
        m_audit(AuditEvent{
            .level = level, .event = std::string{ event }, .outcome = std::string{ outcome }, .message = std::move(message) });
    }
    catch (const std::exception&)
    {
        // An audit sink that throws must not change the outcome of a vault operation.
        return;
    }
}

} // namespace passholder::core
