#ifndef PASSHOLDER_UI_CLI_COMMANDLINE_HPP
#define PASSHOLDER_UI_CLI_COMMANDLINE_HPP

#include "passholder/core/AuditLog.hpp"
#include "passholder/core/ClipboardBridge.hpp"
#include "passholder/core/VaultConfig.hpp"
#include "passholder/core/VaultSession.hpp"
#include "passholder/crypto/ICryptoProvider.hpp"
#include "passholder/security/SecureMemory.hpp"
#include "passholder/storage/IRecordStore.hpp"
#include "passholder/storage/IVaultRepository.hpp"

#include <chrono>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace passholder::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<passholder::security::SecureString(const std::string&)>;
using Confirmer = std::function<bool(const std::string&)>;
using AuditSinkFactory = std::function<passholder::core::AuditSink(const passholder::core::VaultConfig&)>;
using ClearScheduler = std::function<void(std::chrono::seconds)>;

struct CommandLineIo final
{
    std::ostream& out;
    std::ostream& err;
    PasswordReader readPassword;
    Confirmer confirm;
};

// One command per invocation: add, list, get, copy, delete, search.
class CommandLine final
{
public:
    CommandLine(passholder::crypto::ICryptoProvider& crypto, passholder::storage::IVaultRepository& repository,
                passholder::storage::RecordStoreOpener openStore, passholder::core::IClipboardBridge& clipboard,
                passholder::core::VaultConfig baseConfig, CommandLineIo io, AuditSinkFactory auditFactory = {},
                ClearScheduler scheduleClear = {});

    // `args` excludes the program name. Returns the process exit code.
    [[nodiscard]] int run(const std::vector<std::string>& args);

private:
    struct Options final
    {
        std::string vaultDir;
        std::string service;
        std::string username;
        std::string password;
        std::string notes;
        long long id{ 0 };
        bool yes{ false };
        int clearAfter{ -1 };
    };

    [[nodiscard]] bool unlock(passholder::core::VaultSession& session, bool exists,
                              const passholder::core::VaultConfig& config);
    [[nodiscard]] passholder::core::RecordSelector selectorFrom(const Options& opts) const;
    [[nodiscard]] int reportFailure(const passholder::core::VaultFailure& failure);
    void printTable(const std::vector<passholder::storage::RecordSummary>& rows);

    [[nodiscard]] int doAdd(passholder::core::VaultSession& session, const Options& opts);
    [[nodiscard]] int doList(passholder::core::VaultSession& session);
    [[nodiscard]] int doGet(passholder::core::VaultSession& session, const Options& opts);
    [[nodiscard]] int doCopy(passholder::core::VaultSession& session, const Options& opts);
    [[nodiscard]] int doDelete(passholder::core::VaultSession& session, const Options& opts);
    [[nodiscard]] int doSearch(passholder::core::VaultSession& session, const Options& opts);

    passholder::crypto::ICryptoProvider& m_crypto;
    passholder::storage::IVaultRepository& m_repository;
    passholder::storage::RecordStoreOpener m_openStore;
    passholder::core::IClipboardBridge& m_clipboard;
    passholder::core::VaultConfig m_baseConfig;
    CommandLineIo m_io;
    AuditSinkFactory m_auditFactory;
    ClearScheduler m_scheduleClear;
    std::chrono::seconds m_pendingClear{ 0 };
};

} // namespace passholder::ui::cli

#endif // PASSHOLDER_UI_CLI_COMMANDLINE_HPP
