#include "CommandLine.hpp"

#include <CLI/CLI.hpp>
#include <iomanip>
#include <ostream>
#include <utility>
#include <variant>

namespace passholder::ui::cli
{
namespace
{

constexpr int g_kExitOk{ 0 };
constexpr int g_kExitFailure{ 1 };

[[nodiscard]] std::string describe(const std::string& service, const std::string& username)
{
    std::string out{ "'" + service + "'" };
    if (!username.empty())
    {
        out += " (" + username + ")";
    }
    return out;
}

} // namespace

CommandLine::CommandLine(passholder::crypto::ICryptoProvider& crypto, passholder::storage::IVaultRepository& repository,
                         passholder::storage::RecordStoreOpener openStore, passholder::core::IClipboardBridge& clipboard,
                         passholder::core::VaultConfig baseConfig, CommandLineIo io, AuditSinkFactory auditFactory,
                         ClearScheduler scheduleClear)
    : m_crypto(crypto), m_repository(repository), m_openStore(std::move(openStore)), m_clipboard(clipboard),
      m_baseConfig(std::move(baseConfig)), m_io(std::move(io)), m_auditFactory(std::move(auditFactory)),
      m_scheduleClear(std::move(scheduleClear))
{
}

int CommandLine::run(const std::vector<std::string>& args)
{
    std::vector<std::string> argvStore{};
    argvStore.reserve(args.size() + 1U);
    argvStore.emplace_back("passholder");
    argvStore.insert(argvStore.end(), args.begin(), args.end());

    CLI::App app{ "passholder: local encrypted password store" };
    app.require_subcommand(1);

    Options opts{};
    std::function<int(passholder::core::VaultSession&)> action{};

    app.add_option("--vault-dir", opts.vaultDir, "Vault directory (default: $PASSHOLDER_HOME or ~/passholder)");

    // ADD
    auto* subAdd = app.add_subcommand("add", "Add a new password");
    subAdd->add_option("service", opts.service, "Service name")->required();
    subAdd->add_option("-u,--username", opts.username, "Username");
    subAdd->add_option("-p,--password", opts.password, "Password (prompted when omitted)");
    subAdd->add_option("-n,--notes", opts.notes, "Notes");
    subAdd->callback([&]() { action = [&](passholder::core::VaultSession& s) { return doAdd(s, opts); }; });

    // LIST
    app.add_subcommand("list", "List all stored entries without passwords")->callback([&]() {
        action = [&](passholder::core::VaultSession& s) { return doList(s); };
    });

    // GET
    auto* subGet = app.add_subcommand("get", "Show a password");
    subGet->add_option("service", opts.service, "Service name");
    subGet->add_option("-u,--username", opts.username, "Username");
    subGet->add_option("--id", opts.id, "Entry id");
    subGet->callback([&]() { action = [&](passholder::core::VaultSession& s) { return doGet(s, opts); }; });

    // COPY
    auto* subCopy = app.add_subcommand("copy", "Copy a password to the clipboard");
    subCopy->add_option("service", opts.service, "Service name");
    subCopy->add_option("-u,--username", opts.username, "Username");
    subCopy->add_option("--id", opts.id, "Entry id");
    subCopy->add_option("--clear-after", opts.clearAfter, "Seconds until the clipboard is cleared (0 keeps it)")
        ->check(CLI::NonNegativeNumber);
    subCopy->callback([&]() { action = [&](passholder::core::VaultSession& s) { return doCopy(s, opts); }; });

    // DELETE
    auto* subDelete = app.add_subcommand("delete", "Delete an entry");
    subDelete->add_option("service", opts.service, "Service name");
    subDelete->add_option("-u,--username", opts.username, "Username");
    subDelete->add_option("--id", opts.id, "Entry id");
    subDelete->add_flag("-y,--yes", opts.yes, "Do not ask for confirmation");
    subDelete->callback([&]() { action = [&](passholder::core::VaultSession& s) { return doDelete(s, opts); }; });

    // SEARCH
    auto* subSearch = app.add_subcommand("search", "List entries of one service");
    subSearch->add_option("service", opts.service, "Service name")->required();
    subSearch->callback([&]() { action = [&](passholder::core::VaultSession& s) { return doSearch(s, opts); }; });

    try
    {
        std::vector<char*> argv;
        argv.reserve(argvStore.size());
        for (auto& arg : argvStore)
        {
            argv.push_back(arg.data());
        }
        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e, m_io.out, m_io.err);
    }

    if (!action)
    {
        m_io.err << "error: no command given\n";
        return g_kExitFailure;
    }

    passholder::core::VaultConfig config{ m_baseConfig };
    if (!opts.vaultDir.empty())
    {
        config.vaultDir = opts.vaultDir;
    }
    if (opts.clearAfter < 0)
    {
        opts.clearAfter = static_cast<int>(config.clipboardClearAfter.count());
    }
    const bool exists{ passholder::core::VaultSession::vaultExists(config) };

    passholder::core::VaultSession session{ m_crypto, m_repository, m_openStore, m_clipboard, config,
                                            m_auditFactory ? m_auditFactory(config) : passholder::core::AuditSink{} };

    m_pendingClear = std::chrono::seconds{ 0 };
    int rc{ g_kExitFailure };
    if (unlock(session, exists, config))
    {
        rc = action(session);
    }
    session.close();
    passholder::security::secureWipe(opts.password);

    // Forked only once the key and the working copy are gone.
    if (m_pendingClear.count() > 0 && m_scheduleClear)
    {
        m_scheduleClear(m_pendingClear);
    }
    return rc;
}

bool CommandLine::unlock(passholder::core::VaultSession& session, bool exists,
                         const passholder::core::VaultConfig& config)
{
    passholder::security::SecureString password{};
    auto wipePassword = passholder::security::scopeWipe(password);

    if (!exists)
    {
        m_io.out << "No vault found at " << config.vaultDir.string() << ". Creating a new vault.\n";
        password = m_io.readPassword("New master password: ");
        auto repeated = m_io.readPassword("Confirm master password: ");
        auto wipeRepeated = passholder::security::scopeWipe(repeated);
        if (passholder::security::asStringView(password) != passholder::security::asStringView(repeated))
        {
            m_io.err << "error: passwords do not match\n";
            return false;
        }
    }
    else
    {
        password = m_io.readPassword("Master password: ");
    }

    const auto opened = session.open(password);
    if (!passholder::core::succeeded(opened))
    {
        (void)reportFailure(std::get<passholder::core::VaultFailure>(opened));
        return false;
    }
    return true;
}

passholder::core::RecordSelector CommandLine::selectorFrom(const Options& opts) const
{
    if (opts.id > 0)
    {
        return passholder::core::ById{ .id = opts.id };
    }
    if (!opts.username.empty())
    {
        return passholder::core::ByServiceAndUsername{ .service = opts.service, .username = opts.username };
    }
    return passholder::core::ByService{ .service = opts.service };
}

int CommandLine::reportFailure(const passholder::core::VaultFailure& failure)
{
    m_io.err << "error: " << failure.message << "\n";
    if (failure.code == passholder::core::VaultError::AmbiguousMatch)
    {
        printTable(failure.candidates);
        m_io.out << "Multiple entries match; rerun with --id <ID> to pick one.\n";
    }
    return g_kExitFailure;
}

void CommandLine::printTable(const std::vector<passholder::storage::RecordSummary>& rows)
{
    m_io.out << std::left << std::setw(6) << "ID" << std::setw(24) << "Service" << std::setw(24) << "Username"
             << "Notes\n";
    for (const auto& row : rows)
    {
        m_io.out << std::left << std::setw(6) << row.id << std::setw(24) << row.service << std::setw(24)
                 << (row.username.empty() ? "-" : row.username) << row.notes << "\n";
    }
}

int CommandLine::doAdd(passholder::core::VaultSession& session, const Options& opts)
{
    passholder::storage::NewRecord record{};
    record.service = opts.service;
    record.username = opts.username;
    record.notes = opts.notes;
    record.password = opts.password.empty() ? m_io.readPassword("Password for '" + opts.service + "': ")
                                            : passholder::security::secureStringFrom(opts.password);
    auto wipePassword = passholder::security::scopeWipe(record.password);

    const auto inserted = session.insert(record);
    if (!passholder::core::succeeded(inserted))
    {
        return reportFailure(std::get<passholder::core::VaultFailure>(inserted));
    }
    m_io.out << "Added password for " << describe(opts.service, opts.username) << " with id "
             << std::get<passholder::storage::RecordId>(inserted) << "\n";
    return g_kExitOk;
}

int CommandLine::doList(passholder::core::VaultSession& session)
{
    const auto all = session.queryAll();
    if (!passholder::core::succeeded(all))
    {
        return reportFailure(std::get<passholder::core::VaultFailure>(all));
    }

    const auto& records = std::get<std::vector<passholder::storage::SecretRecord>>(all);
    if (records.empty())
    {
        m_io.out << "No passwords stored.\n";
        return g_kExitOk;
    }

    std::vector<passholder::storage::RecordSummary> rows{};
    rows.reserve(records.size());
    for (const auto& r : records)
    {
        rows.push_back(passholder::storage::summarize(r));
    }
    printTable(rows);
    return g_kExitOk;
}

int CommandLine::doGet(passholder::core::VaultSession& session, const Options& opts)
{
    if (opts.id <= 0 && opts.service.empty())
    {
        m_io.err << "error: give a service or --id\n";
        return g_kExitFailure;
    }

    auto resolved = session.resolve(selectorFrom(opts));
    if (!passholder::core::succeeded(resolved))
    {
        return reportFailure(std::get<passholder::core::VaultFailure>(resolved));
    }

    auto& record = std::get<passholder::storage::SecretRecord>(resolved);
    auto wipePassword = passholder::security::scopeWipe(record.password);
    m_io.out << "Password for " << describe(record.service, record.username) << ": "
             << passholder::security::asStringView(record.password) << "\n";
    return g_kExitOk;
}

int CommandLine::doCopy(passholder::core::VaultSession& session, const Options& opts)
{
    if (opts.id <= 0 && opts.service.empty())
    {
        m_io.err << "error: give a service or --id\n";
        return g_kExitFailure;
    }

    const auto copied = session.copyToClipboard(selectorFrom(opts));
    if (!passholder::core::succeeded(copied))
    {
        return reportFailure(std::get<passholder::core::VaultFailure>(copied));
    }
    m_io.out << std::get<std::string>(copied) << "\n";

    if (opts.clearAfter > 0 && m_scheduleClear)
    {
        m_pendingClear = std::chrono::seconds{ opts.clearAfter };
        m_io.out << "Clipboard will be cleared in " << opts.clearAfter << " seconds.\n";
    }
    return g_kExitOk;
}

int CommandLine::doDelete(passholder::core::VaultSession& session, const Options& opts)
{
    if (opts.id <= 0 && opts.service.empty())
    {
        m_io.err << "error: give a service or --id\n";
        return g_kExitFailure;
    }

    const auto resolved = session.resolve(selectorFrom(opts));
    if (!passholder::core::succeeded(resolved))
    {
        return reportFailure(std::get<passholder::core::VaultFailure>(resolved));
    }
    const auto summary = passholder::storage::summarize(std::get<passholder::storage::SecretRecord>(resolved));

    if (!opts.yes && !m_io.confirm("Delete password ID " + std::to_string(summary.id) + " for " +
                                   describe(summary.service, summary.username) + "?"))
    {
        m_io.out << "Deletion cancelled.\n";
        return g_kExitOk;
    }

    const auto removed = session.deleteById(summary.id);
    if (!passholder::core::succeeded(removed))
    {
        return reportFailure(std::get<passholder::core::VaultFailure>(removed));
    }
    const auto& gone = std::get<passholder::storage::RecordSummary>(removed);
    m_io.out << "Deleted password for " << describe(gone.service, gone.username) << "\n";
    return g_kExitOk;
}

int CommandLine::doSearch(passholder::core::VaultSession& session, const Options& opts)
{
    const auto found = session.queryByService(opts.service);
    if (!passholder::core::succeeded(found))
    {
        return reportFailure(std::get<passholder::core::VaultFailure>(found));
    }

    const auto& records = std::get<std::vector<passholder::storage::SecretRecord>>(found);
    if (records.empty())
    {
        m_io.out << "No passwords found matching '" << opts.service << "'.\n";
        return g_kExitOk;
    }

    std::vector<passholder::storage::RecordSummary> rows{};
    rows.reserve(records.size());
    for (const auto& r : records)
    {
        rows.push_back(passholder::storage::summarize(r));
    }
    printTable(rows);
    return g_kExitOk;
}

} // namespace passholder::ui::cli
