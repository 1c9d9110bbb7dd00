#include "AuditFileSink.hpp"
#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"
#include "SystemClipboard.hpp"

#include "passholder/core/VaultConfig.hpp"
#include "passholder/crypto/providers/NativeProviderFactory.hpp"
#include "passholder/storage/ScratchSpace.hpp"
#include "passholder/storage/file/FileVaultRepositoryFactory.hpp"
#include "passholder/storage/sqlite/SqliteRecordStoreFactory.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace
{

constexpr const char* g_kAuditLogName{ "audit.log" };

} // namespace

int main(int argc, char** argv)
{
    try
    {
        passholder::ui::cli::lockProcessMemory();
        passholder::storage::installScratchSignalHandlers();

        auto crypto{ passholder::crypto::providers::makeNativeCryptoProvider() };
        auto repository{ passholder::storage::file::makeFileVaultRepository() };
        passholder::ui::cli::SystemClipboard clipboard{};

        passholder::ui::cli::CommandLineIo io{ .out = std::cout,
                                               .err = std::cerr,
                                               .readPassword = passholder::ui::cli::readPassword,
                                               .confirm = passholder::ui::cli::confirm };

        passholder::ui::cli::CommandLine cli{
            *crypto,
            *repository,
            passholder::storage::sqlite::openSqliteRecordStore,
            clipboard,
            passholder::core::defaultVaultConfig(),
            io,
            [](const passholder::core::VaultConfig& config) {
                return passholder::ui::cli::makeAuditFileSink(config.vaultDir / g_kAuditLogName);
            },
            [&io](std::chrono::seconds delay) {
                if (!passholder::ui::cli::scheduleClipboardClear(delay))
                {
                    io.err << "warning: could not schedule clipboard clearing\n";
                }
            },
        };

        const std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
