#include "passholder/core/VaultSession.hpp"
#include "passholder/crypto/providers/NativeProviderFactory.hpp"
#include "passholder/storage/StorageErrors.hpp"
#include "passholder/storage/file/FileVaultRepositoryFactory.hpp"
#include "passholder/storage/sqlite/SqliteRecordStoreFactory.hpp"
#include "test_utils/FakeClipboard.hpp"
#include "test_utils/TestUtils.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

namespace
{

using passholder::core::SessionState;
using passholder::core::VaultError;
using passholder::core::VaultFailure;
using passholder::security::secureStringFrom;

// Delegates to the real repository; writes fail while `failWrites` is set.
class FlakyRepository final : public passholder::storage::IVaultRepository
{
public:
    explicit FlakyRepository(passholder::storage::IVaultRepository& inner) : m_inner{ inner }
    {
    }

    [[nodiscard]] bool vaultExists(const passholder::storage::VaultLocation& loc) const override
    {
        return m_inner.vaultExists(loc);
    }

    [[nodiscard]] std::vector<std::uint8_t> loadOrCreateSalt(const passholder::storage::VaultLocation& loc) override
    {
        return m_inner.loadOrCreateSalt(loc);
    }

    [[nodiscard]] std::vector<std::uint8_t> loadVault(const passholder::storage::VaultLocation& loc) const override
    {
        return m_inner.loadVault(loc);
    }

    void storeVaultAtomic(const passholder::storage::VaultLocation& loc, std::span<const std::uint8_t> bytes) override
    {
        if (failWrites)
        {
            throw passholder::storage::StorageError{ "disk full" };
        }
        m_inner.storeVaultAtomic(loc, bytes);
        ++writes;
    }

    bool failWrites{ false };
    int writes{ 0 };

private:
    passholder::storage::IVaultRepository& m_inner;
};

// Every store open fails, as for a working copy SQLite cannot read.
[[nodiscard]] std::unique_ptr<passholder::storage::IRecordStore> failingOpener(const std::filesystem::path&)
{
    throw passholder::storage::StorageError{ "storage: sqlite3_open_v2 failed" };
}

class VaultSessionErrorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_root = passholder::test_utils::makeSecureTempDir("session_err_");
        ASSERT_FALSE(m_root.empty());
        m_config = passholder::test_utils::makeTestConfig(m_root);
        m_crypto = passholder::crypto::providers::makeNativeCryptoProvider();
        m_inner = passholder::storage::file::makeFileVaultRepository();
        m_repo = std::make_unique<FlakyRepository>(*m_inner);
    }

    void TearDown() override
    {
        std::error_code ec{};
        std::filesystem::remove_all(m_root, ec);
    }

    [[nodiscard]] std::unique_ptr<passholder::core::VaultSession>
    makeSession(passholder::storage::RecordStoreOpener opener = passholder::storage::sqlite::openSqliteRecordStore)
    {
        return std::make_unique<passholder::core::VaultSession>(*m_crypto, *m_repo, std::move(opener), m_clipboard,
                                                                m_config);
    }

    [[nodiscard]] static passholder::storage::NewRecord record(std::string service)
    {
        passholder::storage::NewRecord r{};
        r.service = std::move(service);
        r.password = secureStringFrom("pw");
        return r;
    }

    std::filesystem::path m_root;                                   // NOLINT
    passholder::core::VaultConfig m_config;                         // NOLINT
    std::unique_ptr<passholder::crypto::ICryptoProvider> m_crypto;  // NOLINT
    std::unique_ptr<passholder::storage::IVaultRepository> m_inner; // NOLINT
    std::unique_ptr<FlakyRepository> m_repo;                        // NOLINT
    passholder::test_utils::FakeClipboard m_clipboard;              // NOLINT
};

} // namespace

TEST_F(VaultSessionErrorTest, FailedPersistMarksSessionUnsynced)
{
    auto session = makeSession();
    ASSERT_TRUE(passholder::core::succeeded(session->open(secureStringFrom("Secr3t!"))));

    m_repo->failWrites = true;
    const auto inserted = session->insert(record("github"));
    ASSERT_FALSE(passholder::core::succeeded(inserted));
    const auto& failure = std::get<VaultFailure>(inserted);
    EXPECT_EQ(failure.code, VaultError::Persistence);
    EXPECT_EQ(failure.message, "failed to persist vault: disk full");
    EXPECT_FALSE(session->isSynced());
    EXPECT_EQ(session->state(), SessionState::Open);

    // The working copy still holds the record.
    const auto all = session->queryAll();
    ASSERT_TRUE(passholder::core::succeeded(all));
    EXPECT_EQ(std::get<std::vector<passholder::storage::SecretRecord>>(all).size(), 1U);
}

TEST_F(VaultSessionErrorTest, FlushRetriesPersistence)
{
    {
        auto session = makeSession();
        ASSERT_TRUE(passholder::core::succeeded(session->open(secureStringFrom("Secr3t!"))));

        m_repo->failWrites = true;
        (void)session->insert(record("github"));
        EXPECT_EQ(std::get<VaultFailure>(session->flush()).code, VaultError::Persistence);

        m_repo->failWrites = false;
        ASSERT_TRUE(passholder::core::succeeded(session->flush()));
        EXPECT_TRUE(session->isSynced());
    }

    auto session = makeSession();
    ASSERT_TRUE(passholder::core::succeeded(session->open(secureStringFrom("Secr3t!"))));
    const auto found = session->queryByService("github");
    ASSERT_TRUE(passholder::core::succeeded(found));
    EXPECT_EQ(std::get<std::vector<passholder::storage::SecretRecord>>(found).size(), 1U);
}

TEST_F(VaultSessionErrorTest, FailedFirstWriteLeavesNoVault)
{
    m_repo->failWrites = true;
    auto session = makeSession();
    const auto opened = session->open(secureStringFrom("Secr3t!"));
    ASSERT_FALSE(passholder::core::succeeded(opened));
    EXPECT_EQ(std::get<VaultFailure>(opened).code, VaultError::StorageError);
    EXPECT_EQ(session->state(), SessionState::Closed);
    EXPECT_FALSE(passholder::core::VaultSession::vaultExists(m_config));
    EXPECT_TRUE(std::filesystem::is_empty(m_config.scratchRoot));
}

TEST_F(VaultSessionErrorTest, StoreOpenFailureIsStorageError)
{
    {
        auto session = makeSession();
        ASSERT_TRUE(passholder::core::succeeded(session->open(secureStringFrom("Secr3t!"))));
    }

    auto session = makeSession(failingOpener);
    const auto opened = session->open(secureStringFrom("Secr3t!"));
    ASSERT_FALSE(passholder::core::succeeded(opened));
    EXPECT_EQ(std::get<VaultFailure>(opened).code, VaultError::StorageError);
    EXPECT_EQ(session->state(), SessionState::Closed);
    EXPECT_TRUE(std::filesystem::is_empty(m_config.scratchRoot));
}

TEST_F(VaultSessionErrorTest, ReadsDoNotWrite)
{
    auto session = makeSession();
    ASSERT_TRUE(passholder::core::succeeded(session->open(secureStringFrom("Secr3t!"))));
    ASSERT_TRUE(passholder::core::succeeded(session->insert(record("github"))));
    const int before{ m_repo->writes };

    (void)session->queryAll();
    (void)session->queryByService("github");
    (void)session->queryById(1);
    (void)session->copyToClipboard(passholder::core::ById{ .id = 1 });
    EXPECT_EQ(m_repo->writes, before);
}
