#include "passholder/storage/file/FileVaultRepositoryFactory.hpp"

#include "passholder/crypto/KdfParams.hpp"
#include "passholder/storage/StorageErrors.hpp"
#include "test_utils/TestUtils.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace
{

class FileVaultRepositoryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_root = passholder::test_utils::makeSecureTempDir("file_repo_");
        ASSERT_FALSE(m_root.empty());
        m_loc.dir = m_root / "vault";
        m_repo = passholder::storage::file::makeFileVaultRepository();
    }

    void TearDown() override
    {
        std::error_code ec{};
        std::filesystem::remove_all(m_root, ec);
    }

    [[nodiscard]] static unsigned modeOf(const std::filesystem::path& p)
    {
        struct stat st{};
        if (::stat(p.c_str(), &st) != 0)
        {
            return 0U;
        }
        return static_cast<unsigned>(st.st_mode) & 0777U;
    }

    std::filesystem::path m_root;                                  // NOLINT
    passholder::storage::VaultLocation m_loc{};                    // NOLINT
    std::unique_ptr<passholder::storage::IVaultRepository> m_repo; // NOLINT
};

} // namespace

TEST_F(FileVaultRepositoryTest, CreatesSaltOnFirstUse)
{
    EXPECT_FALSE(m_repo->vaultExists(m_loc));

    const auto salt = m_repo->loadOrCreateSalt(m_loc);
    EXPECT_EQ(salt.size(), passholder::crypto::g_kVaultSaltBytes);
    EXPECT_TRUE(std::filesystem::is_regular_file(m_loc.saltPath()));
    EXPECT_EQ(modeOf(m_loc.saltPath()), 0600U);
    EXPECT_EQ(modeOf(m_loc.dir), 0700U);
}

TEST_F(FileVaultRepositoryTest, SaltIsStableAcrossCalls)
{
    const auto first = m_repo->loadOrCreateSalt(m_loc);
    const auto second = m_repo->loadOrCreateSalt(m_loc);
    EXPECT_EQ(first, second);
}

TEST_F(FileVaultRepositoryTest, MissingSaltWithExistingVaultIsFatal)
{
    (void)m_repo->loadOrCreateSalt(m_loc);
    const std::vector<std::uint8_t> body{ 1U, 2U, 3U };
    m_repo->storeVaultAtomic(m_loc, body);
    std::filesystem::remove(m_loc.saltPath());

    EXPECT_THROW((void)m_repo->loadOrCreateSalt(m_loc), passholder::storage::MissingSalt);
    EXPECT_FALSE(std::filesystem::exists(m_loc.saltPath()));
}

TEST_F(FileVaultRepositoryTest, WrongSizedSaltIsRejected)
{
    std::filesystem::create_directories(m_loc.dir);
    {
        std::ofstream out{ m_loc.saltPath(), std::ios::binary };
        out << "short";
    }
    EXPECT_THROW((void)m_repo->loadOrCreateSalt(m_loc), passholder::storage::MissingSalt);
}

TEST_F(FileVaultRepositoryTest, LoadMissingVaultThrows)
{
    EXPECT_THROW((void)m_repo->loadVault(m_loc), passholder::storage::VaultNotFound);
}

TEST_F(FileVaultRepositoryTest, StoreReplacesContentAtomically)
{
    const std::vector<std::uint8_t> v1(100U, 0x11U);
    const std::vector<std::uint8_t> v2(10U, 0x22U);

    m_repo->storeVaultAtomic(m_loc, v1);
    EXPECT_TRUE(m_repo->vaultExists(m_loc));
    EXPECT_EQ(m_repo->loadVault(m_loc), v1);
    EXPECT_EQ(modeOf(m_loc.vaultPath()), 0600U);

    m_repo->storeVaultAtomic(m_loc, v2);
    EXPECT_EQ(m_repo->loadVault(m_loc), v2);

    // No temporaries are left beside the vault-file.
    std::size_t entries{};
    for (const auto& entry : std::filesystem::directory_iterator{ m_loc.dir })
    {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1U);
}

TEST_F(FileVaultRepositoryTest, FailedStoreKeepsPreviousContent)
{
    const std::vector<std::uint8_t> v1(16U, 0x33U);
    m_repo->storeVaultAtomic(m_loc, v1);

    std::filesystem::permissions(m_loc.dir, std::filesystem::perms::owner_read | std::filesystem::perms::owner_exec,
                                 std::filesystem::perm_options::replace);
    if (::geteuid() == 0)
    {
        std::filesystem::permissions(m_loc.dir, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace);
        GTEST_SKIP() << "root ignores directory permissions";
    }

    const std::vector<std::uint8_t> v2(16U, 0x44U);
    EXPECT_THROW(m_repo->storeVaultAtomic(m_loc, v2), passholder::storage::StorageError);

    std::filesystem::permissions(m_loc.dir, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace);
    EXPECT_EQ(m_repo->loadVault(m_loc), v1);
}
