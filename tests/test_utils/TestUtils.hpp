#ifndef PASSHOLDER_TESTS_TEST_UTILS_TESTUTILS_HPP
#define PASSHOLDER_TESTS_TEST_UTILS_TESTUTILS_HPP

#include "passholder/core/VaultConfig.hpp"
#include "passholder/crypto/KdfParams.hpp"
#include "passholder/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace passholder::test_utils
{

[[nodiscard]] inline std::optional<std::string> getEnv(std::string_view name)
{
    if (name.empty())
    {
        return std::nullopt;
    }
    const char* value{ std::getenv(std::string{ name }.c_str()) };
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ value };
}

[[nodiscard]] inline bool envFlagSet(std::string_view name)
{
    const auto value{ getEnv(name) };
    // Any non-empty value other than "0" enables the flag.
    return value.has_value() && !value->empty() && (*value != "0");
}

namespace detail
{

[[nodiscard]] inline bool tryPrepareBaseDir(const std::filesystem::path& candidate) noexcept
{
    std::error_code ec{};
    if (!std::filesystem::create_directories(candidate, ec) && ec)
    {
        return false;
    }

    ec.clear();
    if (!std::filesystem::is_directory(candidate, ec) || ec)
    {
        return false;
    }

    ec.clear();
    std::filesystem::permissions(candidate, std::filesystem::perms::owner_all, std::filesystem::perm_options::replace,
                                 ec);
    if (ec)
    {
        return false;
    }

    ec.clear();
    const auto perms{ std::filesystem::status(candidate, ec).permissions() };
    if (ec)
    {
        return false;
    }
    const auto publicBits{ std::filesystem::perms::group_all | std::filesystem::perms::others_all };
    return ((perms & publicBits) == std::filesystem::perms::none);
}

} // namespace detail

// Unique 0700 directory under the system temp dir, named from the OS CSPRNG. Empty on failure.
[[nodiscard]] inline std::filesystem::path makeSecureTempDir(std::string_view prefix)
{
    constexpr std::size_t kTokenBytes{ 16U };
    constexpr std::size_t kMaxAttempts{ 16U };

    const auto base{ std::filesystem::temp_directory_path() / std::filesystem::path{ "passholder_tests" } };
    if (!detail::tryPrepareBaseDir(base))
    {
        return {};
    }

    for (std::size_t attempt{}; attempt < kMaxAttempts; ++attempt)
    {
        std::array<std::uint8_t, kTokenBytes> rnd{};
        if (!passholder::security::secureRandomFill(std::span<std::uint8_t>{ rnd }))
        {
            break;
        }

        std::string name{ prefix };
        name += passholder::security::toHex(std::span<const std::uint8_t>{ rnd });
        const auto dir{ base / std::filesystem::path{ name } };

        std::error_code ec{};
        if (std::filesystem::create_directory(dir, ec) && !ec)
        {
            std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace, ec);
            if (ec)
            {
                ec.clear();
                std::filesystem::remove_all(dir, ec);
                continue;
            }
            return dir;
        }
    }

    return {};
}

// Removes the directory tree on scope exit.
class TempDirGuard final
{
public:
    explicit TempDirGuard(std::filesystem::path dir) : m_dir{ std::move(dir) }
    {
    }
    TempDirGuard(const TempDirGuard&) = delete;
    TempDirGuard& operator=(const TempDirGuard&) = delete;
    ~TempDirGuard() noexcept
    {
        std::error_code ec{};
        if (!m_dir.empty())
        {
            std::filesystem::remove_all(m_dir, ec);
        }
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept
    {
        return m_dir;
    }

private:
    std::filesystem::path m_dir;
};

// Cheap Argon2id parameters so the suite stays fast; PASSHOLDER_RUN_SLOW_TESTS selects the production defaults.
[[nodiscard]] inline passholder::crypto::Argon2idParams testKdfParams()
{
    if (envFlagSet("PASSHOLDER_RUN_SLOW_TESTS"))
    {
        return passholder::crypto::g_kArgon2idDefaultParams;
    }
    return passholder::crypto::Argon2idParams{ .iterations = 1U, .memoryKiB = 8U, .parallelism = 1U };
}

// Vault config rooted in `dir`, with scratch space beside it and fast KDF parameters.
[[nodiscard]] inline passholder::core::VaultConfig makeTestConfig(const std::filesystem::path& dir)
{
    passholder::core::VaultConfig config{};
    config.vaultDir = dir / "vault";
    config.scratchRoot = dir / "scratch";
    config.kdf = testKdfParams();
    config.verifier = testKdfParams();
    std::error_code ec{};
    std::filesystem::create_directories(config.scratchRoot, ec);
    return config;
}

} // namespace passholder::test_utils

#endif // PASSHOLDER_TESTS_TEST_UTILS_TESTUTILS_HPP
