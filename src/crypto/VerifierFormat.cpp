#include "passholder/crypto/VerifierFormat.hpp"

#include <sodium.h>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace passholder::crypto
{
namespace
{

constexpr int g_kBase64Variant{ sodium_base64_VARIANT_ORIGINAL_NO_PADDING };
constexpr std::string_view g_kPrefix{ "$argon2id$v=19$" };
constexpr std::size_t g_kMinHashBytes{ 16U };
constexpr std::size_t g_kMaxHashBytes{ 64U };

[[nodiscard]] std::optional<std::uint32_t> parseU32(std::string_view text) noexcept
{
    if (text.empty() || (text.size() > 1U && text.front() == '0'))
    {
        return std::nullopt;
    }
    std::uint32_t value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

// Consumes "<key>=<u32>" from the front of `text`.
[[nodiscard]] std::optional<std::uint32_t> takeParam(std::string_view& text, char key) noexcept
{
    if (text.size() < 3U || text[0] != key || text[1] != '=')
    {
        return std::nullopt;
    }
    text.remove_prefix(2U);
    const std::size_t end{ text.find(',') };
    const std::string_view digits{ text.substr(0, end) };
    text.remove_prefix(end == std::string_view::npos ? text.size() : end + 1U);
    return parseU32(digits);
}

} // namespace

[[nodiscard]] std::string encodeBase64(std::span<const std::uint8_t> bytes)
{
    const std::size_t encodedLen{ sodium_base64_encoded_len(bytes.size(), g_kBase64Variant) };
    std::string out(encodedLen, '\0');
    (void)sodium_bin2base64(out.data(), out.size(), bytes.data(), bytes.size(), g_kBase64Variant);
    // Drop the terminator libsodium writes.
    out.resize(std::char_traits<char>::length(out.c_str()));
    return out;
}

[[nodiscard]] std::optional<std::vector<std::uint8_t>> decodeBase64(std::string_view text)
{
    std::vector<std::uint8_t> out((text.size() * 3U) / 4U + 1U);
    std::size_t outLen{};
    // No ignore set and no end pointer: any foreign character, padding or stray bit fails.
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &outLen, nullptr,
                          g_kBase64Variant) != 0)
    {
        return std::nullopt;
    }
    out.resize(outLen);
    return out;
}

[[nodiscard]] std::string encodeVerifier(const Argon2idParams& params, std::span<const std::uint8_t> salt,
                                         std::span<const std::uint8_t> hash)
{
    std::string out{ g_kPrefix };
    out += "m=" + std::to_string(params.memoryKiB);
    out += ",t=" + std::to_string(params.iterations);
    out += ",p=" + std::to_string(params.parallelism);
    out += '$';
    out += encodeBase64(salt);
    out += '$';
    out += encodeBase64(hash);
    return out;
}

[[nodiscard]] std::optional<VerifierRecord> decodeVerifier(std::string_view verifier)
{
    if (!verifier.starts_with(g_kPrefix))
    {
        return std::nullopt;
    }
    verifier.remove_prefix(g_kPrefix.size());

    const std::size_t paramsEnd{ verifier.find('$') };
    if (paramsEnd == std::string_view::npos)
    {
        return std::nullopt;
    }
    std::string_view paramText{ verifier.substr(0, paramsEnd) };
    verifier.remove_prefix(paramsEnd + 1U);

    const auto m = takeParam(paramText, 'm');
    const auto t = takeParam(paramText, 't');
    const auto p = takeParam(paramText, 'p');
    if (!m || !t || !p || !paramText.empty())
    {
        return std::nullopt;
    }

    const std::size_t saltEnd{ verifier.find('$') };
    if (saltEnd == std::string_view::npos)
    {
        return std::nullopt;
    }
    auto salt = decodeBase64(verifier.substr(0, saltEnd));
    auto hash = decodeBase64(verifier.substr(saltEnd + 1U));
    if (!salt || !hash)
    {
        return std::nullopt;
    }
    if (salt->size() < g_kMinSaltBytes || hash->size() < g_kMinHashBytes || hash->size() > g_kMaxHashBytes)
    {
        return std::nullopt;
    }

    VerifierRecord record{};
    record.params = Argon2idParams{ .iterations = *t, .memoryKiB = *m, .parallelism = *p };
    record.salt = std::move(*salt);
    record.hash = std::move(*hash);
    return record;
}

} // namespace passholder::crypto
