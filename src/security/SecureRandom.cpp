#include "passholder/security/SecureRandom.hpp"

#include "passholder/security/SecureMemory.hpp"
#include <cerrno>
#include <vector>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace passholder::security
{

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* outPtr{ out.data() };
    std::size_t remaining{ out.size() };

    while (remaining > 0U)
    {
        const ssize_t bytesReceived{ ::getrandom(outPtr, remaining, 0) };
        if (bytesReceived > 0)
        {
            const auto received{ static_cast<std::size_t>(bytesReceived) };
            if (received > remaining)
            {
                return false;
            }
            remaining -= received;
            outPtr += received;
            continue;
        }

        if (bytesReceived < 0 && errno == EINTR)
        {
            continue;
        }
        return false;
    }
    return true;
}

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

std::optional<std::string> secureRandomHex(std::size_t byteCount)
{
    std::vector<std::uint8_t> rnd(byteCount);
    if (!secureRandomFill(std::span<std::uint8_t>{ rnd }))
    {
        return std::nullopt;
    }
    auto out{ toHex(std::span<const std::uint8_t>{ rnd }) };
    secureWipe(std::span<std::uint8_t>{ rnd });
    return out;
}

} // namespace passholder::security
