#include "ConsoleUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace passholder::ui::cli
{

namespace
{

// Restores the terminal echo flag on scope exit.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
        if (::isatty(STDIN_FILENO) == 0 || ::tcgetattr(STDIN_FILENO, &m_saved) != 0)
        {
            return;
        }
        struct termios quiet = m_saved;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        m_active = (::tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0);
    }
    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;
    ~EchoGuard() noexcept
    {
        if (m_active)
        {
            (void)::tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
        }
    }

private:
    struct termios m_saved
    {
    };
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
    (void)::mlockall(MCL_CURRENT | MCL_FUTURE);
    struct rlimit lim
    {
        0, 0
    };
    (void)::setrlimit(RLIMIT_CORE, &lim);
}

passholder::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    {
        EchoGuard noEcho{};
        std::getline(std::cin, line);
    }
    std::cout << "\n";

    auto sec = passholder::security::secureStringFrom(line);
    passholder::security::secureWipe(line);
    return sec;
}

bool confirm(const std::string& prompt)
{
    std::cout << prompt << " [y/N]: " << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer))
    {
        return false;
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

} // namespace passholder::ui::cli
