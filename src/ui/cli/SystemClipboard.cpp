#include "SystemClipboard.hpp"

#include "passholder/security/SecureMemory.hpp"
#include <sodium.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace passholder::ui::cli
{
namespace
{

using Argv = std::vector<const char*>;

[[nodiscard]] bool onWayland() noexcept
{
    const char* display = std::getenv("WAYLAND_DISPLAY");
    return display != nullptr && *display != '\0';
}

// Runs argv with `input` on its stdin; true if the tool exited with status 0.
[[nodiscard]] bool runWithStdin(const Argv& argv, std::string_view input) noexcept
{
    std::array<int, 2> pipefd{ -1, -1 };
    if (::pipe(pipefd.data()) != 0)
    {
        return false;
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return false;
    }

    if (pid == 0)
    {
        ::dup2(pipefd[0], STDIN_FILENO);
        ::close(pipefd[0]);
        ::close(pipefd[1]);

        std::vector<char*> args{};
        for (const char* a : argv)
        {
            args.push_back(const_cast<char*>(a));
        }
        args.push_back(nullptr);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(pipefd[0]);
    // A tool that exits early must not kill us with SIGPIPE.
    struct sigaction ignore{};
    struct sigaction previous{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    (void)::sigaction(SIGPIPE, &ignore, &previous);

    const char* ptr = input.data();
    std::size_t remaining = input.size();
    while (remaining > 0U)
    {
        const ssize_t w = ::write(pipefd[1], ptr, remaining);
        if (w < 0 && errno == EINTR)
        {
            continue;
        }
        if (w <= 0)
        {
            break;
        }
        ptr += w;
        remaining -= static_cast<std::size_t>(w);
    }
    ::close(pipefd[1]);
    (void)::sigaction(SIGPIPE, &previous, nullptr);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            return false;
        }
    }
    return remaining == 0U && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

// Runs argv and collects its stdout; nullopt unless the tool exited with status 0.
[[nodiscard]] std::optional<std::string> runForStdout(const Argv& argv)
{
    std::array<int, 2> pipefd{ -1, -1 };
    if (::pipe(pipefd.data()) != 0)
    {
        return std::nullopt;
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::nullopt;
    }

    if (pid == 0)
    {
        ::dup2(pipefd[1], STDOUT_FILENO);
        ::close(pipefd[0]);
        ::close(pipefd[1]);

        std::vector<char*> args{};
        for (const char* a : argv)
        {
            args.push_back(const_cast<char*>(a));
        }
        args.push_back(nullptr);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(pipefd[1]);
    std::string out{};
    std::array<char, 512> chunk{};
    for (;;)
    {
        const ssize_t r = ::read(pipefd[0], chunk.data(), chunk.size());
        if (r < 0 && errno == EINTR)
        {
            continue;
        }
        if (r <= 0)
        {
            break;
        }
        out.append(chunk.data(), static_cast<std::size_t>(r));
    }
    ::close(pipefd[0]);
    passholder::security::secureWipe(std::span<char>{ chunk });

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            passholder::security::secureWipe(out);
            return std::nullopt;
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
    {
        passholder::security::secureWipe(out);
        return std::nullopt;
    }
    return out;
}

[[nodiscard]] std::optional<std::string> readClipboard()
{
    if (onWayland())
    {
        if (auto text = runForStdout(Argv{ "wl-paste", "--no-newline" }))
        {
            return text;
        }
    }
    if (auto text = runForStdout(Argv{ "xclip", "-selection", "clipboard", "-o" }))
    {
        return text;
    }
    return runForStdout(Argv{ "xsel", "--clipboard", "--output" });
}

using ClipboardDigest = std::array<unsigned char, crypto_generichash_BYTES>;

// Digest of the current clipboard text; the text itself is wiped right away.
[[nodiscard]] std::optional<ClipboardDigest> clipboardDigest()
{
    auto text = readClipboard();
    if (!text)
    {
        return std::nullopt;
    }
    ClipboardDigest digest{};
    const int rc = crypto_generichash(digest.data(), digest.size(), reinterpret_cast<const unsigned char*>(text->data()),
                                      text->size(), nullptr, 0);
    passholder::security::secureWipe(*text);
    if (rc != 0)
    {
        return std::nullopt;
    }
    return digest;
}

} // namespace

bool SystemClipboard::setText(std::string_view text)
{
    if (onWayland() && runWithStdin(Argv{ "wl-copy" }, text))
    {
        return true;
    }
    if (runWithStdin(Argv{ "xclip", "-selection", "clipboard" }, text))
    {
        return true;
    }
    return runWithStdin(Argv{ "xsel", "--clipboard", "--input" }, text);
}

bool SystemClipboard::clear()
{
    if (onWayland() && runWithStdin(Argv{ "wl-copy", "--clear" }, {}))
    {
        return true;
    }
    if (runWithStdin(Argv{ "xclip", "-selection", "clipboard" }, {}))
    {
        return true;
    }
    return runWithStdin(Argv{ "xsel", "--clipboard", "--clear" }, {});
}

bool scheduleClipboardClear(std::chrono::seconds delay)
{
    if (delay.count() <= 0)
    {
        return true;
    }

    // Unreadable clipboard: the child clears unconditionally.
    const auto copied = (::sodium_init() >= 0) ? clipboardDigest() : std::nullopt;

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        return false;
    }
    if (pid == 0)
    {
        for (const int sig : { SIGINT, SIGTERM, SIGHUP, SIGQUIT })
        {
            (void)::signal(sig, SIG_DFL);
        }
        // Outlive the terminal session of the parent.
        (void)::setsid();
        unsigned remaining = static_cast<unsigned>(delay.count());
        while (remaining > 0U)
        {
            remaining = ::sleep(remaining);
        }
        if (copied)
        {
            const auto current = clipboardDigest();
            if (current && ::sodium_memcmp(current->data(), copied->data(), copied->size()) != 0)
            {
                ::_exit(0);
            }
        }
        SystemClipboard clipboard{};
        ::_exit(clipboard.clear() ? 0 : 1);
    }
    return true;
}

} // namespace passholder::ui::cli
