#ifndef PASSHOLDER_UI_CLI_CONSOLEUTILS_HPP
#define PASSHOLDER_UI_CLI_CONSOLEUTILS_HPP

#include "passholder/security/SecureMemory.hpp"
#include <string>

namespace passholder::ui::cli
{

// Locks pages in RAM and disables core dumps. Best effort.
void lockProcessMemory() noexcept;

[[nodiscard]] passholder::security::SecureString readPassword(const std::string& prompt);

// Asks a yes/no question on the terminal; anything but y/yes is a no.
[[nodiscard]] bool confirm(const std::string& prompt);

} // namespace passholder::ui::cli

#endif // PASSHOLDER_UI_CLI_CONSOLEUTILS_HPP
