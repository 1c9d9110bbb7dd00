#ifndef PASSHOLDER_UI_CLI_SYSTEMCLIPBOARD_HPP
#define PASSHOLDER_UI_CLI_SYSTEMCLIPBOARD_HPP

#include "passholder/core/ClipboardBridge.hpp"
#include <chrono>
#include <string_view>

namespace passholder::ui::cli
{

// Pipes text into wl-copy (Wayland), xclip or xsel, whichever succeeds first.
class SystemClipboard final : public passholder::core::IClipboardBridge
{
public:
    [[nodiscard]] bool setText(std::string_view text) override;
    [[nodiscard]] bool clear() override;
};

// Forks a detached child that clears the clipboard after `delay`, unless it no longer holds what it
// holds now. Returns false if the fork failed.
[[nodiscard]] bool scheduleClipboardClear(std::chrono::seconds delay);

} // namespace passholder::ui::cli

#endif // PASSHOLDER_UI_CLI_SYSTEMCLIPBOARD_HPP
