#ifndef INCLUDE_PASSHOLDER_CORE_CLIPBOARDBRIDGE_HPP
#define INCLUDE_PASSHOLDER_CORE_CLIPBOARDBRIDGE_HPP

#include <string_view>

namespace passholder::core
{

// Host clipboard, provided by the front end.
class IClipboardBridge
{
public:
    IClipboardBridge() = default;
    IClipboardBridge(const IClipboardBridge&) = delete;
    IClipboardBridge& operator=(const IClipboardBridge&) = delete;
    IClipboardBridge(IClipboardBridge&&) = delete;
    IClipboardBridge& operator=(IClipboardBridge&&) = delete;
    virtual ~IClipboardBridge() = default;

    // Returns false if the host refused the text.
    [[nodiscard]] virtual bool setText(std::string_view text) = 0;

    [[nodiscard]] virtual bool clear() = 0;
};

} // namespace passholder::core

#endif // INCLUDE_PASSHOLDER_CORE_CLIPBOARDBRIDGE_HPP
