#ifndef PASSHOLDER_TESTS_TEST_UTILS_FAKECLIPBOARD_HPP
#define PASSHOLDER_TESTS_TEST_UTILS_FAKECLIPBOARD_HPP

#include "passholder/core/ClipboardBridge.hpp"
#include <string>
#include <string_view>

namespace passholder::test_utils
{

// In-memory clipboard; `available = false` makes every call refuse.
class FakeClipboard final : public passholder::core::IClipboardBridge
{
public:
    [[nodiscard]] bool setText(std::string_view text) override
    {
        if (!available)
        {
            return false;
        }
        contents.assign(text);
        ++writes;
        return true;
    }

    [[nodiscard]] bool clear() override
    {
        if (!available)
        {
            return false;
        }
        contents.clear();
        return true;
    }

    bool available{ true };
    std::string contents;
    int writes{ 0 };
};

} // namespace passholder::test_utils

#endif // PASSHOLDER_TESTS_TEST_UTILS_FAKECLIPBOARD_HPP
