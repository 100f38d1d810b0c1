#pragma once

#include <string_view>

namespace termpost::render
{

enum class StyleIntent
{
    BoldOn,
    BoldOff,
    UnderlineOn,
    UnderlineOff,
    InverseOn,
    InverseOff,
    BackgroundRed,
    BackgroundGreen,
    Reset
};

struct StyleRun
{
    std::string_view escape;
    std::string_view markdown;
};

// Throws std::logic_error for a value outside the enumeration.
StyleRun encode(StyleIntent intent);
std::string_view intentName(StyleIntent intent) noexcept;

} // namespace termpost::render
