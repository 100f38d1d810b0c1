#include "termpost/render/style_codec.hpp"

#include <stdexcept>
#include <string>

namespace termpost::render
{

StyleRun encode(StyleIntent intent)
{
    switch (intent)
    {
    case StyleIntent::BoldOn:
        return {"\033[1m", "**"};
    case StyleIntent::BoldOff:
        return {"\033[22m", "**"};
    case StyleIntent::UnderlineOn:
        return {"\033[4m", "_"};
    case StyleIntent::UnderlineOff:
        return {"\033[24m", "_"};
    case StyleIntent::InverseOn:
        return {"\033[7m", "`"};
    case StyleIntent::InverseOff:
        return {"\033[27m", "`"};
    case StyleIntent::BackgroundRed:
        return {"\033[41m", ""};
    case StyleIntent::BackgroundGreen:
        return {"\033[42m", ""};
    case StyleIntent::Reset:
        return {"\033[0m", ""};
    }
    throw std::logic_error("Unknown style intent: " + std::to_string(static_cast<int>(intent)));
}

std::string_view intentName(StyleIntent intent) noexcept
{
    switch (intent)
    {
    case StyleIntent::BoldOn:
        return "bold-on";
    case StyleIntent::BoldOff:
        return "bold-off";
    case StyleIntent::UnderlineOn:
        return "underline-on";
    case StyleIntent::UnderlineOff:
        return "underline-off";
    case StyleIntent::InverseOn:
        return "inverse-on";
    case StyleIntent::InverseOff:
        return "inverse-off";
    case StyleIntent::BackgroundRed:
        return "background-red";
    case StyleIntent::BackgroundGreen:
        return "background-green";
    case StyleIntent::Reset:
        return "reset";
    }
    return "unknown";
}

} // namespace termpost::render
