#pragma once

#include <span>
#include <string_view>

namespace termpost::appinfo
{

struct ToolInfo
{
    std::string_view id;
    std::string_view executable;
    std::string_view displayName;
    std::string_view shortDescription;
    std::string_view usage;
};

std::span<const ToolInfo> tools() noexcept;
const ToolInfo *findTool(std::string_view id) noexcept;
const ToolInfo &requireTool(std::string_view id);

} // namespace termpost::appinfo
