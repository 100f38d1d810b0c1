#include "termpost/app_info.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace termpost::appinfo
{
    namespace
    {

        constexpr std::array<ToolInfo, 2> kTools{{
            ToolInfo{
                "term-post-ansi",
                "term-post-ansi",
                "Document to ANSI",
                "Convert a document tree into text styled with ANSI escape codes.",
                "[options] DOCUMENT.json OUTPUT"},
            ToolInfo{
                "term-post-motd",
                "term-post-motd",
                "Message of the Day",
                "Build the message of the day from the latest news post.",
                "[options] --fallback FILE POST.json OUTPUT"},
        }};

    } // namespace

    std::span<const ToolInfo> tools() noexcept
    {
        return std::span<const ToolInfo>{kTools};
    }

    const ToolInfo *findTool(std::string_view id) noexcept
    {
        auto it = std::find_if(kTools.begin(), kTools.end(), [&](const ToolInfo &info)
                               { return info.id == id; });
        if (it == kTools.end())
            return nullptr;
        return &*it;
    }

    const ToolInfo &requireTool(std::string_view id)
    {
        if (const ToolInfo *info = findTool(id))
            return *info;
        throw std::runtime_error("Unknown tool id: " + std::string{id});
    }

} // namespace termpost::appinfo
