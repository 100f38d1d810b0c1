#include <gtest/gtest.h>

#include "termpost/app_info.hpp"

#include <algorithm>
#include <stdexcept>

namespace
{

bool containsToolId(std::span<const termpost::appinfo::ToolInfo> tools, std::string_view id)
{
    return std::any_of(tools.begin(), tools.end(), [&](const termpost::appinfo::ToolInfo &info) {
        return info.id == id;
    });
}

} // namespace

TEST(AppInfo, ListsBothTools)
{
    auto tools = termpost::appinfo::tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_TRUE(containsToolId(tools, "term-post-ansi"));
    EXPECT_TRUE(containsToolId(tools, "term-post-motd"));
}

TEST(AppInfo, RequireToolReturnsMatchingExecutable)
{
    const auto &info = termpost::appinfo::requireTool("term-post-motd");
    EXPECT_EQ(info.id, "term-post-motd");
    EXPECT_EQ(info.executable, "term-post-motd");
    EXPECT_FALSE(info.shortDescription.empty());
}

TEST(AppInfo, FindToolReturnsNullForUnknownId)
{
    EXPECT_EQ(termpost::appinfo::findTool("term-post"), nullptr);
    EXPECT_NE(termpost::appinfo::findTool("term-post-ansi"), nullptr);
}

TEST(AppInfo, RequireToolThrowsForUnknownId)
{
    EXPECT_THROW(termpost::appinfo::requireTool("does-not-exist"), std::runtime_error);
}
