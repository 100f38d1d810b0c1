#include <gtest/gtest.h>

#include "ansi_options.hpp"
#include "motd_options.hpp"

#include "termpost/errors.hpp"
#include "termpost/paths.hpp"

#include <filesystem>
#include <fstream>
#include <string>

TEST(AnsiOptions, DefaultsRenderEscapeCodesWithoutWrapping)
{
    termpost::config::OptionRegistry registry("term-post-ansi");
    termpost::ansi::registerAnsiOptions(registry);

    auto settings = termpost::ansi::settingsFromRegistry(registry);
    EXPECT_FALSE(settings.briefing);
    EXPECT_EQ(settings.wrapWidth, 0);
    EXPECT_EQ(settings.format, termpost::render::OutputFormat::Escape);
}

TEST(AnsiOptions, MarkdownFormatIsSelectable)
{
    termpost::config::OptionRegistry registry("term-post-ansi");
    termpost::ansi::registerAnsiOptions(registry);
    registry.setFromString(termpost::ansi::kOptionFormat, "markdown");
    registry.setFromString(termpost::ansi::kOptionWrapWidth, "60");

    auto settings = termpost::ansi::settingsFromRegistry(registry);
    EXPECT_EQ(settings.format, termpost::render::OutputFormat::Markdown);
    EXPECT_EQ(settings.wrapWidth, 60);
}

TEST(AnsiOptions, UnknownFormatIsAConfigurationError)
{
    termpost::config::OptionRegistry registry("term-post-ansi");
    termpost::ansi::registerAnsiOptions(registry);
    registry.setFromString(termpost::ansi::kOptionFormat, "html");

    EXPECT_THROW(termpost::ansi::settingsFromRegistry(registry), termpost::ConfigurationError);
    EXPECT_THROW(registry.setFromString(termpost::ansi::kOptionWrapWidth, "-1"), termpost::ConfigurationError);
}

TEST(MotdOptions, DefaultsKeepPostsForThreeDays)
{
    termpost::config::OptionRegistry registry("term-post-motd");
    termpost::motd::registerMotdOptions(registry);

    auto settings = termpost::motd::settingsFromRegistry(registry);
    EXPECT_EQ(settings.lifespanHours, 72);
    EXPECT_EQ(settings.indent, 2);
    EXPECT_EQ(settings.wrapWidth, 0);
    EXPECT_FALSE(settings.headerFile.has_value());
    EXPECT_FALSE(settings.fallbackFile.has_value());
    EXPECT_FALSE(settings.footerLink.has_value());
}

TEST(MotdOptions, NegativeValuesAreRejected)
{
    termpost::config::OptionRegistry registry("term-post-motd");
    termpost::motd::registerMotdOptions(registry);

    EXPECT_THROW(registry.setFromString(termpost::motd::kOptionLifespan, "-1"), termpost::ConfigurationError);
    EXPECT_THROW(registry.setFromString(termpost::motd::kOptionIndent, "-2"), termpost::ConfigurationError);
    EXPECT_THROW(registry.setFromString(termpost::motd::kOptionWrapWidth, "-80"), termpost::ConfigurationError);
}

TEST(MotdOptions, FooterLinkIsNormalized)
{
    termpost::config::OptionRegistry registry("term-post-motd");
    termpost::motd::registerMotdOptions(registry);
    registry.setFromString(termpost::motd::kOptionLink, "https://example.org");

    auto settings = termpost::motd::settingsFromRegistry(registry);
    ASSERT_TRUE(settings.footerLink.has_value());
    EXPECT_EQ(*settings.footerLink, "https://example.org/");

    registry.setFromString(termpost::motd::kOptionLink, "not a link");
    EXPECT_THROW(termpost::motd::settingsFromRegistry(registry), termpost::ConfigurationError);
}

TEST(MotdOptions, LayoutReadsHeaderFile)
{
    auto header = std::filesystem::temp_directory_path() / "term_post_motd_header_test.txt";
    {
        std::ofstream out(header);
        out << "Welcome\n";
    }

    termpost::motd::MotdSettings settings;
    settings.headerFile = header;
    settings.wrapWidth = 40;
    auto layout = termpost::motd::layoutFromSettings(settings);
    ASSERT_TRUE(layout.header.has_value());
    EXPECT_EQ(*layout.header, "Welcome\n");
    EXPECT_FALSE(layout.footer.has_value());
    EXPECT_EQ(layout.wrapWidth, 40);
    EXPECT_EQ(layout.indent, 2);

    std::error_code ec;
    std::filesystem::remove(header, ec);
}

TEST(MotdOptions, UnreadableFooterIsAConfigurationError)
{
    termpost::motd::MotdSettings settings;
    settings.footerFile = std::filesystem::temp_directory_path() / "term_post_missing_footer" / "footer.txt";
    EXPECT_THROW(termpost::motd::layoutFromSettings(settings), termpost::ConfigurationError);
}

TEST(AnsiOptions, DirectoryOutputTakesInputNameWithFormatExtension)
{
    auto directory = std::filesystem::temp_directory_path() / "term_post_ansi_output_test";
    std::filesystem::create_directories(directory);

    EXPECT_EQ(termpost::ansi::outputPathFor("/srv/news/post.json", directory, termpost::render::OutputFormat::Escape),
              directory / "post.ansi");
    EXPECT_EQ(termpost::ansi::outputPathFor("post.json", directory, termpost::render::OutputFormat::Markdown),
              directory / "post.md");
    EXPECT_EQ(termpost::ansi::outputPathFor("post.json", directory / "motd.txt",
                                            termpost::render::OutputFormat::Escape),
              directory / "motd.txt");

    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
}

namespace
{

void writeFile(const std::filesystem::path &path, const std::string &content = {})
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

} // namespace

TEST(MotdOptions, WebsitePageFindsSourceFromLink)
{
    auto root = std::filesystem::temp_directory_path() / "term_post_motd_website_test";
    std::filesystem::remove_all(root);
    writeFile(root / "news" / "post.json", "{}");
    writeFile(root / "_website" / "index.html");

    termpost::config::OptionRegistry registry("term-post-motd");
    termpost::motd::registerMotdOptions(registry);
    registry.setFromString(termpost::motd::kOptionWebsiteHtml, (root / "_website" / "index.html").string());
    auto settings = termpost::motd::settingsFromRegistry(registry);
    ASSERT_TRUE(settings.websiteHtml.has_value());

    auto linked = termpost::motd::parsePostRecord(R"({"date": "10/03/2024", "html_link": "/news/post.html"})");
    EXPECT_EQ(termpost::motd::postSourcePath(linked, settings),
              termpost::paths::resolvePath(root / "news" / "post.json"));

    auto broken = termpost::motd::parsePostRecord(
        R"({"date": "10/03/2024", "source": "/abs/post.json", "html_link": "/news/gone.html"})");
    EXPECT_EQ(termpost::motd::postSourcePath(broken, settings), std::filesystem::path("/abs/post.json"));

    auto missing = termpost::motd::parsePostRecord(R"({"date": "10/03/2024", "html_link": "/news/gone.html"})");
    EXPECT_THROW(termpost::motd::postSourcePath(missing, settings), termpost::ConfigurationError);

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST(MotdOptions, RecordWithoutSourceNeedsWebsitePage)
{
    termpost::motd::MotdSettings settings;
    auto record = termpost::motd::parsePostRecord(R"({"date": "10/03/2024", "html_link": "/news/post.html"})");
    EXPECT_THROW(termpost::motd::postSourcePath(record, settings), termpost::ConfigurationError);

    auto withSource = termpost::motd::parsePostRecord(R"({"date": "10/03/2024", "source": "/abs/post.json"})");
    EXPECT_EQ(termpost::motd::postSourcePath(withSource, settings), std::filesystem::path("/abs/post.json"));
}
