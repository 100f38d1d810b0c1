#include <gtest/gtest.h>

#include "termpost/errors.hpp"
#include "termpost/motd/post_record.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

using termpost::doc::NodeKind;

TEST(PostDate, ParsesDayMonthYearAsUtcMidnight)
{
    using namespace std::chrono;
    auto parsed = termpost::motd::parsePostDate("29/02/2024");
    EXPECT_EQ(parsed, sys_days{year{2024} / February / 29});
    EXPECT_EQ(termpost::motd::parsePostDate(" 01/12/2023\n"), sys_days{year{2023} / December / 1});
}

TEST(PostDate, RejectsMalformedDates)
{
    EXPECT_THROW(termpost::motd::parsePostDate(""), termpost::DateParseError);
    EXPECT_THROW(termpost::motd::parsePostDate("2024-03-10"), termpost::DateParseError);
    EXPECT_THROW(termpost::motd::parsePostDate("1/3/2024"), termpost::DateParseError);
    EXPECT_THROW(termpost::motd::parsePostDate("10/13/2024"), termpost::DateParseError);
    EXPECT_THROW(termpost::motd::parsePostDate("29/02/2023"), termpost::DateParseError);
    EXPECT_THROW(termpost::motd::parsePostDate("aa/bb/cccc"), termpost::DateParseError);
}

TEST(PostRecord, ReadsAllFields)
{
    auto record = termpost::motd::parsePostRecord(
        R"({"date": "10/03/2024", "source": "news/post.json", "html_link": "https://example.org/news/post.html"})",
        "/var/lib/posts");

    EXPECT_EQ(record.date, "10/03/2024");
    EXPECT_EQ(record.source, std::filesystem::path("/var/lib/posts/news/post.json"));
    ASSERT_TRUE(record.htmlLink.has_value());
    EXPECT_EQ(*record.htmlLink, "https://example.org/news/post.html");
}

TEST(PostRecord, LinkIsOptional)
{
    auto record = termpost::motd::parsePostRecord(R"({"date": "10/03/2024", "source": "/abs/post.json"})");
    EXPECT_EQ(record.source, std::filesystem::path("/abs/post.json"));
    EXPECT_FALSE(record.htmlLink.has_value());
}

TEST(PostRecord, MissingFieldsThrow)
{
    EXPECT_THROW(termpost::motd::parsePostRecord(R"({"source": "a.json"})"), termpost::DocumentError);
    EXPECT_THROW(termpost::motd::parsePostRecord(R"({"date": "10/03/2024"})"), termpost::DocumentError);
    EXPECT_THROW(termpost::motd::parsePostRecord("[]"), termpost::DocumentError);
    EXPECT_THROW(termpost::motd::parsePostRecord("{"), termpost::DocumentError);
}

TEST(PostRecord, LinkAloneIsEnough)
{
    auto record = termpost::motd::parsePostRecord(
        R"({"date": "10/03/2024", "html_link": "/news/post.html"})", "/var/lib/posts");
    EXPECT_TRUE(record.source.empty());
    ASSERT_TRUE(record.htmlLink.has_value());
    EXPECT_EQ(*record.htmlLink, "/news/post.html");

    EXPECT_THROW(termpost::motd::parsePostRecord(R"({"date": "10/03/2024", "source": ""})"),
                 termpost::DocumentError);
}

TEST(PostRecord, LoadResolvesSourceNextToRecord)
{
    auto directory = std::filesystem::temp_directory_path() / "term_post_record_test";
    std::filesystem::create_directories(directory);
    auto path = directory / "latest.json";
    {
        std::ofstream out(path);
        out << R"({"date": "10/03/2024", "source": "post.json"})";
    }

    auto record = termpost::motd::loadPostRecord(path);
    EXPECT_EQ(record.source, directory / "post.json");

    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
    EXPECT_THROW(termpost::motd::loadPostRecord(path), termpost::DocumentError);
}

TEST(PostInfo, ExtractsTitleAndDateField)
{
    auto tree = termpost::doc::makeNode(
        NodeKind::Document,
        {termpost::doc::makeNode(NodeKind::Title, "Maintenance"),
         termpost::doc::makeNode(NodeKind::DocInfo, {termpost::doc::makeField("date", " 10/03/2024 ")}),
         termpost::doc::makeNode(NodeKind::Paragraph, "Downtime tonight.")});

    auto info = termpost::motd::postInfoFromDocument(tree);
    EXPECT_EQ(info.title, "Maintenance");
    EXPECT_EQ(info.date, "10/03/2024");
}

TEST(PostInfo, MissingTitleOrDateThrows)
{
    auto untitled = termpost::doc::makeNode(
        NodeKind::Document, {termpost::doc::makeNode(NodeKind::DocInfo, {termpost::doc::makeField("date", "x")})});
    EXPECT_THROW(termpost::motd::postInfoFromDocument(untitled), termpost::DocumentError);

    auto undated = termpost::doc::makeNode(NodeKind::Document, {termpost::doc::makeNode(NodeKind::Title, "T")});
    EXPECT_THROW(termpost::motd::postInfoFromDocument(undated), termpost::DocumentError);
}
