#include <gtest/gtest.h>

#include "termpost/doc/document_loader.hpp"
#include "termpost/errors.hpp"

#include <filesystem>
#include <fstream>

using termpost::doc::NodeKind;

TEST(DocumentLoader, ParsesNestedNodes)
{
    auto tree = termpost::doc::parseDocument(R"({
        "kind": "document",
        "children": [
            {"kind": "title", "children": ["Release Notes"]},
            {"kind": "paragraph", "children": [
                {"kind": "strong", "children": [{"kind": "text", "text": "v2.0"}]},
                " is out, see ",
                {"kind": "reference", "refuri": "https://example.org/", "children": ["here"]}
            ]}
        ]
    })");

    ASSERT_EQ(tree.kind, NodeKind::Document);
    ASSERT_EQ(tree.children.size(), 2u);
    EXPECT_EQ(tree.children[0].kind, NodeKind::Title);
    EXPECT_EQ(tree.children[0].plainText(), "Release Notes");

    const auto &paragraph = tree.children[1];
    ASSERT_EQ(paragraph.children.size(), 3u);
    EXPECT_EQ(paragraph.children[0].kind, NodeKind::Strong);
    EXPECT_EQ(paragraph.children[1].kind, NodeKind::PlainText);
    EXPECT_EQ(paragraph.children[2].target, "https://example.org/");
}

TEST(DocumentLoader, ReadsDirectiveAndSubstitutionMembers)
{
    auto tree = termpost::doc::parseDocument(R"({"kind": "document", "children": [
        {"kind": "directive", "name": "update", "argument": "05/06/2024"},
        {"kind": "substitution", "name": "Warning"}
    ]})");

    ASSERT_EQ(tree.children.size(), 2u);
    EXPECT_EQ(tree.children[0].name, "update");
    EXPECT_EQ(tree.children[0].argument, "05/06/2024");
    EXPECT_EQ(tree.children[1].kind, NodeKind::Substitution);
    EXPECT_EQ(tree.children[1].name, "Warning");
}

TEST(DocumentLoader, UnknownKindsAreKept)
{
    auto tree = termpost::doc::parseDocument(R"({"kind": "table", "children": ["cell"]})");
    EXPECT_EQ(tree.kind, NodeKind::Unknown);
    EXPECT_EQ(tree.name, "table");
    EXPECT_EQ(tree.plainText(), "cell");
}

TEST(DocumentLoader, MissingKindMeansText)
{
    auto tree = termpost::doc::parseDocument(R"({"text": "loose"})");
    EXPECT_EQ(tree.kind, NodeKind::PlainText);
    EXPECT_EQ(tree.text, "loose");
}

TEST(DocumentLoader, MalformedInputThrows)
{
    EXPECT_THROW(termpost::doc::parseDocument("{not json"), termpost::DocumentError);
    EXPECT_THROW(termpost::doc::parseDocument("[1, 2]"), termpost::DocumentError);
    EXPECT_THROW(termpost::doc::parseDocument(R"({"kind": "paragraph", "children": "x"})"), termpost::DocumentError);
    EXPECT_THROW(termpost::doc::parseDocument(R"({"kind": "paragraph", "children": [42]})"), termpost::DocumentError);
}

TEST(DocumentLoader, LoadsFromFile)
{
    auto path = std::filesystem::temp_directory_path() / "term_post_loader_test.json";
    {
        std::ofstream out(path);
        out << R"({"kind": "paragraph", "children": ["from disk"]})";
    }

    auto tree = termpost::doc::loadDocument(path);
    EXPECT_EQ(tree.plainText(), "from disk");

    std::error_code ec;
    std::filesystem::remove(path, ec);
    EXPECT_THROW(termpost::doc::loadDocument(path), termpost::DocumentError);
}
