#include <gtest/gtest.h>

#include "termpost/doc/document.hpp"

using termpost::doc::NodeKind;

TEST(Document, KindNamesRoundTrip)
{
    EXPECT_EQ(termpost::doc::kindName(NodeKind::BulletList), "bullet_list");
    EXPECT_EQ(termpost::doc::kindName(NodeKind::PlainText), "text");
    EXPECT_EQ(termpost::doc::kindFromName("enumerated_list"), NodeKind::EnumeratedList);
    EXPECT_EQ(termpost::doc::kindFromName("docinfo"), NodeKind::DocInfo);
    EXPECT_FALSE(termpost::doc::kindFromName("table").has_value());
}

TEST(Document, PlainTextConcatenatesDescendants)
{
    auto paragraph = termpost::doc::makeNode(
        NodeKind::Paragraph, {termpost::doc::makeText("a "), termpost::doc::makeNode(NodeKind::Strong, "b"),
                              termpost::doc::makeReference(" c", "https://example.org/")});
    EXPECT_EQ(paragraph.plainText(), "a b c");
}

TEST(Document, FindFirstSearchesDepthFirst)
{
    auto tree = termpost::doc::makeNode(
        NodeKind::Document,
        {termpost::doc::makeNode(NodeKind::Section, {termpost::doc::makeNode(NodeKind::Title, "Inner")}),
         termpost::doc::makeNode(NodeKind::Title, "Outer")});

    const auto *title = termpost::doc::findFirst(tree, NodeKind::Title);
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->plainText(), "Inner");
    EXPECT_EQ(termpost::doc::findFirst(tree, NodeKind::Literal), nullptr);
}

TEST(Document, BuildersFillNamedMembers)
{
    auto directive = termpost::doc::makeDirective("update", "01/01/2024");
    EXPECT_EQ(directive.kind, NodeKind::Directive);
    EXPECT_EQ(directive.name, "update");
    EXPECT_EQ(directive.argument, "01/01/2024");

    auto field = termpost::doc::makeField("date", "02/03/2024");
    EXPECT_EQ(field.name, "date");
    EXPECT_EQ(field.plainText(), "02/03/2024");

    auto badge = termpost::doc::makeSubstitution("Info");
    EXPECT_EQ(badge.name, "Info");
    EXPECT_TRUE(badge.text.empty());
}
