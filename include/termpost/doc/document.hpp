#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termpost::doc
{

enum class NodeKind
{
    Document,
    Section,
    Title,
    Subtitle,
    Paragraph,
    Strong,
    Emphasis,
    Literal,
    Reference,
    BulletList,
    EnumeratedList,
    ListItem,
    Substitution,
    Directive,
    Transition,
    DocInfo,
    Field,
    PlainText,
    Unknown
};

struct DocumentNode
{
    NodeKind kind = NodeKind::Unknown;
    std::string text;
    std::vector<DocumentNode> children;

    // Reference target, substitution name, directive name, field name, or the
    // kind name an Unknown node was loaded from.
    std::string name;
    std::string target;
    std::string argument;

    // Concatenated text of this node and all of its descendants.
    std::string plainText() const;
};

std::string_view kindName(NodeKind kind) noexcept;
std::optional<NodeKind> kindFromName(std::string_view name) noexcept;

// Builders for assembling trees in code.
DocumentNode makeText(std::string text);
DocumentNode makeNode(NodeKind kind, std::vector<DocumentNode> children = {});
DocumentNode makeNode(NodeKind kind, std::string text);
DocumentNode makeReference(std::string text, std::string target);
DocumentNode makeSubstitution(std::string name, std::string text = {});
DocumentNode makeDirective(std::string name, std::string argument, std::vector<DocumentNode> children = {});
DocumentNode makeField(std::string name, std::string value);

const DocumentNode *findFirst(const DocumentNode &root, NodeKind kind);

} // namespace termpost::doc
