#include "termpost/doc/document.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace termpost::doc
{
namespace
{

struct KindEntry
{
    NodeKind kind;
    std::string_view name;
};

constexpr std::array<KindEntry, 19> kKinds{{
    {NodeKind::Document, "document"},
    {NodeKind::Section, "section"},
    {NodeKind::Title, "title"},
    {NodeKind::Subtitle, "subtitle"},
    {NodeKind::Paragraph, "paragraph"},
    {NodeKind::Strong, "strong"},
    {NodeKind::Emphasis, "emphasis"},
    {NodeKind::Literal, "literal"},
    {NodeKind::Reference, "reference"},
    {NodeKind::BulletList, "bullet_list"},
    {NodeKind::EnumeratedList, "enumerated_list"},
    {NodeKind::ListItem, "list_item"},
    {NodeKind::Substitution, "substitution"},
    {NodeKind::Directive, "directive"},
    {NodeKind::Transition, "transition"},
    {NodeKind::DocInfo, "docinfo"},
    {NodeKind::Field, "field"},
    {NodeKind::PlainText, "text"},
    {NodeKind::Unknown, "unknown"},
}};

void appendText(const DocumentNode &node, std::string &out)
{
    out += node.text;
    for (const auto &child : node.children)
        appendText(child, out);
}

} // namespace

std::string DocumentNode::plainText() const
{
    std::string result;
    appendText(*this, result);
    return result;
}

std::string_view kindName(NodeKind kind) noexcept
{
    auto it = std::find_if(kKinds.begin(), kKinds.end(), [&](const KindEntry &entry)
                           { return entry.kind == kind; });
    if (it == kKinds.end())
        return "unknown";
    return it->name;
}

std::optional<NodeKind> kindFromName(std::string_view name) noexcept
{
    auto it = std::find_if(kKinds.begin(), kKinds.end(), [&](const KindEntry &entry)
                           { return entry.name == name; });
    if (it == kKinds.end())
        return std::nullopt;
    return it->kind;
}

DocumentNode makeText(std::string text)
{
    DocumentNode node;
    node.kind = NodeKind::PlainText;
    node.text = std::move(text);
    return node;
}

DocumentNode makeNode(NodeKind kind, std::vector<DocumentNode> children)
{
    DocumentNode node;
    node.kind = kind;
    node.children = std::move(children);
    return node;
}

DocumentNode makeNode(NodeKind kind, std::string text)
{
    DocumentNode node;
    node.kind = kind;
    node.children.push_back(makeText(std::move(text)));
    return node;
}

DocumentNode makeReference(std::string text, std::string target)
{
    DocumentNode node = makeNode(NodeKind::Reference, std::move(text));
    node.target = std::move(target);
    return node;
}

DocumentNode makeSubstitution(std::string name, std::string text)
{
    DocumentNode node;
    node.kind = NodeKind::Substitution;
    node.name = std::move(name);
    node.text = std::move(text);
    return node;
}

DocumentNode makeDirective(std::string name, std::string argument, std::vector<DocumentNode> children)
{
    DocumentNode node = makeNode(NodeKind::Directive, std::move(children));
    node.name = std::move(name);
    node.argument = std::move(argument);
    return node;
}

DocumentNode makeField(std::string name, std::string value)
{
    DocumentNode node;
    node.kind = NodeKind::Field;
    node.name = std::move(name);
    node.text = std::move(value);
    return node;
}

const DocumentNode *findFirst(const DocumentNode &root, NodeKind kind)
{
    if (root.kind == kind)
        return &root;
    for (const auto &child : root.children)
    {
        if (const DocumentNode *found = findFirst(child, kind))
            return found;
    }
    return nullptr;
}

} // namespace termpost::doc
