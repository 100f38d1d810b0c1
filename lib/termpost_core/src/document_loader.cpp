#include "termpost/doc/document_loader.hpp"

#include "termpost/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace termpost::doc
{
namespace
{

std::string stringMember(const nlohmann::json &object, const char *key)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null())
        return {};
    if (it->is_string())
        return it->get<std::string>();
    return it->dump();
}

DocumentNode fromJson(const nlohmann::json &value, const std::string &origin)
{
    if (value.is_string())
        return makeText(value.get<std::string>());
    if (!value.is_object())
        throw DocumentError("Malformed document tree in '" + origin + "': node is not an object");

    DocumentNode node;
    std::string kind = stringMember(value, "kind");
    if (kind.empty())
        kind = "text";
    if (auto known = kindFromName(kind))
    {
        node.kind = *known;
    }
    else
    {
        node.kind = NodeKind::Unknown;
        node.name = kind;
    }

    node.text = stringMember(value, "text");
    if (node.kind != NodeKind::Unknown)
        node.name = stringMember(value, "name");
    node.target = stringMember(value, "refuri");
    node.argument = stringMember(value, "argument");

    auto children = value.find("children");
    if (children != value.end())
    {
        if (!children->is_array())
            throw DocumentError("Malformed document tree in '" + origin + "': children of '" + kind +
                                "' is not an array");
        node.children.reserve(children->size());
        for (const auto &child : *children)
            node.children.push_back(fromJson(child, origin));
    }
    return node;
}

} // namespace

DocumentNode parseDocument(const std::string &json, const std::string &origin)
{
    nlohmann::json data;
    try
    {
        data = nlohmann::json::parse(json);
    }
    catch (const nlohmann::json::parse_error &err)
    {
        throw DocumentError("Invalid JSON document tree in '" + origin + "': " + err.what());
    }
    return fromJson(data, origin);
}

DocumentNode loadDocument(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in)
        throw DocumentError("Document file not found: '" + path.string() + "'");
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parseDocument(buffer.str(), path.string());
}

} // namespace termpost::doc
