#include "termpost/motd/post_record.hpp"

#include "termpost/errors.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <fstream>
#include <sstream>

namespace termpost::motd
{
namespace
{

bool parseDigits(std::string_view view, unsigned &value) noexcept
{
    value = 0;
    for (char ch : view)
    {
        if (!std::isdigit(static_cast<unsigned char>(ch)))
            return false;
        value = value * 10 + static_cast<unsigned>(ch - '0');
    }
    return !view.empty();
}

std::string trim(std::string_view view)
{
    std::size_t start = 0;
    std::size_t end = view.size();
    while (start < end && std::isspace(static_cast<unsigned char>(view[start])))
        ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(view[end - 1])))
        --end;
    return std::string(view.substr(start, end - start));
}

const doc::DocumentNode *findField(const doc::DocumentNode &node, std::string_view name)
{
    if (node.kind == doc::NodeKind::Field && node.name == name)
        return &node;
    for (const auto &child : node.children)
    {
        if (const doc::DocumentNode *found = findField(child, name))
            return found;
    }
    return nullptr;
}

} // namespace

Clock::time_point parsePostDate(std::string_view date)
{
    std::string text = trim(date);
    const std::string error = "Invalid post date '" + std::string(date) + "', expected DD/MM/YYYY";
    if (text.size() != 10 || text[2] != '/' || text[5] != '/')
        throw DateParseError(error);

    unsigned day = 0;
    unsigned month = 0;
    unsigned year = 0;
    std::string_view view(text);
    if (!parseDigits(view.substr(0, 2), day) || !parseDigits(view.substr(3, 2), month) ||
        !parseDigits(view.substr(6, 4), year))
        throw DateParseError(error);

    std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(year)}, std::chrono::month{month},
                                    std::chrono::day{day}};
    if (!ymd.ok())
        throw DateParseError(error);
    return std::chrono::sys_days{ymd};
}

PostRecord parsePostRecord(const std::string &json, const std::filesystem::path &baseDirectory)
{
    nlohmann::json data;
    try
    {
        data = nlohmann::json::parse(json);
    }
    catch (const nlohmann::json::parse_error &err)
    {
        throw DocumentError(std::string("Invalid JSON post record: ") + err.what());
    }
    if (!data.is_object())
        throw DocumentError("Malformed post record: expected a JSON object");

    PostRecord record;
    auto date = data.find("date");
    if (date == data.end() || !date->is_string())
        throw DocumentError("Malformed post record: missing date");
    record.date = date->get<std::string>();

    auto link = data.find("html_link");
    if (link != data.end() && link->is_string() && !link->get<std::string>().empty())
        record.htmlLink = link->get<std::string>();

    auto source = data.find("source");
    if (source != data.end() && source->is_string())
        record.source = source->get<std::string>();
    if (record.source.empty())
    {
        if (!record.htmlLink)
            throw DocumentError("Malformed post record: missing source");
        return record;
    }
    if (record.source.is_relative() && !baseDirectory.empty())
        record.source = (baseDirectory / record.source).lexically_normal();
    return record;
}

PostRecord loadPostRecord(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in)
        throw DocumentError("Post record not found: '" + path.string() + "'");
    std::ostringstream buffer;
    buffer << in.rdbuf();
    try
    {
        return parsePostRecord(buffer.str(), path.parent_path());
    }
    catch (const DocumentError &err)
    {
        throw DocumentError(std::string(err.what()) + " in '" + path.string() + "'");
    }
}

PostInfo postInfoFromDocument(const doc::DocumentNode &tree, const std::string &origin)
{
    PostInfo info;
    const doc::DocumentNode *title = doc::findFirst(tree, doc::NodeKind::Title);
    if (!title)
        throw DocumentError("Malformed news post, missing title: '" + origin + "'");
    info.title = title->plainText();

    const doc::DocumentNode *date = findField(tree, "date");
    if (!date)
        throw DocumentError("Malformed news post, missing date: '" + origin + "'");
    info.date = trim(date->plainText());
    return info;
}

} // namespace termpost::motd
