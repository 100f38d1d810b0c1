#include "termpost/options.hpp"

#include "termpost/errors.hpp"
#include "termpost/paths.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace termpost::config
{
namespace
{

std::string lowercase(std::string_view text)
{
    std::string result(text);
    for (char &ch : result)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return result;
}

std::optional<bool> readBool(std::string_view text)
{
    const std::string word = lowercase(text);
    if (word == "true" || word == "yes" || word == "on" || word == "1")
        return true;
    if (word == "false" || word == "no" || word == "off" || word == "0")
        return false;
    return std::nullopt;
}

std::optional<std::int64_t> readInteger(std::string_view text)
{
    std::int64_t number = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [end, error] = std::from_chars(first, last, number);
    if (text.empty() || error != std::errc() || end != last)
        return std::nullopt;
    return number;
}

const char *kindLabel(OptionKind kind) noexcept
{
    switch (kind)
    {
    case OptionKind::Boolean:
        return "a boolean";
    case OptionKind::Integer:
        return "an integer";
    case OptionKind::String:
        return "a string";
    }
    return "a value";
}

std::string describe(const OptionValue &value)
{
    if (const auto *text = std::get_if<std::string>(&value))
        return "'" + *text + "'";
    if (const auto *flag = std::get_if<bool>(&value))
        return *flag ? "true" : "false";
    if (const auto *number = std::get_if<std::int64_t>(&value))
        return std::to_string(*number);
    return "nothing";
}

[[noreturn]] void rejectValue(const OptionDefinition &definition, const std::string &found)
{
    throw ConfigurationError("Option '" + definition.key + "' expects " + kindLabel(definition.kind) + ", got " +
                             found);
}

// Converts value to the kind of the definition and checks the minimum.
OptionValue coerce(const OptionDefinition &definition, const OptionValue &value)
{
    if (std::holds_alternative<std::monostate>(value))
        return value;

    const auto *text = std::get_if<std::string>(&value);
    switch (definition.kind)
    {
    case OptionKind::Boolean:
    {
        if (const auto *flag = std::get_if<bool>(&value))
            return *flag;
        std::optional<bool> parsed = text ? readBool(*text) : std::nullopt;
        if (!parsed)
            rejectValue(definition, describe(value));
        return *parsed;
    }
    case OptionKind::Integer:
    {
        std::optional<std::int64_t> parsed;
        if (const auto *number = std::get_if<std::int64_t>(&value))
            parsed = *number;
        else if (text)
            parsed = readInteger(*text);
        if (!parsed)
            rejectValue(definition, describe(value));
        if (definition.minimum && *parsed < *definition.minimum)
            throw ConfigurationError("Option '" + definition.key + "' must be at least " +
                                     std::to_string(*definition.minimum) + ", got " + std::to_string(*parsed));
        return *parsed;
    }
    case OptionKind::String:
        if (text)
            return *text;
        return describe(value);
    }
    return value;
}

OptionValue valueFromJson(const OptionDefinition &definition, const nlohmann::json &json)
{
    if (json.is_null())
        return OptionValue();
    if (json.is_boolean())
        return coerce(definition, OptionValue(json.get<bool>()));
    if (json.is_number_integer())
        return coerce(definition, OptionValue(json.get<std::int64_t>()));
    if (json.is_string())
        return coerce(definition, OptionValue(json.get<std::string>()));
    rejectValue(definition, json.dump());
}

nlohmann::json valueToJson(const OptionValue &value)
{
    if (const auto *flag = std::get_if<bool>(&value))
        return *flag;
    if (const auto *number = std::get_if<std::int64_t>(&value))
        return *number;
    if (const auto *text = std::get_if<std::string>(&value))
        return *text;
    return nullptr;
}

std::filesystem::path environmentPath(const char *name)
{
    const char *value = std::getenv(name);
    if (!value || !*value)
        return {};
    return std::filesystem::path(value);
}

} // namespace

OptionRegistry::OptionRegistry(std::string toolId)
    : id(std::move(toolId))
{
}

void OptionRegistry::registerOption(OptionDefinition definition)
{
    definition.defaultValue = coerce(definition, definition.defaultValue);
    std::string key = definition.key;
    entries[key] = Entry{std::move(definition), std::nullopt};
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return entries.count(key) != 0;
}

void OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    auto it = entries.find(key);
    if (it == entries.end())
        throw ConfigurationError("Unknown option '" + key + "' for " + id);
    it->second.value = coerce(it->second.definition, value);
}

void OptionRegistry::reset(const std::string &key)
{
    auto it = entries.find(key);
    if (it != entries.end())
        it->second.value.reset();
}

const OptionValue &OptionRegistry::get(const std::string &key) const
{
    const Entry &found = entry(key);
    return found.value ? *found.value : found.definition.defaultValue;
}

bool OptionRegistry::getBool(const std::string &key) const
{
    const auto *flag = std::get_if<bool>(&get(key));
    return flag && *flag;
}

std::int64_t OptionRegistry::getInteger(const std::string &key) const
{
    const auto *number = std::get_if<std::int64_t>(&get(key));
    return number ? *number : 0;
}

std::string OptionRegistry::getString(const std::string &key) const
{
    const auto *text = std::get_if<std::string>(&get(key));
    return text ? *text : std::string();
}

std::optional<std::string> OptionRegistry::getOptionalString(const std::string &key) const
{
    std::string text = getString(key);
    if (text.empty())
        return std::nullopt;
    return text;
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object())
        return false;

    for (auto member = data.begin(); member != data.end(); ++member)
    {
        auto it = entries.find(member.key());
        if (it == entries.end())
            continue;
        it->second.value = valueFromJson(it->second.definition, member.value());
    }
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, stored] : entries)
        data[key] = valueToJson(stored.value ? *stored.value : stored.definition.defaultValue);

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);
    try
    {
        paths::writeFileAtomically(filePath, data.dump(2) + "\n");
    }
    catch (const std::runtime_error &)
    {
        return false;
    }
    return true;
}

bool OptionRegistry::loadDefaults()
{
    return loadFromFile(defaultOptionsPath());
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(defaultOptionsPath());
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(entries.size());
    for (const auto &[key, stored] : entries)
        result.push_back(stored.definition);
    return result;
}

std::filesystem::path OptionRegistry::configRoot()
{
    std::filesystem::path base = environmentPath("XDG_CONFIG_HOME");
    if (base.empty())
    {
        std::filesystem::path home = environmentPath("HOME");
        base = home.empty() ? std::filesystem::path(".config") : home / ".config";
    }
    return base / "term-post";
}

const OptionRegistry::Entry &OptionRegistry::entry(const std::string &key) const
{
    auto it = entries.find(key);
    if (it == entries.end())
        throw ConfigurationError("Unknown option '" + key + "' for " + id);
    return it->second;
}

} // namespace termpost::config
