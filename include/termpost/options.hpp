#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace termpost::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String
};

// Unset options hold std::monostate.
using OptionValue = std::variant<std::monostate, bool, std::int64_t, std::string>;

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string displayName;
    std::string description;
    std::optional<std::int64_t> minimum;
};

// Settings of one tool, layered as defaults < saved defaults < option files <
// command line. Every stored value already has the kind of its definition;
// anything that cannot be converted, or an integer below its minimum, raises
// ConfigurationError.
class OptionRegistry
{
public:
    explicit OptionRegistry(std::string toolId);

    const std::string &toolId() const noexcept { return id; }

    void registerOption(OptionDefinition definition);
    bool hasOption(const std::string &key) const noexcept;

    void set(const std::string &key, const OptionValue &value);
    void setFromString(const std::string &key, const std::string &text) { set(key, OptionValue(text)); }
    void reset(const std::string &key);

    // Unknown keys raise ConfigurationError.
    const OptionValue &get(const std::string &key) const;
    bool getBool(const std::string &key) const;
    std::int64_t getInteger(const std::string &key) const;
    std::string getString(const std::string &key) const;
    std::optional<std::string> getOptionalString(const std::string &key) const;

    // A missing or unparsable file is reported as false; a value of the wrong
    // kind throws.
    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool loadDefaults();
    bool saveDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    std::vector<OptionDefinition> listRegisteredOptions() const;

    static std::filesystem::path configRoot();

private:
    struct Entry
    {
        OptionDefinition definition;
        std::optional<OptionValue> value;
    };

    const Entry &entry(const std::string &key) const;

    std::string id;
    std::map<std::string, Entry> entries;
};

} // namespace termpost::config
