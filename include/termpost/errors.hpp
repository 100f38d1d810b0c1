#pragma once

#include <stdexcept>
#include <string>

namespace termpost
{

// Usage errors: negative widths or lifespans, unreadable resources, bad links.
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

class DateParseError : public std::runtime_error
{
public:
    explicit DateParseError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Unreadable or malformed document trees and post records.
class DocumentError : public std::runtime_error
{
public:
    explicit DocumentError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace termpost
