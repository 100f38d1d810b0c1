#include "termpost/log.hpp"

#include <utility>

namespace termpost::log
{

std::string_view levelName(Level level) noexcept
{
    switch (level)
    {
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Warning:
        return "warning";
    case Level::Error:
        return "error";
    }
    return "unknown";
}

Logger::Logger(std::string toolName, std::ostream *sink, Level threshold)
    : tool(std::move(toolName)), out(sink), threshold(threshold)
{
}

bool Logger::enabled(Level level) const noexcept
{
    return out && static_cast<int>(level) >= static_cast<int>(threshold);
}

void Logger::write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;
    *out << tool << ": " << levelName(level) << ": " << message << std::endl;
}

} // namespace termpost::log
