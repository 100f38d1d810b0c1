#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace termpost::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error
};

std::string_view levelName(Level level) noexcept;

class Logger
{
public:
    Logger(std::string toolName, std::ostream *sink, Level threshold = Level::Warning);

    void setThreshold(Level level) noexcept { threshold = level; }
    Level currentThreshold() const noexcept { return threshold; }
    bool enabled(Level level) const noexcept;

    void write(Level level, std::string_view message);
    void debug(std::string_view message) { write(Level::Debug, message); }
    void info(std::string_view message) { write(Level::Info, message); }
    void warning(std::string_view message) { write(Level::Warning, message); }
    void error(std::string_view message) { write(Level::Error, message); }

private:
    std::string tool;
    std::ostream *out;
    Level threshold;
};

// Helpers for library code that receives an optional logger.
inline void debug(Logger *logger, std::string_view message)
{
    if (logger)
        logger->debug(message);
}

inline void info(Logger *logger, std::string_view message)
{
    if (logger)
        logger->info(message);
}

inline void warning(Logger *logger, std::string_view message)
{
    if (logger)
        logger->warning(message);
}

} // namespace termpost::log
