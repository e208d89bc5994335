#pragma once

#include <string>
#include <utility>

#include <fmt/core.h>

/**
 * Leveled logging to stderr.
 * stdout is reserved for the in-place progress line, so log output never
 * tears it apart.
 */
namespace logger
{

enum class Level
{
    Debug,
    Info,
    Warn,
    Error
};

void setLevel(Level level);
Level level();

/**
 * Write one already-formatted line if `lvl` passes the current threshold.
 */
void write(Level lvl, const std::string &message);

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args &&...args)
{
    if (level() <= Level::Debug)
    {
        write(Level::Debug, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args &&...args)
{
    if (level() <= Level::Info)
    {
        write(Level::Info, fmt::format(format, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args &&...args)
{
    write(Level::Warn, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args &&...args)
{
    write(Level::Error, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace logger
