#include "logger.hpp"

#include <cstdio>

namespace logger
{

namespace
{

Level &levelRef()
{
    static Level current = Level::Info;
    return current;
}

const char *tag(Level lvl)
{
    switch (lvl)
    {
    case Level::Debug:
        return "debug";
    case Level::Info:
        return "info";
    case Level::Warn:
        return "warn";
    case Level::Error:
        return "error";
    }
    return "?";
}

} // namespace

void setLevel(Level lvl)
{
    levelRef() = lvl;
}

Level level()
{
    return levelRef();
}

void write(Level lvl, const std::string &message)
{
    if (lvl < levelRef())
    {
        return;
    }

    // Flush any pending progress text so the two streams stay ordered
    std::fflush(stdout);
    fmt::print(stderr, "[{}] {}\n", tag(lvl), message);
}

} // namespace logger
