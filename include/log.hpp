#ifndef APPCAST_LOG_HPP
#define APPCAST_LOG_HPP

#include <string>
#include <string_view>
#include <utility>

#include "fmt/format.h"

namespace logging
{

enum class level
{
    debug,
    info,
    warning,
    error,
    off
};

void set_level(level lvl);

level get_level();

// Restrict debug output to a comma separated list of components (e.g. "ssdp,dial").
// An empty list enables debug output for every component.
void set_debug_components(std::string_view components);

bool enabled(level lvl, std::string_view component);

void write(level lvl, std::string_view component, std::string_view message);

template<typename... Args>
void log(level lvl, std::string_view component, fmt::format_string<Args...> format, Args&&... args)
{
    // Skip formatting when nothing would be printed
    if(!enabled(lvl, component))
        return;
    write(lvl, component, fmt::format(format, std::forward<Args>(args)...));
}

template<typename... Args>
void debug(std::string_view component, fmt::format_string<Args...> format, Args&&... args)
{
    log(level::debug, component, format, std::forward<Args>(args)...);
}

template<typename... Args>
void info(std::string_view component, fmt::format_string<Args...> format, Args&&... args)
{
    log(level::info, component, format, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(std::string_view component, fmt::format_string<Args...> format, Args&&... args)
{
    log(level::warning, component, format, std::forward<Args>(args)...);
}

template<typename... Args>
void error(std::string_view component, fmt::format_string<Args...> format, Args&&... args)
{
    log(level::error, component, format, std::forward<Args>(args)...);
}

} // namespace logging

#endif
