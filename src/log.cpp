#include "log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <set>

namespace logging
{

static std::atomic<level> current_level {level::info};
static std::mutex component_mutex;
static std::set<std::string, std::less<>> debug_components;

static const char* level_name(level lvl)
{
    switch(lvl)
    {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warning:
            return "warning";
        case level::error:
            return "error";
        default:
            return "";
    }
}

void set_level(level lvl)
{
    current_level.store(lvl);
}

level get_level()
{
    return current_level.load();
}

void set_debug_components(std::string_view components)
{
    std::lock_guard<std::mutex> lock {component_mutex};
    debug_components.clear();
    while(!components.empty())
    {
        size_t sep = components.find(',');
        std::string_view name = components.substr(0, sep);
        if(!name.empty())
            debug_components.emplace(name);
        if(sep == std::string::npos)
            break;
        components.remove_prefix(sep + 1);
    }
}

bool enabled(level lvl, std::string_view component)
{
    if(lvl == level::off || lvl < current_level.load())
        return false;
    if(lvl != level::debug)
        return true;

    std::lock_guard<std::mutex> lock {component_mutex};
    return debug_components.empty() || debug_components.find(component) != debug_components.end();
}

void write(level lvl, std::string_view component, std::string_view message)
{
    // One call per line so concurrent handlers do not interleave
    fmt::print(stderr, "[{}] [{}] {}\n", level_name(lvl), component, message);
}

} // namespace logging
