#include "config.hpp"

#include <stdexcept>

#include "utils.hpp"

namespace appcast
{

logging::level parse_log_level(std::string_view name)
{
    if(utils::iequals(name, "debug"))
        return logging::level::debug;
    if(utils::iequals(name, "info"))
        return logging::level::info;
    if(utils::iequals(name, "warning") || utils::iequals(name, "warn"))
        return logging::level::warning;
    if(utils::iequals(name, "error"))
        return logging::level::error;
    if(utils::iequals(name, "off"))
        return logging::level::off;
    throw std::invalid_argument {"Unknown log level: " + std::string {name}};
}

void apply_logging(const config& cfg)
{
    logging::set_level(cfg.log_level);
    logging::set_debug_components(cfg.debug_components);
}

} // namespace appcast
