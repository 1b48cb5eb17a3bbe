#ifndef APPCAST_CONFIG_HPP
#define APPCAST_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "log.hpp"

#define DISCOVERY_IP "239.255.255.250"
#define DISCOVERY_PORT 1900
#define DISCOVERY_TIME 3000
#define DISCOVERY_TTL 4
#define DEFAULT_EXPIRY 1800
#define HTTP_TIMEOUT 5000

namespace appcast
{

struct retry_policy
{
    // Total number of attempts for operations failing with device_busy or unreachable_device
    unsigned int attempts = 1;
    std::chrono::milliseconds delay {500};
};

struct config
{
    std::string multicast_addr = DISCOVERY_IP;
    uint16_t multicast_port = DISCOVERY_PORT;
    int multicast_ttl = DISCOVERY_TTL;
    std::string interface_addr; /// empty selects the first non loopback interface

    std::chrono::milliseconds discovery_window {DISCOVERY_TIME};
    std::chrono::seconds default_expiry {DEFAULT_EXPIRY};
    std::chrono::seconds refresh_interval {60};

    std::chrono::milliseconds http_timeout {HTTP_TIMEOUT};
    retry_policy retry;

    logging::level log_level = logging::level::info;
    std::string debug_components;
};

// Throws std::invalid_argument for unknown names
logging::level parse_log_level(std::string_view name);

// Applies the logging related settings
void apply_logging(const config& cfg);

} // namespace appcast

#endif
