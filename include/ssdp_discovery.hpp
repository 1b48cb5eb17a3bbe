#ifndef SSDP_DISCOVERY_HPP
#define SSDP_DISCOVERY_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "device_registry.hpp"
#include "ssdp_transport.hpp"

namespace discovery
{

// Parses "max-age=N" out of a CACHE-CONTROL header value
std::optional<std::chrono::seconds> parse_max_age(std::string_view cache_control);

// Validates a response against the expected search target.
// Returns nullopt if LOCATION, USN or ST is missing, ST differs or LOCATION is no absolute url.
std::optional<discovered_device> to_device(const ssdp_response& res, const std::string& search_target);

class ssdp_discovery
{
public:

    ssdp_discovery() = delete;
    ssdp_discovery(const ssdp_discovery&) = delete;
    ssdp_discovery& operator=(const ssdp_discovery&) = delete;

    ssdp_discovery(transport& source, device_registry& registry, std::string search_target = dial_search_target);

    // Runs one discovery round and returns all non-expired devices afterwards.
    // Throws appcast::transport_error if the search could not be sent.
    std::vector<discovered_device> discover(std::chrono::milliseconds timeout);

    device_registry& registry() const
    {
        return m_registry;
    }

private:

    void handle_response(const ssdp_response& res);

    transport& m_transport;

    device_registry& m_registry;

    const std::string m_search_target;

};

} // namespace discovery

#endif
