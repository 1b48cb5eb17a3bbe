#ifndef UPNP_DEVICE_HPP
#define UPNP_DEVICE_HPP

#include <chrono>
#include <optional>
#include <string>

#include "device_registry.hpp"
#include "http/client.hpp"

namespace upnp
{

constexpr const char* dial_service_type = "urn:dial-multiscreen-org:service:dial:1";

// A discovered device whose DIAL application-control url is known. Refetch for an updated view.
struct dial_device
{
    discovery::discovered_device device;
    std::string friendly_name;
    std::string application_url; /// absolute, always ends with '/'
    std::string manufacturer;
    std::string model_name;
    std::string udn;
};

// Registry timestamps of the embedded device are not compared
bool operator==(const dial_device& lhs, const dial_device& rhs);

bool operator!=(const dial_device& lhs, const dial_device& rhs);

struct device_description
{
    std::string friendly_name;
    std::string manufacturer;
    std::string model_name;
    std::string udn;
    std::string url_base;
    std::optional<std::string> dial_control_url;
};

// Throws appcast::malformed_description if xml is not well formed or lacks <friendlyName>
device_description parse_description(const std::string& xml);

class description_resolver
{
public:

    description_resolver() = delete;
    description_resolver(const description_resolver&) = delete;
    description_resolver& operator=(const description_resolver&) = delete;

    explicit description_resolver(http::client& client);

    // Throws appcast::unreachable_device, appcast::malformed_description or appcast::no_dial_service
    dial_device resolve(const discovery::discovered_device& device, std::chrono::milliseconds http_timeout) const;

private:

    http::client& m_client;

};

} // namespace upnp

#endif
