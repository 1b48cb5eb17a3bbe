#include "upnp_device.hpp"

#include <vector>

#include "rapidxml/rapidxml.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

using namespace rapidxml;

namespace upnp
{

bool operator==(const dial_device& lhs, const dial_device& rhs)
{
    return lhs.device.usn == rhs.device.usn &&
        lhs.device.location == rhs.device.location &&
        lhs.device.server == rhs.device.server &&
        lhs.device.search_target == rhs.device.search_target &&
        lhs.friendly_name == rhs.friendly_name &&
        lhs.application_url == rhs.application_url &&
        lhs.manufacturer == rhs.manufacturer &&
        lhs.model_name == rhs.model_name &&
        lhs.udn == rhs.udn;
}

bool operator!=(const dial_device& lhs, const dial_device& rhs)
{
    return !(lhs == rhs);
}

static std::string node_value(xml_node<char>* parent, const char* name)
{
    if(!parent)
        return {};
    xml_node<char>* node = parent->first_node(name);
    if(!node)
        return {};
    return std::string {utils::trim(std::string_view {node->value(), node->value_size()})};
}

// Searches the service list of a device and of all embedded devices
static std::optional<std::string> find_dial_control_url(xml_node<char>* device_node)
{
    if(xml_node<char>* service_root = device_node->first_node("serviceList"))
    {
        for(xml_node<char>* service_node = service_root->first_node("service"); service_node; service_node = service_node->next_sibling("service"))
        {
            if(node_value(service_node, "serviceType") != dial_service_type)
                continue;

            std::string control_url = node_value(service_node, "controlURL");
            if(!control_url.empty())
                return control_url;
        }
    }

    if(xml_node<char>* device_root = device_node->first_node("deviceList"))
    {
        for(xml_node<char>* embedded = device_root->first_node("device"); embedded; embedded = embedded->next_sibling("device"))
        {
            if(auto url = find_dial_control_url(embedded))
                return url;
        }
    }

    return std::nullopt;
}

device_description parse_description(const std::string& xml)
{
    // rapidxml parses in place and needs a terminated, mutable buffer
    std::vector<char> buffer(xml.begin(), xml.end());
    buffer.push_back('\0');

    xml_document<char> doc;
    try {
        doc.parse<0>(buffer.data());
    } catch(rapidxml::parse_error& e) {
        throw appcast::malformed_description {std::string {"Invalid device description: "} + e.what()};
    }

    xml_node<char>* root = doc.first_node("root");
    xml_node<char>* device_node = root ? root->first_node("device") : nullptr;
    if(!device_node || !device_node->first_node("friendlyName"))
        throw appcast::malformed_description {"Device description without <friendlyName>"};

    device_description desc;
    desc.friendly_name = node_value(device_node, "friendlyName");
    desc.manufacturer = node_value(device_node, "manufacturer");
    desc.model_name = node_value(device_node, "modelName");
    desc.udn = node_value(device_node, "UDN");
    desc.url_base = node_value(root, "URLBase");
    desc.dial_control_url = find_dial_control_url(device_node);

    return desc;
}

description_resolver::description_resolver(http::client& client)
    : m_client {client}
{}

dial_device description_resolver::resolve(const discovery::discovered_device& device, std::chrono::milliseconds http_timeout) const
{
    http::request req;
    try {
        req = http::request {"GET", device.location};
    } catch(std::invalid_argument& e) {
        throw appcast::unreachable_device {fmt::format("Invalid location {}: {}", device.location, e.what())};
    }

    http::response res = m_client.perform(req, http_timeout);
    if(!res.success())
        throw appcast::unreachable_device {fmt::format("Description fetch from {} failed with {}", device.location, res.get_code())};

    device_description desc = parse_description(res.get_body());

    // DIAL announces the application url in a header of the description response,
    // older receivers only list the service in the description body
    std::string app_url = std::string {utils::trim(res.get_header("Application-URL"))};
    std::string base = device.location;
    if(app_url.empty())
    {
        if(!desc.dial_control_url)
            throw appcast::no_dial_service {fmt::format("Device {} does not advertise a DIAL service", device.usn)};

        app_url = *desc.dial_control_url;
        if(utils::is_absolute_url(desc.url_base))
            base = desc.url_base;
    }

    try {
        app_url = utils::resolve_url(base, app_url);
    } catch(std::invalid_argument& e) {
        throw appcast::no_dial_service {fmt::format("Unusable application url {}: {}", app_url, e.what())};
    }
    if(app_url.back() != '/')
        app_url.push_back('/');

    logging::debug("upnp", "Resolved {} ({}) to application url {}", device.usn, desc.friendly_name, app_url);

    return dial_device {
        device,
        std::move(desc.friendly_name),
        std::move(app_url),
        std::move(desc.manufacturer),
        std::move(desc.model_name),
        std::move(desc.udn)
    };
}

} // namespace upnp
