#include "ssdp_discovery.hpp"

#include <charconv>
#include <future>

#include "log.hpp"
#include "utils.hpp"

namespace discovery
{

std::optional<std::chrono::seconds> parse_max_age(std::string_view view)
{
    while(!view.empty())
    {
        size_t sep = view.find(',');
        std::string_view directive = utils::trim(view.substr(0, sep));

        size_t eq = directive.find('=');
        if(eq != std::string::npos && utils::iequals(utils::trim(directive.substr(0, eq)), "max-age"))
        {
            std::string_view value = utils::trim(directive.substr(eq + 1));
            long seconds = 0;
            auto res = std::from_chars(value.data(), value.data() + value.size(), seconds);
            if(res.ec == std::errc {} && seconds >= 0)
                return std::chrono::seconds {seconds};
            return std::nullopt;
        }

        if(sep == std::string::npos)
            break;
        view.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

std::optional<discovered_device> to_device(const ssdp_response& res, const std::string& search_target)
{
    auto location = res.headers.find("LOCATION");
    auto usn = res.headers.find("USN");
    auto st = res.headers.find("ST");

    if(location == res.headers.end() || location->second.empty())
    {
        logging::debug("ssdp", "Discarding response from {} without LOCATION", res.peer);
        return std::nullopt;
    }
    if(usn == res.headers.end() || usn->second.empty())
    {
        logging::debug("ssdp", "Discarding response from {} without USN", res.peer);
        return std::nullopt;
    }
    if(st == res.headers.end() || st->second != search_target)
    {
        logging::debug("ssdp", "Discarding response from {} for another search target", res.peer);
        return std::nullopt;
    }
    if(!utils::is_absolute_url(location->second))
    {
        logging::debug("ssdp", "Discarding response from {} with invalid LOCATION {}", res.peer, location->second);
        return std::nullopt;
    }

    discovered_device device;
    device.usn = usn->second;
    device.location = location->second;
    device.search_target = st->second;

    auto server = res.headers.find("SERVER");
    if(server != res.headers.end())
        device.server = server->second;

    auto cache_control = res.headers.find("CACHE-CONTROL");
    if(cache_control != res.headers.end())
        device.max_age = parse_max_age(cache_control->second);

    return device;
}

ssdp_discovery::ssdp_discovery(transport& source, device_registry& registry, std::string search_target)
    : m_transport {source}, m_registry {registry}, m_search_target {std::move(search_target)}
{}

void ssdp_discovery::handle_response(const ssdp_response& res)
{
    if(auto device = to_device(res, m_search_target))
        m_registry.upsert(std::move(*device));
}

std::vector<discovered_device> ssdp_discovery::discover(std::chrono::milliseconds timeout)
{
    size_t evicted = m_registry.evict_expired();
    if(evicted > 0)
        logging::debug("ssdp", "Evicted {} expired device(s)", evicted);

    std::unique_ptr<ssdp_search> round = m_transport.search(m_search_target, timeout);

    // Devices answer at random points within MX, handle each response as it arrives
    std::vector<std::future<void>> handlers;
    while(auto res = round->next())
    {
        handlers.push_back(std::async(std::launch::async, [this, res = std::move(*res)]()
        {
            handle_response(res);
        }));
    }
    round.reset();

    for(auto& fut : handlers)
        fut.get();

    std::vector<discovered_device> devices = m_registry.snapshot();
    logging::info("ssdp", "Discovery finished with {} response(s), {} device(s) known", handlers.size(), devices.size());
    return devices;
}

} // namespace discovery
