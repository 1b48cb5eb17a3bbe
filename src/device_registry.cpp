#include "device_registry.hpp"

#include <algorithm>

#include "log.hpp"

namespace discovery
{

device_registry::device_registry(std::chrono::seconds default_expiry)
    : m_default_expiry {default_expiry}
{}

bool device_registry::expired(const discovered_device& device, registry_clock::time_point now) const
{
    return now - device.last_seen > device.max_age.value_or(m_default_expiry);
}

void device_registry::upsert(discovered_device record, registry_clock::time_point now)
{
    std::lock_guard<std::mutex> lock {m_mutex};

    auto it = m_devices.find(record.usn);
    if(it == m_devices.end())
    {
        record.first_seen = now;
        record.last_seen = now;
        logging::debug("registry", "New device {} at {}", record.usn, record.location);
        std::string usn = record.usn;
        m_devices.emplace(std::move(usn), std::move(record));
        return;
    }

    discovered_device& known = it->second;
    if(known.location != record.location)
        logging::debug("registry", "Device {} moved from {} to {}", known.usn, known.location, record.location);

    known.location = std::move(record.location);
    known.server = std::move(record.server);
    known.search_target = std::move(record.search_target);
    known.max_age = record.max_age;
    known.last_seen = now;
}

std::vector<discovered_device> device_registry::snapshot(registry_clock::time_point now) const
{
    std::vector<discovered_device> devices;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        devices.reserve(m_devices.size());
        for(const auto& it : m_devices)
        {
            if(!expired(it.second, now))
                devices.push_back(it.second);
        }
    }

    std::sort(devices.begin(), devices.end(), [](const discovered_device& lhs, const discovered_device& rhs) {
        if(lhs.last_seen != rhs.last_seen)
            return lhs.last_seen > rhs.last_seen;
        return lhs.usn < rhs.usn;
    });
    return devices;
}

size_t device_registry::evict_expired(registry_clock::time_point now)
{
    std::lock_guard<std::mutex> lock {m_mutex};

    size_t evicted = 0;
    for(auto it = m_devices.begin(); it != m_devices.end(); )
    {
        if(expired(it->second, now))
        {
            logging::debug("registry", "Evicting expired device {}", it->first);
            it = m_devices.erase(it);
            ++evicted;
        }
        else
        {
            ++it;
        }
    }
    return evicted;
}

std::optional<discovered_device> device_registry::find(const std::string& usn) const
{
    std::lock_guard<std::mutex> lock {m_mutex};

    auto it = m_devices.find(usn);
    if(it == m_devices.end())
        return std::nullopt;
    return it->second;
}

size_t device_registry::size() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_devices.size();
}

void device_registry::clear()
{
    std::lock_guard<std::mutex> lock {m_mutex};
    m_devices.clear();
}

} // namespace discovery
