#ifndef DEVICE_REGISTRY_HPP
#define DEVICE_REGISTRY_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.hpp"

namespace discovery
{

using registry_clock = std::chrono::steady_clock;

struct discovered_device
{
    std::string usn;
    std::string location;
    std::string server;
    std::string search_target;

    registry_clock::time_point first_seen;
    registry_clock::time_point last_seen;

    // Advertised lifetime from CACHE-CONTROL, the registry default applies if absent
    std::optional<std::chrono::seconds> max_age;
};

// Deduplicating, expiring store of discovered devices keyed by USN.
// All operations are serialized, so concurrent response handlers may call them freely.
class device_registry
{
public:

    device_registry(const device_registry&) = delete;
    device_registry& operator=(const device_registry&) = delete;

    explicit device_registry(std::chrono::seconds default_expiry = std::chrono::seconds {DEFAULT_EXPIRY});

    // Inserts unseen devices, otherwise refreshes last_seen and the advertised fields
    void upsert(discovered_device record, registry_clock::time_point now = registry_clock::now());

    // Non-expired devices, most recently seen first
    std::vector<discovered_device> snapshot(registry_clock::time_point now = registry_clock::now()) const;

    size_t evict_expired(registry_clock::time_point now = registry_clock::now());

    std::optional<discovered_device> find(const std::string& usn) const;

    size_t size() const;

    void clear();

    std::chrono::seconds default_expiry() const
    {
        return m_default_expiry;
    }

private:

    bool expired(const discovered_device& device, registry_clock::time_point now) const;

    const std::chrono::seconds m_default_expiry;

    mutable std::mutex m_mutex;

    std::unordered_map<std::string, discovered_device> m_devices;

};

} // namespace discovery

#endif
