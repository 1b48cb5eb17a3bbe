#ifndef DIAL_APP_HPP
#define DIAL_APP_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "http/client.hpp"
#include "upnp_device.hpp"

namespace dial
{

enum class app_state
{
    stopped,
    starting,
    running,
    stopping,
    hidden,
    unknown
};

const char* to_string(app_state state);

// Case insensitive, anything unrecognized is app_state::unknown
app_state parse_state(std::string_view state);

// Last observed status of one application, re-derived on every status query
struct application_instance
{
    std::string name;
    app_state state = app_state::unknown;
    std::optional<std::string> instance_url;
    std::optional<bool> allow_stop;
    std::string dial_version;
    std::map<std::string, std::string> additional_data;
};

// Parses a DIAL status document, relative instance links are resolved against app_url.
// Throws appcast::malformed_status.
application_instance parse_status(const std::string& app, const std::string& xml, const std::string& app_url);

// Stateless lifecycle control of named applications on one DIAL device.
// Every call is a single HTTP exchange, the device is the only source of truth.
class app_client
{
public:

    app_client() = delete;
    app_client(const app_client&) = delete;
    app_client& operator=(const app_client&) = delete;

    app_client(http::client& client, upnp::dial_device device, const appcast::config& cfg = {});

    // POSTs payload verbatim. Returns the instance url if the device announced one.
    std::optional<std::string> launch(const std::string& app, const std::optional<std::string>& payload = std::nullopt) const;

    application_instance status(const std::string& app) const;

    // DELETEs an instance url previously reported by the device.
    // Urls outside {application url}{app}/ throw appcast::operation_not_supported without a request.
    void stop(const std::string& app, const std::string& instance_url) const;

    // Moves a running instance to the background (DIAL 2.1), POST {instance_url}/hide
    void hide(const std::string& app, const std::string& instance_url) const;

    bool supports_stop(const std::string& app) const;

    const upnp::dial_device& device() const
    {
        return m_device;
    }

    // Throws appcast::operation_not_supported for names that are no single path segment
    std::string app_url(const std::string& app) const;

private:

    http::request instance_request(const std::string& method, const std::string& app,
        const std::string& instance_url, const char* operation) const;

    template<typename F>
    auto with_retry(const char* operation, const std::string& app, bool retry_unreachable, F&& func) const -> decltype(func());

    http::client& m_client;

    const upnp::dial_device m_device;

    const std::chrono::milliseconds m_timeout;

    const appcast::retry_policy m_retry;

};

} // namespace dial

#endif
