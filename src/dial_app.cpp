#include "dial_app.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <vector>

#include "rapidxml/rapidxml.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

using namespace rapidxml;

namespace dial
{

static constexpr const char* client_dial_version = "2.2";

const char* to_string(app_state state)
{
    switch(state)
    {
        case app_state::stopped:
            return "stopped";
        case app_state::starting:
            return "starting";
        case app_state::running:
            return "running";
        case app_state::stopping:
            return "stopping";
        case app_state::hidden:
            return "hidden";
        default:
            return "unknown";
    }
}

app_state parse_state(std::string_view state)
{
    state = utils::trim(state);
    for(app_state s : {app_state::stopped, app_state::starting, app_state::running, app_state::stopping, app_state::hidden})
    {
        if(utils::iequals(state, to_string(s)))
            return s;
    }
    return app_state::unknown;
}

static std::string node_text(xml_node<char>* node)
{
    return std::string {utils::trim(std::string_view {node->value(), node->value_size()})};
}

application_instance parse_status(const std::string& app, const std::string& xml, const std::string& app_url)
{
    std::vector<char> buffer(xml.begin(), xml.end());
    buffer.push_back('\0');

    xml_document<char> doc;
    try {
        doc.parse<0>(buffer.data());
    } catch(rapidxml::parse_error& e) {
        throw appcast::malformed_status {std::string {"Invalid status of "} + app + ": " + e.what()};
    }

    xml_node<char>* service = doc.first_node("service");
    if(!service)
        throw appcast::malformed_status {"Status of " + app + " without <service>"};
    xml_node<char>* state = service->first_node("state");
    if(!state)
        throw appcast::malformed_status {"Status of " + app + " without <state>"};

    application_instance instance;
    instance.name = app;
    if(xml_node<char>* name = service->first_node("name"))
    {
        std::string reported = node_text(name);
        if(!reported.empty())
            instance.name = std::move(reported);
    }
    instance.state = parse_state(std::string_view {state->value(), state->value_size()});

    if(xml_attribute<char>* version = service->first_attribute("dialVer"))
        instance.dial_version = version->value();

    if(xml_node<char>* options = service->first_node("options"))
    {
        if(xml_attribute<char>* allow_stop = options->first_attribute("allowStop"))
            instance.allow_stop = utils::iequals(utils::trim(allow_stop->value()), "true");
    }

    for(xml_node<char>* link = service->first_node("link"); link; link = link->next_sibling("link"))
    {
        xml_attribute<char>* rel = link->first_attribute("rel");
        xml_attribute<char>* href = link->first_attribute("href");
        if(!rel || !href || std::string_view {rel->value()} != "run" || utils::trim(href->value()).empty())
            continue;

        try {
            instance.instance_url = utils::resolve_url(app_url + "/", href->value());
        } catch(std::invalid_argument& e) {
            throw appcast::malformed_status {"Status of " + app + " with invalid link: " + e.what()};
        }
        break;
    }

    if(xml_node<char>* additional = service->first_node("additionalData"))
    {
        for(xml_node<char>* data = additional->first_node(); data; data = data->next_sibling())
        {
            if(data->type() != node_element)
                continue;
            instance.additional_data[std::string {data->name(), data->name_size()}] = node_text(data);
        }
    }

    return instance;
}

static void check_app_name(const std::string& app)
{
    // Names are used as a single path segment
    if(app.empty() || app.find_first_of("/?#% \t\r\n") != std::string::npos)
        throw appcast::operation_not_supported {"Invalid application name: " + app};
}

app_client::app_client(http::client& client, upnp::dial_device device, const appcast::config& cfg)
    : m_client {client}, m_device {std::move(device)}, m_timeout {cfg.http_timeout}, m_retry {cfg.retry}
{}

std::string app_client::app_url(const std::string& app) const
{
    check_app_name(app);
    return m_device.application_url + app;
}

http::request app_client::instance_request(const std::string& method, const std::string& app,
    const std::string& instance_url, const char* operation) const
{
    utils::url base = utils::parse_url(app_url(app) + "/");

    utils::url target;
    try {
        target = utils::parse_url(instance_url);
    } catch(std::invalid_argument& e) {
        throw appcast::operation_not_supported {fmt::format("Cannot {} {} with instance url {}: {}", operation, app, instance_url, e.what())};
    }

    // Instances live below {application url}{app}/
    if(target.scheme != base.scheme || !utils::iequals(target.host, base.host) || target.port != base.port
        || target.path.compare(0, base.path.size(), base.path) != 0)
    {
        throw appcast::operation_not_supported {fmt::format("{} is no instance of {} on {}", instance_url, app, m_device.friendly_name)};
    }

    return http::request {method, instance_url};
}

template<typename F>
auto app_client::with_retry(const char* operation, const std::string& app, bool retry_unreachable, F&& func) const -> decltype(func())
{
    unsigned int attempts = std::max(1u, m_retry.attempts);
    for(unsigned int attempt = 1; ; ++attempt)
    {
        try {
            return func();
        } catch(appcast::device_busy& e) {
            if(attempt >= attempts)
                throw;
            logging::info("dial", "{} {} on {}: {}, retrying ({}/{})", operation, app, m_device.friendly_name, e.what(), attempt, attempts);
        } catch(appcast::unreachable_device& e) {
            if(!retry_unreachable || attempt >= attempts)
                throw;
            logging::info("dial", "{} {} on {}: {}, retrying ({}/{})", operation, app, m_device.friendly_name, e.what(), attempt, attempts);
        }
        std::this_thread::sleep_for(m_retry.delay);
    }
}

std::optional<std::string> app_client::launch(const std::string& app, const std::optional<std::string>& payload) const
{
    const std::string url = app_url(app);

    // Not repeated after a transport failure, the device may have launched already
    return with_retry("launch", app, false, [&]() -> std::optional<std::string>
    {
        http::request req {"POST", url};
        if(payload && !payload->empty())
        {
            req.set_header("Content-Type", "text/plain; charset=\"utf-8\"");
            req.set_body(*payload);
        }

        http::response res = m_client.perform(req, m_timeout);
        switch(res.get_code())
        {
            case 200:
            case 201:
                break;
            case 404:
                throw appcast::app_not_installed {app + " is not installed on " + m_device.friendly_name};
            case 500:
            case 503:
                throw appcast::device_busy {fmt::format("{} cannot launch {} now ({})", m_device.friendly_name, app, res.get_code())};
            case 400:
            case 401:
            case 403:
            case 413:
            case 501:
                throw appcast::operation_not_supported {fmt::format("Launch of {} rejected with {}", app, res.get_code())};
            default:
                throw appcast::unreachable_device {fmt::format("Launch of {} failed with {}", app, res.get_code())};
        }

        logging::info("dial", "Launched {} on {}", app, m_device.friendly_name);

        std::string location = std::string {utils::trim(res.get_header("LOCATION"))};
        if(location.empty())
            return std::nullopt;
        try {
            return utils::resolve_url(url, location);
        } catch(std::invalid_argument&) {
            logging::warning("dial", "Ignoring invalid instance location {} of {}", location, app);
            return std::nullopt;
        }
    });
}

application_instance app_client::status(const std::string& app) const
{
    const std::string url = app_url(app);

    return with_retry("status", app, true, [&]()
    {
        http::request req {"GET", url + "?clientDialVer=" + client_dial_version};

        http::response res = m_client.perform(req, m_timeout);
        switch(res.get_code())
        {
            case 200:
                break;
            case 404:
                throw appcast::app_not_installed {app + " is not installed on " + m_device.friendly_name};
            case 500:
            case 503:
                throw appcast::device_busy {fmt::format("{} cannot report the status of {} now ({})", m_device.friendly_name, app, res.get_code())};
            case 400:
            case 401:
            case 403:
                throw appcast::operation_not_supported {fmt::format("Status of {} rejected with {}", app, res.get_code())};
            default:
                throw appcast::unreachable_device {fmt::format("Status of {} failed with {}", app, res.get_code())};
        }

        application_instance instance = parse_status(app, res.get_body(), url);
        logging::debug("dial", "{} on {} is {}", app, m_device.friendly_name, to_string(instance.state));
        return instance;
    });
}

void app_client::stop(const std::string& app, const std::string& instance_url) const
{
    http::request req = instance_request("DELETE", app, instance_url, "stop");

    with_retry("stop", app, true, [&]()
    {
        http::response res = m_client.perform(req, m_timeout);
        switch(res.get_code())
        {
            case 200:
            case 204:
                break;
            case 404:
                throw appcast::app_not_installed {"No instance of " + app + " at " + instance_url};
            case 500:
            case 503:
                throw appcast::device_busy {fmt::format("{} cannot stop {} now ({})", m_device.friendly_name, app, res.get_code())};
            case 400:
            case 401:
            case 403:
            case 405:
            case 501:
                throw appcast::operation_not_supported {fmt::format("Stop of {} rejected with {}", app, res.get_code())};
            default:
                throw appcast::unreachable_device {fmt::format("Stop of {} failed with {}", app, res.get_code())};
        }
        logging::info("dial", "Stopped {} on {}", app, m_device.friendly_name);
    });
}

void app_client::hide(const std::string& app, const std::string& instance_url) const
{
    std::string url = instance_url;
    if(url.empty() || url.back() != '/')
        url += '/';
    url += "hide";

    http::request req = instance_request("POST", app, url, "hide");

    with_retry("hide", app, false, [&]()
    {
        http::response res = m_client.perform(req, m_timeout);
        switch(res.get_code())
        {
            case 200:
            case 204:
                break;
            case 404:
                throw appcast::app_not_installed {"No running instance of " + app + " at " + instance_url};
            case 500:
            case 503:
                throw appcast::device_busy {fmt::format("{} cannot hide {} now ({})", m_device.friendly_name, app, res.get_code())};
            case 400:
            case 401:
            case 403:
            case 405:
            case 501:
                throw appcast::operation_not_supported {fmt::format("Hide of {} rejected with {}", app, res.get_code())};
            default:
                throw appcast::unreachable_device {fmt::format("Hide of {} failed with {}", app, res.get_code())};
        }
        logging::info("dial", "Hid {} on {}", app, m_device.friendly_name);
    });
}

bool app_client::supports_stop(const std::string& app) const
{
    // allowStop defaults to true when the device does not state it
    return status(app).allow_stop.value_or(true);
}

} // namespace dial
