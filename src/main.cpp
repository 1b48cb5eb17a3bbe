#include <csignal>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "fmt/format.h"

#include "config.hpp"
#include "dial_app.hpp"
#include "errors.hpp"
#include "http/client.hpp"
#include "refresher.hpp"
#include "ssdp_discovery.hpp"
#include "upnp_device.hpp"

static void print_usage()
{
    fmt::print(
        "Usage: appcast-cli [options] <command> [arguments]\n"
        "\n"
        "Commands:\n"
        "  discover                           list DIAL devices in the local network\n"
        "  resolve <device>                   show the DIAL endpoint of a device\n"
        "  status <device> <app>              query the state of an application\n"
        "  launch <device> <app> [payload]    launch an application\n"
        "  stop <device> <app> [instance]     stop a running application\n"
        "  hide <device> <app> [instance]     move a running application to the background\n"
        "  watch                              rediscover periodically until interrupted\n"
        "\n"
        "<device> is an index printed by discover or a USN.\n"
        "\n"
        "Options:\n"
        "  --window <ms>          discovery listening window (default {})\n"
        "  --http-timeout <ms>    timeout of every HTTP exchange (default {})\n"
        "  --interface <addr>     local IPv4 address used for multicast\n"
        "  --retries <n>          attempts for busy or unreachable devices (default 1)\n"
        "  --interval <s>         rediscovery interval of watch (default 60)\n"
        "  --log-level <level>    debug, info, warning, error or off\n"
        "  --debug <components>   enable debug output for ssdp,registry,upnp,dial,http\n",
        DISCOVERY_TIME, HTTP_TIMEOUT);
}

static long parse_number(const std::string& option, const std::string& value)
{
    try {
        size_t pos = 0;
        long number = std::stol(value, &pos);
        if(pos != value.size() || number < 0)
            throw std::invalid_argument {value};
        return number;
    } catch(std::logic_error&) {
        throw std::invalid_argument {"Invalid value for " + option + ": " + value};
    }
}

// Consumes options and returns the remaining positional arguments
static std::vector<std::string> parse_args(int argc, char** argv, appcast::config& cfg)
{
    std::vector<std::string> positional;
    for(int i = 1; i < argc; i++)
    {
        std::string arg {argv[i]};
        if(arg.rfind("--", 0) != 0)
        {
            positional.push_back(std::move(arg));
            continue;
        }
        if(arg == "--help")
        {
            print_usage();
            std::exit(EXIT_SUCCESS);
        }
        if(i + 1 >= argc)
            throw std::invalid_argument {"Missing value for " + arg};

        std::string value {argv[++i]};
        if(arg == "--window")
            cfg.discovery_window = std::chrono::milliseconds {parse_number(arg, value)};
        else if(arg == "--http-timeout")
            cfg.http_timeout = std::chrono::milliseconds {parse_number(arg, value)};
        else if(arg == "--interface")
            cfg.interface_addr = value;
        else if(arg == "--retries")
            cfg.retry.attempts = static_cast<unsigned int>(parse_number(arg, value));
        else if(arg == "--interval")
            cfg.refresh_interval = std::chrono::seconds {parse_number(arg, value)};
        else if(arg == "--log-level")
            cfg.log_level = appcast::parse_log_level(value);
        else if(arg == "--debug")
        {
            cfg.debug_components = value;
            cfg.log_level = logging::level::debug;
        }
        else
            throw std::invalid_argument {"Unknown option " + arg};
    }
    return positional;
}

static void print_devices(const std::vector<discovery::discovered_device>& devices)
{
    fmt::print("Detected {} device(s) in your local network.\n-------------------------------\n", devices.size());
    for(size_t i = 0; i < devices.size(); i++)
        fmt::print("{} | {} | {} | {}\n", i, devices[i].usn, devices[i].location, devices[i].server);
}

static discovery::discovered_device select_device(const std::vector<discovery::discovered_device>& devices, const std::string& selector)
{
    for(const auto& device : devices)
    {
        if(device.usn == selector)
            return device;
    }

    size_t selected = 0;
    try {
        selected = static_cast<size_t>(parse_number("<device>", selector));
    } catch(std::invalid_argument&) {
        throw std::invalid_argument {"No device " + selector};
    }
    if(selected >= devices.size())
        throw std::invalid_argument {"No device " + selector};
    return devices[selected];
}

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

static int watch(discovery::ssdp_discovery& engine, const appcast::config& cfg)
{
    sigset_t sigset;
    block_signals(&sigset);

    discovery::refresher refresh {engine, cfg.discovery_window, cfg.refresh_interval,
        [](const std::vector<discovery::discovered_device>& devices) { print_devices(devices); }};

    int signum = 0;
    sigwait(&sigset, &signum);
    fmt::print("Shutting down...\n");
    refresh.stop();
    return EXIT_SUCCESS;
}

static int run(const std::vector<std::string>& args, const appcast::config& cfg)
{
    const std::string& command = args[0];

    discovery::udp_transport transport {cfg};
    discovery::device_registry registry {cfg.default_expiry};
    discovery::ssdp_discovery engine {transport, registry};

    if(command == "watch")
        return watch(engine, cfg);

    fmt::print("Scanning network for DIAL devices...\n");
    std::vector<discovery::discovered_device> devices = engine.discover(cfg.discovery_window);
    if(command == "discover")
    {
        print_devices(devices);
        return EXIT_SUCCESS;
    }

    if(args.size() < 2)
        throw std::invalid_argument {"Missing <device> for " + command};
    if(devices.empty())
    {
        fmt::print("No devices found...\n");
        return EXIT_FAILURE;
    }

    http::tcp_client client;
    upnp::description_resolver resolver {client};
    upnp::dial_device device = resolver.resolve(select_device(devices, args[1]), cfg.http_timeout);
    if(command == "resolve")
    {
        fmt::print("{}\n  manufacturer: {}\n  model: {}\n  udn: {}\n  application url: {}\n",
            device.friendly_name, device.manufacturer, device.model_name, device.udn, device.application_url);
        return EXIT_SUCCESS;
    }

    if(args.size() < 3)
        throw std::invalid_argument {"Missing <app> for " + command};
    const std::string& app = args[2];
    dial::app_client dial_client {client, device, cfg};

    if(command == "status")
    {
        dial::application_instance instance = dial_client.status(app);
        fmt::print("{}: {}\n", instance.name, dial::to_string(instance.state));
        if(instance.instance_url)
            fmt::print("  instance: {}\n", *instance.instance_url);
        fmt::print("  stoppable: {}\n", instance.allow_stop.value_or(true));
        for(const auto& it : instance.additional_data)
            fmt::print("  {} => {}\n", it.first, it.second);
        return EXIT_SUCCESS;
    }

    if(command == "launch")
    {
        std::optional<std::string> payload;
        if(args.size() > 3)
            payload = args[3];
        std::optional<std::string> instance = dial_client.launch(app, payload);
        fmt::print("Status: Launched{}\n", instance ? " (" + *instance + ")" : std::string {});
        return EXIT_SUCCESS;
    }

    if(command == "stop" || command == "hide")
    {
        std::string instance_url;
        if(args.size() > 3)
        {
            instance_url = args[3];
        }
        else
        {
            dial::application_instance instance = dial_client.status(app);
            if(!instance.instance_url)
            {
                fmt::print("{} is {}, nothing to {}\n", app, dial::to_string(instance.state), command);
                return EXIT_FAILURE;
            }
            instance_url = *instance.instance_url;
        }
        if(command == "hide")
        {
            dial_client.hide(app, instance_url);
            fmt::print("Status: Hidden\n");
        }
        else
        {
            dial_client.stop(app, instance_url);
            fmt::print("Status: Stopped\n");
        }
        return EXIT_SUCCESS;
    }

    throw std::invalid_argument {"Unknown command " + command};
}

int main(int argc, char** argv)
{
    appcast::config cfg;
    std::vector<std::string> args;
    try {
        args = parse_args(argc, argv, cfg);
    } catch(std::invalid_argument& e) {
        fmt::print(stderr, "{}\n\n", e.what());
        print_usage();
        return EXIT_FAILURE;
    }
    if(args.empty())
    {
        print_usage();
        return EXIT_FAILURE;
    }
    appcast::apply_logging(cfg);

    try {
        return run(args, cfg);
    } catch(appcast::cast_error& e) {
        fmt::print(stderr, "Error ({}): {}\n", appcast::to_string(e.code()), e.what());
    } catch(std::invalid_argument& e) {
        fmt::print(stderr, "{}\n", e.what());
    }
    return EXIT_FAILURE;
}
