#include <utils.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <memory>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>

namespace utils
{

const char* error_msg = "Unable to get local ip address";

static uint16_t default_port(std::string_view scheme)
{
    return (scheme == "https") ? 443 : 80;
}

std::string url::authority() const
{
    if(port == default_port(scheme))
        return host;
    return host + ":" + std::to_string(port);
}

std::string url::to_string() const
{
    return scheme + "://" + authority() + path;
}

url parse_url(std::string_view view)
{
    url parsed;

    std::string::size_type tmp = view.find("://");
    if(tmp == std::string::npos || tmp == 0)
        throw std::invalid_argument {"Url without scheme"};

    for(char c : view.substr(0, tmp))
        parsed.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if(parsed.scheme != "http" && parsed.scheme != "https")
        throw std::invalid_argument {"Unsupported url scheme"};
    view.remove_prefix(tmp + 3);

    std::string_view authority = view.substr(0, view.find_first_of("/?#"));
    view.remove_prefix(authority.size());
    if(authority.empty())
        throw std::invalid_argument {"Url without host"};

    // Strip user info
    if((tmp = authority.rfind('@')) != std::string::npos)
        authority.remove_prefix(tmp + 1);

    parsed.port = default_port(parsed.scheme);
    tmp = authority.rfind(':');
    if(tmp != std::string::npos && authority.find(']', tmp) == std::string::npos)
    {
        std::string_view port_view = authority.substr(tmp + 1);
        authority = authority.substr(0, tmp);
        if(!port_view.empty())
        {
            unsigned int port = 0;
            auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port);
            if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size() || port == 0 || port > 65535)
                throw std::invalid_argument {"Invalid port in url"};
            parsed.port = static_cast<uint16_t>(port);
        }
    }
    if(authority.empty())
        throw std::invalid_argument {"Url without host"};
    parsed.host = std::string {authority};

    // Fragments are never sent to the server
    view = view.substr(0, view.find('#'));
    if(view.empty() || view.front() != '/')
        parsed.path = "/" + std::string {view};
    else
        parsed.path = std::string {view};

    return parsed;
}

bool is_absolute_url(std::string_view str)
{
    try {
        parse_url(str);
        return true;
    } catch(std::invalid_argument&) {
        return false;
    }
}

std::string resolve_url(const std::string& base, std::string_view reference)
{
    reference = trim(reference);
    if(is_absolute_url(reference))
        return std::string {reference};

    url parsed = parse_url(base);
    if(reference.empty())
        return parsed.to_string();

    if(reference.substr(0, 2) == "//")
        return parsed.scheme + ":" + std::string {reference};

    if(reference.front() == '/')
        return parsed.scheme + "://" + parsed.authority() + std::string {reference};

    // Relative to the directory of the base path, query of the base is dropped
    std::string dir = parsed.path.substr(0, parsed.path.find('?'));
    dir.erase(dir.rfind('/') + 1);

    while(reference.substr(0, 2) == "./")
        reference.remove_prefix(2);
    while(reference.substr(0, 3) == "../")
    {
        reference.remove_prefix(3);
        if(dir.size() > 1)
        {
            dir.pop_back();
            dir.erase(dir.rfind('/') + 1);
        }
    }

    return parsed.scheme + "://" + parsed.authority() + dir + std::string {reference};
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

std::string_view trim(std::string_view view)
{
    const char* whitespace = " \t\r\n";
    size_t start = view.find_first_not_of(whitespace);
    if(start == std::string::npos)
        return {};
    size_t end = view.find_last_not_of(whitespace);
    return view.substr(start, end - start + 1);
}

bool case_insensitive_less::operator()(const std::string& lhs, const std::string& rhs) const
{
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) < std::tolower(static_cast<unsigned char>(b));
    });
}

std::string get_local_ipaddr()
{
    ifaddrs* addrs;
    if(getifaddrs(&addrs))
        throw std::runtime_error {error_msg};
    std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> guard {addrs, &freeifaddrs};

    for(ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr)
            continue;

        // SSDP over IPv4 only
        if(curr_addr->ifa_addr->sa_family == AF_INET)
        {
            std::array<char, NI_MAXHOST> host;

            int s = getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in),
                host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
            if(s != 0)
                throw std::runtime_error {error_msg};

            if((curr_addr->ifa_flags & IFF_UP) && !(curr_addr->ifa_flags & IFF_LOOPBACK))
                return host.data();
        }
    }

    throw std::runtime_error {error_msg};
}

} // utils
