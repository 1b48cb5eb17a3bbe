#include "ssdp_transport.hpp"

#include <socketwrapper.hpp>

#include <array>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include "errors.hpp"
#include "log.hpp"

namespace discovery
{

std::optional<ssdp_response> parse_response(std::string_view view, const std::string& peer)
{
    size_t endl = view.find("\r\n");
    if(endl == std::string::npos)
        return std::nullopt;

    // Status line must be "HTTP/1.x 200 OK"
    std::string_view status = view.substr(0, endl);
    if(status.substr(0, 5) != "HTTP/" || status.find(" 200") == std::string::npos)
        return std::nullopt;

    ssdp_response res;
    res.peer = peer;

    view.remove_prefix(endl + 2);
    while(!view.empty() && view.substr(0, 2) != "\r\n")
    {
        endl = view.find("\r\n");
        std::string_view line = view.substr(0, endl);

        size_t sep = line.find(':');
        if(sep == std::string::npos || sep == 0)
            return std::nullopt;

        res.headers[std::string {utils::trim(line.substr(0, sep))}] = std::string {utils::trim(line.substr(sep + 1))};

        // Some devices terminate the last header line without the blank line
        if(endl == std::string::npos)
            break;
        view.remove_prefix(endl + 2);
    }

    if(res.headers.empty())
        return std::nullopt;
    return res;
}

std::string build_msearch(const std::string& search_target, std::chrono::milliseconds window,
    const std::string& multicast_addr, uint16_t multicast_port)
{
    // MX must be between 1 and 5 seconds, devices reply at a random point within it
    long mx = std::clamp<long>(static_cast<long>(std::chrono::duration_cast<std::chrono::seconds>(window).count()), 1, 5);

    return fmt::format("M-SEARCH * HTTP/1.1\r\nHOST: {}:{}\r\nMAN: \"ssdp:discover\"\r\nMX: {}\r\nST: {}\r\n\r\n",
        multicast_addr, multicast_port, mx, search_target);
}

namespace
{

class udp_search : public ssdp_search
{
public:

    udp_search() = delete;
    udp_search(const udp_search&) = delete;
    udp_search& operator=(const udp_search&) = delete;

    explicit udp_search(std::chrono::steady_clock::time_point deadline)
        : m_deadline {deadline}, m_sock {"0.0.0.0", 0}
    {}

    void configure(int ttl, const std::string& interface_addr)
    {
        unsigned char c_ttl = static_cast<unsigned char>(ttl);
        if(setsockopt(m_sock.get(), IPPROTO_IP, IP_MULTICAST_TTL, &c_ttl, sizeof(c_ttl)) != 0)
            logging::warning("ssdp", "Unable to set multicast ttl: {}", std::strerror(errno));

        if(interface_addr.empty())
            return;

        in_addr iface {};
        if(inet_pton(AF_INET, interface_addr.c_str(), &iface) != 1)
        {
            logging::warning("ssdp", "Ignoring invalid interface address {}", interface_addr);
            return;
        }
        if(setsockopt(m_sock.get(), IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) != 0)
            logging::warning("ssdp", "Unable to use interface {}: {}", interface_addr, std::strerror(errno));
    }

    void send(const std::string& addr, uint16_t port, const std::string& msg)
    {
        m_sock.send(addr, port, msg);
    }

    std::optional<ssdp_response> next() override
    {
        using namespace std::chrono;

        while(true)
        {
            auto remaining = duration_cast<milliseconds>(m_deadline - steady_clock::now());
            if(remaining.count() <= 0)
                return std::nullopt;

            pollfd pfd {m_sock.get(), POLLIN, 0};
            int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if(ret == 0)
                return std::nullopt;
            if(ret < 0)
            {
                if(errno == EINTR)
                    continue;
                logging::warning("ssdp", "Poll failed: {}", std::strerror(errno));
                return std::nullopt;
            }

            sockaddr_in peer {};
            socklen_t peer_len = sizeof(peer);
            ssize_t br = recvfrom(m_sock.get(), m_buffer.data(), m_buffer.size(), 0, reinterpret_cast<sockaddr*>(&peer), &peer_len);
            if(br <= 0)
                continue;

            std::array<char, INET_ADDRSTRLEN> addr {};
            inet_ntop(AF_INET, &peer.sin_addr, addr.data(), addr.size());

            auto res = parse_response(std::string_view {m_buffer.data(), static_cast<size_t>(br)}, addr.data());
            if(!res)
            {
                logging::debug("ssdp", "Dropping malformed datagram from {}", addr.data());
                continue;
            }
            return res;
        }
    }

private:

    std::chrono::steady_clock::time_point m_deadline;

    std::array<char, 4096> m_buffer;

    net::udp_socket<net::ip_version::v4> m_sock;

};

} // namespace

udp_transport::udp_transport(const appcast::config& cfg)
    : m_multicast_addr {cfg.multicast_addr},
      m_multicast_port {cfg.multicast_port},
      m_ttl {cfg.multicast_ttl},
      m_interface_addr {cfg.interface_addr}
{
    if(m_interface_addr.empty())
    {
        try {
            m_interface_addr = utils::get_local_ipaddr();
        } catch(std::runtime_error& e) {
            logging::warning("ssdp", "{}, using the default multicast route", e.what());
        }
    }
}

std::unique_ptr<ssdp_search> udp_transport::search(const std::string& search_target, std::chrono::milliseconds timeout)
{
    std::string msg = build_msearch(search_target, timeout, m_multicast_addr, m_multicast_port);

    try {
        auto round = std::make_unique<udp_search>(std::chrono::steady_clock::now() + timeout);
        round->configure(m_ttl, m_interface_addr);
        round->send(m_multicast_addr, m_multicast_port, msg);
        logging::debug("ssdp", "Sent M-SEARCH for {} to {}:{}", search_target, m_multicast_addr, m_multicast_port);
        return round;
    } catch(std::runtime_error& e) {
        throw appcast::transport_error {fmt::format("SSDP search failed: {}", e.what())};
    }
}

} // namespace discovery
