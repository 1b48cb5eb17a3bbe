#ifndef SSDP_TRANSPORT_HPP
#define SSDP_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "utils.hpp"

namespace discovery
{

constexpr const char* dial_search_target = "urn:dial-multiscreen-org:service:dial:1";

struct ssdp_response
{
    std::string peer;           /// source address of the datagram
    utils::header_map headers;
};

// Returns nullopt for anything but a "HTTP/1.1 200" header block
std::optional<ssdp_response> parse_response(std::string_view datagram, const std::string& peer = {});

std::string build_msearch(const std::string& search_target, std::chrono::milliseconds window,
    const std::string& multicast_addr = DISCOVERY_IP, uint16_t multicast_port = DISCOVERY_PORT);

// One network round, responses are produced lazily until the listening window ends
class ssdp_search
{
public:
    virtual ~ssdp_search() = default;

    // Blocks until the next response arrives, nullopt once the window has elapsed
    virtual std::optional<ssdp_response> next() = 0;
};

class transport
{
public:
    virtual ~transport() = default;

    // Throws appcast::transport_error if the request could not be sent
    virtual std::unique_ptr<ssdp_search> search(const std::string& search_target, std::chrono::milliseconds timeout) = 0;
};

class udp_transport : public transport
{
public:

    udp_transport() = delete;
    udp_transport(const udp_transport&) = delete;
    udp_transport& operator=(const udp_transport&) = delete;

    explicit udp_transport(const appcast::config& cfg);

    std::unique_ptr<ssdp_search> search(const std::string& search_target, std::chrono::milliseconds timeout) override;

private:

    std::string m_multicast_addr;

    uint16_t m_multicast_port;

    int m_ttl;

    std::string m_interface_addr;

};

} // namespace discovery

#endif
