#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <chrono>

#include "http/request.hpp"
#include "http/response.hpp"

namespace http
{

// Performs one request/response exchange
class client
{
public:
    virtual ~client() = default;

    // Throws appcast::unreachable_device on connection failure or when timeout expires
    // before the response is complete
    virtual response perform(const request& req, std::chrono::milliseconds timeout) = 0;
};

// Plain HTTP/1.1 over a fresh TCP connection per request
class tcp_client : public client
{
public:
    tcp_client() = default;
    tcp_client(const tcp_client&) = delete;
    tcp_client& operator=(const tcp_client&) = delete;

    response perform(const request& req, std::chrono::milliseconds timeout) override;
};

} // namespace http

#endif
