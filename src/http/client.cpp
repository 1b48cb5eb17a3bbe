#include "http/client.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <stdexcept>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "errors.hpp"
#include "log.hpp"

namespace http
{

using deadline_clock = std::chrono::steady_clock;

namespace
{

// Owns a connected socket, closed on every exit path
class connection
{
public:

    connection() = delete;
    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    connection(const utils::url& target, deadline_clock::time_point deadline)
        : m_deadline {deadline}
    {
        addrinfo hints {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* result = nullptr;
        int err = getaddrinfo(target.host.c_str(), std::to_string(target.port).c_str(), &hints, &result);
        if(err != 0)
            throw appcast::unreachable_device {fmt::format("Unable to resolve {}: {}", target.host, gai_strerror(err))};
        std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard {result, &freeaddrinfo};

        m_fd = socket(result->ai_family, result->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, result->ai_protocol);
        if(m_fd < 0)
            throw appcast::unreachable_device {fmt::format("Unable to create socket: {}", std::strerror(errno))};

        if(::connect(m_fd, result->ai_addr, result->ai_addrlen) != 0)
        {
            if(errno != EINPROGRESS)
            {
                int e = errno;
                close_fd();
                throw appcast::unreachable_device {fmt::format("Unable to connect to {}: {}", target.authority(), std::strerror(e))};
            }

            wait_for(POLLOUT, "connect");

            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(m_fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
            if(so_error != 0)
            {
                close_fd();
                throw appcast::unreachable_device {fmt::format("Unable to connect to {}: {}", target.authority(), std::strerror(so_error))};
            }
        }
    }

    ~connection()
    {
        close_fd();
    }

    void send(std::string_view data)
    {
        while(!data.empty())
        {
            wait_for(POLLOUT, "send");
            ssize_t bw = ::send(m_fd, data.data(), data.size(), MSG_NOSIGNAL);
            if(bw < 0)
            {
                if(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    continue;
                throw appcast::unreachable_device {fmt::format("Send failed: {}", std::strerror(errno))};
            }
            data.remove_prefix(static_cast<size_t>(bw));
        }
    }

    // Returns 0 when the peer closed the connection
    size_t read(char* buffer, size_t size)
    {
        while(true)
        {
            wait_for(POLLIN, "read");
            ssize_t br = ::recv(m_fd, buffer, size, 0);
            if(br >= 0)
                return static_cast<size_t>(br);
            if(errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                throw appcast::unreachable_device {fmt::format("Read failed: {}", std::strerror(errno))};
        }
    }

private:

    void wait_for(short events, const char* what)
    {
        while(true)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(m_deadline - deadline_clock::now());
            if(remaining.count() <= 0)
            {
                close_fd();
                throw appcast::unreachable_device {fmt::format("Timeout during {}", what), true};
            }

            pollfd pfd {m_fd, events, 0};
            int ret = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if(ret > 0)
                return;
            if(ret < 0 && errno != EINTR)
            {
                int e = errno;
                close_fd();
                throw appcast::unreachable_device {fmt::format("Poll failed: {}", std::strerror(e))};
            }
        }
    }

    void close_fd()
    {
        if(m_fd >= 0)
        {
            ::close(m_fd);
            m_fd = -1;
        }
    }

    int m_fd = -1;
    deadline_clock::time_point m_deadline;
};

} // namespace

response tcp_client::perform(const request& req, std::chrono::milliseconds timeout)
{
    const utils::url& target = req.get_target();
    if(target.scheme != "http")
        throw appcast::unreachable_device {"Only plain http is supported: " + req.get_url()};

    logging::debug("http", "{} {}", req.get_method(), req.get_url());

    connection conn {target, deadline_clock::now() + timeout};
    conn.send(req.to_string());

    std::string raw;
    std::array<char, 4096> buffer;
    while(true)
    {
        size_t br = conn.read(buffer.data(), buffer.size());
        if(br == 0)
            break;
        raw.append(buffer.data(), br);

        try {
            auto size = response::message_size(raw);
            if(size && raw.size() >= *size)
                break;
        } catch(std::invalid_argument& e) {
            throw appcast::unreachable_device {fmt::format("Invalid response from {}: {}", target.authority(), e.what())};
        }
    }

    try {
        response res {raw};
        logging::debug("http", "{} {} -> {} {}", req.get_method(), req.get_url(), res.get_code(), res.get_phrase());
        return res;
    } catch(std::invalid_argument& e) {
        throw appcast::unreachable_device {fmt::format("Invalid response from {}: {}", target.authority(), e.what())};
    }
}

} // namespace http
