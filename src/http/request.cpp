#include "http/request.hpp"

namespace http
{

request::request(std::string method, const std::string& url)
    : m_method {std::move(method)}, m_url {url}, m_target {utils::parse_url(url)}
{}

std::string request::to_string() const
{
    std::string request {m_method};
    ((request += " ") += m_target.path) += " HTTP/1.1\r\n";
    (request += "Host: ") += m_target.authority() + "\r\n";

    for(const auto& it : m_headers)
        (((request += it.first) += ": ") += it.second) += "\r\n";

    // One exchange per connection, the response is read until the peer closes
    if(!check_header("Connection"))
        request += "Connection: close\r\n";
    if(!check_header("Content-Length") && (!m_body.empty() || m_method == "POST"))
        request += "Content-Length: " + std::to_string(m_body.size()) + "\r\n";

    request += "\r\n";
    request += m_body;

    return request;
}

bool request::check_header(const std::string& key) const
{
    return m_headers.find(key) != m_headers.end();
}

std::string request::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    return it != m_headers.end() ? it->second : std::string {};
}

void request::set_header(const std::string& key, const std::string& value)
{
    m_headers[key] = value;
}

} // namespace http
