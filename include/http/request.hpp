#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <string>
#include <utility>

#include "utils.hpp"

namespace http {

class request {

public:

    request() = default;

    // Throws std::invalid_argument if url is not an absolute http url
    request(std::string method, const std::string& url);

    std::string to_string() const;

    bool check_header(const std::string& key) const;

    const utils::header_map& get_headers() const { return m_headers; }

    std::string get_header(const std::string& key) const;

    void set_header(const std::string& key, const std::string& value);

    void set_body(std::string body) { m_body = std::move(body); }

    const std::string& get_method() const { return m_method; }

    const std::string& get_url() const { return m_url; }

    const utils::url& get_target() const { return m_target; }

    const std::string& get_body() const { return m_body; }

private:

    std::string m_method;           /// http method used by this request (e.g. post, get, ...)
    std::string m_url;              /// absolute url as given by the caller
    utils::url m_target;            /// parsed m_url
    utils::header_map m_headers;    /// additional request headers
    std::string m_body;

};

} // namespace http

#endif
