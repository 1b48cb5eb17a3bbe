#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "utils.hpp"

namespace http
{

class response
{
public:

    response() = default;

    // Throws std::invalid_argument if raw is not a complete http response header block
    explicit response(std::string_view raw);

    void parse(std::string_view raw);

    // Number of bytes the complete message occupies, if it can be told from the data received so far
    static std::optional<size_t> message_size(std::string_view raw);

    bool check_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    const utils::header_map& get_headers() const
    {
        return m_headers;
    }

    void set_header(const std::string& key, const std::string& value);

    void set_code(int code)
    {
        m_code = code;
    }

    void set_code(int code, std::string phrase)
    {
        m_code = code; m_phrase = std::move(phrase);
    }

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_phrase() const
    {
        return m_phrase;
    }

    bool success() const
    {
        return m_code >= 200 && m_code < 300;
    }

    void set_body(std::string body)
    {
        m_body = std::move(body);
    }

    const std::string& get_body() const
    {
        return m_body;
    }

private:

    int m_code = 0;
    std::string m_phrase;
    std::string m_body;

    utils::header_map m_headers;

};

} // namespace http

#endif
