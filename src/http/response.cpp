#include <http/response.hpp>

#include <charconv>
#include <stdexcept>

namespace http
{

static constexpr std::string_view header_termination {"\r\n\r\n"};

static bool is_chunked(const utils::header_map& headers)
{
    auto it = headers.find("Transfer-Encoding");
    return it != headers.end() && it->second.find("chunked") != std::string::npos;
}

static std::optional<size_t> content_length(const utils::header_map& headers)
{
    auto it = headers.find("Content-Length");
    if(it == headers.end())
        return std::nullopt;

    size_t length = 0;
    std::string_view value = utils::trim(it->second);
    auto res = std::from_chars(value.data(), value.data() + value.size(), length);
    if(res.ec != std::errc {})
        throw std::invalid_argument {"Invalid Content-Length"};
    return length;
}

static utils::header_map parse_headers(std::string_view view)
{
    utils::header_map headers;
    while(!view.empty())
    {
        size_t endl = view.find("\r\n");
        std::string_view line = view.substr(0, endl);
        size_t sep = line.find(':');
        if(sep == std::string::npos || sep == 0)
            throw std::invalid_argument {"invalid_header"};

        headers[std::string {utils::trim(line.substr(0, sep))}] = std::string {utils::trim(line.substr(sep + 1))};

        if(endl == std::string::npos)
            break;
        view.remove_prefix(endl + 2);
    }
    return headers;
}

// Decodes a chunked body, returns the number of bytes consumed or nullopt if incomplete
static std::optional<size_t> decode_chunked(std::string_view view, std::string* dest)
{
    size_t consumed = 0;
    while(true)
    {
        size_t endl = view.find("\r\n", consumed);
        if(endl == std::string::npos)
            return std::nullopt;

        std::string_view size_view = view.substr(consumed, endl - consumed);
        size_view = size_view.substr(0, size_view.find(';'));
        size_view = utils::trim(size_view);
        size_t chunk_size = 0;
        auto res = std::from_chars(size_view.data(), size_view.data() + size_view.size(), chunk_size, 16);
        if(res.ec != std::errc {})
            throw std::invalid_argument {"Invalid chunk size"};

        consumed = endl + 2;
        if(chunk_size == 0)
        {
            // Skip trailers up to the terminating empty line
            size_t end = view.find("\r\n", consumed);
            while(end != std::string::npos && end != consumed)
            {
                consumed = end + 2;
                end = view.find("\r\n", consumed);
            }
            if(end == std::string::npos)
                return std::nullopt;
            return end + 2;
        }

        if(view.size() < consumed + chunk_size + 2)
            return std::nullopt;
        if(dest)
            dest->append(view.data() + consumed, chunk_size);
        consumed += chunk_size + 2;
    }
}

response::response(std::string_view raw)
{
    parse(raw);
}

void response::parse(std::string_view raw)
{
    size_t header_end = raw.find(header_termination);
    if(header_end == std::string::npos)
        throw std::invalid_argument {"invalid_response"};

    std::string_view head = raw.substr(0, header_end);
    std::string_view body = raw.substr(header_end + header_termination.size());

    /* Parse the status line */
    size_t endl = head.find("\r\n");
    std::string_view status_line = head.substr(0, endl);
    if(status_line.substr(0, 5) != "HTTP/")
        throw std::invalid_argument {"invalid_statusline"};

    size_t code_start = status_line.find(' ');
    if(code_start == std::string::npos)
        throw std::invalid_argument {"invalid_statusline"};
    std::string_view code_view = status_line.substr(code_start + 1);
    size_t code_end = code_view.find(' ');
    if(code_end != std::string::npos)
    {
        m_phrase = std::string {utils::trim(code_view.substr(code_end + 1))};
        code_view = code_view.substr(0, code_end);
    }
    else
    {
        m_phrase.clear();
    }

    int code = 0;
    auto res = std::from_chars(code_view.data(), code_view.data() + code_view.size(), code);
    if(res.ec != std::errc {} || code < 100 || code > 999)
        throw std::invalid_argument {"invalid_statuscode"};
    m_code = code;

    /* Read and parse response headers */
    m_headers = (endl == std::string::npos) ? utils::header_map {} : parse_headers(head.substr(endl + 2));

    /* Body */
    m_body.clear();
    if(is_chunked(m_headers))
    {
        if(!decode_chunked(body, &m_body))
            throw std::invalid_argument {"incomplete_body"};
    }
    else if(auto length = content_length(m_headers))
    {
        if(body.size() < *length)
            throw std::invalid_argument {"incomplete_body"};
        m_body = std::string {body.substr(0, *length)};
    }
    else
    {
        m_body = std::string {body};
    }
}

std::optional<size_t> response::message_size(std::string_view raw)
{
    size_t header_end = raw.find(header_termination);
    if(header_end == std::string::npos)
        return std::nullopt;
    header_end += header_termination.size();

    utils::header_map headers;
    std::string_view head = raw.substr(0, header_end - header_termination.size());
    size_t endl = head.find("\r\n");
    if(endl != std::string::npos)
        headers = parse_headers(head.substr(endl + 2));

    // Responses to status requests without a body
    std::string_view status = head.substr(0, endl);
    if(status.find(" 204") != std::string::npos || status.find(" 304") != std::string::npos)
        return header_end;

    if(is_chunked(headers))
    {
        auto consumed = decode_chunked(raw.substr(header_end), nullptr);
        if(!consumed)
            return std::nullopt;
        return header_end + *consumed;
    }

    if(auto length = content_length(headers))
        return header_end + *length;

    return std::nullopt;
}

bool response::check_header(const std::string& key) const
{
    return m_headers.find(key) != m_headers.end();
}

std::string response::get_header(const std::string& key) const
{
    try {
        return m_headers.at(key);
    } catch(std::out_of_range& e) {
        return "";
    }
}

void response::set_header(const std::string& key, const std::string& value)
{
    m_headers[key] = value;
}

} // namespace http
