#ifndef APPCAST_UTILS_HPP
#define APPCAST_UTILS_HPP

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace utils
{

struct url
{
    std::string scheme;
    std::string host;
    uint16_t port = 80;
    std::string path = "/"; /// path including the query string

    std::string authority() const;

    std::string to_string() const;
};

// Throws std::invalid_argument if the string is not an absolute http(s) url
url parse_url(std::string_view str);

bool is_absolute_url(std::string_view str);

// Resolve a (possibly relative) reference against an absolute base url
std::string resolve_url(const std::string& base, std::string_view reference);

bool iequals(std::string_view lhs, std::string_view rhs);

std::string_view trim(std::string_view view);

struct case_insensitive_less
{
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

// Header names of HTTP and SSDP messages are case insensitive
using header_map = std::map<std::string, std::string, case_insensitive_less>;

std::string get_local_ipaddr();

} // utils

#endif
