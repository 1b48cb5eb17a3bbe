#ifndef APPCAST_ERRORS_HPP
#define APPCAST_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace appcast
{

enum class errc
{
    transport_error,
    timeout,
    malformed_response,
    app_not_installed,
    device_busy,
    operation_not_supported,
    unreachable_device
};

const char* to_string(errc code);

// Base of every failure surfaced by discovery, resolution and application control
class cast_error : public std::runtime_error
{
public:
    cast_error(errc code, const std::string& what)
        : std::runtime_error {what}, m_code {code}
    {}

    errc code() const
    {
        return m_code;
    }

private:
    errc m_code;
};

class transport_error : public cast_error
{
public:
    explicit transport_error(const std::string& what)
        : cast_error {errc::transport_error, what}
    {}
};

// Connection failures and exceeded call timeouts, the latter report errc::timeout
class unreachable_device : public cast_error
{
public:
    explicit unreachable_device(const std::string& what, bool timed_out = false)
        : cast_error {timed_out ? errc::timeout : errc::unreachable_device, what}
    {}

    bool timed_out() const
    {
        return code() == errc::timeout;
    }
};

class malformed_description : public cast_error
{
public:
    explicit malformed_description(const std::string& what)
        : cast_error {errc::malformed_response, what}
    {}
};

class malformed_status : public cast_error
{
public:
    explicit malformed_status(const std::string& what)
        : cast_error {errc::malformed_response, what}
    {}
};

class no_dial_service : public cast_error
{
public:
    explicit no_dial_service(const std::string& what)
        : cast_error {errc::malformed_response, what}
    {}
};

class app_not_installed : public cast_error
{
public:
    explicit app_not_installed(const std::string& what)
        : cast_error {errc::app_not_installed, what}
    {}
};

class device_busy : public cast_error
{
public:
    explicit device_busy(const std::string& what)
        : cast_error {errc::device_busy, what}
    {}
};

class operation_not_supported : public cast_error
{
public:
    explicit operation_not_supported(const std::string& what)
        : cast_error {errc::operation_not_supported, what}
    {}
};

} // namespace appcast

#endif
