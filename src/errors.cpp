#include "errors.hpp"

namespace appcast
{

const char* to_string(errc code)
{
    switch(code)
    {
        case errc::transport_error:
            return "transport error";
        case errc::timeout:
            return "timeout";
        case errc::malformed_response:
            return "malformed response";
        case errc::app_not_installed:
            return "app not installed";
        case errc::device_busy:
            return "device busy";
        case errc::operation_not_supported:
            return "operation not supported";
        case errc::unreachable_device:
            return "unreachable device";
    }
    return "unknown error";
}

} // namespace appcast
