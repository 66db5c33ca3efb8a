#include <cctype>
#include <cstdio>
#include <string>

#include "transport/types.hpp"

namespace transport
{

const char *interface_name(Interface i)
{
    switch (i)
    {
        case Interface::Rpc:
            return "rpc";
        case Interface::Script:
            return "script";
        case Interface::Streaming:
            return "streaming";
        case Interface::Tracing:
            return "tracing";
        case Interface::Debug:
            return "debug";
    }
    return "?";
}

std::optional<Interface> parse_interface(std::string_view name)
{
    if (name == "rpc")
        return Interface::Rpc;
    if (name == "script")
        return Interface::Script;
    if (name == "streaming")
        return Interface::Streaming;
    if (name == "tracing")
        return Interface::Tracing;
    if (name == "debug")
        return Interface::Debug;
    return std::nullopt;
}

const char *error_kind_name(ErrorKind k)
{
    switch (k)
    {
        case ErrorKind::None:
            return "none";
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::InvalidState:
            return "invalid_state";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::AdapterRejected:
            return "adapter_rejected";
        case ErrorKind::UnexpectedDisconnect:
            return "unexpected_disconnect";
        case ErrorKind::CapacityExhausted:
            return "capacity_exhausted";
        case ErrorKind::NotSupported:
            return "not_supported";
    }
    return "?";
}

std::string device_slug(DeviceUuid uuid)
{
    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx", (unsigned long long)uuid);
    std::string s = "d--";
    for (int i = 0; i < 16; ++i)
    {
        if (i > 0 && i % 4 == 0)
            s.push_back('-');
        s.push_back(hex[i]);
    }
    return s;
}

std::string uuid_hex(DeviceUuid uuid)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%x", (unsigned)uuid);
    return std::string(buf);
}

std::optional<DeviceUuid> parse_uuid_hex(std::string_view s)
{
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
        s.remove_prefix(2);
    if (s.empty() || s.size() > 8)
        return std::nullopt;

    DeviceUuid v = 0;
    for (char c : s)
    {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isxdigit(uc))
            return std::nullopt;
        const int digit = std::isdigit(uc) ? uc - '0' : std::tolower(uc) - 'a' + 10;
        v               = (v << 4) | static_cast<DeviceUuid>(digit);
    }
    return v;
}

}  // namespace transport
