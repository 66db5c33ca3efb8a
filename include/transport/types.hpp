#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace transport
{

using ConnId     = std::int64_t;
using AdapterId  = int;
using DeviceUuid = std::uint32_t;
using Payload    = std::vector<std::uint8_t>;

inline constexpr AdapterId NO_ADAPTER = -1;

enum class Interface
{
    Rpc,
    Script,
    Streaming,
    Tracing,
    Debug
};

const char              *interface_name(Interface i);
std::optional<Interface> parse_interface(std::string_view name);

// Why an operation failed. Carried for logs and tests; callers only need success/reason.
enum class ErrorKind
{
    None,
    NotFound,
    InvalidState,
    Timeout,
    AdapterRejected,
    UnexpectedDisconnect,
    CapacityExhausted,
    NotSupported
};

const char *error_kind_name(ErrorKind k);

struct Result
{
    bool                       success{false};
    std::optional<std::string> reason{};
    ErrorKind                  kind{ErrorKind::None};

    static Result ok() { return Result{true, std::nullopt, ErrorKind::None}; }
    static Result fail(std::string why, ErrorKind k = ErrorKind::AdapterRejected)
    {
        return Result{false, std::move(why), k};
    }
};

struct RpcResult
{
    bool                         success{false};
    std::optional<std::string>   reason{};
    std::optional<std::uint8_t>  status{};
    std::optional<Payload>       payload{};
    ErrorKind                    kind{ErrorKind::None};

    static RpcResult ok(std::uint8_t st, Payload p)
    {
        return RpcResult{true, std::nullopt, st, std::move(p), ErrorKind::None};
    }
    static RpcResult fail(std::string why, ErrorKind k = ErrorKind::AdapterRejected)
    {
        return RpcResult{false, std::move(why), std::nullopt, std::nullopt, k};
    }
};

struct DebugResult
{
    bool                       success{false};
    std::optional<std::string> reason{};
    std::optional<std::string> value{};
    ErrorKind                  kind{ErrorKind::None};

    static DebugResult ok(std::string v)
    {
        return DebugResult{true, std::nullopt, std::move(v), ErrorKind::None};
    }
    static DebugResult fail(std::string why, ErrorKind k = ErrorKind::AdapterRejected)
    {
        return DebugResult{false, std::move(why), std::nullopt, k};
    }
};

// What an adapter saw during a scan.
struct DeviceInfo
{
    DeviceUuid                         uuid{0};
    std::string                        connection_string;
    int                                signal_strength{0};
    std::map<std::string, std::string> properties;  // adapter specific extras
};

// A complete report streamed by a device. Decoding is left to the consumer.
struct Report
{
    DeviceUuid                            origin{0};
    Payload                               raw;
    std::chrono::system_clock::time_point received{std::chrono::system_clock::now()};
};

// Completion callbacks: (connection id, adapter id, outcome)
using OpCallback       = std::function<void(ConnId, AdapterId, const Result &)>;
using RpcCallback      = std::function<void(ConnId, AdapterId, const RpcResult &)>;
using DebugCallback    = std::function<void(ConnId, AdapterId, const DebugResult &)>;
using ProbeCallback    = std::function<void(AdapterId, const Result &)>;
using ProgressCallback = std::function<void(std::size_t done, std::size_t total)>;

// Event channels
using ScanHandler       = std::function<void(AdapterId, const DeviceInfo &, std::chrono::seconds expiry)>;
using DisconnectHandler = std::function<void(AdapterId, ConnId)>;
using ReportHandler     = std::function<void(ConnId, const Report &)>;
using TraceHandler      = std::function<void(ConnId, const Payload &)>;
using LostHandler       = std::function<void(AdapterId, DeviceUuid)>;

// "d--0000-0000-0000-0abc"
std::string device_slug(DeviceUuid uuid);
std::string uuid_hex(DeviceUuid uuid);
std::optional<DeviceUuid> parse_uuid_hex(std::string_view s);

}  // namespace transport
