#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "app/monitors.hpp"
#include "transport/device_adapter.hpp"
#include "util/config.hpp"
#include "util/event_loop.hpp"
#include "util/timeout.hpp"

namespace app
{

// One adapter's latest sighting of a device.
struct ScanRecord
{
    int                                     signal_strength{0};
    std::string                             connection_string;
    std::optional<util::Clock::time_point>  expires_at;  // nullopt: never expires
    std::map<std::string, std::string>      properties;

    bool expired(util::Clock::time_point now) const { return expires_at && *expires_at <= now; }
};

struct Route
{
    transport::AdapterId               adapter{transport::NO_ADAPTER};
    int                                signal_strength{0};
    std::string                        connection_string;          // adapter's own
    std::string                        qualified_connection_string;  // "adapter/<id>/<conn>"
    std::map<std::string, std::string> properties;
};

// Every adapter that currently sees a device, strongest first.
struct DeviceView
{
    transport::DeviceUuid uuid{0};
    std::string           connection_string;  // "device/<uuid hex>"
    std::vector<Route>    adapters;
    transport::AdapterId  best_adapter{transport::NO_ADAPTER};
    int                   signal_strength{0};
};

struct ConnectResult
{
    bool                             success{false};
    std::optional<transport::ConnId> connection_id{};
    std::optional<std::string>       reason{};
    transport::ErrorKind             kind{transport::ErrorKind::None};
};

enum class LinkState
{
    Connecting,
    Idle,
    Busy,
    Disconnecting
};

using ConnectCallback     = std::function<void(const ConnectResult &)>;
using ResultCallback      = std::function<void(const transport::Result &)>;
using RpcResultCallback   = std::function<void(const transport::RpcResult &)>;
using DebugResultCallback = std::function<void(const transport::DebugResult &)>;

// ============================================================================
// DeviceManager
// - Aggregates every adapter's scan results and routes connections to the best one.
// - All of its state lives on one owning loop; adapter callbacks are posted there.
// - Results are delivered on the owning loop. The *_sync forms block the caller and must
//   not be used from the loop (monitor callbacks included).
// ============================================================================
class DeviceManager
{
  public:
    explicit DeviceManager(config::ManagerSettings settings = config::ManagerSettings{});
    ~DeviceManager();

    DeviceManager(const DeviceManager &)            = delete;
    DeviceManager &operator=(const DeviceManager &) = delete;

    // Only before start().
    std::optional<transport::AdapterId> add_adapter(std::shared_ptr<transport::DeviceAdapter> a);

    bool start();
    void stop();
    bool running() const { return started_.load(); }

    // ---- connections ----
    void connect(transport::DeviceUuid uuid, ConnectCallback cb);
    // "device/<uuid hex>" or "adapter/<adapter id>/<adapter connection string>"
    void connect_string(const std::string &connection_string, ConnectCallback cb);
    void disconnect(transport::ConnId id, ResultCallback cb);

    void open_interface(transport::ConnId id, transport::Interface iface, ResultCallback cb);
    void close_interface(transport::ConnId id, transport::Interface iface, ResultCallback cb);
    void send_rpc(transport::ConnId id, std::uint8_t address, std::uint8_t feature,
                  std::uint8_t command, transport::Payload payload,
                  std::chrono::milliseconds timeout, RpcResultCallback cb);
    void send_script(transport::ConnId id, transport::Payload data,
                     transport::ProgressCallback progress, ResultCallback cb);
    void debug(transport::ConnId id, std::string command, transport::DebugArgs args,
               transport::ProgressCallback progress, DebugResultCallback cb);

    // Out-of-band scan on every adapter that supports it.
    void probe(ResultCallback cb);
    void device_lost(transport::AdapterId adapter, transport::DeviceUuid uuid);

    ConnectResult          connect_sync(transport::DeviceUuid uuid);
    ConnectResult          connect_string_sync(const std::string &connection_string);
    transport::Result      disconnect_sync(transport::ConnId id);
    transport::Result      open_interface_sync(transport::ConnId id, transport::Interface iface);
    transport::Result      close_interface_sync(transport::ConnId id, transport::Interface iface);
    transport::RpcResult   send_rpc_sync(transport::ConnId id, std::uint8_t address,
                                         std::uint8_t feature, std::uint8_t command,
                                         transport::Payload        payload,
                                         std::chrono::milliseconds timeout);
    transport::Result      send_script_sync(transport::ConnId id, transport::Payload data,
                                            transport::ProgressCallback progress = {});
    transport::DebugResult debug_sync(transport::ConnId id, std::string command,
                                      transport::DebugArgs        args,
                                      transport::ProgressCallback progress = {});
    transport::Result      probe_sync();

    // ---- monitors ----
    // uuid == nullopt watches every device.
    std::optional<std::string> register_monitor(std::optional<transport::DeviceUuid> uuid,
                                                std::set<EventKind> events, MonitorCallback cb);
    // Event names: device_seen, report, trace, disconnection, progress.
    std::optional<std::string> register_monitor(std::optional<transport::DeviceUuid> uuid,
                                                const std::vector<std::string> &events,
                                                MonitorCallback                  cb);
    bool adjust_monitor(const std::string &monitor_id, const std::set<EventKind> &add,
                        const std::set<EventKind> &remove);
    bool remove_monitor(const std::string &monitor_id);

    // ---- views ----
    std::vector<DeviceView>  scanned_devices();
    std::optional<LinkState> connection_state(transport::ConnId id);
    std::size_t              connection_count();

  private:
    struct Connection
    {
        transport::DeviceUuid uuid{0};
        transport::AdapterId  adapter{transport::NO_ADAPTER};
        LinkState             state{LinkState::Connecting};
    };

    // Everything below runs on the owning loop.
    void on_scan(transport::AdapterId adapter, const transport::DeviceInfo &info,
                 std::chrono::seconds expiry);
    void on_device_lost(transport::AdapterId adapter, transport::DeviceUuid uuid);
    void on_disconnect(transport::AdapterId adapter, transport::ConnId id);
    void on_report(transport::ConnId id, const transport::Report &r);
    void on_trace(transport::ConnId id, const transport::Payload &bytes);
    void on_progress(transport::ConnId id, const std::string &operation, std::size_t done,
                     std::size_t total, const transport::ProgressCallback &user);

    // Every attempt takes its connection id up front, failed ones included.
    void route_connect(transport::ConnId id, transport::DeviceUuid uuid, const ConnectCallback &cb);
    void begin_connect(transport::ConnId id, transport::DeviceUuid uuid,
                       transport::AdapterId adapter, const std::string &connection_string,
                       ConnectCallback cb);
    void op_done(transport::ConnId id);
    void sweep_expired();
    std::vector<DeviceView> build_view() const;

    // Non-null when `id` is Idle; otherwise fills `failure`.
    Connection *idle_connection(transport::ConnId id, transport::Result &failure);
    transport::DeviceAdapter *adapter(transport::AdapterId id) const;

    // Adapter callbacks come from foreign threads. `closed` runs on the calling thread
    // instead when the loop no longer accepts work.
    void marshal(util::EventLoop::Task t, util::EventLoop::Task closed = nullptr);
    // Public requests: `refuse` runs inline unless the manager is started and the loop
    // takes the work.
    void submit(util::EventLoop::Task work, util::EventLoop::Task refuse);

    config::ManagerSettings settings_;
    util::EventLoop         loop_;
    std::atomic<bool>       started_{false};

    std::vector<std::shared_ptr<transport::DeviceAdapter>> adapters_;

    std::unordered_map<transport::DeviceUuid, std::map<transport::AdapterId, ScanRecord>> scans_;
    std::map<transport::ConnId, Connection>                                               conns_;
    transport::ConnId next_conn_id_{0};
    MonitorTable      monitors_;
};

}  // namespace app
