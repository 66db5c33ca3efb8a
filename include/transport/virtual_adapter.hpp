#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>

#include "transport/connection_manager.hpp"
#include "transport/device_adapter.hpp"
#include "util/work_queue.hpp"

namespace transport
{

// (status, response payload)
using RpcHandler   = std::function<std::pair<std::uint8_t, Payload>(const Payload &)>;
// nullopt fails the debug command
using DebugHandler = std::function<std::optional<std::string>(const DebugArgs &)>;

struct VirtualDevice
{
    DeviceUuid           uuid{0};
    int                  signal_strength{-50};
    std::chrono::seconds expiry{0};  // 0: sightings never expire
    std::map<std::string, std::string>                        properties;
    std::map<std::pair<std::uint8_t, std::uint16_t>, RpcHandler> rpcs;  // (address, rpc id)
    std::map<std::string, DebugHandler>                          debug_commands;
};

// VirtualAdapter: in-process tiles behind the full adapter contract. Completions arrive
// from the adapter's own I/O thread, like a real radio. Connection strings are device slugs.
class VirtualAdapter final : public DeviceAdapter
{
  public:
    explicit VirtualAdapter(std::string name = "virtual", int max_connections = 1,
                            std::chrono::milliseconds latency = std::chrono::milliseconds(1));
    ~VirtualAdapter() override;

    std::string name() const override { return name_; }
    bool        start() override;
    void        stop() override;
    bool        can_connect() const override;
    void        periodic_callback() override;

    void connect_async(ConnId id, const std::string &connection_string, OpCallback cb) override;
    void disconnect_async(ConnId id, OpCallback cb) override;
    void open_interface_async(ConnId id, Interface iface, OpCallback cb) override;
    void close_interface_async(ConnId id, Interface iface, OpCallback cb) override;
    void send_rpc_async(ConnId id, std::uint8_t address, std::uint16_t rpc_id, Payload payload,
                        std::chrono::milliseconds timeout, RpcCallback cb) override;
    void send_script_async(ConnId id, Payload data, ProgressCallback progress,
                           OpCallback cb) override;
    void probe_async(ProbeCallback cb) override;
    void debug_async(ConnId id, const std::string &command, DebugArgs args,
                     ProgressCallback progress, DebugCallback cb) override;

    // ---- device management / test hooks ----
    bool add_device(VirtualDevice dev);
    // Device disappears for good: its connection drops and device-lost subscribers are told.
    bool remove_device(DeviceUuid uuid);
    // An unresponsive device accepts requests but never answers them.
    bool set_responsive(DeviceUuid uuid, bool responsive);
    bool set_signal_strength(DeviceUuid uuid, int rssi);
    // Needs an open streaming / tracing interface.
    bool push_report(DeviceUuid uuid, Payload raw);
    bool push_trace(DeviceUuid uuid, Payload bytes);
    // Link loss outside of our control.
    bool drop_connection(DeviceUuid uuid);

    std::optional<Payload>  last_script(DeviceUuid uuid) const;
    std::set<Interface>     open_interfaces(ConnId id) const;
    std::size_t             connection_count() const { return cm_.count(); }

    static constexpr std::size_t SCRIPT_CHUNK = 20;

  private:
    struct DeviceState
    {
        VirtualDevice dev;
        bool          responsive{true};
        Payload       script;
        bool          has_script{false};
    };

    // What the device side knows about an open link
    struct Session
    {
        DeviceUuid          uuid{0};
        std::set<Interface> open;
    };

    using Task = std::function<void()>;

    void io_loop();
    bool io_post(Task t);
    void announce_all();

    std::optional<DeviceUuid> session_uuid(ConnId id) const;
    std::optional<ConnId>     session_for(DeviceUuid uuid) const;
    bool                      responsive(DeviceUuid uuid) const;
    bool                      interface_open(ConnId id, Interface iface) const;

    std::string               name_;
    std::chrono::milliseconds latency_;

    ConnectionManager cm_;

    util::WorkQueue<Task> io_;
    std::thread           io_thr_;
    std::atomic<bool>     running_{false};

    mutable std::mutex                mu_;
    std::map<DeviceUuid, DeviceState> devices_;
    std::map<ConnId, Session>         sessions_;
};

}  // namespace transport
