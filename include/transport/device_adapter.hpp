#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "transport/types.hpp"
#include "util/config.hpp"

namespace transport
{

using DebugArgs = std::map<std::string, std::string>;

// Standard per-adapter config keys
inline constexpr const char *CFG_PROBE_SUPPORTED    = "probe_supported";
inline constexpr const char *CFG_DEFAULT_TIMEOUT_MS = "default_timeout_ms";
inline constexpr const char *CFG_MAX_CONNECTIONS    = "max_connections";

// Capability contract for one transport backend.
//
// Implementations override the *_async forms; each one must invoke its callback exactly
// once, from any thread. Operations an adapter does not override fail with a
// "not supported" result. The *_sync forms block the caller on the async form and must
// not be called from a thread the adapter needs to complete the operation.
class DeviceAdapter
{
  public:
    DeviceAdapter();
    virtual ~DeviceAdapter() = default;

    DeviceAdapter(const DeviceAdapter &)            = delete;
    DeviceAdapter &operator=(const DeviceAdapter &) = delete;

    virtual std::string name() const = 0;
    virtual bool        start() { return true; }
    // Tears down every connection and releases resources. Idempotent.
    virtual void stop()              = 0;
    virtual bool can_connect() const = 0;
    // Housekeeping, called about once a second from the manager loop. Must not block.
    virtual void periodic_callback() {}

    virtual void connect_async(ConnId id, const std::string &connection_string, OpCallback cb);
    virtual void disconnect_async(ConnId id, OpCallback cb);
    virtual void open_interface_async(ConnId id, Interface iface, OpCallback cb);
    virtual void close_interface_async(ConnId id, Interface iface, OpCallback cb);
    virtual void send_rpc_async(ConnId id, std::uint8_t address, std::uint16_t rpc_id,
                                Payload payload, std::chrono::milliseconds timeout,
                                RpcCallback cb);
    virtual void send_script_async(ConnId id, Payload data, ProgressCallback progress,
                                   OpCallback cb);
    virtual void probe_async(ProbeCallback cb);
    virtual void debug_async(ConnId id, const std::string &command, DebugArgs args,
                             ProgressCallback progress, DebugCallback cb);

    Result      connect_sync(ConnId id, const std::string &connection_string);
    Result      disconnect_sync(ConnId id);
    Result      open_interface_sync(ConnId id, Interface iface);
    Result      close_interface_sync(ConnId id, Interface iface);
    RpcResult   send_rpc_sync(ConnId id, std::uint8_t address, std::uint16_t rpc_id,
                              Payload payload, std::chrono::milliseconds timeout);
    Result      send_script_sync(ConnId id, Payload data, ProgressCallback progress = {});
    Result      probe_sync();
    DebugResult debug_sync(ConnId id, const std::string &command, DebugArgs args,
                           ProgressCallback progress = {});

    // ---- configuration ----
    void                       set_config(const std::string &key, config::Value v);
    std::optional<config::Value> get_config(const std::string &key) const;
    config::Value              get_config(const std::string &key, config::Value default_value) const;

    // ---- event channels ----
    void add_scan_callback(ScanHandler h);
    void add_disconnect_callback(DisconnectHandler h);
    void add_report_callback(ReportHandler h);
    void add_trace_callback(TraceHandler h);
    void add_device_lost_callback(LostHandler h);

    void      set_id(AdapterId id) { id_.store(id); }
    AdapterId id() const { return id_.load(); }

  protected:
    void notify_scan(const DeviceInfo &info, std::chrono::seconds expiry);
    void notify_disconnect(ConnId id);
    void notify_report(ConnId id, const Report &r);
    void notify_trace(ConnId id, const Payload &bytes);
    void notify_device_lost(DeviceUuid uuid);

    std::chrono::milliseconds default_timeout() const;
    const config::ConfigStore &config() const { return config_; }

  private:
    std::atomic<AdapterId> id_{NO_ADAPTER};
    config::ConfigStore    config_;

    mutable std::mutex             handlers_mu_;
    std::vector<ScanHandler>       on_scan_;
    std::vector<DisconnectHandler> on_disconnect_;
    std::vector<ReportHandler>     on_report_;
    std::vector<TraceHandler>      on_trace_;
    std::vector<LostHandler>       on_lost_;
};

}  // namespace transport
