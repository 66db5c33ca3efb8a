#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "transport/connection_manager.hpp"
#include "transport/device_adapter.hpp"
#include "util/constants.hpp"

namespace transport
{

struct BluezConfig
{
    std::string adapter        = "hci0";
    std::string svc_uuid       = std::string(constants::TILEBUS_SVC_UUID);
    std::string streaming_uuid = std::string(constants::TILEBUS_STREAMING_UUID);  // Notify
    std::string tracing_uuid   = std::string(constants::TILEBUS_TRACING_UUID);    // Notify
    int         max_connections = constants::BLUEZ_MAX_CONNECTIONS;

    // TILELINK_BLUEZ_ADAPTER overrides `adapter`
    static BluezConfig from_env();
};

// What a tile puts in its advertisement (manufacturer data, company 0x03C0).
struct TileAdvert
{
    DeviceUuid    uuid{0};
    std::uint16_t flags{0};
    bool          pending_data{false};
    bool          low_voltage{false};
    bool          user_connected{false};
};

// <u32 uuid><u16 flags>, little endian. nullopt when too short.
std::optional<TileAdvert> parse_tile_advert(const std::uint8_t *data, std::size_t len);

// "/org/bluez/hci0" + "AA:BB:CC:DD:EE:FF" -> "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
std::string device_path_for(const std::string &adapter_path, const std::string &address);
// Inverse of device_path_for; nullopt for paths that are not device objects.
std::optional<std::string> address_from_path(const std::string &obj_path);

// Partial Device1 properties from one D-Bus message.
struct DeviceProps
{
    std::optional<std::string>  address;
    std::optional<std::int16_t> rssi;
    std::optional<TileAdvert>   advert;
    std::optional<bool>         connected;
    bool                        svc_hit{false};
};

// BluezAdapter: TileBus devices over BLE through BlueZ's D-Bus API.
// Connection strings are BLE addresses; the CM internal id is the BlueZ device path.
// Only the streaming and tracing interfaces are carried.
class BluezAdapter final : public DeviceAdapter
{
  public:
    explicit BluezAdapter(BluezConfig cfg = BluezConfig::from_env());
    ~BluezAdapter() override;

    std::string name() const override { return "bluez"; }
    bool        start() override;
    void        stop() override;
    bool        can_connect() const override;
    void        periodic_callback() override;

    void connect_async(ConnId id, const std::string &connection_string, OpCallback cb) override;
    void disconnect_async(ConnId id, OpCallback cb) override;
    void open_interface_async(ConnId id, Interface iface, OpCallback cb) override;
    void close_interface_async(ConnId id, Interface iface, OpCallback cb) override;
    void probe_async(ProbeCallback cb) override;

    const BluezConfig &bluez_config() const { return cfg_; }
    bool               is_running() const noexcept { return running_.load(); }

    // ---- called from sd-bus callbacks on the bus thread ----
    void note_device(const std::string &path, const DeviceProps &props);
    void note_device_removed(const std::string &path);
    void note_link_lost(const std::string &path);
    void note_char_value(const std::string &path, const std::uint8_t *data, std::size_t len);

    struct BusCall;
    void complete_call(BusCall *call, bool ok, const std::string &why);

  private:
    bool start_bus();
    void stop_bus(const std::vector<std::string> &open_paths = {});
    bool set_discovery_filter();
    bool start_discovery();
    bool cold_scan();
    bool submit_device_call(const char *method, const std::string &path, ConnId id, OpToken tok,
                            bool connect);
    std::optional<std::string> find_char_path(const std::string &dev_path,
                                              const std::string &uuid);
    bool set_notify(const std::string &char_path, bool on, std::string &why);
    void run_bus_loop();
    bool post_bus(std::function<void()> task);
    void drop_notifications(ConnId id);

    BluezConfig       cfg_;
    std::atomic<bool> running_{false};
    ConnectionManager cm_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace transport
