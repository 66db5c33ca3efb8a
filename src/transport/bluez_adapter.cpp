/* ======================================================================
 * BlueZ Adapter (facade) - overall flow
 *
 *  Manager loop                 CM worker                  Bus thread                 BlueZ/DBus
 *  ------------                 ---------                  ----------                 ----------
 *  start()
 *    └─ open bus, match InterfacesAdded/Removed, PropertiesChanged
 *    └─ SetDiscoveryFilter + StartDiscovery ──────────────────────────────────────▶  Adapter1
 *    └─ spawn bus loop; queue a cold scan ─────────────▶  GetManagedObjects
 *
 *  connect_async(addr)
 *    └─ cm.begin_connection ─▶  started(token)
 *                                 └─ Device1.Connect (async) ─────────────────────▶  Device1
 *                                                         ◀── reply → cm.finish_connection(token)
 *  open_interface_async(streaming|tracing)
 *    └─ cm.begin_operation ──▶  started(token) → post to bus thread
 *                                                          └─ find characteristic, StartNotify
 *                                                          └─ cm.finish_operation(token)
 *  Signals (bus thread)
 *    └─ Device1 props ─────────▶ note_device → notify_scan
 *    └─ Connected=false ───────▶ note_link_lost → cm.force_disconnect + notify_disconnect
 *    └─ InterfacesRemoved ─────▶ note_device_removed → notify_device_lost
 *    └─ Characteristic Value ──▶ note_char_value → notify_report / notify_trace
 *
 *  All sd-bus calls are made under impl_->bus_mu.
 * ====================================================================== */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// clang-format off
#include "transport/bluez_adapter.hpp"
#include "transport/bluez_adapter_impl.hpp"
#include "util/log.hpp"
// clang-format on

#if TILELINK_HAVE_SDBUS
#include "transport/bluez_dbus_util.hpp"
#endif

namespace transport
{

BluezConfig BluezConfig::from_env()
{
    BluezConfig cfg;
    if (const char *a = std::getenv("TILELINK_BLUEZ_ADAPTER"))
    {
        if (*a)
            cfg.adapter = a;
    }
    return cfg;
}

std::optional<TileAdvert> parse_tile_advert(const std::uint8_t *data, std::size_t len)
{
    if (!data || len < 6)
        return std::nullopt;

    TileAdvert adv;
    adv.uuid = static_cast<DeviceUuid>(data[0]) | (static_cast<DeviceUuid>(data[1]) << 8) |
               (static_cast<DeviceUuid>(data[2]) << 16) | (static_cast<DeviceUuid>(data[3]) << 24);
    adv.flags          = static_cast<std::uint16_t>(data[4] | (data[5] << 8));
    adv.pending_data   = (adv.flags & constants::ADV_FLAG_PENDING_DATA) != 0;
    adv.low_voltage    = (adv.flags & constants::ADV_FLAG_LOW_VOLTAGE) != 0;
    adv.user_connected = (adv.flags & constants::ADV_FLAG_USER_CONNECTED) != 0;
    return adv;
}

std::string device_path_for(const std::string &adapter_path, const std::string &address)
{
    std::string tail = address;
    for (auto &c : tail)
        c = (c == ':') ? '_' : (char)std::toupper((unsigned char)c);
    return adapter_path + "/dev_" + tail;
}

std::optional<std::string> address_from_path(const std::string &obj_path)
{
    // DBus path "/org/bluez/hci0/dev_XX_YY_ZZ" -> "XX:YY:ZZ"
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return std::nullopt;
    std::string tail = obj_path.substr(pos + 5);
    if (tail.empty() || tail.find('/') != std::string::npos)
        return std::nullopt;
    for (auto &c : tail)
        if (c == '_')
            c = ':';
    return tail;
}

// "AA:BB:CC:DD:EE:FF", either case
static bool valid_address(const std::string &s)
{
    if (s.size() != 17)
        return false;
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (i % 3 == 2)
        {
            if (s[i] != ':')
                return false;
        }
        else if (!std::isxdigit((unsigned char)s[i]))
            return false;
    }
    return true;
}

static const char *flag(bool b)
{
    return b ? "true" : "false";
}

BluezAdapter::BluezAdapter(BluezConfig cfg)
    : cfg_(std::move(cfg)), cm_("bluez", [this] { return id(); }), impl_(std::make_unique<Impl>())
{
    set_config(CFG_PROBE_SUPPORTED, true);
    set_config(CFG_MAX_CONNECTIONS, static_cast<std::int64_t>(cfg_.max_connections));
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
}

BluezAdapter::~BluezAdapter()
{
    stop();
}

bool BluezAdapter::start()
{
#if !TILELINK_HAVE_SDBUS
    LOG_ERROR("[BLUEZ] sd-bus not available (TILELINK_HAVE_SDBUS=0)");
    return false;
#else
    if (running_.load())
        return true;

    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
    impl_->tasks.reopen();

    if (!start_bus())
    {
        stop_bus();
        return false;
    }
    if (!cm_.start())
    {
        LOG_ERROR("[BLUEZ] connection manager failed to start");
        stop_bus();
        return false;
    }

    impl_->uuid_filter_ok = set_discovery_filter();
    if (!start_discovery())
        LOG_WARN("[BLUEZ] StartDiscovery failed (continue without scan)");

    running_.store(true);
    impl_->loop = std::thread([this] { run_bus_loop(); });
    post_bus([this] { (void)cold_scan(); });

    LOG_SYSTEM("[BLUEZ] started on %s", impl_->adapter_path.c_str());
    return true;
#endif
}

void BluezAdapter::stop()
{
    if (!running_.exchange(false))
        return;

    std::vector<std::string> open_paths;
    for (const auto &c : cm_.connections())
        open_paths.push_back(c.internal_id);

    // CM first: pending callbacks fail with "Adapter stopped" before the bus goes away
    cm_.stop();
    impl_->tasks.close();
    stop_bus(open_paths);

    // leftovers run against a closed bus so their callbacks still fire once
    while (auto t = impl_->tasks.try_pop())
        (*t)();

    std::lock_guard<std::mutex> lk(impl_->seen_mu);
    impl_->seen.clear();
    impl_->notifying.clear();
    LOG_SYSTEM("[BLUEZ] stopped");
}

bool BluezAdapter::can_connect() const
{
    const auto max = DeviceAdapter::config().get_int(CFG_MAX_CONNECTIONS, cfg_.max_connections);
    return static_cast<std::int64_t>(cm_.count()) < max;
}

void BluezAdapter::periodic_callback()
{
#if TILELINK_HAVE_SDBUS
    // discovery can be switched off under us (another client, adapter reset)
    if (running_.load() && !impl_->discovery_on.load())
        post_bus([this] { (void)start_discovery(); });
#endif
}

bool BluezAdapter::post_bus(std::function<void()> task)
{
    if (!running_.load())
        return false;
    return impl_->tasks.push(std::move(task));
}

// ============================================================================
// Connect / disconnect
// ============================================================================
void BluezAdapter::connect_async(ConnId id, const std::string &connection_string, OpCallback cb)
{
    if (!running_.load())
    {
        cb(id, this->id(), Result::fail("Adapter is not running", ErrorKind::InvalidState));
        return;
    }
    if (!valid_address(connection_string))
    {
        cb(id, this->id(),
           Result::fail("Invalid BLE address " + connection_string, ErrorKind::NotFound));
        return;
    }
    if (!can_connect())
    {
        cb(id, this->id(), Result::fail("No free connection slots", ErrorKind::CapacityExhausted));
        return;
    }

    const std::string path = device_path_for(impl_->adapter_path, connection_string);
    Context           ctx{{"address", connection_string}};
    {
        std::lock_guard<std::mutex> lk(impl_->seen_mu);
        auto                        it = impl_->seen.find(path);
        if (it != impl_->seen.end() && it->second.advert)
            ctx["uuid"] = uuid_hex(it->second.advert->uuid);
    }

    cm_.begin_connection(id, path, std::move(cb), default_timeout(), std::move(ctx),
                         [this, id, path](OpToken tok) {
                             if (!submit_device_call("Connect", path, id, tok, true))
                                 cm_.finish_connection(path, false,
                                                       std::string("Could not send Device1.Connect"),
                                                       tok);
                         });
}

void BluezAdapter::disconnect_async(ConnId id, OpCallback cb)
{
    cm_.begin_disconnection(id, std::move(cb), default_timeout(), [this, id](OpToken tok) {
        auto path = cm_.get_internal_id(id);
        if (!path)
            return;
        drop_notifications(id);
        if (!submit_device_call("Disconnect", *path, id, tok, false))
            cm_.finish_disconnection(id, false, std::string("Could not send Device1.Disconnect"),
                                     tok);
    });
}

void BluezAdapter::complete_call(BusCall *call, bool ok, const std::string &why)
{
    std::optional<std::string> reason;
    if (!ok)
        reason = why;

    if (call->connect)
        cm_.finish_connection(call->path, ok, reason, call->token);
    else
        cm_.finish_disconnection(call->id, ok, reason, call->token);

#if TILELINK_HAVE_SDBUS
    // runs under bus_mu
    auto &calls = impl_->calls;
    auto  it    = std::find_if(calls.begin(), calls.end(),
                               [call](const std::unique_ptr<BusCall> &c) { return c.get() == call; });
    if (it != calls.end())
    {
        unref_slot((*it)->slot);
        calls.erase(it);
    }
#endif
}

// ============================================================================
// Interfaces
// ============================================================================
void BluezAdapter::open_interface_async(ConnId id, Interface iface, OpCallback cb)
{
    if (iface != Interface::Streaming && iface != Interface::Tracing)
    {
        DeviceAdapter::open_interface_async(id, iface, std::move(cb));
        return;
    }

    cm_.begin_operation(
        id, "open_interface", OpCallback(std::move(cb)), default_timeout(),
        [this, id, iface](OpToken tok) {
            const bool queued = post_bus([this, id, iface, tok] {
                auto dev = cm_.get_internal_id(id);
                if (!dev)
                    return;  // already failed by force_disconnect
                const std::string &uuid =
                    iface == Interface::Streaming ? cfg_.streaming_uuid : cfg_.tracing_uuid;

                auto chr = find_char_path(*dev, uuid);
                if (!chr)
                {
                    cm_.finish_operation(id,
                                         Result::fail(std::string("No ") + interface_name(iface) +
                                                          " characteristic on device",
                                                      ErrorKind::NotFound),
                                         tok);
                    return;
                }
                std::string why;
                if (!set_notify(*chr, true, why))
                {
                    cm_.finish_operation(id, Result::fail(why), tok);
                    return;
                }
                {
                    std::lock_guard<std::mutex> lk(impl_->seen_mu);
                    impl_->notifying[*chr] = {id, iface};
                }
                cm_.finish_operation(id, Result::ok(), tok);
            });
            if (!queued)
                cm_.finish_operation(id, Result::fail("Adapter stopped", ErrorKind::InvalidState),
                                     tok);
        });
}

void BluezAdapter::close_interface_async(ConnId id, Interface iface, OpCallback cb)
{
    if (iface != Interface::Streaming && iface != Interface::Tracing)
    {
        DeviceAdapter::close_interface_async(id, iface, std::move(cb));
        return;
    }

    cm_.begin_operation(
        id, "close_interface", OpCallback(std::move(cb)), default_timeout(),
        [this, id, iface](OpToken tok) {
            const bool queued = post_bus([this, id, iface, tok] {
                std::optional<std::string> chr;
                {
                    std::lock_guard<std::mutex> lk(impl_->seen_mu);
                    for (auto it = impl_->notifying.begin(); it != impl_->notifying.end(); ++it)
                    {
                        if (it->second.first == id && it->second.second == iface)
                        {
                            chr = it->first;
                            impl_->notifying.erase(it);
                            break;
                        }
                    }
                }
                std::string why;
                if (chr && !set_notify(*chr, false, why))
                    LOG_WARN("[BLUEZ] StopNotify on %s: %s", chr->c_str(), why.c_str());
                cm_.finish_operation(id, Result::ok(), tok);
            });
            if (!queued)
                cm_.finish_operation(id, Result::fail("Adapter stopped", ErrorKind::InvalidState),
                                     tok);
        });
}

void BluezAdapter::drop_notifications(ConnId id)
{
    std::lock_guard<std::mutex> lk(impl_->seen_mu);
    for (auto it = impl_->notifying.begin(); it != impl_->notifying.end();)
    {
        if (it->second.first == id)
            it = impl_->notifying.erase(it);
        else
            ++it;
    }
}

// ============================================================================
// Probe
// ============================================================================
void BluezAdapter::probe_async(ProbeCallback cb)
{
    const bool queued = post_bus([this, cb] {
        if (cold_scan())
            cb(id(), Result::ok());
        else
            cb(id(), Result::fail("GetManagedObjects failed"));
    });
    if (!queued)
        cb(id(), Result::fail("Adapter is not running", ErrorKind::InvalidState));
}

// ============================================================================
// Bus thread notifications
// ============================================================================
void BluezAdapter::note_device(const std::string &path, const DeviceProps &props)
{
    DeviceInfo info;
    {
        std::lock_guard<std::mutex> lk(impl_->seen_mu);
        auto                       &s = impl_->seen[path];
        if (props.address)
            s.addr = *props.address;
        if (props.rssi)
            s.rssi = *props.rssi;
        if (props.advert)
            s.advert = props.advert;

        if (!s.advert)
            return;  // not a tile, or its advertisement has not been seen yet
        if (s.addr.empty())
        {
            auto addr = address_from_path(path);
            if (!addr)
                return;
            s.addr = *addr;
        }

        info.uuid                          = s.advert->uuid;
        info.connection_string             = s.addr;
        info.signal_strength               = s.rssi;
        info.properties["address"]         = s.addr;
        info.properties["pending_data"]    = flag(s.advert->pending_data);
        info.properties["low_voltage"]     = flag(s.advert->low_voltage);
        info.properties["user_connected"]  = flag(s.advert->user_connected);
    }
    notify_scan(info, constants::BLE_SCAN_EXPIRY);
}

void BluezAdapter::note_device_removed(const std::string &path)
{
    note_link_lost(path);

    std::optional<DeviceUuid> uuid;
    {
        std::lock_guard<std::mutex> lk(impl_->seen_mu);
        auto                        it = impl_->seen.find(path);
        if (it == impl_->seen.end())
            return;
        if (it->second.advert)
            uuid = it->second.advert->uuid;
        impl_->seen.erase(it);
    }
    if (uuid)
        notify_device_lost(*uuid);
}

void BluezAdapter::note_link_lost(const std::string &path)
{
    auto id = cm_.get_connection_id(path);
    if (!id)
        return;

    // Connecting and Disconnecting are settled by the Device1 call replies
    const ConnState st = cm_.state(path);
    if (st != ConnState::Idle && st != ConnState::InProgress)
        return;

    LOG_WARN("[BLUEZ] link to %s lost (connection %lld)", path.c_str(), (long long)*id);
    drop_notifications(*id);
    cm_.force_disconnect(path);
    notify_disconnect(*id);
}

void BluezAdapter::note_char_value(const std::string &path, const std::uint8_t *data,
                                   std::size_t len)
{
    ConnId    id    = 0;
    Interface iface = Interface::Streaming;
    {
        std::lock_guard<std::mutex> lk(impl_->seen_mu);
        auto                        it = impl_->notifying.find(path);
        if (it == impl_->notifying.end())
            return;
        id    = it->second.first;
        iface = it->second.second;
    }

    Payload bytes(data, data + len);
    if (iface == Interface::Tracing)
    {
        notify_trace(id, bytes);
        return;
    }

    Report r;
    r.raw = std::move(bytes);
    if (auto ctx = cm_.get_context(id))
    {
        auto it = ctx->find("uuid");
        if (it != ctx->end())
        {
            if (auto uuid = parse_uuid_hex(it->second))
                r.origin = *uuid;
        }
    }
    notify_report(id, r);
}

}  // namespace transport
