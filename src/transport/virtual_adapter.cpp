#include <algorithm>
#include <cstdio>
#include <utility>
#include <vector>

#include "transport/virtual_adapter.hpp"
#include "util/log.hpp"

namespace transport
{

VirtualAdapter::VirtualAdapter(std::string name, int max_connections,
                               std::chrono::milliseconds latency)
    : name_(std::move(name)), latency_(latency), cm_(name_, [this] { return id(); })
{
    set_config(CFG_PROBE_SUPPORTED, true);
    set_config(CFG_MAX_CONNECTIONS, static_cast<std::int64_t>(max_connections));
}

VirtualAdapter::~VirtualAdapter()
{
    stop();
}

bool VirtualAdapter::start()
{
    if (running_.exchange(true))
        return true;

    io_.reopen();
    io_thr_ = std::thread([this] { io_loop(); });
    if (!cm_.start())
    {
        LOG_ERROR("[VIRTUAL][%s] connection manager failed to start", name_.c_str());
        stop();
        return false;
    }

    io_post([this] { announce_all(); });
    LOG_INFO("[VIRTUAL][%s] started", name_.c_str());
    return true;
}

void VirtualAdapter::stop()
{
    if (!running_.exchange(false))
        return;

    cm_.stop();
    io_.close();
    if (io_thr_.joinable())
        io_thr_.join();

    std::lock_guard<std::mutex> lk(mu_);
    sessions_.clear();
    LOG_INFO("[VIRTUAL][%s] stopped", name_.c_str());
}

bool VirtualAdapter::can_connect() const
{
    const auto max = config().get_int(CFG_MAX_CONNECTIONS, 1);
    return static_cast<std::int64_t>(cm_.count()) < max;
}

void VirtualAdapter::periodic_callback()
{
    io_post([this] { announce_all(); });
}

// ============================================================================
// I/O thread
// ============================================================================
void VirtualAdapter::io_loop()
{
    while (true)
    {
        auto t = io_.pop_for(std::chrono::milliseconds(100));
        if (!t)
        {
            if (io_.closed())
                break;
            continue;
        }
        if (latency_.count() > 0)
            std::this_thread::sleep_for(latency_);
        (*t)();
    }
}

bool VirtualAdapter::io_post(Task t)
{
    if (!running_.load())
        return false;
    return io_.push(std::move(t));
}

void VirtualAdapter::announce_all()
{
    std::vector<std::pair<DeviceInfo, std::chrono::seconds>> seen;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto &kv : devices_)
        {
            DeviceInfo info;
            info.uuid              = kv.first;
            info.connection_string = device_slug(kv.first);
            info.signal_strength   = kv.second.dev.signal_strength;
            info.properties        = kv.second.dev.properties;
            seen.emplace_back(std::move(info), kv.second.dev.expiry);
        }
    }
    for (const auto &s : seen)
        notify_scan(s.first, s.second);
}

// ============================================================================
// Session helpers
// ============================================================================
std::optional<DeviceUuid> VirtualAdapter::session_uuid(ConnId id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = sessions_.find(id);
    if (it == sessions_.end())
        return std::nullopt;
    return it->second.uuid;
}

std::optional<ConnId> VirtualAdapter::session_for(DeviceUuid uuid) const
{
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &kv : sessions_)
        if (kv.second.uuid == uuid)
            return kv.first;
    return std::nullopt;
}

bool VirtualAdapter::responsive(DeviceUuid uuid) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = devices_.find(uuid);
    return it != devices_.end() && it->second.responsive;
}

bool VirtualAdapter::interface_open(ConnId id, Interface iface) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = sessions_.find(id);
    return it != sessions_.end() && it->second.open.count(iface) != 0;
}

std::set<Interface> VirtualAdapter::open_interfaces(ConnId id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = sessions_.find(id);
    if (it == sessions_.end())
        return {};
    return it->second.open;
}

// ============================================================================
// Connect / disconnect
// ============================================================================
void VirtualAdapter::connect_async(ConnId id, const std::string &connection_string, OpCallback cb)
{
    std::optional<DeviceUuid> uuid;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto &kv : devices_)
            if (device_slug(kv.first) == connection_string)
                uuid = kv.first;
    }
    if (!uuid)
    {
        LOG_WARN("[VIRTUAL][%s] no device at '%s'", name_.c_str(), connection_string.c_str());
        cb(id, this->id(), Result::fail("Could not find device " + connection_string,
                                        ErrorKind::NotFound));
        return;
    }
    if (!can_connect())
    {
        cb(id, this->id(), Result::fail("No free connection slots", ErrorKind::CapacityExhausted));
        return;
    }

    const DeviceUuid dev = *uuid;
    cm_.begin_connection(
        id, connection_string, std::move(cb), default_timeout(), {{"uuid", uuid_hex(dev)}},
        [this, id, dev](OpToken tok) {
            io_post([this, id, dev, tok] {
                if (!responsive(dev))
                    return;  // left to the deadline
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    sessions_[id] = Session{dev, {}};
                }
                cm_.finish_connection(id, true, std::nullopt, tok);
            });
        });
}

void VirtualAdapter::disconnect_async(ConnId id, OpCallback cb)
{
    cm_.begin_disconnection(id, std::move(cb), default_timeout(), [this, id](OpToken tok) {
        io_post([this, id, tok] {
            auto dev = session_uuid(id);
            if (dev && !responsive(*dev))
                return;
            {
                std::lock_guard<std::mutex> lk(mu_);
                sessions_.erase(id);
            }
            cm_.finish_disconnection(id, true, std::nullopt, tok);
        });
    });
}

// ============================================================================
// Operations
// ============================================================================
void VirtualAdapter::open_interface_async(ConnId id, Interface iface, OpCallback cb)
{
    cm_.begin_operation(id, "open_interface", OpCallback(std::move(cb)), default_timeout(),
                        [this, id, iface](OpToken tok) {
                            io_post([this, id, iface, tok] {
                                auto dev = session_uuid(id);
                                if (!dev || !responsive(*dev))
                                    return;
                                {
                                    std::lock_guard<std::mutex> lk(mu_);
                                    sessions_[id].open.insert(iface);
                                }
                                cm_.finish_operation(id, Result::ok(), tok);
                            });
                        });
}

void VirtualAdapter::close_interface_async(ConnId id, Interface iface, OpCallback cb)
{
    cm_.begin_operation(id, "close_interface", OpCallback(std::move(cb)), default_timeout(),
                        [this, id, iface](OpToken tok) {
                            io_post([this, id, iface, tok] {
                                auto dev = session_uuid(id);
                                if (!dev || !responsive(*dev))
                                    return;
                                {
                                    std::lock_guard<std::mutex> lk(mu_);
                                    sessions_[id].open.erase(iface);
                                }
                                cm_.finish_operation(id, Result::ok(), tok);
                            });
                        });
}

void VirtualAdapter::send_rpc_async(ConnId id, std::uint8_t address, std::uint16_t rpc_id,
                                    Payload payload, std::chrono::milliseconds timeout,
                                    RpcCallback cb)
{
    cm_.begin_operation(
        id, "rpc", RpcCallback(std::move(cb)), timeout,
        [this, id, address, rpc_id, payload](OpToken tok) {
            io_post([this, id, address, rpc_id, payload, tok] {
                auto dev = session_uuid(id);
                if (!dev || !responsive(*dev))
                    return;
                if (!interface_open(id, Interface::Rpc))
                {
                    cm_.finish_operation(id, RpcResult::fail("RPC interface is not open",
                                                             ErrorKind::InvalidState),
                                         tok);
                    return;
                }

                RpcHandler handler;
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    auto                        d = devices_.find(*dev);
                    if (d != devices_.end())
                    {
                        auto it = d->second.dev.rpcs.find({address, rpc_id});
                        if (it != d->second.dev.rpcs.end())
                            handler = it->second;
                    }
                }
                if (!handler)
                {
                    char why[64];
                    std::snprintf(why, sizeof(why), "RPC 0x%04x not found at address %u",
                                  (unsigned)rpc_id, (unsigned)address);
                    cm_.finish_operation(id, RpcResult::fail(why, ErrorKind::AdapterRejected), tok);
                    return;
                }

                auto resp = handler(payload);
                cm_.finish_operation(id, RpcResult::ok(resp.first, std::move(resp.second)), tok);
            });
        });
}

void VirtualAdapter::send_script_async(ConnId id, Payload data, ProgressCallback progress,
                                       OpCallback cb)
{
    cm_.begin_operation(
        id, "script", OpCallback(std::move(cb)), default_timeout(),
        [this, id, data, progress](OpToken tok) {
            io_post([this, id, data, progress, tok] {
                auto dev = session_uuid(id);
                if (!dev || !responsive(*dev))
                    return;
                if (!interface_open(id, Interface::Script))
                {
                    cm_.finish_operation(
                        id, Result::fail("Script interface is not open", ErrorKind::InvalidState),
                        tok);
                    return;
                }

                for (std::size_t done = 0; done < data.size();)
                {
                    done = std::min(done + SCRIPT_CHUNK, data.size());
                    if (progress)
                        progress(done, data.size());
                }
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    auto                        d = devices_.find(*dev);
                    if (d != devices_.end())
                    {
                        d->second.script     = data;
                        d->second.has_script = true;
                    }
                }
                cm_.finish_operation(id, Result::ok(), tok);
            });
        });
}

void VirtualAdapter::debug_async(ConnId id, const std::string &command, DebugArgs args,
                                 ProgressCallback progress, DebugCallback cb)
{
    cm_.begin_operation(
        id, "debug", DebugCallback(std::move(cb)), default_timeout(),
        [this, id, command, args, progress](OpToken tok) {
            io_post([this, id, command, args, progress, tok] {
                auto dev = session_uuid(id);
                if (!dev || !responsive(*dev))
                    return;
                if (!interface_open(id, Interface::Debug))
                {
                    cm_.finish_operation(id, DebugResult::fail("Debug interface is not open",
                                                               ErrorKind::InvalidState),
                                         tok);
                    return;
                }

                DebugHandler handler;
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    auto                        d = devices_.find(*dev);
                    if (d != devices_.end())
                    {
                        auto it = d->second.dev.debug_commands.find(command);
                        if (it != d->second.dev.debug_commands.end())
                            handler = it->second;
                    }
                }
                if (!handler)
                {
                    cm_.finish_operation(
                        id, DebugResult::fail("Unknown debug command " + command,
                                              ErrorKind::AdapterRejected),
                        tok);
                    return;
                }

                if (progress)
                    progress(0, 1);
                auto value = handler(args);
                if (progress)
                    progress(1, 1);

                if (value)
                    cm_.finish_operation(id, DebugResult::ok(*value), tok);
                else
                    cm_.finish_operation(id, DebugResult::fail("Debug command " + command + " failed"),
                                         tok);
            });
        });
}

void VirtualAdapter::probe_async(ProbeCallback cb)
{
    const bool queued = io_post([this, cb] {
        announce_all();
        cb(id(), Result::ok());
    });
    if (!queued)
        cb(id(), Result::fail("Adapter is not running", ErrorKind::InvalidState));
}

// ============================================================================
// Device management
// ============================================================================
bool VirtualAdapter::add_device(VirtualDevice dev)
{
    const DeviceUuid uuid = dev.uuid;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (devices_.count(uuid) != 0)
        {
            LOG_ERROR("[VIRTUAL][%s] device %s already present", name_.c_str(),
                      uuid_hex(uuid).c_str());
            return false;
        }
        devices_[uuid].dev = std::move(dev);
    }
    io_post([this] { announce_all(); });
    return true;
}

bool VirtualAdapter::remove_device(DeviceUuid uuid)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (devices_.count(uuid) == 0)
            return false;
    }
    return io_post([this, uuid] {
        if (auto conn = session_for(uuid))
        {
            {
                std::lock_guard<std::mutex> lk(mu_);
                sessions_.erase(*conn);
            }
            cm_.force_disconnect(*conn, "Device lost");
            notify_disconnect(*conn);
        }
        {
            std::lock_guard<std::mutex> lk(mu_);
            devices_.erase(uuid);
        }
        notify_device_lost(uuid);
    });
}

bool VirtualAdapter::set_responsive(DeviceUuid uuid, bool responsive)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = devices_.find(uuid);
    if (it == devices_.end())
        return false;
    it->second.responsive = responsive;
    return true;
}

bool VirtualAdapter::set_signal_strength(DeviceUuid uuid, int rssi)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = devices_.find(uuid);
    if (it == devices_.end())
        return false;
    it->second.dev.signal_strength = rssi;
    return true;
}

bool VirtualAdapter::push_report(DeviceUuid uuid, Payload raw)
{
    auto conn = session_for(uuid);
    if (!conn || !interface_open(*conn, Interface::Streaming))
    {
        LOG_WARN("[VIRTUAL][%s] report from %s dropped: streaming not open", name_.c_str(),
                 uuid_hex(uuid).c_str());
        return false;
    }
    const ConnId id = *conn;
    return io_post([this, id, uuid, raw] {
        Report r;
        r.origin = uuid;
        r.raw    = raw;
        notify_report(id, r);
    });
}

bool VirtualAdapter::push_trace(DeviceUuid uuid, Payload bytes)
{
    auto conn = session_for(uuid);
    if (!conn || !interface_open(*conn, Interface::Tracing))
    {
        LOG_WARN("[VIRTUAL][%s] trace from %s dropped: tracing not open", name_.c_str(),
                 uuid_hex(uuid).c_str());
        return false;
    }
    const ConnId id = *conn;
    return io_post([this, id, bytes] { notify_trace(id, bytes); });
}

bool VirtualAdapter::drop_connection(DeviceUuid uuid)
{
    auto conn = session_for(uuid);
    if (!conn)
        return false;
    const ConnId id = *conn;
    return io_post([this, id] {
        {
            std::lock_guard<std::mutex> lk(mu_);
            sessions_.erase(id);
        }
        cm_.force_disconnect(id);
        notify_disconnect(id);
    });
}

std::optional<Payload> VirtualAdapter::last_script(DeviceUuid uuid) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = devices_.find(uuid);
    if (it == devices_.end() || !it->second.has_script)
        return std::nullopt;
    return it->second.script;
}

}  // namespace transport
