#include <algorithm>
#include <cstdlib>
#include <future>
#include <memory>
#include <mutex>
#include <utility>

#include "app/device_manager.hpp"
#include "util/log.hpp"

namespace app
{

using transport::AdapterId;
using transport::ConnId;
using transport::DeviceUuid;
using transport::ErrorKind;
using transport::Result;

namespace
{
constexpr const char *DEVICE_PREFIX  = "device/";
constexpr const char *ADAPTER_PREFIX = "adapter/";
constexpr const char *NOT_RUNNING    = "Device manager is not running";

ConnectResult connect_refused()
{
    return ConnectResult{false, std::nullopt, std::string(NOT_RUNNING), ErrorKind::InvalidState};
}

std::string qualified(AdapterId adapter, const std::string &conn)
{
    return std::string(ADAPTER_PREFIX) + std::to_string(adapter) + "/" + conn;
}

bool starts_with(const std::string &s, const char *prefix)
{
    return s.rfind(prefix, 0) == 0;
}

// Blocks on an async call; `failure` is returned when blocking is not allowed.
template <typename R, typename Submit>
R block_on(bool usable, R failure, Submit submit)
{
    if (!usable)
        return failure;
    auto p   = std::make_shared<std::promise<R>>();
    auto fut = p->get_future();
    submit([p](const R &r) { p->set_value(r); });
    return fut.get();
}
}  // namespace

DeviceManager::DeviceManager(config::ManagerSettings settings)
    : settings_(std::move(settings)), loop_(settings_.queue_capacity)
{
}

DeviceManager::~DeviceManager()
{
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================
std::optional<AdapterId> DeviceManager::add_adapter(std::shared_ptr<transport::DeviceAdapter> a)
{
    if (started_)
    {
        LOG_ERROR("[DM] adapters must be added before start()");
        return std::nullopt;
    }
    if (!a)
    {
        LOG_ERROR("[DM] null adapter");
        return std::nullopt;
    }

    const AdapterId aid = static_cast<AdapterId>(adapters_.size());
    a->set_id(aid);
    a->set_config(transport::CFG_DEFAULT_TIMEOUT_MS,
                  static_cast<std::int64_t>(settings_.default_timeout.count()));

    a->add_scan_callback([this](AdapterId from, const transport::DeviceInfo &info,
                                std::chrono::seconds expiry) {
        marshal([this, from, info, expiry] { on_scan(from, info, expiry); });
    });
    a->add_device_lost_callback([this](AdapterId from, DeviceUuid uuid) {
        marshal([this, from, uuid] { on_device_lost(from, uuid); });
    });
    a->add_disconnect_callback([this](AdapterId from, ConnId id) {
        marshal([this, from, id] { on_disconnect(from, id); });
    });
    a->add_report_callback([this](ConnId id, const transport::Report &r) {
        marshal([this, id, r] { on_report(id, r); });
    });
    a->add_trace_callback([this](ConnId id, const transport::Payload &bytes) {
        marshal([this, id, bytes] { on_trace(id, bytes); });
    });

    adapters_.push_back(std::move(a));
    LOG_INFO("[DM] adapter %d: %s", aid, adapters_.back()->name().c_str());
    return aid;
}

bool DeviceManager::start()
{
    if (started_)
        return true;

    if (!loop_.start())
    {
        LOG_ERROR("[DM] owning loop failed to start");
        return false;
    }

    std::vector<transport::DeviceAdapter *> up;
    for (auto &a : adapters_)
    {
        if (!a->start())
        {
            LOG_ERROR("[DM] adapter %s failed to start; rolling back", a->name().c_str());
            for (auto *u : up)
                u->stop();
            loop_.stop();
            return false;
        }
        up.push_back(a.get());
    }

    loop_.schedule_every(settings_.sweep_interval, [this] { sweep_expired(); });
    loop_.schedule_every(settings_.periodic_interval, [this] {
        for (auto &a : adapters_)
            a->periodic_callback();
    });

    started_ = true;
    LOG_INFO("[DM] started with %zu adapter(s)", adapters_.size());
    return true;
}

void DeviceManager::stop()
{
    if (!started_.exchange(false))
        return;

    loop_.cancel_all();
    // Adapters fail whatever is still pending; those results reach the loop before it stops.
    for (auto &a : adapters_)
        a->stop();
    loop_.call([this] {
        conns_.clear();
        scans_.clear();
    });
    loop_.stop();
    LOG_INFO("[DM] stopped");
}

void DeviceManager::marshal(util::EventLoop::Task t, util::EventLoop::Task closed)
{
    if (loop_.post(std::move(t)))
        return;
    if (closed)
        closed();
    else
        LOG_WARN("[DM] owning loop closed; event dropped");
}

void DeviceManager::submit(util::EventLoop::Task work, util::EventLoop::Task refuse)
{
    if (started_ && loop_.post(std::move(work)))
        return;
    LOG_WARN("[DM] %s", NOT_RUNNING);
    refuse();
}

transport::DeviceAdapter *DeviceManager::adapter(AdapterId id) const
{
    if (id < 0 || static_cast<std::size_t>(id) >= adapters_.size())
        return nullptr;
    return adapters_[static_cast<std::size_t>(id)].get();
}

// ============================================================================
// Scan aggregation
// ============================================================================
void DeviceManager::on_scan(AdapterId adapter, const transport::DeviceInfo &info,
                            std::chrono::seconds expiry)
{
    ScanRecord rec;
    rec.signal_strength   = info.signal_strength;
    rec.connection_string = info.connection_string;
    rec.properties        = info.properties;
    if (expiry.count() > 0)
        rec.expires_at = util::Clock::now() + expiry;

    scans_[info.uuid][adapter] = std::move(rec);
    monitors_.dispatch(info.uuid, ScanEvent{adapter, info});
}

void DeviceManager::on_device_lost(AdapterId adapter, DeviceUuid uuid)
{
    auto it = scans_.find(uuid);
    if (it == scans_.end())
        return;
    it->second.erase(adapter);
    if (it->second.empty())
        scans_.erase(it);
    LOG_INFO("[DM] device %s lost by adapter %d", transport::uuid_hex(uuid).c_str(), adapter);
}

void DeviceManager::device_lost(AdapterId adapter, DeviceUuid uuid)
{
    marshal([this, adapter, uuid] { on_device_lost(adapter, uuid); });
}

void DeviceManager::sweep_expired()
{
    const auto now = util::Clock::now();
    for (auto it = scans_.begin(); it != scans_.end();)
    {
        auto &per_adapter = it->second;
        for (auto r = per_adapter.begin(); r != per_adapter.end();)
        {
            if (r->second.expired(now))
                r = per_adapter.erase(r);
            else
                ++r;
        }

        if (per_adapter.empty())
        {
            LOG_DEBUG("[DM] device %s expired", transport::uuid_hex(it->first).c_str());
            it = scans_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

std::vector<DeviceView> DeviceManager::build_view() const
{
    // the sweep runs on an interval; records past expiry are hidden until it catches up
    const auto now = util::Clock::now();

    std::vector<DeviceView> out;
    for (const auto &kv : scans_)
    {
        DeviceView v;
        v.uuid              = kv.first;
        v.connection_string = DEVICE_PREFIX + transport::uuid_hex(kv.first);
        for (const auto &rec : kv.second)
        {
            if (rec.second.expired(now))
                continue;
            Route r;
            r.adapter                     = rec.first;
            r.signal_strength             = rec.second.signal_strength;
            r.connection_string           = rec.second.connection_string;
            r.qualified_connection_string = qualified(rec.first, rec.second.connection_string);
            r.properties                  = rec.second.properties;
            v.adapters.push_back(std::move(r));
        }
        if (v.adapters.empty())
            continue;
        // strongest first; adapter id breaks ties
        std::stable_sort(v.adapters.begin(), v.adapters.end(), [](const Route &a, const Route &b) {
            return a.signal_strength > b.signal_strength;
        });
        v.best_adapter    = v.adapters.front().adapter;
        v.signal_strength = v.adapters.front().signal_strength;
        out.push_back(std::move(v));
    }
    std::sort(out.begin(), out.end(),
              [](const DeviceView &a, const DeviceView &b) { return a.uuid < b.uuid; });
    return out;
}

std::vector<DeviceView> DeviceManager::scanned_devices()
{
    return loop_.call([this] { return build_view(); });
}

// ============================================================================
// Connect / disconnect
// ============================================================================
void DeviceManager::connect(DeviceUuid uuid, ConnectCallback cb)
{
    submit([this, uuid, cb] { route_connect(next_conn_id_++, uuid, cb); },
           [cb] { cb(connect_refused()); });
}

void DeviceManager::route_connect(ConnId id, DeviceUuid uuid, const ConnectCallback &cb)
{
    const auto now = util::Clock::now();

    std::vector<std::pair<AdapterId, const ScanRecord *>> routes;
    auto it = scans_.find(uuid);
    if (it != scans_.end())
    {
        for (const auto &kv : it->second)
            if (!kv.second.expired(now))
                routes.emplace_back(kv.first, &kv.second);
    }
    if (routes.empty())
    {
        LOG_WARN("[DM] conn %lld: %s not found", (long long)id, transport::uuid_hex(uuid).c_str());
        cb(ConnectResult{false, std::nullopt, std::string("UUID not found"), ErrorKind::NotFound});
        return;
    }

    std::stable_sort(routes.begin(), routes.end(), [](const auto &a, const auto &b) {
        return a.second->signal_strength > b.second->signal_strength;
    });

    for (const auto &r : routes)
    {
        auto *a = adapter(r.first);
        if (a && a->can_connect())
        {
            begin_connect(id, uuid, r.first, r.second->connection_string, cb);
            return;
        }
    }

    LOG_WARN("[DM] conn %lld: no free adapter for %s", (long long)id,
             transport::uuid_hex(uuid).c_str());
    cb(ConnectResult{false, std::nullopt,
                     std::string("No room on any adapter that sees this device"),
                     ErrorKind::CapacityExhausted});
}

void DeviceManager::connect_string(const std::string &connection_string, ConnectCallback cb)
{
    submit([this, connection_string, cb] {
        const ConnId id = next_conn_id_++;
        if (starts_with(connection_string, DEVICE_PREFIX))
        {
            auto uuid = transport::parse_uuid_hex(
                connection_string.substr(std::char_traits<char>::length(DEVICE_PREFIX)));
            if (!uuid)
            {
                cb(ConnectResult{false, std::nullopt,
                                 "Invalid device uuid in " + connection_string,
                                 ErrorKind::NotFound});
                return;
            }
            route_connect(id, *uuid, cb);
            return;
        }

        if (starts_with(connection_string, ADAPTER_PREFIX))
        {
            const std::string rest  = connection_string.substr(std::char_traits<char>::length(ADAPTER_PREFIX));
            const auto        slash = rest.find('/');
            AdapterId                 aid = transport::NO_ADAPTER;
            transport::DeviceAdapter *a   = nullptr;
            if (slash != std::string::npos && slash > 0)
            {
                char      *end = nullptr;
                const long v   = std::strtol(rest.c_str(), &end, 10);
                if (end == rest.c_str() + slash)
                {
                    aid = static_cast<AdapterId>(v);
                    a   = adapter(aid);
                }
            }
            if (!a)
            {
                cb(ConnectResult{false, std::nullopt, "Unknown adapter in " + connection_string,
                                 ErrorKind::NotFound});
                return;
            }
            if (!a->can_connect())
            {
                cb(ConnectResult{false, std::nullopt,
                                 "No room on adapter " + std::to_string(aid),
                                 ErrorKind::CapacityExhausted});
                return;
            }

            const std::string conn = rest.substr(slash + 1);
            DeviceUuid        uuid = 0;
            for (const auto &kv : scans_)
            {
                auto r = kv.second.find(aid);
                if (r != kv.second.end() && r->second.connection_string == conn)
                    uuid = kv.first;
            }
            begin_connect(id, uuid, aid, conn, cb);
            return;
        }

        LOG_ERROR("[DM] malformed connection string '%s'", connection_string.c_str());
        cb(ConnectResult{false, std::nullopt, "Invalid connection string " + connection_string,
                         ErrorKind::NotFound});
    }, [cb] { cb(connect_refused()); });
}

void DeviceManager::begin_connect(ConnId id, DeviceUuid uuid, AdapterId aid,
                                  const std::string &connection_string, ConnectCallback cb)
{
    conns_[id] = Connection{uuid, aid, LinkState::Connecting};
    LOG_INFO("[DM] conn %lld: %s via adapter %d ('%s')", (long long)id,
             transport::uuid_hex(uuid).c_str(), aid, connection_string.c_str());

    adapter(aid)->connect_async(id, connection_string, [this, cb](ConnId id, AdapterId,
                                                                  const Result &r) {
        marshal([this, id, r, cb] {
            auto it = conns_.find(id);
            if (r.success && it != conns_.end())
            {
                it->second.state = LinkState::Idle;
                cb(ConnectResult{true, id, std::nullopt, ErrorKind::None});
                return;
            }
            if (it != conns_.end())
                conns_.erase(it);
            cb(ConnectResult{false, std::nullopt,
                             r.success ? std::optional<std::string>("Connection was lost")
                                       : r.reason,
                             r.success ? ErrorKind::UnexpectedDisconnect : r.kind});
        }, [cb] { cb(connect_refused()); });
    });
}

DeviceManager::Connection *DeviceManager::idle_connection(ConnId id, Result &failure)
{
    auto it = conns_.find(id);
    if (it == conns_.end())
    {
        failure = Result::fail("Could not find connection id " + std::to_string(id),
                               ErrorKind::NotFound);
        return nullptr;
    }
    if (it->second.state != LinkState::Idle)
    {
        failure = Result::fail("Connection id " + std::to_string(id) + " is not in the right state",
                               ErrorKind::InvalidState);
        return nullptr;
    }
    return &it->second;
}

void DeviceManager::op_done(ConnId id)
{
    auto it = conns_.find(id);
    if (it != conns_.end() && it->second.state == LinkState::Busy)
        it->second.state = LinkState::Idle;
}

void DeviceManager::disconnect(ConnId id, ResultCallback cb)
{
    submit([this, id, cb] {
        Result      failure;
        Connection *c = idle_connection(id, failure);
        if (!c)
        {
            cb(failure);
            return;
        }
        c->state = LinkState::Disconnecting;
        adapter(c->adapter)->disconnect_async(id, [this, cb](ConnId id, AdapterId, const Result &r) {
            marshal([this, id, r, cb] {
                auto it = conns_.find(id);
                if (it != conns_.end())
                {
                    if (r.success)
                        conns_.erase(it);
                    else if (it->second.state == LinkState::Disconnecting)
                        it->second.state = LinkState::Idle;
                }
                cb(r);
            }, [cb, r] { cb(r); });
        });
    }, [cb] { cb(Result::fail(NOT_RUNNING, ErrorKind::InvalidState)); });
}

// ============================================================================
// Operation forwarding
// ============================================================================
void DeviceManager::open_interface(ConnId id, transport::Interface iface, ResultCallback cb)
{
    submit([this, id, iface, cb] {
        Result      failure;
        Connection *c = idle_connection(id, failure);
        if (!c)
        {
            cb(failure);
            return;
        }
        c->state = LinkState::Busy;
        adapter(c->adapter)->open_interface_async(id, iface,
                                                  [this, cb](ConnId id, AdapterId, const Result &r) {
                                                      marshal([this, id, r, cb] {
                                                          op_done(id);
                                                          cb(r);
                                                      }, [cb, r] { cb(r); });
                                                  });
    }, [cb] { cb(Result::fail(NOT_RUNNING, ErrorKind::InvalidState)); });
}

void DeviceManager::close_interface(ConnId id, transport::Interface iface, ResultCallback cb)
{
    submit([this, id, iface, cb] {
        Result      failure;
        Connection *c = idle_connection(id, failure);
        if (!c)
        {
            cb(failure);
            return;
        }
        c->state = LinkState::Busy;
        adapter(c->adapter)->close_interface_async(id, iface,
                                                   [this, cb](ConnId id, AdapterId, const Result &r) {
                                                       marshal([this, id, r, cb] {
                                                           op_done(id);
                                                           cb(r);
                                                       }, [cb, r] { cb(r); });
                                                   });
    }, [cb] { cb(Result::fail(NOT_RUNNING, ErrorKind::InvalidState)); });
}

void DeviceManager::send_rpc(ConnId id, std::uint8_t address, std::uint8_t feature,
                             std::uint8_t command, transport::Payload payload,
                             std::chrono::milliseconds timeout, RpcResultCallback cb)
{
    const auto rpc_id = static_cast<std::uint16_t>((feature << 8) | command);
    submit([this, id, address, rpc_id, payload, timeout, cb] {
        Result      failure;
        Connection *c = idle_connection(id, failure);
        if (!c)
        {
            cb(transport::RpcResult::fail(*failure.reason, failure.kind));
            return;
        }
        c->state = LinkState::Busy;
        adapter(c->adapter)->send_rpc_async(
            id, address, rpc_id, payload, timeout,
            [this, cb](ConnId id, AdapterId, const transport::RpcResult &r) {
                marshal([this, id, r, cb] {
                    op_done(id);
                    cb(r);
                }, [cb, r] { cb(r); });
            });
    }, [cb] { cb(transport::RpcResult::fail(NOT_RUNNING, ErrorKind::InvalidState)); });
}

void DeviceManager::send_script(ConnId id, transport::Payload data,
                                transport::ProgressCallback progress, ResultCallback cb)
{
    submit([this, id, data, progress, cb] {
        Result      failure;
        Connection *c = idle_connection(id, failure);
        if (!c)
        {
            cb(failure);
            return;
        }
        c->state = LinkState::Busy;

        transport::ProgressCallback on_prog = [this, id, progress](std::size_t done,
                                                                   std::size_t total) {
            marshal([this, id, progress, done, total] {
                on_progress(id, "script", done, total, progress);
            });
        };
        adapter(c->adapter)->send_script_async(id, data, std::move(on_prog),
                                               [this, cb](ConnId id, AdapterId, const Result &r) {
                                                   marshal([this, id, r, cb] {
                                                       op_done(id);
                                                       cb(r);
                                                   }, [cb, r] { cb(r); });
                                               });
    }, [cb] { cb(Result::fail(NOT_RUNNING, ErrorKind::InvalidState)); });
}

void DeviceManager::debug(ConnId id, std::string command, transport::DebugArgs args,
                          transport::ProgressCallback progress, DebugResultCallback cb)
{
    submit([this, id, command, args, progress, cb] {
        Result      failure;
        Connection *c = idle_connection(id, failure);
        if (!c)
        {
            cb(transport::DebugResult::fail(*failure.reason, failure.kind));
            return;
        }
        c->state = LinkState::Busy;

        transport::ProgressCallback on_prog = [this, id, progress](std::size_t done,
                                                                   std::size_t total) {
            marshal([this, id, progress, done, total] {
                on_progress(id, "debug", done, total, progress);
            });
        };
        adapter(c->adapter)->debug_async(
            id, command, args, std::move(on_prog),
            [this, cb](ConnId id, AdapterId, const transport::DebugResult &r) {
                marshal([this, id, r, cb] {
                    op_done(id);
                    cb(r);
                }, [cb, r] { cb(r); });
            });
    }, [cb] { cb(transport::DebugResult::fail(NOT_RUNNING, ErrorKind::InvalidState)); });
}

void DeviceManager::probe(ResultCallback cb)
{
    submit([this, cb] {
        std::vector<transport::DeviceAdapter *> targets;
        for (auto &a : adapters_)
        {
            const auto  v   = a->get_config(transport::CFG_PROBE_SUPPORTED, false);
            const bool *yes = std::get_if<bool>(&v);
            if (yes && *yes)
                targets.push_back(a.get());
        }
        if (targets.empty())
        {
            cb(Result::fail("No adapter supports probing", ErrorKind::NotSupported));
            return;
        }

        // Completions land on the loop, or on adapter threads once the loop has closed.
        struct Pending
        {
            std::mutex                 mu;
            std::size_t                remaining{0};
            std::optional<std::string> first_error;
        };
        auto pending       = std::make_shared<Pending>();
        pending->remaining = targets.size();

        auto tally = [pending, cb](AdapterId aid, const Result &r) {
            std::optional<Result> outcome;
            {
                std::lock_guard<std::mutex> lk(pending->mu);
                if (!r.success && !pending->first_error)
                    pending->first_error = "adapter " + std::to_string(aid) + ": " +
                                           r.reason.value_or("probe failed");
                if (--pending->remaining == 0)
                    outcome = pending->first_error ? Result::fail(*pending->first_error)
                                                   : Result::ok();
            }
            if (outcome)
                cb(*outcome);
        };

        for (auto *a : targets)
        {
            a->probe_async([this, tally](AdapterId aid, const Result &r) {
                marshal([tally, aid, r] { tally(aid, r); }, [tally, aid, r] { tally(aid, r); });
            });
        }
    }, [cb] { cb(Result::fail(NOT_RUNNING, ErrorKind::InvalidState)); });
}

// ============================================================================
// Adapter events
// ============================================================================
void DeviceManager::on_disconnect(AdapterId adapter, ConnId id)
{
    auto it = conns_.find(id);
    if (it == conns_.end())
    {
        LOG_DEBUG("[DM] disconnect for unknown conn %lld from adapter %d", (long long)id, adapter);
        return;
    }
    const DeviceUuid uuid = it->second.uuid;
    conns_.erase(it);
    LOG_INFO("[DM] conn %lld to %s dropped", (long long)id, transport::uuid_hex(uuid).c_str());
    monitors_.dispatch(uuid, DisconnectEvent{id, "Unexpected disconnection"});
}

void DeviceManager::on_report(ConnId id, const transport::Report &r)
{
    auto             it   = conns_.find(id);
    const DeviceUuid uuid = it != conns_.end() ? it->second.uuid : r.origin;
    monitors_.dispatch(uuid, ReportEvent{id, r});
}

void DeviceManager::on_trace(ConnId id, const transport::Payload &bytes)
{
    auto it = conns_.find(id);
    if (it == conns_.end())
    {
        LOG_WARN("[DM] trace for unknown conn %lld dropped", (long long)id);
        return;
    }
    monitors_.dispatch(it->second.uuid, TraceEvent{id, bytes});
}

void DeviceManager::on_progress(ConnId id, const std::string &operation, std::size_t done,
                                std::size_t total, const transport::ProgressCallback &user)
{
    if (user)
        user(done, total);
    auto it = conns_.find(id);
    if (it != conns_.end())
        monitors_.dispatch(it->second.uuid, ProgressEvent{id, operation, done, total});
}

// ============================================================================
// Monitors
// ============================================================================
std::optional<std::string> DeviceManager::register_monitor(std::optional<DeviceUuid> uuid,
                                                           std::set<EventKind>       events,
                                                           MonitorCallback           cb)
{
    return loop_.call([&] { return monitors_.add(uuid, std::move(events), std::move(cb)); });
}

std::optional<std::string> DeviceManager::register_monitor(std::optional<DeviceUuid>       uuid,
                                                           const std::vector<std::string> &events,
                                                           MonitorCallback                 cb)
{
    std::set<EventKind> kinds;
    for (const auto &name : events)
    {
        auto k = parse_event_name(name);
        if (!k)
        {
            LOG_ERROR("[DM] unknown monitor event '%s'", name.c_str());
            return std::nullopt;
        }
        kinds.insert(*k);
    }
    return register_monitor(uuid, std::move(kinds), std::move(cb));
}

bool DeviceManager::adjust_monitor(const std::string &monitor_id, const std::set<EventKind> &add,
                                   const std::set<EventKind> &remove)
{
    return loop_.call([&] { return monitors_.adjust(monitor_id, add, remove); });
}

bool DeviceManager::remove_monitor(const std::string &monitor_id)
{
    return loop_.call([&] { return monitors_.remove(monitor_id); });
}

// ============================================================================
// Views
// ============================================================================
std::optional<LinkState> DeviceManager::connection_state(ConnId id)
{
    return loop_.call([this, id]() -> std::optional<LinkState> {
        auto it = conns_.find(id);
        if (it == conns_.end())
            return std::nullopt;
        return it->second.state;
    });
}

std::size_t DeviceManager::connection_count()
{
    return loop_.call([this] { return conns_.size(); });
}

// ============================================================================
// Blocking forms
// ============================================================================
namespace
{
const char *NOT_BLOCKABLE = "Blocking call needs a running manager and a foreign thread";
}

ConnectResult DeviceManager::connect_sync(DeviceUuid uuid)
{
    const bool ok = started_ && !loop_.in_loop_thread();
    if (!ok)
        LOG_ERROR("[DM] connect_sync: %s", NOT_BLOCKABLE);
    return block_on<ConnectResult>(
        ok, ConnectResult{false, std::nullopt, std::string(NOT_BLOCKABLE), ErrorKind::InvalidState},
        [&](ConnectCallback done) { connect(uuid, std::move(done)); });
}

ConnectResult DeviceManager::connect_string_sync(const std::string &connection_string)
{
    const bool ok = started_ && !loop_.in_loop_thread();
    if (!ok)
        LOG_ERROR("[DM] connect_string_sync: %s", NOT_BLOCKABLE);
    return block_on<ConnectResult>(
        ok, ConnectResult{false, std::nullopt, std::string(NOT_BLOCKABLE), ErrorKind::InvalidState},
        [&](ConnectCallback done) { connect_string(connection_string, std::move(done)); });
}

Result DeviceManager::disconnect_sync(ConnId id)
{
    const bool ok = started_ && !loop_.in_loop_thread();
    if (!ok)
        LOG_ERROR("[DM] disconnect_sync: %s", NOT_BLOCKABLE);
    return block_on<Result>(ok, Result::fail(NOT_BLOCKABLE, ErrorKind::InvalidState),
                            [&](ResultCallback done) { disconnect(id, std::move(done)); });
}

Result DeviceManager::open_interface_sync(ConnId id, transport::Interface iface)
{
    const bool ok = started_ && !loop_.in_loop_thread();
    if (!ok)
        LOG_ERROR("[DM] open_interface_sync: %s", NOT_BLOCKABLE);
    return block_on<Result>(ok, Result::fail(NOT_BLOCKABLE, ErrorKind::InvalidState),
                            [&](ResultCallback done) { open_interface(id, iface, std::move(done)); });
}

Result DeviceManager::close_interface_sync(ConnId id, transport::Interface iface)
{
    const bool ok = started_ && !loop_.in_loop_thread();
    if (!ok)
        LOG_ERROR("[DM] close_interface_sync: %s", NOT_BLOCKABLE);
    return block_on<Result>(ok, Result::fail(NOT_BLOCKABLE, ErrorKind::InvalidState),
                            [&](ResultCallback done) { close_interface(id, iface, std::move(done)); });
}

transport::RpcResult DeviceManager::send_rpc_sync(ConnId id, std::uint8_t address,
                                                  std::uint8_t feature, std::uint8_t command,
                                                  transport::Payload        payload,
                                                  std::chrono::milliseconds timeout)
{
    const bool ok = started_ && !loop_.in_loop_thread();
    if (!ok)
        LOG_ERROR("[DM] send_rpc_sync: %s", NOT_BLOCKABLE);
    return block_on<transport::RpcResult>(
        ok, transport::RpcResult::fail(NOT_BLOCKABLE, ErrorKind::InvalidState),
        [&](RpcResultCallback done) {
            send_rpc(id, address, feature, command, std::move(payload), timeout, std::move(done));
        });
}

Result DeviceManager::send_script_sync(ConnId id, transport::Payload data,
                                       transport::ProgressCallback progress)
{
    const bool ok = started_ && !loop_.in_loop_thread();
    if (!ok)
        LOG_ERROR("[DM] send_script_sync: %s", NOT_BLOCKABLE);
    return block_on<Result>(ok, Result::fail(NOT_BLOCKABLE, ErrorKind::InvalidState),
                            [&](ResultCallback done) {
                                send_script(id, std::move(data), std::move(progress),
                                            std::move(done));
                            });
}

transport::DebugResult DeviceManager::debug_sync(ConnId id, std::string command,
                                                 transport::DebugArgs        args,
                                                 transport::ProgressCallback progress)
{
    const bool ok = started_ && !loop_.in_loop_thread();
    if (!ok)
        LOG_ERROR("[DM] debug_sync: %s", NOT_BLOCKABLE);
    return block_on<transport::DebugResult>(
        ok, transport::DebugResult::fail(NOT_BLOCKABLE, ErrorKind::InvalidState),
        [&](DebugResultCallback done) {
            debug(id, std::move(command), std::move(args), std::move(progress), std::move(done));
        });
}

Result DeviceManager::probe_sync()
{
    const bool ok = started_ && !loop_.in_loop_thread();
    if (!ok)
        LOG_ERROR("[DM] probe_sync: %s", NOT_BLOCKABLE);
    return block_on<Result>(ok, Result::fail(NOT_BLOCKABLE, ErrorKind::InvalidState),
                            [&](ResultCallback done) { probe(std::move(done)); });
}

}  // namespace app
