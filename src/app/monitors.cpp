#include <array>
#include <sodium.h>
#include <utility>

#include "app/monitors.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

const char *event_name(EventKind k)
{
    switch (k)
    {
        case EventKind::DeviceSeen:
            return "device_seen";
        case EventKind::Report:
            return "report";
        case EventKind::Trace:
            return "trace";
        case EventKind::Disconnection:
            return "disconnection";
        case EventKind::Progress:
            return "progress";
    }
    return "?";
}

std::optional<EventKind> parse_event_name(std::string_view name)
{
    if (name == "device_seen")
        return EventKind::DeviceSeen;
    if (name == "report")
        return EventKind::Report;
    if (name == "trace")
        return EventKind::Trace;
    if (name == "disconnection")
        return EventKind::Disconnection;
    if (name == "progress")
        return EventKind::Progress;
    return std::nullopt;
}

EventKind kind_of(const DeviceEvent &ev)
{
    switch (ev.index())
    {
        case 0:
            return EventKind::DeviceSeen;
        case 1:
            return EventKind::Report;
        case 2:
            return EventKind::Trace;
        case 3:
            return EventKind::Disconnection;
        default:
            return EventKind::Progress;
    }
}

MonitorTable::MonitorTable()
{
    if (!ensure_sodium_init())
        LOG_ERROR("[MON] libsodium init failed; monitors cannot be registered");
}

std::optional<std::string> MonitorTable::add(std::optional<transport::DeviceUuid> uuid,
                                             std::set<EventKind> events, MonitorCallback cb)
{
    if (!cb)
    {
        LOG_ERROR("[MON] refusing a monitor without a callback");
        return std::nullopt;
    }
    if (!ensure_sodium_init())
        return std::nullopt;

    std::array<unsigned char, constants::MONITOR_SUFFIX_BYTES> raw{};
    std::array<char, constants::MONITOR_SUFFIX_BYTES * 2 + 1>  hex{};

    std::string id;
    do
    {
        randombytes_buf(raw.data(), raw.size());
        sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
        id = (uuid ? transport::uuid_hex(*uuid) : std::string("*")) + "/" + hex.data();
    } while (monitors_.count(id) != 0 || pending_add_.count(id) != 0);

    Monitor m{uuid, std::move(events), std::move(cb)};
    if (dispatching_)
    {
        pending_add_.insert(id);
        deferred_.push_back([this, id, m]() {
            pending_add_.erase(id);
            monitors_.emplace(id, m);
        });
    }
    else
    {
        monitors_.emplace(id, std::move(m));
    }
    LOG_DEBUG("[MON] registered %s", id.c_str());
    return id;
}

bool MonitorTable::adjust(const std::string &id, const std::set<EventKind> &add,
                          const std::set<EventKind> &remove)
{
    if (!contains(id))
    {
        LOG_ERROR("[MON] unknown monitor %s", id.c_str());
        return false;
    }

    auto apply = [this, id, add, remove]() {
        auto it = monitors_.find(id);
        if (it == monitors_.end())
            return;  // removed earlier in the same batch
        for (auto k : add)
            it->second.events.insert(k);
        for (auto k : remove)
            it->second.events.erase(k);
    };

    if (dispatching_)
        deferred_.push_back(std::move(apply));
    else
        apply();
    return true;
}

bool MonitorTable::remove(const std::string &id)
{
    if (!contains(id))
    {
        LOG_ERROR("[MON] unknown monitor %s", id.c_str());
        return false;
    }

    if (dispatching_)
        deferred_.push_back([this, id]() { monitors_.erase(id); });
    else
        monitors_.erase(id);
    LOG_DEBUG("[MON] removed %s", id.c_str());
    return true;
}

bool MonitorTable::contains(const std::string &id) const
{
    return monitors_.count(id) != 0 || pending_add_.count(id) != 0;
}

void MonitorTable::dispatch(transport::DeviceUuid uuid, const DeviceEvent &ev)
{
    const EventKind kind = kind_of(ev);

    // Clears the dispatch flag and applies deferred changes on every way out, including
    // a monitor callback that throws.
    struct DispatchScope
    {
        MonitorTable &table;
        const bool    nested;

        explicit DispatchScope(MonitorTable &t) : table(t), nested(t.dispatching_)
        {
            table.dispatching_ = true;
        }
        ~DispatchScope()
        {
            if (nested)
                return;
            table.dispatching_ = false;
            table.apply_deferred();
        }
    } scope(*this);

    for (const auto &kv : monitors_)
    {
        const Monitor &m = kv.second;
        if (m.uuid && *m.uuid != uuid)
            continue;
        if (m.events.count(kind) == 0)
            continue;
        m.cb(uuid, kind, ev);
    }
}

void MonitorTable::apply_deferred()
{
    auto pending = std::move(deferred_);
    deferred_.clear();
    for (auto &fn : pending)
        fn();
}

}  // namespace app
