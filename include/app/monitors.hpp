#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "transport/types.hpp"

namespace app
{

enum class EventKind
{
    DeviceSeen,
    Report,
    Trace,
    Disconnection,
    Progress
};

const char              *event_name(EventKind k);  // "device_seen", "report", ...
std::optional<EventKind> parse_event_name(std::string_view name);

struct ScanEvent
{
    transport::AdapterId  adapter{transport::NO_ADAPTER};
    transport::DeviceInfo info;
};

struct ReportEvent
{
    transport::ConnId connection_id{0};
    transport::Report report;
};

struct TraceEvent
{
    transport::ConnId  connection_id{0};
    transport::Payload data;
};

struct DisconnectEvent
{
    transport::ConnId connection_id{0};
    std::string       reason;
};

struct ProgressEvent
{
    transport::ConnId connection_id{0};
    std::string       operation;  // "script" or "debug"
    std::size_t       done{0};
    std::size_t       total{0};
};

using DeviceEvent = std::variant<ScanEvent, ReportEvent, TraceEvent, DisconnectEvent, ProgressEvent>;

EventKind kind_of(const DeviceEvent &ev);

using MonitorCallback =
    std::function<void(transport::DeviceUuid, EventKind, const DeviceEvent &)>;

// Monitor registrations of one DeviceManager. Not thread safe: only the manager loop
// touches it. Changes made from inside a callback apply once the current dispatch returns.
class MonitorTable
{
  public:
    MonitorTable();

    // uuid == nullopt watches every device. Returns "<uuid hex>/<random hex>", or nullopt
    // when no random suffix could be produced.
    std::optional<std::string> add(std::optional<transport::DeviceUuid> uuid,
                                   std::set<EventKind> events, MonitorCallback cb);
    bool adjust(const std::string &id, const std::set<EventKind> &add,
                const std::set<EventKind> &remove);
    bool remove(const std::string &id);

    void dispatch(transport::DeviceUuid uuid, const DeviceEvent &ev);

    bool        contains(const std::string &id) const;
    std::size_t size() const { return monitors_.size(); }

  private:
    struct Monitor
    {
        std::optional<transport::DeviceUuid> uuid;
        std::set<EventKind>                  events;
        MonitorCallback                      cb;
    };

    void apply_deferred();

    std::map<std::string, Monitor>     monitors_;
    std::set<std::string>              pending_add_;  // added during a dispatch
    bool                               dispatching_{false};
    std::vector<std::function<void()>> deferred_;
};

}  // namespace app
