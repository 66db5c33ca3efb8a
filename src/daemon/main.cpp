#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "app/device_manager.hpp"
#include "transport/bluez_adapter.hpp"
#include "transport/virtual_adapter.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

static app::DeviceManager *g_dm = nullptr;

// ---------------- helpers ----------------
static std::optional<transport::ConnId> parse_conn_id(const std::string &s)
{
    if (s.empty())
        return std::nullopt;
    char     *end = nullptr;
    long long v   = std::strtoll(s.c_str(), &end, 10);
    if (!end || *end != '\0' || v < 0)
        return std::nullopt;
    return static_cast<transport::ConnId>(v);
}

static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// A demo tile so the virtual transport has something to show.
static void add_demo_tiles(transport::VirtualAdapter &va)
{
    transport::VirtualDevice dev;
    dev.uuid            = 0x10;
    dev.signal_strength = -40;
    dev.properties["name"] = "demo tile";
    // controller version: address 8, rpc 0x0004
    dev.rpcs[{8, 0x0004}] = [](const transport::Payload &) {
        return std::pair<std::uint8_t, transport::Payload>(0, transport::Payload{1, 0, 0});
    };
    dev.debug_commands["dump_ram"] = [](const transport::DebugArgs &) {
        return std::optional<std::string>("00000000");
    };
    va.add_device(std::move(dev));
}

std::shared_ptr<transport::DeviceAdapter> make_adapter_from_env()
{
    const char *t = std::getenv("TILELINK_TRANSPORT");
    if (t && std::strcmp(t, "bluez") == 0)
        return std::make_shared<transport::BluezAdapter>(transport::BluezConfig::from_env());

    // default - virtual
    auto va = std::make_shared<transport::VirtualAdapter>("virtual", 2);
    add_demo_tiles(*va);
    return va;
}

static void log_result(const char *what, const transport::Result &r)
{
    if (r.success)
        LOG_SYSTEM("[%s] ok", what);
    else
        LOG_WARN("[%s] failed: %s", what, r.reason ? r.reason->c_str() : "?");
}

static void on_event(transport::DeviceUuid uuid, app::EventKind kind, const app::DeviceEvent &ev)
{
    switch (kind)
    {
        case app::EventKind::Report:
        {
            const auto &r = std::get<app::ReportEvent>(ev);
            LOG_SYSTEM("[EVENT] report from %s on %lld (%zu bytes)", transport::uuid_hex(uuid).c_str(),
                       (long long)r.connection_id, r.report.raw.size());
            break;
        }
        case app::EventKind::Disconnection:
        {
            const auto &d = std::get<app::DisconnectEvent>(ev);
            LOG_SYSTEM("[EVENT] %lld disconnected: %s", (long long)d.connection_id,
                       d.reason.c_str());
            break;
        }
        default:
            LOG_DEBUG("[EVENT] %s for %s", app::event_name(kind), transport::uuid_hex(uuid).c_str());
            break;
    }
}

// Returns false on QUIT.
static bool on_line(const std::string &line)
{
    std::istringstream in(line);
    std::string        cmd;
    in >> cmd;
    cmd = lower(cmd);
    if (cmd.empty())
        return true;

    if (cmd == "quit")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return false;
    }
    if (cmd == "devices")
    {
        auto view = g_dm->scanned_devices();
        if (view.empty())
        {
            LOG_SYSTEM("[DEVICES] none seen");
            return true;
        }
        for (const auto &d : view)
        {
            LOG_SYSTEM("[DEVICE] %s best=adapter %d rssi=%d (%zu route(s))",
                       d.connection_string.c_str(), d.best_adapter, d.signal_strength,
                       d.adapters.size());
        }
        return true;
    }
    if (cmd == "probe")
    {
        log_result("PROBE", g_dm->probe_sync());
        return true;
    }
    if (cmd == "connect")
    {
        std::string target;
        in >> target;
        app::ConnectResult res;
        if (target.find('/') != std::string::npos)
        {
            res = g_dm->connect_string_sync(target);
        }
        else if (auto uuid = transport::parse_uuid_hex(target))
        {
            res = g_dm->connect_sync(*uuid);
        }
        else
        {
            LOG_WARN("[CONNECT] expected a uuid or a connection string, got '%s'", target.c_str());
            return true;
        }
        if (res.success)
            LOG_SYSTEM("[CONNECT] connection id %lld", (long long)*res.connection_id);
        else
            LOG_WARN("[CONNECT] failed: %s", res.reason ? res.reason->c_str() : "?");
        return true;
    }

    std::string id_s;
    in >> id_s;
    auto id = parse_conn_id(id_s);
    if (!id)
    {
        LOG_WARN("CMD: %s needs a connection id", cmd.c_str());
        return true;
    }

    if (cmd == "disconnect")
    {
        log_result("DISCONNECT", g_dm->disconnect_sync(*id));
    }
    else if (cmd == "open" || cmd == "close")
    {
        std::string name;
        in >> name;
        auto iface = transport::parse_interface(lower(name));
        if (!iface)
        {
            LOG_WARN("CMD: unknown interface '%s'", name.c_str());
            return true;
        }
        if (cmd == "open")
            log_result("OPEN", g_dm->open_interface_sync(*id, *iface));
        else
            log_result("CLOSE", g_dm->close_interface_sync(*id, *iface));
    }
    else if (cmd == "rpc")
    {
        unsigned addr = 0, rpc_id = 0;
        in >> addr >> std::hex >> rpc_id;
        if (!in || addr > 0xff || rpc_id > 0xffff)
        {
            LOG_WARN("CMD: RPC <id> <address> <rpc id hex>");
            return true;
        }
        auto r = g_dm->send_rpc_sync(*id, static_cast<std::uint8_t>(addr),
                                     static_cast<std::uint8_t>(rpc_id >> 8),
                                     static_cast<std::uint8_t>(rpc_id & 0xff), {},
                                     std::chrono::milliseconds(1000));
        if (r.success)
            LOG_SYSTEM("[RPC] status=%u payload=%zu bytes", (unsigned)r.status.value_or(0),
                       r.payload ? r.payload->size() : (size_t)0);
        else
            LOG_WARN("[RPC] failed: %s", r.reason ? r.reason->c_str() : "?");
    }
    else
    {
        LOG_WARN("CMD: unknown command '%s'", cmd.c_str());
    }
    return true;
}

int main()
{
    // log level and timings from env vars
    auto settings = config::ManagerSettings::from_env();

    const char *env_transport = std::getenv("TILELINK_TRANSPORT");
    LOG_SYSTEM("Config: transport=%s sweep=%lldms timeout=%lldms",
               env_transport ? env_transport : "virtual", (long long)settings.sweep_interval.count(),
               (long long)settings.default_timeout.count());

    app::DeviceManager dm(settings);
    if (!dm.add_adapter(make_adapter_from_env()))
    {
        LOG_ERROR("add_adapter failed");
        return 1;
    }
    if (!dm.start())
    {
        LOG_ERROR("DeviceManager start failed");
        return 1;
    }
    g_dm = &dm;

    if (!dm.register_monitor(std::nullopt,
                             std::vector<std::string>{"report", "disconnection", "device_seen"},
                             &on_event))
        LOG_WARN("event monitor not registered");

    std::string line;
    while (std::getline(std::cin, line))
    {
        if (!on_line(line))
            break;
    }

    g_dm = nullptr;
    dm.stop();
    return 0;
}
