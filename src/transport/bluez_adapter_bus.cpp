/* ======================================================================
 * BlueZ Adapter - bus side
 *
 *  start_bus()         sd_bus_open_system + signal matches
 *  set_discovery_filter  Adapter1.SetDiscoveryFilter {Transport=le, UUIDs=[svc]}
 *  start_discovery       Adapter1.StartDiscovery (InProgress counts as on)
 *  cold_scan             ObjectManager.GetManagedObjects → note_device per Device1
 *  find_char_path        GetManagedObjects under one device → characteristic by UUID
 *  set_notify            GattCharacteristic1.StartNotify / StopNotify
 *  run_bus_loop          sd_bus_process under bus_mu, sd_bus_wait outside, then queued tasks
 *  stop_bus()            Disconnect open devices, StopDiscovery, close, join, unref
 * ====================================================================== */

#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// clang-format off
#include "transport/bluez_adapter.hpp"
#include "transport/bluez_adapter_impl.hpp"
#include "util/log.hpp"
#include "transport/bluez_dbus_util.hpp"
// clang-format on

#if TILELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "transport/bluez_helper.hpp"
namespace
{

// ======================================================================
// Function: adapter_start_discovery_locked
// - In: caller holds bus_mu
// - Out: true when discovery is running afterwards (InProgress counts)
// - Note: no-op while discovery_on is already set
// ======================================================================
static bool adapter_start_discovery_locked(sd_bus            *bus,
                                           const std::string &adapter_path,
                                           std::atomic_bool  &discovery_on)
{
    if (!bus)
        return false;
    if (discovery_on.load())
        return true;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StartDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (err.name && std::string(err.name) == "org.bluez.Error.InProgress")
        {
            discovery_on.store(true);
            LOG_INFO("[BLUEZ] StartDiscovery already in progress on %s", adapter_path.c_str());
            sd_bus_error_free(&err);
            return true;
        }
        LOG_WARN("[BLUEZ] StartDiscovery failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    discovery_on.store(true);
    LOG_SYSTEM("[BLUEZ] StartDiscovery OK on %s", adapter_path.c_str());
    return true;
}

// ======================================================================
// Function: adapter_stop_discovery_locked
// - In: caller holds bus_mu
// - Out: false only when BlueZ refused StopDiscovery
// - Note: discovery_on is reset whatever BlueZ answers
// ======================================================================
static bool adapter_stop_discovery_locked(sd_bus            *bus,
                                          const std::string &adapter_path,
                                          std::atomic_bool  &discovery_on)
{
    if (!bus)
        return false;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_WARN("[BLUEZ] StopDiscovery failed (treat as off): %s",
                 err.message ? err.message : strerror(-r));
    else
        LOG_SYSTEM("[BLUEZ] StopDiscovery OK");
    discovery_on.store(false);
    sd_bus_error_free(&err);
    return true;
}

// ======================================================================
// Function: char_notify_locked
// - In: bus_mu locked, char_path is a GattCharacteristic1
// - Out: true if StartNotify / StopNotify returned success
// - Note: fills why with the DBus error on failure
// ======================================================================
static bool char_notify_locked(sd_bus *bus, const std::string &char_path, bool on,
                               std::string &why)
{
    const char     *method = on ? "StartNotify" : "StopNotify";
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", char_path.c_str(),
                               "org.bluez.GattCharacteristic1", method, &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        const char *ename = err.name ? err.name : "";
        const char *emsg  = err.message ? err.message : strerror(-r);
        why               = std::string(method) + " failed: " + (*emsg ? emsg : ename);
        LOG_WARN("[BLUEZ] %s on %s: %s", method, char_path.c_str(), why.c_str());
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ] %s OK on %s", method, char_path.c_str());
    return true;
}

// Device1 objects found by one GetManagedObjects walk.
struct FoundDevice
{
    std::string           path;
    transport::DeviceProps props;
};

}  // namespace
#endif

namespace transport
{

// ======================================================================
// Function: BluezAdapter::start_bus
// - In: bus not opened yet
// - Out: true once the system bus is open and all three signals are matched
// - Note: on failure the caller runs stop_bus() to release what was taken
// ======================================================================
bool BluezAdapter::start_bus()
{
#if !TILELINK_HAVE_SDBUS
    return false;
#else
    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ] failed to connect system bus: %d", r);
        return false;
    }

    r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                            bluez_on_iface_added, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] subscribe to InterfacesAdded failed: %d", r);
        return false;
    }
    r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                            bluez_on_iface_removed, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] subscribe to InterfacesRemoved failed: %d", r);
        return false;
    }
    // PropertiesChanged (Device1.RSSI / ManufacturerData / Connected, GattCharacteristic1.Value)
    r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                            "org.freedesktop.DBus.Properties", "PropertiesChanged",
                            bluez_on_props_changed, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] subscribe to PropertiesChanged failed: %d", r);
        return false;
    }
    LOG_INFO("[BLUEZ] subscribed to InterfacesAdded/Removed/PropertiesChanged, svc=%s",
             cfg_.svc_uuid.c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezAdapter::stop_bus
// - In: may be called with a half-opened bus; takes bus_mu as needed
// - Out: devices disconnected (best effort), discovery off, bus released
// - Note: the bus thread is joined after bus_mu is released
// ======================================================================
void BluezAdapter::stop_bus(const std::vector<std::string> &open_paths)
{
    // clang-format off
#if TILELINK_HAVE_SDBUS
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        // Disconnect what we opened (best-effort)
        for (const auto &path : open_paths) {
            if (!impl_->bus)
                break;
            sd_bus_error    derr{};
            sd_bus_message *drep = nullptr;
            (void)sd_bus_call_method(impl_->bus, "org.bluez", path.c_str(),
                                     "org.bluez.Device1", "Disconnect", &derr, &drep, "");
            if (drep) sd_bus_message_unref(drep);
            sd_bus_error_free(&derr);
        }
        if (impl_->bus && impl_->discovery_on.load()) {
            if (!adapter_stop_discovery_locked(impl_->bus, impl_->adapter_path,
                                               impl_->discovery_on))
                LOG_SYSTEM("[BLUEZ] stop failed when trying to stop discovery");
        }
        // closing the bus ends sd_bus_wait() in the loop thread
        if (impl_->bus)
            sd_bus_close(impl_->bus);
    }

    // the loop thread takes bus_mu on every turn
    if (impl_->loop.joinable())
        impl_->loop.join();

    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);
    for (auto &c : impl_->calls)
        unref_slot(c->slot);
    impl_->calls.clear();
    impl_->uuid_filter_ok = false;

    if (impl_->bus) {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
// clang-format on
#else
    (void)open_paths;
    if (impl_->loop.joinable())
        impl_->loop.join();
#endif
}

// ======================================================================
// Function: BluezAdapter::set_discovery_filter
// - In: bus open
// - Out: true on success
// - Note: LE only, service UUID filter keeps non-tiles out of the signals
// ======================================================================
bool BluezAdapter::set_discovery_filter()
{
#if !TILELINK_HAVE_SDBUS
    return false;
#else
    if (!impl_->bus)
        return false;

    std::lock_guard<std::mutex> lk(impl_->bus_mu);

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int             r = sd_bus_message_new_method_call(impl_->bus, &msg, "org.bluez",
                                                       impl_->adapter_path.c_str(), "org.bluez.Adapter1",
                                                       "SetDiscoveryFilter");
    if (r < 0)
        goto out;

    // a{sv}
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        goto out;
    // Transport="le"
    r = sd_bus_message_append(msg, "{sv}", "Transport", "s", "le");
    if (r < 0)
        goto out;
    // DuplicateData=true: RSSI updates keep arriving for known devices
    r = sd_bus_message_append(msg, "{sv}", "DuplicateData", "b", 1);
    if (r < 0)
        goto out;
    // UUIDs=["<svc_uuid>"]
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "s", "UUIDs");
    if (r < 0)
        goto out;
    r = sd_bus_message_open_container(msg, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        goto out;
    r = sd_bus_message_append(msg, "as", 1, cfg_.svc_uuid.c_str());
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // variant
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // dict
    if (r < 0)
        goto out;
    r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
        goto out;

    r = sd_bus_call(impl_->bus, msg, 0, &err, &rep);
out:
    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        LOG_WARN("[BLUEZ] SetDiscoveryFilter failed: %s",
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ] SetDiscoveryFilter OK (Transport=le, UUID=%s)", cfg_.svc_uuid.c_str());
    return true;
#endif
}

bool BluezAdapter::start_discovery()
{
#if !TILELINK_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return adapter_start_discovery_locked(impl_->bus, impl_->adapter_path, impl_->discovery_on);
#endif
}

// ======================================================================
// Function: BluezAdapter::cold_scan
// - In: takes bus_mu for the GetManagedObjects call
// - Out: true if the object tree was read; every Device1 under our adapter is noted
// - Note: BlueZ caches devices across discovery sessions, so this reports tiles seen
//         before start() without waiting for new advertisements
// ======================================================================
bool BluezAdapter::cold_scan()
{
#if !TILELINK_HAVE_SDBUS
    return false;
#else
    std::vector<FoundDevice> found;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (!impl_->bus)
            return false;

        sd_bus_message *reply = nullptr;
        sd_bus_error    err{};
        int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                                   "GetManagedObjects", &err, &reply, "");
        if (r < 0)
        {
            LOG_WARN("[BLUEZ] GetManagedObjects failed: %s",
                     err.message ? err.message : strerror(-r));
            if (reply)
                sd_bus_message_unref(reply);
            sd_bus_error_free(&err);
            return false;
        }

        const std::string dev_prefix = impl_->adapter_path + "/dev_";

        // Walk a{oa{sa{sv}}}
        r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
        if (r < 0)
            goto out;
        // --- Objects
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
        {
            const char *obj = nullptr;
            if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
                goto out;

            std::string path(obj ? obj : "");
            // only device objects, not their GATT children
            if (path.rfind(dev_prefix, 0) != 0 ||
                path.find('/', dev_prefix.size()) != std::string::npos)
            {
                if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                    goto out;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    goto out;
                continue;
            }

            // --- Interfaces
            if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
                goto out;
            while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
            {
                const char *iface = nullptr;
                if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                    goto out;
                if (iface && strcmp(iface, "org.bluez.Device1") == 0)
                {
                    FoundDevice dev{path, {}};
                    if ((r = bluez_read_device_props(reply, cfg_.svc_uuid, dev.props)) < 0)
                        goto out;
                    found.push_back(std::move(dev));
                }
                else if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    goto out;

                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    goto out;  // {sa{sv}} dict-entry
            }
            if (r < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // a{sa{sv}}
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // {oa{sa{sv}}}
        }
        if (r >= 0)
            r = sd_bus_message_exit_container(reply);
    out:
        if (reply)
            sd_bus_message_unref(reply);
        sd_bus_error_free(&err);
        if (r < 0)
        {
            LOG_WARN("[BLUEZ] GetManagedObjects walk failed: %s", strerror(-r));
            return false;
        }
    }

    LOG_DEBUG("[BLUEZ] cold scan: %zu device object(s)", found.size());
    for (const auto &d : found)
        note_device(d.path, d.props);
    return true;
#endif
}

// ======================================================================
// Function: BluezAdapter::find_char_path
// - In: dev_path is a connected device; takes bus_mu
// - Out: object path of the characteristic with `uuid`, nullopt if absent
// - Note: relies on BlueZ having resolved services after Connect
// ======================================================================
std::optional<std::string> BluezAdapter::find_char_path(const std::string &dev_path,
                                                        const std::string &uuid)
{
#if !TILELINK_HAVE_SDBUS
    (void)dev_path;
    (void)uuid;
    return std::nullopt;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return std::nullopt;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(impl_->bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.message ? err.message : strerror(-r));
        if (reply)
            sd_bus_message_unref(reply);
        sd_bus_error_free(&err);
        return std::nullopt;
    }

    std::optional<std::string> hit;
    const std::string          dev_prefix = dev_path + "/";

    // ==========================
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    // ==========================
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    while (r >= 0 &&
           (r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            break;
        std::string path(obj ? obj : "");
        if (path.rfind(dev_prefix, 0) != 0)
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                break;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;
            continue;
        }

        // --- Interfaces
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            break;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                break;
            if (iface && strcmp(iface, "org.bluez.GattCharacteristic1") == 0)
            {
                // --- Characteristic properties (looking for "UUID")
                std::string char_uuid;
                if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                    break;
                while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sv")) >
                       0)
                {
                    const char *key = nullptr;
                    if ((r = sd_bus_message_read(reply, "s", &key)) < 0)
                        break;
                    if (key && strcmp(key, "UUID") == 0)
                        r = read_var_s(reply, char_uuid);
                    else
                        r = sd_bus_message_skip(reply, "v");
                    if (r < 0)
                        break;
                    if ((r = sd_bus_message_exit_container(reply)) < 0)
                        break;
                }
                if (r < 0)
                    break;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    break;  // exit a{sv}
                if (!char_uuid.empty() && ieq(char_uuid, uuid))
                    hit = path;
            }
            else if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                break;

            if ((r = sd_bus_message_exit_container(reply)) < 0)
                break;  // {sa{sv}} dict-entry
        }
        if (r < 0 || hit)
            break;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            break;  // {oa{sa{sv}}}
    }

    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);

    if (hit)
        LOG_INFO("[BLUEZ] characteristic %s at %s", uuid.c_str(), hit->c_str());
    else
        LOG_WARN("[BLUEZ] characteristic %s not found under %s", uuid.c_str(), dev_path.c_str());
    return hit;
#endif
}

bool BluezAdapter::set_notify(const std::string &char_path, bool on, std::string &why)
{
#if !TILELINK_HAVE_SDBUS
    (void)char_path;
    (void)on;
    why = "sd-bus not available";
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
    {
        why = "Adapter stopped";
        return false;
    }
    return char_notify_locked(impl_->bus, char_path, on, why);
#endif
}

// ======================================================================
// Function: BluezAdapter::submit_device_call
// - In: called on the CM worker from a started hook; takes bus_mu
// - Out: true once Device1.<method> is queued; the reply lands in complete_call
// - Note: the BusCall owns the reply slot until the reply or stop_bus()
// ======================================================================
bool BluezAdapter::submit_device_call(const char *method, const std::string &path, ConnId id,
                                      OpToken tok, bool connect)
{
#if !TILELINK_HAVE_SDBUS
    (void)method;
    (void)path;
    (void)id;
    (void)tok;
    (void)connect;
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;

    auto call     = std::make_unique<BusCall>();
    call->self    = this;
    call->path    = path;
    call->id      = id;
    call->token   = tok;
    call->connect = connect;

    int r = sd_bus_call_method_async(impl_->bus, &call->slot, "org.bluez", path.c_str(),
                                     "org.bluez.Device1", method, bluez_on_device_call_reply,
                                     call.get(), "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] Device1.%s submit failed on %s: %s", method, path.c_str(),
                 strerror(-r));
        return false;
    }
    LOG_DEBUG("[BLUEZ] Device1.%s submitted for %s", method, path.c_str());
    impl_->calls.push_back(std::move(call));
    return true;
#endif
}

void BluezAdapter::run_bus_loop()
{
#if TILELINK_HAVE_SDBUS
    while (running_.load(std::memory_order_relaxed))
    {
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            while (1)
            {
                int pr = sd_bus_process(impl_->bus, nullptr);
                if (pr <= 0)
                    break;
            }
        }
        // do not hold the lock while waiting, otherwise callers of bus calls stall
        {
            const uint64_t WAIT_USEC = 100000;  // 100ms
            sd_bus_wait(impl_->bus, WAIT_USEC);
        }
        // queued work runs outside the lock; it takes bus_mu itself
        while (auto t = impl_->tasks.try_pop())
            (*t)();
    }
#endif
}

}  // namespace transport
