// src/transport/bluez_helper.cpp
#include "transport/bluez_adapter.hpp"
#include "transport/bluez_adapter_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "transport/bluez_helper.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

#include <cstring>
#include <string>
#include <vector>

#if TILELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace transport
{

int bluez_read_device_props(sd_bus_message *m, const std::string &svc_uuid, DeviceProps &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;

    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && strcmp(key, "Address") == 0)
        {
            std::string addr;
            if ((r = read_var_s(m, addr)) < 0)
                return r;
            out.address = addr;
        }
        else if (key && strcmp(key, "RSSI") == 0)
        {
            int16_t rssi = 0;
            if ((r = read_var_i16(m, rssi)) < 0)
                return r;
            out.rssi = rssi;
        }
        else if (key && strcmp(key, "Connected") == 0)
        {
            bool b = false;
            if ((r = read_var_b(m, b)) < 0)
                return r;
            out.connected = b;
        }
        else if (key && strcmp(key, "UUIDs") == 0)
        {
            bool hit = false;
            if ((r = var_as_has_uuid(m, svc_uuid, hit)) < 0)
                return r;
            out.svc_hit |= hit;
        }
        else if (key && strcmp(key, "ManufacturerData") == 0)
        {
            std::vector<uint8_t> data;
            bool                 hit = false;
            if ((r = var_manufacturer_data(m, constants::ARCH_MANUFACTURER_ID, data, hit)) < 0)
                return r;
            if (hit)
                out.advert = parse_tile_advert(data.data(), data.size());
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<transport::BluezAdapter *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string obj_path(obj);
    const std::string prefix = "/org/bluez/" + self->bluez_config().adapter + "/dev_";
    if (obj_path.rfind(prefix, 0) != 0)
        return 0;
    // only the device object itself, not its GATT children
    if (obj_path.find('/', prefix.size()) != std::string::npos)
        return 0;

    DeviceProps props;
    bool        have_device = false;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read(m, "s", &iface)) < 0)
            return r;

        if (iface && strcmp(iface, "org.bluez.Device1") == 0)
        {
            if ((r = bluez_read_device_props(m, self->bluez_config().svc_uuid, props)) < 0)
                return r;
            have_device = true;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "a{sv}")) < 0)
                return r;
        }

        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (have_device)
        self->note_device(obj_path, props);
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<transport::BluezAdapter *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    bool device_gone = false;
    r                = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    while (true)
    {
        const char *iface = nullptr;
        int         rr    = sd_bus_message_read_basic(m, 's', &iface);
        if (rr < 0)
            return rr;
        if (rr == 0)
            break;
        if (iface && strcmp(iface, "org.bluez.Device1") == 0)
            device_gone = true;
    }
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (device_gone)
    {
        LOG_DEBUG("[BLUEZ] InterfacesRemoved(Device1) on %s", obj);
        self->note_device_removed(obj);
    }
    return 0;
}

int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *self  = static_cast<transport::BluezAdapter *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;

    const char *path = sd_bus_message_get_path(m);
    if (!path || !iface)
        return 0;

    if (strcmp(iface, "org.bluez.Device1") == 0)
    {
        DeviceProps props;
        if ((r = bluez_read_device_props(m, self->bluez_config().svc_uuid, props)) < 0)
            return r;
        if ((r = sd_bus_message_skip(m, "as")) < 0)
            return r;

        if (props.connected && !*props.connected)
        {
            LOG_DEBUG("[BLUEZ] Connected=false on %s", path);
            self->note_link_lost(path);
        }
        if (props.address || props.rssi || props.advert)
            self->note_device(path, props);
        return 0;
    }

    if (strcmp(iface, "org.bluez.GattCharacteristic1") != 0)
        return 0;

    bool                 value_hit = false;
    std::vector<uint8_t> value;

    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        if ((r = sd_bus_message_read(m, "s", &key)) < 0)
            return r;

        if (key && strcmp(key, "Value") == 0)
        {
            if ((r = read_var_ay(m, value)) < 0)
                return r;
            value_hit = true;
        }
        else
        {
            if ((r = sd_bus_message_skip(m, "v")) < 0)
                return r;
        }
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;
    if ((r = sd_bus_message_skip(m, "as")) < 0)
        return r;

    if (value_hit && !value.empty())
        self->note_char_value(path, value.data(), value.size());
    return 0;
}

int bluez_on_device_call_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *call = static_cast<BluezAdapter::BusCall *>(userdata);
    auto *self = call->self;

    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e     = sd_bus_message_get_error(m);
        const char         *ename = (e && e->name) ? e->name : "unknown";
        const char         *emsg  = (e && e->message) ? e->message : "no message";
        LOG_WARN("[BLUEZ] Device1.%s on %s failed: %s: %s",
                 call->connect ? "Connect" : "Disconnect", call->path.c_str(), ename, emsg);
        self->complete_call(call, false, std::string(ename) + ": " + emsg);
        return 1;
    }

    LOG_INFO("[BLUEZ] Device1.%s OK: %s", call->connect ? "Connect" : "Disconnect",
             call->path.c_str());
    self->complete_call(call, true, std::string());
    return 1;
}

}  // namespace transport

#endif
