// include/transport/bluez_helper.hpp
#pragma once

#if TILELINK_HAVE_SDBUS
#include <string>
#include <systemd/sd-bus.h>

#include "transport/bluez_adapter.hpp"

namespace transport
{

// DBus signal callbacks; userdata is the BluezAdapter
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
// Device1.Connect / Disconnect replies; userdata is a BluezAdapter::BusCall
int bluez_on_device_call_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

// Reads one Device1 a{sv} property dict into `out`. Leaves the message after the dict.
int bluez_read_device_props(sd_bus_message *m, const std::string &svc_uuid, DeviceProps &out);

}  // namespace transport
#endif  // TILELINK_HAVE_SDBUS
