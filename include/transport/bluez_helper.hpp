// include/transport/bluez_helper.hpp
#pragma once

#if APDULINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

#include "transport/bluez_link_impl.hpp"

namespace transport
{

// DBus callbacks; userdata is BluezLink::Impl*, BluezDevice* for the connect reply.
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

// Reads one Device1 property dict (a{sv}), skipping the keys it does not track.
int bluez_read_device_props(sd_bus_message *m, BluezDeviceProps &out);

}  // namespace transport
#endif  // APDULINK_HAVE_SDBUS
