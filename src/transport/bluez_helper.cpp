// src/transport/bluez_helper.cpp
#include "transport/bluez_helper.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"

#include <cerrno>
#include <cstring>
#include <optional>
#include <string>

#if APDULINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace transport
{

int bluez_read_device_props(sd_bus_message *m, BluezDeviceProps &out)
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
            std::string v;
            if ((r = read_var_s(m, v)) < 0)
                return r;
            out.address = v;
        }
        else if (key && strcmp(key, "Name") == 0)
        {
            std::string v;
            if ((r = read_var_s(m, v)) < 0)
                return r;
            out.name = v;
        }
        else if (key && strcmp(key, "UUIDs") == 0)
        {
            std::vector<std::string> v;
            if ((r = read_var_as(m, v)) < 0)
                return r;
            out.uuids = std::move(v);
        }
        else if (key && strcmp(key, "Connected") == 0)
        {
            bool b = false;
            if ((r = read_var_b(m, b)) < 0)
                return r;
            out.connected = b;
        }
        else if (key && strcmp(key, "ServicesResolved") == 0)
        {
            bool b = false;
            if ((r = read_var_b(m, b)) < 0)
                return r;
            out.services_resolved = b;
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

// ======================================================================
// Function: bluez_on_iface_added
// - In: InterfacesAdded(o, a{sa{sv}}) from the ObjectManager
// - Out: new Device1 objects under our adapter go to the device cache
// ======================================================================
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *impl = static_cast<BluezLink::Impl *>(userdata);

    const char *obj = nullptr;
    int         r   = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    const std::string obj_path(obj);
    const std::string prefix = impl->adapter_path + "/dev_";
    if (obj_path.rfind(prefix, 0) != 0 || addr_from_path(obj_path).empty())
        return 0;  // GATT objects are walked on demand

    BluezDeviceProps props;
    bool             is_device = false;

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
            is_device = true;
            if ((r = bluez_read_device_props(m, props)) < 0)
                return r;
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

    if (is_device)
    {
        LOG_DEBUG("[BLUEZ] device added %s name=%s", obj,
                  props.name ? props.name->c_str() : "-");
        impl->note_device(obj_path, props);
    }
    return 0;
}

int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *impl = static_cast<BluezLink::Impl *>(userdata);
    const char *obj  = nullptr;
    int         r    = sd_bus_message_read(m, "o", &obj);
    if (r < 0 || !obj)
        return r < 0 ? r : -EINVAL;

    std::vector<std::string> ifaces;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    const char *s = nullptr;
    while ((r = sd_bus_message_read_basic(m, 's', &s)) > 0)
    {
        if (s)
            ifaces.emplace_back(s);
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    for (const auto &i : ifaces)
    {
        if (i != "org.bluez.Device1")
            continue;
        // object gone: treat as a dropped link, the handle itself stays valid
        BluezDeviceProps gone;
        gone.connected         = false;
        gone.services_resolved = false;
        impl->note_props(obj, "org.bluez.Device1", gone, std::nullopt, std::nullopt);
        LOG_SYSTEM("[BLUEZ] InterfacesRemoved -> device %s gone", obj);
    }
    return 0;
}

// ======================================================================
// Function: bluez_on_props_changed
// - In: PropertiesChanged(s, a{sv}, as) for any object of org.bluez
// - Out: Adapter1.Powered, Device1 state and GattCharacteristic1.Value are forwarded
// ======================================================================
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret_error*/)
{
    auto       *impl  = static_cast<BluezLink::Impl *>(userdata);
    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0)
        return r;
    if (!iface)
        return 0;

    BluezDeviceProps     props;
    std::optional<bool>  powered;
    std::optional<Frame> value;

    if (strcmp(iface, "org.bluez.Device1") == 0)
    {
        if ((r = bluez_read_device_props(m, props)) < 0)
            return r;
    }
    else
    {
        r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
        if (r < 0)
            return r;
        while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
        {
            const char *key = nullptr;
            if ((r = sd_bus_message_read(m, "s", &key)) < 0)
                return r;

            if (key && strcmp(key, "Powered") == 0 && strcmp(iface, "org.bluez.Adapter1") == 0)
            {
                bool b = false;
                if ((r = read_var_b(m, b)) < 0)
                    return r;
                powered = b;
            }
            else if (key && strcmp(key, "Value") == 0 &&
                     strcmp(iface, "org.bluez.GattCharacteristic1") == 0)
            {
                r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
                if (r < 0)
                    return r;
                const void *buf = nullptr;
                size_t      len = 0;
                r               = sd_bus_message_read_array(m, 'y', &buf, &len);
                if (r < 0)
                    return r;
                const auto *p = static_cast<const std::uint8_t *>(buf);
                value         = Frame(p, p + len);
                r             = sd_bus_message_exit_container(m);
                if (r < 0)
                    return r;
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
    }

    r = sd_bus_message_skip(m, "as");
    if (r < 0)
        return r;

    const char *path = sd_bus_message_get_path(m);
    if (!path)
        return 0;
    impl->note_props(path, iface, props, powered, value);
    return 0;
}

int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *dev = static_cast<BluezDevice *>(userdata);

    if (sd_bus_message_is_method_error(m, nullptr))
    {
        const sd_bus_error *e     = sd_bus_message_get_error(m);
        const char         *ename = (e && e->name) ? e->name : "unknown";
        const char         *emsg  = (e && e->message) ? e->message : "no message";
        LOG_ERROR("[BLUEZ] Device1.Connect failed: %s: %s", ename, emsg);
        dev->connect_reply(false, ename);
        return 1;
    }

    LOG_SYSTEM("[BLUEZ] Device connected: %s", dev->path().c_str());
    dev->connect_reply(true, "");
    return 1;
}

}  // namespace transport

#endif
