/* ======================================================================
 * BlueZ link stack — overall flow
 *
 *  Caller thread                    Bus thread                       BlueZ/DBus
 *  -------------                    ----------                       ----------
 *  start()
 *    └─ match InterfacesAdded / InterfacesRemoved / PropertiesChanged
 *    └─ read Adapter1.Powered, cold scan ───────────────────────────▶  GetManagedObjects
 *    └─ spawn bus loop
 *
 *  start_scan(uuids)
 *    └─ SetDiscoveryFilter + StartDiscovery ────────────────────────▶  Adapter1
 *    └─ replay cached devices that advertise one of the uuids
 *                                   ◀── InterfacesAdded / Device1 props
 *                                   └─ queue on_device
 *
 *  BluezDevice::connect() ──────────────────────────────────────────▶  Device1.Connect (async)
 *                                   ◀── connect reply, ServicesResolved
 *  BluezCharacteristic::write() ────────────────────────────────────▶  WriteValue (type=request)
 *                                   ◀── PropertiesChanged(Value) -> queue on_notify
 *                                   ◀── PropertiesChanged(Connected=false) -> queue on_disconnect
 *
 *  Signal handlers run inside sd_bus_process() with bus_mu held. They only record
 *  state and queue user callbacks; the loop runs the queue after unlocking, so a
 *  callback may call back into the bus.
 * ====================================================================== */

#include <chrono>
#include <cstring>
#include <errno.h>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

// clang-format off
#include "transport/bluez_link.hpp"
#include "transport/bluez_link_impl.hpp"
#include "transport/bluez_dbus_util.hpp"
#include "util/log.hpp"
// clang-format on

#if APDULINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "transport/bluez_helper.hpp"
#endif

namespace transport
{

// ============== Impl: device cache ==============
BluezDevice *BluezLink::Impl::device_at(const std::string &path, bool create)
{
    auto it = devices.find(path);
    if (it != devices.end())
        return it->second.get();
    if (!create)
        return nullptr;
    auto &slot = devices[path];
    slot       = std::make_unique<BluezDevice>(*this, path);
    return slot.get();
}

BluezDevice *BluezLink::Impl::device_under(const std::string &obj_path)
{
    for (auto &kv : devices)
    {
        const std::string prefix = kv.first + "/";
        if (obj_path.rfind(prefix, 0) == 0)
            return kv.second.get();
    }
    return nullptr;
}

void BluezLink::Impl::note_device(const std::string &path, const BluezDeviceProps &p)
{
    BluezDevice *d    = device_at(path, true);
    OnDisconnect drop = d->apply(p);
    if (drop)
        pending.push_back(std::move(drop));

    if (scanning && on_device && d->advertises(scan_uuids))
    {
        OnDevice         cb   = on_device;
        DeviceDescriptor desc = d->descriptor(scan_uuids);
        pending.push_back([cb, desc] { cb(desc); });
    }
}

void BluezLink::Impl::note_props(const std::string          &path,
                                 const std::string          &iface,
                                 const BluezDeviceProps     &p,
                                 const std::optional<bool>  &powered_prop,
                                 const std::optional<Frame> &value)
{
    if (iface == "org.bluez.Adapter1")
    {
        if (path != adapter_path || !powered_prop)
            return;
        powered.store(*powered_prop);
        if (!*powered_prop)
            discovery_on.store(false);
        LOG_SYSTEM("[BLUEZ] adapter %s powered=%d", adapter_path.c_str(), (int)*powered_prop);
        if (on_availability)
        {
            OnAvailability cb = on_availability;
            const bool     v  = *powered_prop;
            pending.push_back([cb, v] { cb(v); });
        }
        return;
    }

    if (iface == "org.bluez.Device1")
    {
        if (path.rfind(adapter_path + "/dev_", 0) != 0)
            return;
        const bool announce = p.name.has_value() || p.uuids.has_value();
        if (announce)
        {
            note_device(path, p);
            return;
        }
        BluezDevice *d = device_at(path, false);
        if (!d)
            return;
        OnDisconnect drop = d->apply(p);
        if (drop)
        {
            LOG_SYSTEM("[BLUEZ] Disconnected (%s)", path.c_str());
            pending.push_back(std::move(drop));
        }
        return;
    }

    if (iface == "org.bluez.GattCharacteristic1" && value)
    {
        BluezDevice *d = device_under(path);
        if (!d)
            return;
        BluezCharacteristic *c = d->characteristic(path);
        if (!c)
            return;
        OnFrame cb = c->notify_target();
        if (!cb)
            return;
        LOG_DEBUG("[BLUEZ] notify on %s len=%zu", path.c_str(), value->size());
        Frame f = *value;
        pending.push_back([cb, f] { cb(f); });
    }
}

// ======================================================================
// Function: start_discovery_locked / stop_discovery_locked
// - In: bus_mu locked, adapter_path valid
// - Out: true when discovery ends up in the requested state
// - Note: InProgress counts as on; a failed stop still clears the flag
// ======================================================================
bool BluezLink::Impl::start_discovery_locked()
{
#if !APDULINK_HAVE_SDBUS
    return false;
#else
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
#endif
}

bool BluezLink::Impl::stop_discovery_locked()
{
#if !APDULINK_HAVE_SDBUS
    return false;
#else
    if (!bus)
        return false;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(bus, "org.bluez", adapter_path.c_str(), "org.bluez.Adapter1",
                               "StopDiscovery", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        // usually "already stopped"
        LOG_WARN("[BLUEZ] StopDiscovery failed (treat as off): %s",
                 err.message ? err.message : strerror(-r));
    }
    else
    {
        LOG_SYSTEM("[BLUEZ] StopDiscovery OK");
    }
    discovery_on.store(false);
    sd_bus_error_free(&err);
    return true;
#endif
}

// ======================================================================
// Function: set_discovery_filter_locked
// - In: bus_mu locked, service uuids of interest
// - Out: true when Adapter1.SetDiscoveryFilter accepted LE + uuids
// ======================================================================
bool BluezLink::Impl::set_discovery_filter_locked(const std::vector<std::string> &uuids)
{
#if !APDULINK_HAVE_SDBUS
    (void)uuids;
    return false;
#else
    if (!bus)
        return false;

    sd_bus_message *msg = nullptr, *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(bus, &msg, "org.bluez", adapter_path.c_str(),
                                           "org.bluez.Adapter1", "SetDiscoveryFilter");
    if (r >= 0)
        r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r >= 0)
        r = append_sv_s(msg, "Transport", "le");
    if (r >= 0)
        r = append_sv_b(msg, "DuplicateData", false);
    if (r >= 0 && !uuids.empty())
        r = append_sv_as(msg, "UUIDs", uuids);
    if (r >= 0)
        r = sd_bus_message_close_container(msg);  // a{sv}
    if (r >= 0)
        r = sd_bus_call(bus, msg, 0, &err, &rep);

    if (msg)
        sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);

    if (r < 0)
    {
        LOG_WARN("[BLUEZ] SetDiscoveryFilter failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    LOG_INFO("[BLUEZ] SetDiscoveryFilter OK (Transport=le, %zu uuid(s))", uuids.size());
    return true;
#endif
}

// ======================================================================
// Function: cold_scan_locked
// - In: bus_mu locked
// - Out: every Device1 object BlueZ already knows goes through note_device
// - Note: does not start active discovery
// ======================================================================
bool BluezLink::Impl::cold_scan_locked()
{
#if !APDULINK_HAVE_SDBUS
    return false;
#else
    if (!bus)
        return false;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return false;
    }

    const std::string dev_prefix = adapter_path + "/dev_";
    // =========================
    // Hierarchy:
    // Object path (o)
    // |- Interfaces (a{sa{sv}})
    //     |- Properties ({sv})
    // =========================
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto out;
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto out;
        if (!obj)
        {
            r = -EINVAL;
            goto out;
        }
        const std::string path(obj);
        if (path.rfind(dev_prefix, 0) != 0 || addr_from_path(path).empty())
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                goto out;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;
            continue;
        }

        BluezDeviceProps props;
        bool             is_device = false;
        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto out;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto out;
            if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
            {
                is_device = true;
                if ((r = bluez_read_device_props(reply, props)) < 0)
                    goto out;
            }
            else
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    goto out;
            }
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto out;  // {sa{sv}}
        }
        if (r < 0)
            goto out;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto out;  // {oa{sa{sv}}}

        if (is_device)
            note_device(path, props);
    }
out:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
        LOG_WARN("[BLUEZ] cold scan walk failed: %s", strerror(-r));
    return r >= 0;
#endif
}

// ============== BluezLink ==============
BluezLink::BluezLink(BluezConfig cfg) : cfg_(std::move(cfg)), impl_(std::make_unique<Impl>(cfg_)) {}

BluezLink::~BluezLink()
{
    stop();
}

// ======================================================================
// Function: BluezLink::start
// - In: adapter name from config
// - Out: true once matches are installed and the loop runs
// ======================================================================
bool BluezLink::start()
{
#if !APDULINK_HAVE_SDBUS
    LOG_ERROR("[BLUEZ] sd-bus not available (APDULINK_HAVE_SDBUS=0)");
    return false;
#else
    if (impl_->running.load())
        return true;

    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ] failed to connect system bus: %s", strerror(-r));
        return false;
    }

    auto fail = [this](const char *what, int rc) {
        LOG_ERROR("[BLUEZ] subscribe to %s failed: %s", what, strerror(-rc));
        unref_slot(impl_->added_slot);
        unref_slot(impl_->removed_slot);
        unref_slot(impl_->props_slot);
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
        return false;
    };

    r = sd_bus_match_signal(impl_->bus, &impl_->added_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesAdded",
                            bluez_on_iface_added, impl_.get());
    if (r < 0)
        return fail("InterfacesAdded", r);
    r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                            "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                            bluez_on_iface_removed, impl_.get());
    if (r < 0)
        return fail("InterfacesRemoved", r);
    // PropertiesChanged (Adapter1.Powered / Device1.Connected / GattCharacteristic1.Value)
    r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                            "org.freedesktop.DBus.Properties", "PropertiesChanged",
                            bluez_on_props_changed, impl_.get());
    if (r < 0)
        return fail("PropertiesChanged", r);

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        sd_bus_error                err     = SD_BUS_ERROR_NULL;
        int                         powered = 0;
        r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                        "org.bluez.Adapter1", "Powered", &err, 'b', &powered);
        if (r < 0)
        {
            LOG_WARN("[BLUEZ] adapter %s not available: %s", impl_->adapter_path.c_str(),
                     err.message ? err.message : strerror(-r));
        }
        sd_bus_error_free(&err);
        impl_->powered.store(r >= 0 && powered != 0);
        (void)impl_->cold_scan_locked();
    }
    LOG_INFO("[BLUEZ] started on %s (powered=%d)", impl_->adapter_path.c_str(),
             (int)impl_->powered.load());

    impl_->running.store(true);
    impl_->loop = std::thread([this] {
        while (impl_->running.load(std::memory_order_relaxed))
        {
            std::vector<std::function<void()>> todo;
            {
                std::lock_guard<std::mutex> lk(impl_->bus_mu);
                while (true)
                {
                    int pr = sd_bus_process(impl_->bus, nullptr);
                    if (pr <= 0)
                        break;
                }
                todo.swap(impl_->pending);
            }
            // user callbacks may call back into the bus, so never under bus_mu
            for (auto &fn : todo)
                fn();

            // do not hold the lock while waiting, callers would stall
            const uint64_t WAIT_USEC = 100000;  // 100ms
            sd_bus_wait(impl_->bus, WAIT_USEC);
        }
    });
    return true;
#endif
}

// ======================================================================
// Function: BluezLink::stop
// - In: may be called anytime
// - Out: discovery off, loop joined, bus released
// - Note: joins the bus loop thread outside of locks
// ======================================================================
void BluezLink::stop()
{
#if APDULINK_HAVE_SDBUS
    if (!impl_->running.exchange(false))
        return;

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->bus && impl_->discovery_on.load())
            (void)impl_->stop_discovery_locked();
        impl_->scanning  = false;
        impl_->on_device = nullptr;
        // wake the loop if it sits in sd_bus_wait()
        if (impl_->bus)
            sd_bus_close(impl_->bus);
    }

    if (impl_->loop.joinable())
        impl_->loop.join();

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        for (auto &kv : impl_->devices)
            kv.second->cancel_connect();
        impl_->pending.clear();
    }
    unref_slot(impl_->added_slot);
    unref_slot(impl_->removed_slot);
    unref_slot(impl_->props_slot);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
    LOG_DEBUG("[BLUEZ] stopped");
#endif
}

bool BluezLink::powered() const
{
    return impl_->powered.load();
}

void BluezLink::set_on_availability(OnAvailability cb)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    impl_->on_availability = std::move(cb);
}

bool BluezLink::start_scan(const std::vector<std::string> &service_uuids, OnDevice on_device)
{
    std::vector<DeviceDescriptor> known;
    OnDevice                      cb = on_device;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
#if APDULINK_HAVE_SDBUS
        if (!impl_->bus)
            return false;
#else
        return false;
#endif
        if (!impl_->powered.load())
            return false;
        impl_->scanning   = true;
        impl_->scan_uuids = service_uuids;
        impl_->on_device  = std::move(on_device);

        (void)impl_->set_discovery_filter_locked(service_uuids);
        if (!impl_->start_discovery_locked())
            LOG_WARN("[BLUEZ] StartDiscovery failed (continue with cached devices)");

        for (auto &kv : impl_->devices)
        {
            if (kv.second->advertises(service_uuids))
                known.push_back(kv.second->descriptor(service_uuids));
        }
    }
    if (cb)
    {
        for (const auto &d : known)
            cb(d);
    }
    return true;
}

void BluezLink::stop_scan()
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    impl_->scanning  = false;
    impl_->on_device = nullptr;
    if (impl_->discovery_on.load())
        (void)impl_->stop_discovery_locked();
}

IConnection *BluezLink::device(const DeviceDescriptor &desc)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    for (auto &kv : impl_->devices)
    {
        if (mac_eq(addr_from_path(kv.first), desc.id))
            return kv.second.get();
    }
    LOG_WARN("[BLUEZ] no device object for %s", desc.id.c_str());
    return nullptr;
}

}  // namespace transport
