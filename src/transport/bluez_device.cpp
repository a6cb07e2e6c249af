#include <chrono>
#include <cstring>
#include <errno.h>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

// clang-format off
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

namespace
{

bool has_flag(const std::vector<std::string> &flags, const char *want)
{
    for (const auto &f : flags)
        if (f == want)
            return true;
    return false;
}

}  // namespace

// ============== BluezCharacteristic ==============
bool BluezCharacteristic::can_write() const
{
    return has_flag(flags_, "write") || has_flag(flags_, "write-without-response");
}

bool BluezCharacteristic::can_notify() const
{
    return has_flag(flags_, "notify") || has_flag(flags_, "indicate");
}

void BluezCharacteristic::set_props(std::string uuid, std::string service, std::vector<std::string> flags)
{
    uuid_    = std::move(uuid);
    service_ = std::move(service);
    flags_   = std::move(flags);
}

// ======================================================================
// Function: BluezCharacteristic::write
// - In: one frame, with_response picks type=request or type=command
// - Out: true if WriteValue succeeds on DBus
// - Note: EBADMSG is a soft error, some BlueZ builds report it after a good ATT write
// ======================================================================
bool BluezCharacteristic::write(const Frame &frame, bool with_response)
{
#if !APDULINK_HAVE_SDBUS
    (void)frame;
    (void)with_response;
    return false;
#else
    std::lock_guard<std::mutex> lk(link_.bus_mu);
    if (!link_.bus || frame.empty())
        return false;

    sd_bus_message *msg = nullptr;
    sd_bus_message *rep = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_message_new_method_call(link_.bus, &msg, "org.bluez", path_.c_str(),
                                           "org.bluez.GattCharacteristic1", "WriteValue");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] WriteValue new_method_call failed: %s", strerror(-r));
        return false;
    }

    r = sd_bus_message_append_array(msg, 'y', frame.data(), frame.size());
    // options a{sv}: type and offset=0
    if (r >= 0)
        r = sd_bus_message_open_container(msg, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r >= 0)
        r = append_sv_s(msg, "type", with_response ? "request" : "command");
    if (r >= 0)
        r = append_sv_q(msg, "offset", 0);
    if (r >= 0)
        r = sd_bus_message_close_container(msg);  // a{sv}
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] WriteValue build message failed: %s", strerror(-r));
        sd_bus_message_unref(msg);
        return false;
    }

    r = sd_bus_call(link_.bus, msg, 0, &err, &rep);
    sd_bus_message_unref(msg);
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        if (-r == EBADMSG)
        {
            LOG_INFO("[BLUEZ] WriteValue returned EBADMSG; treating as soft error (len=%zu)",
                     frame.size());
        }
        else
        {
            LOG_WARN("[BLUEZ] WriteValue failed: %s", err.message ? err.message : strerror(-r));
            sd_bus_error_free(&err);
            return false;
        }
    }
    sd_bus_error_free(&err);
    LOG_DEBUG("[BLUEZ] WriteValue OK (len=%zu)", frame.size());
    return true;
#endif
}

// ======================================================================
// Function: BluezCharacteristic::subscribe
// - In: callback for every notified value
// - Out: true if StartNotify succeeds; the callback is dropped on failure
// ======================================================================
bool BluezCharacteristic::subscribe(OnFrame on_notify)
{
#if !APDULINK_HAVE_SDBUS
    (void)on_notify;
    return false;
#else
    std::lock_guard<std::mutex> lk(link_.bus_mu);
    if (!link_.bus)
        return false;
    on_notify_ = std::move(on_notify);

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(link_.bus, "org.bluez", path_.c_str(),
                               "org.bluez.GattCharacteristic1", "StartNotify", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] StartNotify failed on %s: %s", path_.c_str(),
                 err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        on_notify_ = nullptr;
        return false;
    }
    sd_bus_error_free(&err);
    LOG_SYSTEM("[BLUEZ] StartNotify OK on %s", path_.c_str());
    return true;
#endif
}

void BluezCharacteristic::unsubscribe()
{
#if APDULINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(link_.bus_mu);
    const bool was = static_cast<bool>(on_notify_);
    on_notify_     = nullptr;
    if (!link_.bus || !was)
        return;

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(link_.bus, "org.bluez", path_.c_str(),
                               "org.bluez.GattCharacteristic1", "StopNotify", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_DEBUG("[BLUEZ] StopNotify on %s: %s", path_.c_str(), err.message ? err.message : strerror(-r));
    sd_bus_error_free(&err);
#endif
}

// ============== BluezDevice ==============
BluezDevice::BluezDevice(BluezLink::Impl &link, std::string path)
    : link_(link), path_(std::move(path)), address_(addr_from_path(path_))
{
}

std::string BluezDevice::id() const
{
    return addr_from_path(path_);
}

bool BluezDevice::connected() const
{
    std::lock_guard<std::mutex> lk(st_mu_);
    return connected_;
}

void BluezDevice::set_on_disconnect(OnDisconnect cb)
{
    std::lock_guard<std::mutex> lk(st_mu_);
    on_disconnect_ = std::move(cb);
}

DeviceDescriptor BluezDevice::descriptor(const std::vector<std::string> &want_uuids) const
{
    DeviceDescriptor d;
    d.id   = address_.empty() ? addr_from_path(path_) : address_;
    d.name = name_;
    for (const auto &u : uuids_)
    {
        for (const auto &w : want_uuids)
        {
            if (ieq(u, w))
            {
                d.service_uuid = w;
                return d;
            }
        }
    }
    return d;
}

bool BluezDevice::advertises(const std::vector<std::string> &want_uuids) const
{
    if (want_uuids.empty())
        return true;
    for (const auto &u : uuids_)
        for (const auto &w : want_uuids)
            if (ieq(u, w))
                return true;
    return false;
}

OnDisconnect BluezDevice::apply(const BluezDeviceProps &p)
{
    if (p.address)
        address_ = *p.address;
    if (p.name)
        name_ = *p.name;
    if (p.uuids)
        uuids_ = *p.uuids;

    OnDisconnect drop;
    bool         lost = false;
    {
        std::lock_guard<std::mutex> lk(st_mu_);
        if (p.connected)
        {
            if (*p.connected)
            {
                connected_ = true;
            }
            else if (connected_)
            {
                connected_ = false;
                resolved_  = false;
                lost       = true;
                drop       = on_disconnect_;
            }
        }
        if (p.services_resolved)
            resolved_ = *p.services_resolved && connected_;
    }
    st_cv_.notify_all();

    if (lost)
    {
        // GATT objects go away with the link
        for (auto &kv : chars_)
            kv.second->drop_notify();
    }
    return drop;
}

void BluezDevice::connect_reply(bool ok, const std::string &error)
{
    {
        std::lock_guard<std::mutex> lk(st_mu_);
        connect_pending_ = false;
        connect_ok_      = ok;
        connect_error_   = error;
        if (ok)
            connected_ = true;
    }
    st_cv_.notify_all();
}

void BluezDevice::cancel_connect()
{
#if APDULINK_HAVE_SDBUS
    unref_slot(connect_slot_);
#endif
    {
        std::lock_guard<std::mutex> lk(st_mu_);
        connect_pending_ = false;
    }
    st_cv_.notify_all();
}

BluezCharacteristic *BluezDevice::characteristic(const std::string &path)
{
    auto it = chars_.find(path);
    return it == chars_.end() ? nullptr : it->second.get();
}

// ======================================================================
// Function: BluezDevice::connect
// - In: not connected, bus running
// - Out: true once Connect replied OK and ServicesResolved is true
// - Note: discovery is off while Connect is in flight and resumes after if still scanning
// ======================================================================
bool BluezDevice::connect()
{
    {
        std::lock_guard<std::mutex> lk(st_mu_);
        if (connected_ && resolved_)
            return true;
    }
#if !APDULINK_HAVE_SDBUS
    return false;
#else
    {
        std::lock_guard<std::mutex> lk(link_.bus_mu);
        if (!link_.bus)
            return false;
        if (link_.discovery_on.load())
            (void)link_.stop_discovery_locked();

        {
            std::lock_guard<std::mutex> st(st_mu_);
            connect_pending_ = true;
            connect_ok_      = false;
            connect_error_.clear();
        }
        unref_slot(connect_slot_);
        int r = sd_bus_call_method_async(link_.bus, &connect_slot_, "org.bluez", path_.c_str(),
                                         "org.bluez.Device1", "Connect", bluez_on_connect_reply,
                                         this, "");
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ] Device1.Connect submit failed: %s", strerror(-r));
            std::lock_guard<std::mutex> st(st_mu_);
            connect_pending_ = false;
            return false;
        }
        LOG_SYSTEM("[BLUEZ] Connect submitted to %s", path_.c_str());
    }

    bool done = false;
    bool ok   = false;
    {
        std::unique_lock<std::mutex> st(st_mu_);
        done = st_cv_.wait_for(st, std::chrono::milliseconds(link_.cfg.connect_timeout_ms),
                               [this] { return !connect_pending_; });
        ok = done && connect_ok_;
        if (!done)
            connect_pending_ = false;
    }

    {
        std::lock_guard<std::mutex> lk(link_.bus_mu);
        if (!done)
        {
            LOG_ERROR("[BLUEZ] Connect to %s timed out after %u ms", path_.c_str(),
                      (unsigned)link_.cfg.connect_timeout_ms);
            unref_slot(connect_slot_);
        }
        if (link_.scanning)
            (void)link_.start_discovery_locked();
    }

    if (!ok)
        return false;
    return wait_resolved();
#endif
}

bool BluezDevice::wait_resolved()
{
#if !APDULINK_HAVE_SDBUS
    return false;
#else
    {
        // the property may already be true before any signal arrives
        std::lock_guard<std::mutex> lk(link_.bus_mu);
        if (link_.bus)
        {
            sd_bus_error err      = SD_BUS_ERROR_NULL;
            int          resolved = 0;
            int r = sd_bus_get_property_trivial(link_.bus, "org.bluez", path_.c_str(),
                                                "org.bluez.Device1", "ServicesResolved", &err,
                                                'b', &resolved);
            sd_bus_error_free(&err);
            if (r >= 0 && resolved)
            {
                std::lock_guard<std::mutex> st(st_mu_);
                resolved_ = connected_;
            }
        }
    }

    std::unique_lock<std::mutex> st(st_mu_);
    st_cv_.wait_for(st, std::chrono::milliseconds(link_.cfg.resolve_timeout_ms),
                    [this] { return resolved_ || !connected_; });
    if (!resolved_)
        LOG_WARN("[BLUEZ] ServicesResolved not seen on %s", path_.c_str());
    return resolved_;
#endif
}

void BluezDevice::disconnect()
{
#if APDULINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(link_.bus_mu);
    if (!link_.bus)
        return;
    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    int r = sd_bus_call_method(link_.bus, "org.bluez", path_.c_str(), "org.bluez.Device1",
                               "Disconnect", &err, &rep, "");
    if (rep)
        sd_bus_message_unref(rep);
    if (r < 0)
        LOG_WARN("[BLUEZ] Device1.Disconnect failed: %s", err.message ? err.message : strerror(-r));
    else
        LOG_SYSTEM("[BLUEZ] Disconnect requested on %s", path_.c_str());
    sd_bus_error_free(&err);
#endif
}

// ======================================================================
// Function: BluezDevice::discover_services
// - In: connected and resolved
// - Out: GATT services under this device with their characteristics attached
// - Note: walks GetManagedObjects; handles stay valid across calls
// ======================================================================
std::vector<IService *> BluezDevice::discover_services()
{
    std::vector<IService *> out;
    {
        std::lock_guard<std::mutex> st(st_mu_);
        if (!connected_)
            return out;
    }
#if APDULINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(link_.bus_mu);
    if (!link_.bus)
        return out;

    sd_bus_message *reply = nullptr;
    sd_bus_error    err{};
    int r = sd_bus_call_method(link_.bus, "org.bluez", "/", "org.freedesktop.DBus.ObjectManager",
                               "GetManagedObjects", &err, &reply, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GetManagedObjects failed: %s", err.message ? err.message : strerror(-r));
        sd_bus_error_free(&err);
        if (reply)
            sd_bus_message_unref(reply);
        return out;
    }

    const std::string prefix = path_ + "/";
    r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0)
        goto done;
    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0)
    {
        const char *obj = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &obj)) < 0)
            goto done;
        const std::string opath = obj ? obj : "";
        if (opath.rfind(prefix, 0) != 0)
        {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0)
                goto done;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto done;
            continue;
        }

        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
            goto done;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
        {
            const char *iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0)
                goto done;
            const bool is_svc  = iface && std::strcmp(iface, "org.bluez.GattService1") == 0;
            const bool is_char = iface && std::strcmp(iface, "org.bluez.GattCharacteristic1") == 0;
            if (!is_svc && !is_char)
            {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0)
                    goto done;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    goto done;
                continue;
            }

            std::string              uuid, service;
            std::vector<std::string> flags;
            if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sv}")) < 0)
                goto done;
            while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
            {
                const char *key = nullptr;
                if ((r = sd_bus_message_read(reply, "s", &key)) < 0)
                    goto done;
                if (key && std::strcmp(key, "UUID") == 0)
                    r = read_var_s(reply, uuid);
                else if (is_char && key && std::strcmp(key, "Service") == 0)
                    r = read_var_s(reply, service, 'o');
                else if (is_char && key && std::strcmp(key, "Flags") == 0)
                    r = read_var_as(reply, flags);
                else
                    r = sd_bus_message_skip(reply, "v");
                if (r < 0)
                    goto done;
                if ((r = sd_bus_message_exit_container(reply)) < 0)
                    goto done;
            }
            if (r < 0)
                goto done;
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto done;  // a{sv}

            if (is_svc)
            {
                auto &s = services_[opath];
                if (!s)
                    s = std::make_unique<BluezGattService>(opath, uuid);
                else
                    s->set_uuid(uuid);
            }
            else
            {
                auto &c = chars_[opath];
                if (!c)
                    c = std::make_unique<BluezCharacteristic>(link_, opath);
                c->set_props(uuid, service, flags);
            }
            if ((r = sd_bus_message_exit_container(reply)) < 0)
                goto done;  // {sa{sv}}
        }
        if (r < 0)
            goto done;
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto done;  // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0)
            goto done;  // {oa{sa{sv}}}
    }

done:
    if (reply)
        sd_bus_message_unref(reply);
    sd_bus_error_free(&err);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] GATT walk failed on %s: %s", path_.c_str(), strerror(-r));
        return out;
    }

    for (auto &kv : services_)
    {
        kv.second->clear();
        for (auto &ckv : chars_)
        {
            if (ckv.second->service_path() == kv.first)
                kv.second->add(ckv.second.get());
        }
        out.push_back(kv.second.get());
    }
    LOG_INFO("[BLUEZ] %zu GATT service(s) on %s", out.size(), path_.c_str());
#endif
    return out;
}

}  // namespace transport
