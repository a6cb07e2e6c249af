// include/transport/bluez_link_impl.hpp
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct sd_bus;
struct sd_bus_slot;

#include "transport/bluez_link.hpp"

namespace transport
{

class BluezDevice;

// Device1 properties as they arrive from InterfacesAdded, PropertiesChanged or
// GetManagedObjects; unset members were not part of the message.
struct BluezDeviceProps
{
    std::optional<std::string>              address;
    std::optional<std::string>              name;
    std::optional<std::vector<std::string>> uuids;
    std::optional<bool>                     connected;
    std::optional<bool>                     services_resolved;
};

class BluezCharacteristic final : public ICharacteristic
{
  public:
    BluezCharacteristic(BluezLink::Impl &link, std::string path) : link_(link), path_(std::move(path)) {}

    std::string uuid() const override { return uuid_; }
    bool        can_write() const override;
    bool        can_notify() const override;
    bool        write(const Frame &frame, bool with_response) override;
    bool        subscribe(OnFrame on_notify) override;
    void        unsubscribe() override;

    const std::string &path() const { return path_; }

    // discovery walk, bus_mu held
    void set_props(std::string uuid, std::string service, std::vector<std::string> flags);
    const std::string &service_path() const { return service_; }

    // bus_mu held; empty when nobody listens
    OnFrame notify_target() const { return on_notify_; }
    void    drop_notify() { on_notify_ = nullptr; }

  private:
    BluezLink::Impl         &link_;
    const std::string        path_;
    std::string              uuid_;
    std::string              service_;
    std::vector<std::string> flags_;
    OnFrame                  on_notify_;  // guarded by bus_mu
};

class BluezGattService final : public IService
{
  public:
    BluezGattService(std::string path, std::string uuid) : path_(std::move(path)), uuid_(std::move(uuid)) {}

    std::string                    uuid() const override { return uuid_; }
    std::vector<ICharacteristic *> characteristics() const override { return chars_; }

    const std::string &path() const { return path_; }
    void               set_uuid(std::string u) { uuid_ = std::move(u); }
    void               clear() { chars_.clear(); }
    void               add(ICharacteristic *c) { chars_.push_back(c); }

  private:
    const std::string              path_;
    std::string                    uuid_;
    std::vector<ICharacteristic *> chars_;
};

class BluezDevice final : public IConnection
{
  public:
    BluezDevice(BluezLink::Impl &link, std::string path);

    std::string             id() const override;
    bool                    connected() const override;
    bool                    connect() override;
    void                    disconnect() override;
    void                    set_on_disconnect(OnDisconnect cb) override;
    std::vector<IService *> discover_services() override;

    const std::string &path() const { return path_; }
    DeviceDescriptor   descriptor(const std::vector<std::string> &want_uuids) const;  // bus_mu held
    bool               advertises(const std::vector<std::string> &want_uuids) const;  // bus_mu held

    // bus loop, bus_mu held. Returns the disconnect handler to run when the link dropped.
    OnDisconnect apply(const BluezDeviceProps &p);
    void         connect_reply(bool ok, const std::string &error);
    void         cancel_connect();  // bus_mu held, releases a pending Connect slot

    // bus_mu held
    BluezCharacteristic *characteristic(const std::string &path);

  private:
    bool wait_resolved();

    BluezLink::Impl  &link_;
    const std::string path_;

    // bus_mu
    std::string                                                 address_;
    std::string                                                 name_;
    std::vector<std::string>                                    uuids_;
    std::map<std::string, std::unique_ptr<BluezGattService>>    services_;
    std::map<std::string, std::unique_ptr<BluezCharacteristic>> chars_;
    sd_bus_slot                                                *connect_slot_{nullptr};

    // connection state, st_mu_ (always taken after bus_mu, never before)
    mutable std::mutex      st_mu_;
    std::condition_variable st_cv_;
    bool                    connected_{false};
    bool                    resolved_{false};
    bool                    connect_pending_{false};
    bool                    connect_ok_{false};
    std::string             connect_error_;
    OnDisconnect            on_disconnect_;
};

struct BluezLink::Impl
{
    explicit Impl(BluezConfig c) : cfg(std::move(c)), adapter_path("/org/bluez/" + cfg.adapter) {}

    const BluezConfig cfg;
    const std::string adapter_path;  // "/org/bluez/hci0"

#if APDULINK_HAVE_SDBUS
    sd_bus      *bus          = nullptr;
    sd_bus_slot *added_slot   = nullptr;
    sd_bus_slot *removed_slot = nullptr;
    sd_bus_slot *props_slot   = nullptr;
#endif
    // serialize all sd-bus access
    std::mutex       bus_mu;
    std::thread      loop;
    std::atomic_bool running{false};
    std::atomic_bool powered{false};
    std::atomic_bool discovery_on{false};

    // guarded by bus_mu
    bool                                                scanning{false};
    std::vector<std::string>                            scan_uuids;
    OnDevice                                            on_device;
    OnAvailability                                      on_availability;
    std::map<std::string, std::unique_ptr<BluezDevice>> devices;  // by object path, never erased
    std::vector<std::function<void()>>                  pending;  // run by the loop after unlock

    // bus_mu held
    BluezDevice *device_at(const std::string &path, bool create);
    BluezDevice *device_under(const std::string &obj_path);
    void         note_device(const std::string &path, const BluezDeviceProps &p);
    void         note_props(const std::string &path, const std::string &iface,
                            const BluezDeviceProps &p, const std::optional<bool> &powered_prop,
                            const std::optional<Frame> &value);
    bool         start_discovery_locked();
    bool         stop_discovery_locked();
    bool         set_discovery_filter_locked(const std::vector<std::string> &uuids);
    bool         cold_scan_locked();
};

}  // namespace transport
