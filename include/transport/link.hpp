#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Contract between the session core and whatever drives the radio.
// Callbacks fire on the link stack's own thread (bus loop or simulator peer).
namespace transport
{

using Frame          = std::vector<std::uint8_t>;
using OnFrame        = std::function<void(const Frame &)>;
using OnDisconnect   = std::function<void()>;
using OnAvailability = std::function<void(bool powered)>;

struct DeviceDescriptor
{
    std::string id;            // BlueZ: device address
    std::string name;          // may be empty
    std::string service_uuid;  // advertised service that matched the scan filter
};

using OnDevice = std::function<void(const DeviceDescriptor &)>;

struct ICharacteristic
{
    virtual std::string uuid() const       = 0;
    virtual bool        can_write() const  = 0;
    virtual bool        can_notify() const = 0;

    // One frame per call. Returns after the link acknowledged (or refused) it.
    virtual bool write(const Frame &frame, bool with_response) = 0;
    virtual bool subscribe(OnFrame on_notify)                  = 0;
    virtual void unsubscribe()                                 = 0;

    virtual ~ICharacteristic() = default;
};

struct IService
{
    virtual std::string                    uuid() const            = 0;
    virtual std::vector<ICharacteristic *> characteristics() const = 0;
    virtual ~IService()                                            = default;
};

struct IConnection
{
    virtual std::string id() const        = 0;
    virtual bool        connected() const = 0;
    virtual bool        connect()         = 0;
    virtual void        disconnect()      = 0;

    // Replaces the previous handler; nullptr clears it.
    virtual void set_on_disconnect(OnDisconnect cb) = 0;

    // Services stay owned by the connection.
    virtual std::vector<IService *> discover_services() = 0;

    virtual ~IConnection() = default;
};

struct ILinkStack
{
    virtual std::string name() const    = 0;
    virtual bool        powered() const = 0;
    virtual void        set_on_availability(OnAvailability cb) = 0;

    virtual bool start_scan(const std::vector<std::string> &service_uuids, OnDevice on_device) = 0;
    virtual void stop_scan() = 0;

    // Stack-owned handle for a scanned device, nullptr when unknown.
    virtual IConnection *device(const DeviceDescriptor &desc) = 0;

    virtual ~ILinkStack() = default;
};

}  // namespace transport
