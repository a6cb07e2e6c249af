#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "transport/link.hpp"

namespace transport
{

struct BluezConfig
{
    std::string   adapter            = "hci0";
    std::uint32_t connect_timeout_ms = 15000;
    std::uint32_t resolve_timeout_ms = 10000;  // wait for ServicesResolved after Connect
};

// Link stack over BlueZ on the system bus. One bus loop thread handles signals and
// async replies; user callbacks are queued there and run after the bus lock is dropped.
class BluezLink final : public ILinkStack
{
  public:
    explicit BluezLink(BluezConfig cfg);
    ~BluezLink() override;

    BluezLink(const BluezLink &)            = delete;
    BluezLink &operator=(const BluezLink &) = delete;

    // Opens the system bus, installs signal matches and spawns the loop.
    bool start();
    void stop();

    std::string  name() const override { return "bluez"; }
    bool         powered() const override;
    void         set_on_availability(OnAvailability cb) override;
    bool         start_scan(const std::vector<std::string> &service_uuids, OnDevice on_device) override;
    void         stop_scan() override;
    IConnection *device(const DeviceDescriptor &desc) override;

    struct Impl;

  private:
    BluezConfig           cfg_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace transport
