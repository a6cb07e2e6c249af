#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "proto/frag.hpp"
#include "transport/link.hpp"
#include "util/constants.hpp"

// In-process hardware wallet stand-in. Each peer runs its own worker thread that
// answers MTU requests and reassembles APDUs like the real firmware does.
namespace transport
{

struct SimPeerConfig
{
    std::string id           = "SIM-0001";
    std::string name         = "Nano X SIM";
    std::string service_uuid = std::string(constants::NANO_X_SVC_UUID);

    std::uint8_t  announced_mtu      = 158;
    bool          answer_mtu         = true;  // false: silent peer
    std::uint32_t first_mtu_delay_ms = 0;     // first MTU answer of the peer's life
    std::uint32_t mtu_delay_ms       = 0;     // every later MTU answer
    std::uint32_t response_delay_ms  = 0;
    std::uint32_t write_ack_delay_ms = 0;

    // Request -> response message. Unset: echo the request followed by 90 00.
    std::function<Frame(const Frame &)> responder;
    // Request -> raw notification frames, bypassing the fragmenter. Wins over `responder`.
    std::function<std::vector<Frame>(const Frame &)> raw_responder;

    int  drop_after_frames = -1;  // peer drops the link once, after that many host writes
    bool fail_writes       = false;
    bool refuse_disconnect = false;  // host disconnect requests are counted, link stays up
    bool has_service       = true;
    bool has_notify        = true;
    bool has_write         = true;
};

class SimLink;
class SimDevice;

class SimCharacteristic final : public ICharacteristic
{
  public:
    SimCharacteristic(SimDevice &dev, std::string uuid, bool writable, bool notifiable)
        : dev_(dev), uuid_(std::move(uuid)), writable_(writable), notifiable_(notifiable)
    {
    }

    std::string uuid() const override { return uuid_; }
    bool        can_write() const override { return writable_; }
    bool        can_notify() const override { return notifiable_; }
    bool        write(const Frame &frame, bool with_response) override;
    bool        subscribe(OnFrame on_notify) override;
    void        unsubscribe() override;

  private:
    SimDevice  &dev_;
    std::string uuid_;
    bool        writable_;
    bool        notifiable_;
};

class SimService final : public IService
{
  public:
    explicit SimService(std::string uuid) : uuid_(std::move(uuid)) {}

    std::string                    uuid() const override { return uuid_; }
    std::vector<ICharacteristic *> characteristics() const override { return chars_; }
    void                           add(ICharacteristic *c) { chars_.push_back(c); }

  private:
    std::string                    uuid_;
    std::vector<ICharacteristic *> chars_;
};

class SimDevice final : public IConnection
{
  public:
    SimDevice(const SimLink &link, SimPeerConfig cfg);
    ~SimDevice() override;

    SimDevice(const SimDevice &)            = delete;
    SimDevice &operator=(const SimDevice &) = delete;

    std::string             id() const override { return cfg_.id; }
    bool                    connected() const override;
    bool                    connect() override;
    void                    disconnect() override;
    void                    set_on_disconnect(OnDisconnect cb) override;
    std::vector<IService *> discover_services() override;

    // Peer side drop (out of range, powered off, firmware reset).
    void drop_link();

    DeviceDescriptor    descriptor() const;
    int                 connect_count() const;
    int                 disconnect_count() const;  // host initiated only
    int                 mtu_requests() const;
    std::vector<Frame>  writes() const;            // every frame the host wrote
    bool                subscribed() const;

  private:
    friend class SimCharacteristic;

    struct Event
    {
        enum class Kind
        {
            Write,
            Disconnected
        };
        Kind          kind;
        Frame         frame;
        std::uint64_t epoch;
    };

    bool host_write(const Frame &frame);
    bool set_notify(OnFrame cb);
    void sever(bool host_initiated);
    void peer_loop();
    void handle_write(const Frame &frame, std::uint64_t epoch);
    void deliver(const Frame &frame, std::uint64_t epoch);
    bool pause(std::uint32_t ms);

    const SimLink &link_;
    SimPeerConfig  cfg_;

    SimService        service_;
    SimService        battery_;
    SimCharacteristic notify_chr_;
    SimCharacteristic write_chr_;

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Event>       q_;
    bool                    stop_{false};
    bool                    connected_{false};
    std::uint64_t           epoch_{0};
    OnFrame                 on_notify_;
    OnDisconnect            on_disconnect_;
    int                     connects_{0};
    int                     disconnects_{0};
    int                     mtu_requests_{0};
    int                     mtu_answers_{0};
    int                     frames_in_{0};
    bool                    dropped_once_{false};
    std::vector<Frame>      writes_;

    // peer thread only
    frag::Reassembler peer_rx_;
    std::uint64_t     peer_epoch_{0};

    std::thread worker_;
};

class SimLink final : public ILinkStack
{
  public:
    SimLink() = default;
    ~SimLink() override;

    SimDevice &add_peer(const SimPeerConfig &cfg);
    SimDevice *peer(const std::string &id);

    void set_powered(bool on);
    // Re-emits the advertisement of a known peer while a scan runs.
    void announce(const std::string &id);
    bool scanning() const;

    std::string  name() const override { return "sim"; }
    bool         powered() const override;
    void         set_on_availability(OnAvailability cb) override;
    bool         start_scan(const std::vector<std::string> &service_uuids, OnDevice on_device) override;
    void         stop_scan() override;
    IConnection *device(const DeviceDescriptor &desc) override;

  private:
    bool matches(const SimDevice &d) const;  // mu_ held

    mutable std::mutex                                mu_;
    bool                                              powered_{true};
    bool                                              scanning_{false};
    std::vector<std::string>                          scan_uuids_;
    OnDevice                                          on_device_;
    OnAvailability                                    on_availability_;
    std::map<std::string, std::unique_ptr<SimDevice>> peers_;
};

}  // namespace transport
