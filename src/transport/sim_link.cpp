#include <algorithm>
#include <chrono>

#include "proto/mtu.hpp"
#include "transport/sim_link.hpp"
#include "util/log.hpp"

namespace transport
{

// ====== Characteristic ======
bool SimCharacteristic::write(const Frame &frame, bool /*with_response*/)
{
    if (!writable_)
        return false;
    return dev_.host_write(frame);
}

bool SimCharacteristic::subscribe(OnFrame on_notify)
{
    if (!notifiable_)
        return false;
    return dev_.set_notify(std::move(on_notify));
}

void SimCharacteristic::unsubscribe()
{
    if (notifiable_)
        (void)dev_.set_notify(nullptr);
}

// ====== Device ======
SimDevice::SimDevice(const SimLink &link, SimPeerConfig cfg)
    : link_(link),
      cfg_(std::move(cfg)),
      service_(cfg_.service_uuid),
      battery_("0000180f-0000-1000-8000-00805f9b34fb"),
      notify_chr_(*this, std::string(constants::NANO_X_NOTIFY_UUID), false, true),
      write_chr_(*this, std::string(constants::NANO_X_WRITE_UUID), true, false)
{
    if (cfg_.has_notify)
        service_.add(&notify_chr_);
    if (cfg_.has_write)
        service_.add(&write_chr_);
    worker_ = std::thread([this] { peer_loop(); });
}

SimDevice::~SimDevice()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
        q_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

bool SimDevice::connected() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return connected_;
}

bool SimDevice::connect()
{
    if (!link_.powered())
    {
        LOG_WARN("SimDevice::connect: radio off");
        return false;
    }
    std::lock_guard<std::mutex> lk(mu_);
    if (connected_)
        return true;
    connected_ = true;
    ++connects_;
    ++epoch_;
    LOG_INFO("SimDevice: %s connected (#%d)", cfg_.id.c_str(), connects_);
    return true;
}

void SimDevice::disconnect()
{
    if (cfg_.refuse_disconnect)
    {
        std::lock_guard<std::mutex> lk(mu_);
        ++disconnects_;
        LOG_WARN("SimDevice: %s refused the disconnect request", cfg_.id.c_str());
        return;
    }
    sever(true);
}

void SimDevice::drop_link()
{
    sever(false);
}

void SimDevice::set_on_disconnect(OnDisconnect cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_disconnect_ = std::move(cb);
}

std::vector<IService *> SimDevice::discover_services()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!connected_)
        return {};
    std::vector<IService *> out{&battery_};
    if (cfg_.has_service)
        out.push_back(&service_);
    return out;
}

DeviceDescriptor SimDevice::descriptor() const
{
    return DeviceDescriptor{cfg_.id, cfg_.name, cfg_.service_uuid};
}

int SimDevice::connect_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return connects_;
}

int SimDevice::disconnect_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return disconnects_;
}

int SimDevice::mtu_requests() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return mtu_requests_;
}

std::vector<Frame> SimDevice::writes() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return writes_;
}

bool SimDevice::subscribed() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return static_cast<bool>(on_notify_);
}

bool SimDevice::host_write(const Frame &frame)
{
    bool drop = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_)
        {
            LOG_WARN("SimDevice::write: %s not connected", cfg_.id.c_str());
            return false;
        }
        if (cfg_.fail_writes)
        {
            LOG_WARN("SimDevice::write: scripted write failure");
            return false;
        }
        writes_.push_back(frame);
        ++frames_in_;
        q_.push_back(Event{Event::Kind::Write, frame, epoch_});
        if (!dropped_once_ && cfg_.drop_after_frames >= 0 && frames_in_ >= cfg_.drop_after_frames)
        {
            dropped_once_ = true;
            drop          = true;
        }
    }
    cv_.notify_all();

    if (cfg_.write_ack_delay_ms)
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.write_ack_delay_ms));
    if (drop)
        drop_link();
    return true;
}

bool SimDevice::set_notify(OnFrame cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (cb && !connected_)
        return false;
    on_notify_ = std::move(cb);
    return true;
}

void SimDevice::sever(bool host_initiated)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_)
            return;
        connected_ = false;
        if (host_initiated)
            ++disconnects_;
        on_notify_ = nullptr;
        q_.clear();
        q_.push_back(Event{Event::Kind::Disconnected, {}, epoch_});
        LOG_INFO("SimDevice: %s disconnected (%s)", cfg_.id.c_str(),
                 host_initiated ? "host" : "peer");
    }
    cv_.notify_all();
}

// ====== Function: peer_loop ======
// Peer worker: one event at a time, callbacks always outside mu_.
void SimDevice::peer_loop()
{
    for (;;)
    {
        Event ev;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
            if (stop_)
                return;
            ev = std::move(q_.front());
            q_.pop_front();
        }

        if (ev.kind == Event::Kind::Disconnected)
        {
            OnDisconnect cb;
            {
                std::lock_guard<std::mutex> lk(mu_);
                cb = on_disconnect_;
            }
            if (cb)
                cb();
            continue;
        }
        handle_write(ev.frame, ev.epoch);
    }
}

void SimDevice::handle_write(const Frame &frame, std::uint64_t epoch)
{
    if (epoch != peer_epoch_)
    {
        peer_rx_.reset();
        peer_epoch_ = epoch;
    }

    if (mtu::is_control(frame))
    {
        std::uint32_t delay = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ++mtu_requests_;
            delay = mtu_answers_ == 0 ? cfg_.first_mtu_delay_ms : cfg_.mtu_delay_ms;
        }
        if (!cfg_.answer_mtu)
            return;
        if (!pause(delay))
            return;
        {
            std::lock_guard<std::mutex> lk(mu_);
            ++mtu_answers_;
        }
        deliver(mtu::make_answer(cfg_.announced_mtu), epoch);
        return;
    }

    std::optional<Frame> request;
    apdulink::Error      e = peer_rx_.feed(frame, request);
    if (e != apdulink::Error::Ok)
    {
        LOG_WARN("SimDevice: peer dropped bad frame (%s)", apdulink::error_name(e));
        return;
    }
    if (!request)
        return;

    if (!pause(cfg_.response_delay_ms))
        return;

    std::vector<Frame> out;
    if (cfg_.raw_responder)
    {
        out = cfg_.raw_responder(*request);
    }
    else
    {
        Frame response;
        if (cfg_.responder)
        {
            response = cfg_.responder(*request);
        }
        else
        {
            response = *request;
            response.push_back(0x90);
            response.push_back(0x00);
        }
        e = frag::make_frames(response, mtu::budget_from_announced(cfg_.announced_mtu), out);
        if (e != apdulink::Error::Ok)
        {
            LOG_WARN("SimDevice: response not sent (%s)", apdulink::error_name(e));
            return;
        }
    }
    for (const auto &f : out)
        deliver(f, epoch);
}

void SimDevice::deliver(const Frame &frame, std::uint64_t epoch)
{
    OnFrame cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connected_ || epoch != epoch_)
            return;
        cb = on_notify_;
    }
    if (cb)
        cb(frame);
}

// False when the peer is shutting down.
bool SimDevice::pause(std::uint32_t ms)
{
    if (ms == 0)
        return true;
    std::unique_lock<std::mutex> lk(mu_);
    return !cv_.wait_for(lk, std::chrono::milliseconds(ms), [&] { return stop_; });
}

// ====== Link ======
SimLink::~SimLink()
{
    std::map<std::string, std::unique_ptr<SimDevice>> peers;
    {
        std::lock_guard<std::mutex> lk(mu_);
        peers.swap(peers_);
    }
    peers.clear();
}

SimDevice &SimLink::add_peer(const SimPeerConfig &cfg)
{
    OnDevice         cb;
    DeviceDescriptor desc;
    SimDevice       *dev = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto &slot = peers_[cfg.id];
        slot       = std::make_unique<SimDevice>(*this, cfg);
        dev        = slot.get();
        if (scanning_ && matches(*dev))
        {
            cb   = on_device_;
            desc = dev->descriptor();
        }
    }
    if (cb)
        cb(desc);
    return *dev;
}

SimDevice *SimLink::peer(const std::string &id)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = peers_.find(id);
    return it == peers_.end() ? nullptr : it->second.get();
}

void SimLink::set_powered(bool on)
{
    OnAvailability           cb;
    std::vector<SimDevice *> devs;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (powered_ == on)
            return;
        powered_ = on;
        cb       = on_availability_;
        if (!on)
        {
            for (auto &kv : peers_)
                devs.push_back(kv.second.get());
        }
    }
    for (auto *d : devs)
        d->drop_link();
    if (cb)
        cb(on);
}

void SimLink::announce(const std::string &id)
{
    OnDevice         cb;
    DeviceDescriptor desc;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = peers_.find(id);
        if (!scanning_ || it == peers_.end() || !matches(*it->second))
            return;
        cb   = on_device_;
        desc = it->second->descriptor();
    }
    if (cb)
        cb(desc);
}

bool SimLink::scanning() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return scanning_;
}

bool SimLink::powered() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return powered_;
}

void SimLink::set_on_availability(OnAvailability cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_availability_ = std::move(cb);
}

bool SimLink::start_scan(const std::vector<std::string> &service_uuids, OnDevice on_device)
{
    std::vector<DeviceDescriptor> found;
    OnDevice                      cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!powered_)
            return false;
        scanning_   = true;
        scan_uuids_ = service_uuids;
        on_device_  = std::move(on_device);
        cb          = on_device_;
        for (auto &kv : peers_)
        {
            if (matches(*kv.second))
                found.push_back(kv.second->descriptor());
        }
    }
    if (cb)
    {
        for (const auto &d : found)
            cb(d);
    }
    return true;
}

void SimLink::stop_scan()
{
    std::lock_guard<std::mutex> lk(mu_);
    scanning_  = false;
    on_device_ = nullptr;
}

IConnection *SimLink::device(const DeviceDescriptor &desc)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto it = peers_.find(desc.id);
    return it == peers_.end() ? nullptr : it->second.get();
}

bool SimLink::matches(const SimDevice &d) const
{
    if (scan_uuids_.empty())
        return true;
    const std::string svc = d.descriptor().service_uuid;
    return std::find(scan_uuids_.begin(), scan_uuids_.end(), svc) != scan_uuids_.end();
}

}  // namespace transport
