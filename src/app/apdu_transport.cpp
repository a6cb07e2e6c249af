#include <cctype>
#include <chrono>
#include <condition_variable>
#include <optional>
#include <thread>

#include "app/apdu_transport.hpp"
#include "util/log.hpp"

namespace app
{

using apdulink::Error;
using session::Session;
using session::SessionPtr;

ApduTransport::ApduTransport(transport::ILinkStack &link, TransportConfig cfg)
    : link_(link), cfg_(std::move(cfg))
{
    link_.set_on_availability([this](bool powered) { on_availability(powered); });
}

ApduTransport::~ApduTransport()
{
    link_.set_on_availability(nullptr);

    bool stop = false;
    {
        std::lock_guard<std::mutex> lk(listen_mu_);
        stop      = scanning_;
        scanning_ = false;
        listeners_.clear();
        seen_.clear();
    }
    if (stop)
        link_.stop_scan();

    for (auto &s : registry_.all())
        s->close();
}

bool ApduTransport::is_available() const
{
    return link_.powered();
}

void ApduTransport::observe_availability(transport::OnAvailability cb)
{
    const bool now = link_.powered();
    {
        std::lock_guard<std::mutex> lk(avail_mu_);
        observers_.push_back(cb);
    }
    cb(now);  // current state first, then changes
}

void ApduTransport::on_availability(bool powered)
{
    LOG_INFO("%s radio %s", link_.name().c_str(), powered ? "powered on" : "powered off");
    std::vector<transport::OnAvailability> obs;
    {
        std::lock_guard<std::mutex> lk(avail_mu_);
        obs = observers_;
    }
    for (auto &cb : obs)
        cb(powered);
}

// ====== Function: listen ======
Error ApduTransport::listen(transport::OnDevice on_add, ListenToken &token)
{
    if (!link_.powered())
    {
        LOG_WARN("listen: %s radio not ready", link_.name().c_str());
        return Error::RadioNotReady;
    }

    bool                                     start = false;
    std::vector<transport::DeviceDescriptor> replay;
    transport::OnDevice                      cb;
    {
        std::lock_guard<std::mutex> lk(listen_mu_);
        token       = next_token_++;
        Listener &l = listeners_[token];
        l.on_add    = std::move(on_add);
        if (!scanning_)
        {
            scanning_ = true;
            start     = true;
        }
        else
        {
            // joining a running scan: hand over what it already found
            for (const auto &kv : seen_)
            {
                l.seen.insert(kv.first);
                replay.push_back(kv.second);
            }
            cb = l.on_add;
        }
    }

    if (start)
    {
        LOG_INFO("listen: scanning for %zu service uuid(s)", cfg_.service_uuids.size());
        if (!link_.start_scan(cfg_.service_uuids,
                              [this](const transport::DeviceDescriptor &d) { on_device(d); }))
        {
            std::lock_guard<std::mutex> lk(listen_mu_);
            listeners_.erase(token);
            scanning_ = false;
            LOG_ERROR("listen: scan could not start");
            return Error::RadioNotReady;
        }
    }
    for (const auto &d : replay)
        cb(d);
    return Error::Ok;
}

void ApduTransport::unlisten(ListenToken token)
{
    bool stop = false;
    {
        std::lock_guard<std::mutex> lk(listen_mu_);
        listeners_.erase(token);
        if (listeners_.empty() && scanning_)
        {
            scanning_ = false;
            seen_.clear();
            stop = true;
        }
    }
    if (stop)
    {
        LOG_INFO("listen: last listener gone, scan stopped");
        link_.stop_scan();
    }
}

void ApduTransport::on_device(const transport::DeviceDescriptor &d)
{
    if (d.name.empty() || d.name == "unknown")
    {
        LOG_DEBUG("listen: skipping unnamed device %s", d.id.c_str());
        return;
    }

    std::vector<transport::OnDevice> targets;
    {
        std::lock_guard<std::mutex> lk(listen_mu_);
        if (!scanning_)
            return;
        seen_[d.id] = d;
        for (auto &kv : listeners_)
        {
            if (kv.second.seen.insert(d.id).second)
                targets.push_back(kv.second.on_add);
        }
    }
    for (auto &cb : targets)
        cb(d);
}

// ====== Function: open ======
Error ApduTransport::open(const std::string &id, SessionPtr &out)
{
    out = registry_.get(id);
    if (!out)
    {
        LOG_WARN("open: no live session for %s", id.c_str());
        return Error::DeviceDisconnected;
    }
    return Error::Ok;
}

Error ApduTransport::open(const transport::DeviceDescriptor &desc, SessionPtr &out)
{
    std::lock_guard<std::mutex> g(open_mu_);

    out = registry_.get(desc.id);
    if (out)
        return Error::Ok;

    transport::IConnection *conn = link_.device(desc);
    if (!conn)
    {
        LOG_ERROR("open: %s unknown to %s", desc.id.c_str(), link_.name().c_str());
        return link_.powered() ? Error::DeviceDisconnected : Error::RadioNotReady;
    }

    for (int attempt = 1; attempt <= 2; ++attempt)
    {
        SessionPtr    s;
        std::uint32_t mtu_ms = 0;
        Error         e      = open_once(*conn, s, mtu_ms);
        if (e != Error::Ok)
            return e;

        if (attempt == 1 && mtu_ms > cfg_.reconnect_threshold_ms)
        {
            // fresh pairing: the first link is unusable until dropped once
            LOG_INFO("open: MTU answer took %u ms, reconnecting %s", mtu_ms, desc.id.c_str());
            s->force_disconnect();
            if (!s->wait_disconnected(cfg_.teardown_wait_ms))
            {
                LOG_WARN("open: teardown of %s not seen in %u ms", desc.id.c_str(),
                         cfg_.teardown_wait_ms);
                s->on_link_lost();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.settle_delay_ms));
            continue;
        }

        LOG_INFO("open: %s ready (budget %zu, MTU in %u ms)", desc.id.c_str(), s->packet_budget(),
                 mtu_ms);
        out = std::move(s);
        return Error::Ok;
    }
    return Error::DeviceDisconnected;
}

Error ApduTransport::open_once(transport::IConnection &conn, SessionPtr &out, std::uint32_t &mtu_ms)
{
    if (!link_.powered())
    {
        LOG_ERROR("open: radio not ready");
        return Error::RadioNotReady;
    }
    if (!conn.connected() && !conn.connect())
    {
        LOG_ERROR("open: connect to %s failed", conn.id().c_str());
        return link_.powered() ? Error::DeviceDisconnected : Error::RadioNotReady;
    }

    transport::ICharacteristic *notify_chr = nullptr;
    transport::ICharacteristic *write_chr  = nullptr;
    bool                        service    = false;
    for (transport::IService *svc : conn.discover_services())
    {
        if (!known_service(svc->uuid()))
            continue;
        service = true;
        for (transport::ICharacteristic *c : svc->characteristics())
        {
            if (!notify_chr && c->can_notify())
                notify_chr = c;
            if (!write_chr && c->can_write())
                write_chr = c;
        }
        break;
    }
    if (!service)
    {
        LOG_ERROR("open: %s exposes no known service", conn.id().c_str());
        return conn.connected() ? Error::ServiceNotFound : Error::DeviceDisconnected;
    }
    if (!notify_chr || !write_chr)
    {
        LOG_ERROR("open: %s lacks a %s characteristic", conn.id().c_str(),
                  notify_chr ? "write" : "notify");
        return Error::CharacteristicNotFound;
    }

    auto s = std::make_shared<Session>(conn, *write_chr, *notify_chr);
    if (!s->subscribe())
        return conn.connected() ? Error::CharacteristicNotFound : Error::DeviceDisconnected;

    if (!registry_.put(s))
    {
        s->close();
        return Error::DeviceDisconnected;
    }

    transport::IConnection *c = &conn;
    s->set_teardown_hook([this, c](Session &dead) {
        if (registry_.remove(dead.id(), &dead))
            c->set_on_disconnect(nullptr);
    });
    std::weak_ptr<Session> weak = s;
    conn.set_on_disconnect([weak] {
        if (auto live = weak.lock())
            live->on_link_lost();
    });
    if (!conn.connected())
        s->on_link_lost();  // dropped before the handler was in place

    const auto t0 = std::chrono::steady_clock::now();
    Error      e  = s->negotiate(cfg_.negotiate_timeout_ms);
    mtu_ms        = static_cast<std::uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0)
            .count());
    if (e != Error::Ok)
        return e;  // session already torn down and unregistered
    out = std::move(s);
    return Error::Ok;
}

// ====== Function: create ======
Error ApduTransport::create(std::uint32_t timeout_ms, SessionPtr &out, const std::atomic<bool> *cancel)
{
    struct Pending
    {
        std::mutex                                 mu;
        std::condition_variable                    cv;
        std::optional<transport::DeviceDescriptor> first;
    };
    auto pending = std::make_shared<Pending>();

    ListenToken token = 0;
    Error       e     = listen(
        [pending](const transport::DeviceDescriptor &d) {
            {
                std::lock_guard<std::mutex> lk(pending->mu);
                if (!pending->first)
                    pending->first = d;
            }
            pending->cv.notify_all();
        },
        token);
    if (e != Error::Ok)
        return e;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::optional<transport::DeviceDescriptor> found;
    {
        std::unique_lock<std::mutex> lk(pending->mu);
        while (!pending->first)
        {
            if (cancel && cancel->load())
                break;
            if (std::chrono::steady_clock::now() >= deadline)
                break;
            pending->cv.wait_for(lk, std::chrono::milliseconds(50));
        }
        found = pending->first;
    }
    unlisten(token);

    if (!found)
    {
        LOG_WARN("create: no device selected");
        return Error::UserCancelledOpen;
    }
    return open(*found, out);
}

Error ApduTransport::disconnect(const std::string &id)
{
    SessionPtr s = registry_.get(id);
    if (!s)
        return Error::DeviceDisconnected;
    LOG_INFO("disconnect: user request for %s", id.c_str());
    s->force_disconnect();
    if (!s->wait_disconnected(cfg_.teardown_wait_ms))
    {
        LOG_WARN("disconnect: %s still up after %u ms, dropping the session", id.c_str(),
                 cfg_.teardown_wait_ms);
        s->on_link_lost();
    }
    return Error::Ok;
}

bool ApduTransport::known_service(const std::string &uuid) const
{
    auto lower = [](std::string s) {
        for (auto &c : s)
            c = (char)std::tolower((unsigned char)c);
        return s;
    };
    const std::string want = lower(uuid);
    for (const auto &u : cfg_.service_uuids)
    {
        if (lower(u) == want)
            return true;
    }
    return false;
}

}  // namespace app
