#include <chrono>
#include <optional>

#include "proto/frag.hpp"
#include "proto/mtu.hpp"
#include "session/session.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace session
{

using apdulink::Error;
using frame::Bytes;

namespace
{

void trace(const char *tag, const Bytes &b)
{
    if (apdulink::log_enabled(apdulink::Level::Debug))
        LOG_DEBUG("%s %s", tag, hex::encode(b).c_str());
}

}  // namespace

const char *state_name(State s)
{
    switch (s)
    {
        case State::Connecting:
            return "Connecting";
        case State::Negotiating:
            return "Negotiating";
        case State::Ready:
            return "Ready";
        case State::Exchanging:
            return "Exchanging";
        case State::Disconnected:
            return "Disconnected";
    }
    return "?";
}

Session::Session(transport::IConnection     &conn,
                 transport::ICharacteristic &write_chr,
                 transport::ICharacteristic &notify_chr)
    : conn_(conn),
      write_(write_chr),
      notify_(notify_chr),
      id_(conn.id()),
      rx_(std::make_shared<NotifyChannel>())
{
}

Session::~Session()
{
    bool unsub = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        unsub = subscribed_ && !link_lost_;
    }
    if (unsub)
        notify_.unsubscribe();
    rx_->close();
}

bool Session::subscribe()
{
    std::shared_ptr<NotifyChannel> ch = rx_;
    if (!notify_.subscribe([ch](const transport::Frame &raw) { ch->push(raw); }))
    {
        LOG_ERROR("[ble-error] %s: notification subscribe refused", id_.c_str());
        return false;
    }
    std::lock_guard<std::mutex> lk(mu_);
    subscribed_ = true;
    return true;
}

// ====== Function: negotiate ======
Error Session::negotiate(std::uint32_t timeout_ms)
{
    std::lock_guard<ExchangeLock> g(xlock_);
    if (!alive())
        return fail(Error::NegotiationFailed, "session already down");

    set_state(State::Negotiating);
    rx_->clear();

    const Bytes req = mtu::make_request();
    trace("[ble-frame-write]", req);
    if (!write_.write(req, true))
        return fail(Error::NegotiationFailed, "MTU request write failed");

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;)
    {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                              deadline - std::chrono::steady_clock::now())
                              .count();
        Bytes raw;
        if (left <= 0 || !rx_->pop(raw, static_cast<long>(left)))
            return fail(Error::NegotiationFailed, alive() ? "no MTU answer in time" : "link lost");

        trace("[ble-frame-read]", raw);
        if (!mtu::is_control(raw))
        {
            LOG_DEBUG("negotiate: skipping non-control frame");
            continue;
        }
        std::size_t announced = 0;
        if (!mtu::read_announced(raw, announced))
            return fail(Error::NegotiationFailed, "short MTU answer");

        {
            std::lock_guard<std::mutex> lk(mu_);
            budget_ = mtu::budget_from_announced(announced);
        }
        LOG_INFO("%s: device announced %zu, packet budget %zu", id_.c_str(), announced,
                 packet_budget());
        set_state(State::Ready);
        return Error::Ok;
    }
}

// ====== Function: exchange ======
Error Session::exchange(const Bytes &apdu, Bytes &response)
{
    response.clear();
    std::lock_guard<ExchangeLock> g(xlock_);
    if (!alive())
        return Error::DeviceDisconnected;

    std::vector<Bytes> frames;
    Error              e = frag::make_frames(apdu, packet_budget(), frames);
    if (e != Error::Ok)
        return e;  // refused before touching the link

    set_state(State::Exchanging);
    rx_->clear();
    trace("[ble-apdu-write]", apdu);

    for (const auto &f : frames)
    {
        trace("[ble-frame-write]", f);
        if (!write_.write(f, true))
        {
            const bool gone = !alive() || !conn_.connected();
            return fail(gone ? Error::DeviceDisconnected : Error::WriteFailed, "frame write failed");
        }
    }

    frag::Reassembler    rx;
    std::optional<Bytes> done;
    while (!done)
    {
        Bytes raw;
        if (!rx_->pop(raw, -1))
            return fail(Error::DeviceDisconnected, "link lost while waiting for response");
        trace("[ble-frame-read]", raw);
        e = rx.feed(raw, done);
        if (e != Error::Ok)
            return fail(e, "bad response frame");
    }

    response = std::move(*done);
    trace("[ble-apdu-read]", response);
    set_state(State::Ready);
    return Error::Ok;
}

Error Session::fail(Error e, const char *what)
{
    LOG_ERROR("[ble-error] %s: %s (%s)", id_.c_str(), what, apdulink::error_name(e));
    force_disconnect();
    // the stream is out of step even if the link stack never reports the drop
    on_link_lost();
    return e;
}

// ====== Function: close ======
void Session::close()
{
    std::lock_guard<ExchangeLock> g(xlock_);
    bool                          unsub = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!alive_)
            return;
        alive_      = false;
        state_      = State::Disconnected;
        unsub       = subscribed_;
        subscribed_ = false;
    }
    if (unsub)
        notify_.unsubscribe();
    rx_->close();
    run_teardown();
    LOG_INFO("%s: session closed", id_.c_str());
}

void Session::on_link_lost()
{
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (link_lost_)
            return;
        link_lost_  = true;
        alive_      = false;
        subscribed_ = false;
        state_      = State::Disconnected;
        listeners.swap(listeners_);
    }
    LOG_INFO("%s: link lost", id_.c_str());
    rx_->close();
    run_teardown();
    {
        std::lock_guard<std::mutex> lk(mu_);
        down_ = true;
    }
    down_cv_.notify_all();
    for (auto &l : listeners)
        l();
}

void Session::force_disconnect()
{
    if (disconnecting_.exchange(true))
        return;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (link_lost_)
            return;
    }
    LOG_WARN("[ble-error] %s: forcing disconnect", id_.c_str());
    conn_.disconnect();
}

bool Session::wait_disconnected(std::uint32_t timeout_ms)
{
    std::unique_lock<std::mutex> lk(mu_);
    return down_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return down_; });
}

void Session::on_disconnect(Listener l)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!link_lost_)
        listeners_.push_back(std::move(l));
}

void Session::set_teardown_hook(TeardownHook h)
{
    std::lock_guard<std::mutex> lk(mu_);
    teardown_hook_ = std::move(h);
}

std::size_t Session::packet_budget() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return budget_;
}

bool Session::alive() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return alive_;
}

State Session::state() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

void Session::set_state(State s)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == State::Disconnected)
        return;
    LOG_DEBUG("%s: %s -> %s", id_.c_str(), state_name(state_), state_name(s));
    state_ = s;
}

void Session::run_teardown()
{
    TeardownHook hook;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (torn_down_)
            return;
        torn_down_     = true;
        hook           = std::move(teardown_hook_);
        teardown_hook_ = nullptr;
    }
    if (hook)
        hook(*this);
}

}  // namespace session
