#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "proto/frame.hpp"
#include "session/exchange_lock.hpp"
#include "session/notify_channel.hpp"
#include "transport/link.hpp"
#include "util/error.hpp"

namespace session
{

enum class State
{
    Connecting,
    Negotiating,
    Ready,
    Exchanging,
    Disconnected  // terminal
};

const char *state_name(State s);

/*
One connected device. The connection and its characteristics are borrowed from the
link stack; the session never outlives the controller that built it.

negotiate() and exchange() share one FIFO lock, so at most one runs at a time and
waiters go in arrival order. Notifications are pushed by the link thread into a
channel that only the lock holder drains.
*/
class Session
{
  public:
    using Listener     = std::function<void()>;
    using TeardownHook = std::function<void(Session &)>;

    Session(transport::IConnection     &conn,
            transport::ICharacteristic &write_chr,
            transport::ICharacteristic &notify_chr);
    ~Session();

    Session(const Session &)            = delete;
    Session &operator=(const Session &) = delete;

    const std::string &id() const { return id_; }

    // Routes notifications into the session; false when the link refused it.
    bool subscribe();

    // MTU handshake. Ok sets the packet budget; NegotiationFailed forces a disconnect
    // and leaves the session torn down.
    apdulink::Error negotiate(std::uint32_t timeout_ms);

    apdulink::Error exchange(const frame::Bytes &apdu, frame::Bytes &response);

    // Waits for queued exchanges, unsubscribes and leaves the link up.
    void close();

    // Link stack reports the device gone, or the session gave up on the link.
    // Safe to call more than once.
    void on_link_lost();

    // Severs the link once per session; later calls are no-ops.
    void force_disconnect();

    // True once on_link_lost() finished its teardown.
    bool wait_disconnected(std::uint32_t timeout_ms);

    // Runs once when the link drops (not on close()).
    void on_disconnect(Listener l);

    // Runs once, on close() or link loss, before listeners.
    void set_teardown_hook(TeardownHook h);

    std::size_t packet_budget() const;
    bool        alive() const;
    State       state() const;

  private:
    apdulink::Error fail(apdulink::Error e, const char *what);
    void            set_state(State s);
    void            run_teardown();

    transport::IConnection     &conn_;
    transport::ICharacteristic &write_;
    transport::ICharacteristic &notify_;
    const std::string           id_;

    ExchangeLock                   xlock_;
    std::shared_ptr<NotifyChannel> rx_;  // shared with the link callback

    mutable std::mutex      mu_;
    std::condition_variable down_cv_;
    State                   state_{State::Connecting};
    std::size_t             budget_{frame::DEFAULT_BUDGET};
    bool                    alive_{true};
    bool                    link_lost_{false};
    bool                    down_{false};
    bool                    torn_down_{false};
    bool                    subscribed_{false};
    std::vector<Listener>   listeners_;
    TeardownHook            teardown_hook_;
    std::atomic<bool>       disconnecting_{false};
};

}  // namespace session
