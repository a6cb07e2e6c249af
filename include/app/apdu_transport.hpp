#pragma once
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "session/registry.hpp"
#include "transport/link.hpp"
#include "util/constants.hpp"
#include "util/error.hpp"

namespace app
{

struct TransportConfig
{
    std::vector<std::string> service_uuids          = constants::service_uuids();
    std::uint32_t            negotiate_timeout_ms   = constants::NEGOTIATE_TIMEOUT_MS;
    std::uint32_t            reconnect_threshold_ms = constants::RECONNECT_THRESHOLD_MS;
    std::uint32_t            settle_delay_ms        = constants::RECONNECT_SETTLE_MS;
    std::uint32_t            teardown_wait_ms       = constants::TEARDOWN_WAIT_MS;
};

/*
Front door for callers: discovery, opening sessions and the reconnect workaround.

open(descriptor), one attempt:
  radio check -> connect -> find service + notify/write characteristics
  -> Session + subscribe -> register -> disconnect handler -> MTU handshake (timed)

A slow MTU answer on the first attempt means the device just finished pairing and
keeps a stale link; it is dropped and the sequence runs once more.
*/
class ApduTransport
{
  public:
    using ListenToken = std::uint64_t;

    explicit ApduTransport(transport::ILinkStack &link, TransportConfig cfg = TransportConfig{});
    ~ApduTransport();

    ApduTransport(const ApduTransport &)            = delete;
    ApduTransport &operator=(const ApduTransport &) = delete;

    bool is_available() const;
    void observe_availability(transport::OnAvailability cb);

    // Each listener sees a device id once; unnamed devices are skipped.
    apdulink::Error listen(transport::OnDevice on_add, ListenToken &token);
    void            unlisten(ListenToken token);

    // Live session for `id`, else DeviceDisconnected.
    apdulink::Error open(const std::string &id, session::SessionPtr &out);
    apdulink::Error open(const transport::DeviceDescriptor &desc, session::SessionPtr &out);

    // Listens and opens the first device seen. UserCancelledOpen on timeout or `cancel`.
    apdulink::Error create(std::uint32_t timeout_ms, session::SessionPtr &out,
                           const std::atomic<bool> *cancel = nullptr);

    // Forces the link of a live session down.
    apdulink::Error disconnect(const std::string &id);

    session::Registry &registry() { return registry_; }

  private:
    struct Listener
    {
        transport::OnDevice   on_add;
        std::set<std::string> seen;
    };

    void            on_device(const transport::DeviceDescriptor &d);
    void            on_availability(bool powered);
    apdulink::Error open_once(transport::IConnection &conn, session::SessionPtr &out,
                              std::uint32_t &mtu_ms);
    bool            known_service(const std::string &uuid) const;

    transport::ILinkStack &link_;
    TransportConfig        cfg_;
    session::Registry      registry_;

    std::mutex open_mu_;  // one open at a time

    std::mutex                                        listen_mu_;
    std::map<ListenToken, Listener>                   listeners_;
    std::map<std::string, transport::DeviceDescriptor> seen_;  // current scan only
    ListenToken                                       next_token_{1};
    bool                                              scanning_{false};

    std::mutex                             avail_mu_;
    std::vector<transport::OnAvailability> observers_;
};

}  // namespace app
