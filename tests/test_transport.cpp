// tests/test_transport.cpp
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "app/apdu_transport.hpp"
#include "transport/sim_link.hpp"

using apdulink::Error;
using frame::Bytes;

namespace
{

app::TransportConfig fast_config()
{
    app::TransportConfig cfg;
    cfg.negotiate_timeout_ms = 2000;
    cfg.settle_delay_ms      = 50;
    cfg.teardown_wait_ms     = 1000;
    return cfg;
}

struct Seen
{
    std::mutex               mu;
    std::vector<std::string> ids;

    transport::OnDevice sink()
    {
        return [this](const transport::DeviceDescriptor &d) {
            std::lock_guard<std::mutex> lk(mu);
            ids.push_back(d.id);
        };
    }
    std::vector<std::string> snapshot()
    {
        std::lock_guard<std::mutex> lk(mu);
        return ids;
    }
};

transport::SimPeerConfig named(const std::string &id, const std::string &name)
{
    transport::SimPeerConfig p;
    p.id   = id;
    p.name = name;
    return p;
}

}  // namespace

TEST(Transport, OpenNegotiatesAndExchanges)
{
    transport::SimLink  link;
    auto               &dev = link.add_peer(transport::SimPeerConfig{});
    app::ApduTransport  t(link, fast_config());
    session::SessionPtr s;

    ASSERT_EQ(t.open(dev.descriptor(), s), Error::Ok);
    ASSERT_TRUE(s);
    EXPECT_EQ(s->packet_budget(), 155u);

    Bytes resp;
    ASSERT_EQ(s->exchange(Bytes{0xE0, 0x01, 0x00, 0x00, 0x00}, resp), Error::Ok);
    EXPECT_EQ(resp, (Bytes{0xE0, 0x01, 0x00, 0x00, 0x00, 0x90, 0x00}));
}

TEST(Transport, ReusesLiveSession)
{
    transport::SimLink  link;
    auto               &dev = link.add_peer(transport::SimPeerConfig{});
    app::ApduTransport  t(link, fast_config());
    session::SessionPtr a, b, c;

    ASSERT_EQ(t.open(dev.descriptor(), a), Error::Ok);
    ASSERT_EQ(t.open(dev.descriptor(), b), Error::Ok);
    ASSERT_EQ(t.open(std::string("SIM-0001"), c), Error::Ok);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
    EXPECT_EQ(dev.connect_count(), 1);
    EXPECT_EQ(dev.mtu_requests(), 1);
}

TEST(Transport, OpenByUnknownIdIsDisconnected)
{
    transport::SimLink  link;
    app::ApduTransport  t(link, fast_config());
    session::SessionPtr s;
    EXPECT_EQ(t.open(std::string("NOPE"), s), Error::DeviceDisconnected);
    EXPECT_FALSE(s);
}

TEST(Transport, SlowFirstMtuAnswerReconnectsOnce)
{
    transport::SimPeerConfig cfg;
    cfg.first_mtu_delay_ms = 700;
    transport::SimLink  link;
    auto               &dev = link.add_peer(cfg);
    app::ApduTransport  t(link, fast_config());
    session::SessionPtr s;

    ASSERT_EQ(t.open(dev.descriptor(), s), Error::Ok);
    EXPECT_EQ(dev.connect_count(), 2);
    EXPECT_EQ(dev.disconnect_count(), 1);
    EXPECT_EQ(dev.mtu_requests(), 2);
    EXPECT_EQ(t.registry().size(), 1u);
    EXPECT_EQ(t.registry().get("SIM-0001"), s);

    Bytes resp;
    ASSERT_EQ(s->exchange(Bytes{0xB0, 0x01}, resp), Error::Ok);
    EXPECT_EQ(resp, (Bytes{0xB0, 0x01, 0x90, 0x00}));
}

TEST(Transport, QuickMtuAnswerKeepsFirstLink)
{
    transport::SimPeerConfig cfg;
    cfg.first_mtu_delay_ms = 200;
    transport::SimLink  link;
    auto               &dev = link.add_peer(cfg);
    app::ApduTransport  t(link, fast_config());
    session::SessionPtr s;

    ASSERT_EQ(t.open(dev.descriptor(), s), Error::Ok);
    EXPECT_EQ(dev.connect_count(), 1);
    EXPECT_EQ(dev.disconnect_count(), 0);
    EXPECT_EQ(dev.mtu_requests(), 1);
}

TEST(Transport, NegotiationFailureLeavesNoSession)
{
    transport::SimPeerConfig cfg;
    cfg.answer_mtu = false;
    transport::SimLink   link;
    auto                &dev = link.add_peer(cfg);
    app::TransportConfig tc  = fast_config();
    tc.negotiate_timeout_ms  = 200;
    app::ApduTransport  t(link, tc);
    session::SessionPtr s;

    EXPECT_EQ(t.open(dev.descriptor(), s), Error::NegotiationFailed);
    EXPECT_FALSE(s);
    EXPECT_EQ(dev.disconnect_count(), 1);
    EXPECT_EQ(t.registry().size(), 0u);
}

TEST(Transport, NegotiationFailureLeavesNoSessionWhenDisconnectIsRefused)
{
    transport::SimPeerConfig cfg;
    cfg.answer_mtu        = false;
    cfg.refuse_disconnect = true;
    transport::SimLink   link;
    auto                &dev = link.add_peer(cfg);
    app::TransportConfig tc  = fast_config();
    tc.negotiate_timeout_ms  = 100;
    tc.teardown_wait_ms      = 100;
    app::ApduTransport  t(link, tc);
    session::SessionPtr s;

    EXPECT_EQ(t.open(dev.descriptor(), s), Error::NegotiationFailed);
    EXPECT_FALSE(s);
    EXPECT_TRUE(dev.connected());
    EXPECT_EQ(t.registry().size(), 0u);
    EXPECT_EQ(t.open(std::string("SIM-0001"), s), Error::DeviceDisconnected);

    // the half-open link is not handed out as a session
    EXPECT_EQ(t.open(dev.descriptor(), s), Error::NegotiationFailed);
    EXPECT_FALSE(s);
    EXPECT_EQ(t.registry().size(), 0u);
    EXPECT_EQ(dev.disconnect_count(), 2);
}

TEST(Transport, DisconnectDropsSessionEvenIfLinkStaysUp)
{
    transport::SimPeerConfig cfg;
    cfg.refuse_disconnect = true;
    transport::SimLink   link;
    auto                &dev = link.add_peer(cfg);
    app::TransportConfig tc  = fast_config();
    tc.teardown_wait_ms      = 100;
    app::ApduTransport  t(link, tc);
    session::SessionPtr s;
    ASSERT_EQ(t.open(dev.descriptor(), s), Error::Ok);

    EXPECT_EQ(t.disconnect("SIM-0001"), Error::Ok);
    EXPECT_FALSE(s->alive());
    EXPECT_EQ(t.registry().size(), 0u);
    session::SessionPtr again;
    EXPECT_EQ(t.open(std::string("SIM-0001"), again), Error::DeviceDisconnected);
}

TEST(Transport, DisconnectThenLookupFails)
{
    transport::SimLink  link;
    auto               &dev = link.add_peer(transport::SimPeerConfig{});
    app::ApduTransport  t(link, fast_config());
    session::SessionPtr s;
    ASSERT_EQ(t.open(dev.descriptor(), s), Error::Ok);

    EXPECT_EQ(t.disconnect("SIM-0001"), Error::Ok);
    EXPECT_FALSE(s->alive());
    EXPECT_EQ(t.registry().size(), 0u);
    EXPECT_EQ(dev.disconnect_count(), 1);

    session::SessionPtr again;
    EXPECT_EQ(t.open(std::string("SIM-0001"), again), Error::DeviceDisconnected);
    Bytes resp;
    EXPECT_EQ(s->exchange(Bytes{0x00}, resp), Error::DeviceDisconnected);
    EXPECT_EQ(t.disconnect("SIM-0001"), Error::DeviceDisconnected);

    // a fresh open builds a new session
    ASSERT_EQ(t.open(dev.descriptor(), again), Error::Ok);
    EXPECT_NE(again, s);
    EXPECT_EQ(dev.connect_count(), 2);
}

TEST(Transport, PeerDropRemovesSession)
{
    transport::SimLink  link;
    auto               &dev = link.add_peer(transport::SimPeerConfig{});
    app::ApduTransport  t(link, fast_config());
    session::SessionPtr s;
    ASSERT_EQ(t.open(dev.descriptor(), s), Error::Ok);

    dev.drop_link();
    ASSERT_TRUE(s->wait_disconnected(1000));
    session::SessionPtr again;
    EXPECT_EQ(t.open(std::string("SIM-0001"), again), Error::DeviceDisconnected);
    EXPECT_EQ(t.registry().size(), 0u);
}

TEST(Transport, ListenDedupesAndSkipsUnnamed)
{
    transport::SimLink link;
    (void)link.add_peer(named("AA", "Nano X 1A2B"));
    (void)link.add_peer(named("BB", ""));
    (void)link.add_peer(named("CC", "unknown"));
    auto other         = named("DD", "Other");
    other.service_uuid = "0000180d-0000-1000-8000-00805f9b34fb";
    (void)link.add_peer(other);

    app::ApduTransport              t(link, fast_config());
    Seen                            first;
    app::ApduTransport::ListenToken tok1 = 0;
    ASSERT_EQ(t.listen(first.sink(), tok1), Error::Ok);
    EXPECT_TRUE(link.scanning());

    link.announce("AA");
    link.announce("BB");
    (void)link.add_peer(named("EE", "Nano X 9F00"));
    link.announce("EE");

    EXPECT_EQ(first.snapshot(), (std::vector<std::string>{"AA", "EE"}));

    // a late listener gets what the running scan already found
    Seen                            second;
    app::ApduTransport::ListenToken tok2 = 0;
    ASSERT_EQ(t.listen(second.sink(), tok2), Error::Ok);
    EXPECT_EQ(second.snapshot(), (std::vector<std::string>{"AA", "EE"}));
    link.announce("AA");
    EXPECT_EQ(second.snapshot().size(), 2u);

    t.unlisten(tok1);
    EXPECT_TRUE(link.scanning());
    t.unlisten(tok2);
    EXPECT_FALSE(link.scanning());
}

TEST(Transport, CreateOpensFirstDevice)
{
    transport::SimLink  link;
    auto               &dev = link.add_peer(transport::SimPeerConfig{});
    app::ApduTransport  t(link, fast_config());
    session::SessionPtr s;

    ASSERT_EQ(t.create(1000, s), Error::Ok);
    ASSERT_TRUE(s);
    EXPECT_EQ(s->id(), dev.id());
    EXPECT_FALSE(link.scanning());
}

TEST(Transport, CreateCancelledOrTimedOut)
{
    transport::SimLink link;
    (void)link.add_peer(named("BB", ""));
    app::ApduTransport  t(link, fast_config());
    session::SessionPtr s;

    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(t.create(150, s), Error::UserCancelledOpen);
    EXPECT_GE(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(150));
    EXPECT_FALSE(link.scanning());

    std::atomic<bool> cancel{false};
    std::thread       canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.store(true);
    });
    EXPECT_EQ(t.create(10000, s, &cancel), Error::UserCancelledOpen);
    canceller.join();
    EXPECT_FALSE(s);
}

TEST(Transport, RadioOffIsNotReady)
{
    transport::SimLink  link;
    auto               &dev = link.add_peer(transport::SimPeerConfig{});
    app::ApduTransport  t(link, fast_config());

    std::mutex        mu;
    std::vector<bool> states;
    t.observe_availability([&](bool on) {
        std::lock_guard<std::mutex> lk(mu);
        states.push_back(on);
    });

    link.set_powered(false);
    EXPECT_FALSE(t.is_available());

    app::ApduTransport::ListenToken tok = 0;
    EXPECT_EQ(t.listen([](const transport::DeviceDescriptor &) {}, tok), Error::RadioNotReady);
    session::SessionPtr s;
    EXPECT_EQ(t.open(dev.descriptor(), s), Error::RadioNotReady);
    EXPECT_EQ(dev.connect_count(), 0);

    link.set_powered(true);
    EXPECT_TRUE(t.is_available());
    std::lock_guard<std::mutex> lk(mu);
    EXPECT_EQ(states, (std::vector<bool>{true, false, true}));
}

TEST(Transport, MissingServiceOrCharacteristic)
{
    transport::SimLink       link;
    transport::SimPeerConfig no_svc = named("AA", "Nano");
    no_svc.has_service              = false;
    transport::SimPeerConfig no_ntf = named("BB", "Nano");
    no_ntf.has_notify               = false;
    auto &a                         = link.add_peer(no_svc);
    auto &b                         = link.add_peer(no_ntf);

    app::ApduTransport  t(link, fast_config());
    session::SessionPtr s;
    EXPECT_EQ(t.open(a.descriptor(), s), Error::ServiceNotFound);
    EXPECT_EQ(t.open(b.descriptor(), s), Error::CharacteristicNotFound);
    EXPECT_TRUE(a.connected());
    EXPECT_TRUE(b.connected());
    EXPECT_EQ(t.registry().size(), 0u);
}
