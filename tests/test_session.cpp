// tests/test_session.cpp
#include <atomic>
#include <chrono>
#include <cstdint>
#include <gtest/gtest.h>
#include <optional>
#include <thread>
#include <vector>

#include "proto/frag.hpp"
#include "proto/mtu.hpp"
#include "sim_rig.hpp"

using apdulink::Error;
using frame::Bytes;
using session::State;

static Bytes pattern(std::size_t n, std::uint8_t seed)
{
    Bytes v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>(seed + i);
    return v;
}

static Bytes with_ok(Bytes b)
{
    b.push_back(0x90);
    b.push_back(0x00);
    return b;
}

// Polls until the peer has seen `n` host writes.
static bool wait_writes(const transport::SimDevice &dev, std::size_t n)
{
    for (int i = 0; i < 200; ++i)
    {
        if (dev.writes().size() >= n)
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

// Messages the host wrote, in wire order, MTU requests skipped.
static std::vector<Bytes> written_messages(const transport::SimDevice &dev)
{
    std::vector<Bytes> out;
    frag::Reassembler  r;
    for (const auto &f : dev.writes())
    {
        if (mtu::is_control(f))
            continue;
        std::optional<Bytes> done;
        if (r.feed(f, done) != Error::Ok)
            return {};
        if (done)
            out.push_back(*done);
    }
    return out;
}

TEST(Session, NegotiateSetsBudget)
{
    SimRig rig;
    auto   s = rig.make_session();
    ASSERT_TRUE(s);
    EXPECT_EQ(s->state(), State::Connecting);
    EXPECT_EQ(s->packet_budget(), frame::DEFAULT_BUDGET);

    ASSERT_EQ(s->negotiate(1000), Error::Ok);
    EXPECT_EQ(s->packet_budget(), 155u);
    EXPECT_EQ(s->state(), State::Ready);
    EXPECT_EQ(rig.dev->mtu_requests(), 1);
    ASSERT_FALSE(rig.dev->writes().empty());
    EXPECT_EQ(rig.dev->writes()[0], mtu::make_request());
}

TEST(Session, SilentPeerFailsNegotiationWithOneDisconnect)
{
    transport::SimPeerConfig cfg;
    cfg.answer_mtu = false;
    SimRig rig(cfg);
    auto   s = rig.make_session();
    ASSERT_TRUE(s);

    EXPECT_EQ(s->negotiate(200), Error::NegotiationFailed);
    EXPECT_TRUE(s->wait_disconnected(1000));
    EXPECT_EQ(rig.dev->disconnect_count(), 1);
    EXPECT_FALSE(s->alive());
    EXPECT_EQ(s->state(), State::Disconnected);

    // further failures do not sever again
    EXPECT_EQ(s->negotiate(50), Error::NegotiationFailed);
    EXPECT_EQ(rig.dev->disconnect_count(), 1);
}

TEST(Session, ExchangeEchoOverSeveralFrames)
{
    transport::SimPeerConfig cfg;
    cfg.announced_mtu = 23;
    SimRig rig(cfg);
    auto   s = rig.make_session();
    ASSERT_TRUE(s);
    ASSERT_EQ(s->negotiate(1000), Error::Ok);
    ASSERT_EQ(s->packet_budget(), 20u);

    const Bytes apdu = pattern(60, 0x10);
    Bytes       resp;
    ASSERT_EQ(s->exchange(apdu, resp), Error::Ok);
    EXPECT_EQ(resp, with_ok(apdu));
    EXPECT_EQ(s->state(), State::Ready);
    // MTU request + 4 data frames
    EXPECT_EQ(rig.dev->writes().size(), 5u);
}

TEST(Session, ConcurrentExchangesNeverInterleave)
{
    transport::SimPeerConfig cfg;
    cfg.announced_mtu      = 23;
    cfg.write_ack_delay_ms = 1;
    SimRig rig(cfg);
    auto   s = rig.make_session();
    ASSERT_TRUE(s);
    ASSERT_EQ(s->negotiate(1000), Error::Ok);

    const int         rounds = 5;
    std::atomic<int>  bad{0};
    auto              worker = [&](std::uint8_t seed) {
        for (int i = 0; i < rounds; ++i)
        {
            const Bytes apdu = pattern(60, static_cast<std::uint8_t>(seed + i));
            Bytes       resp;
            if (s->exchange(apdu, resp) != Error::Ok || resp != with_ok(apdu))
                ++bad;
        }
    };
    std::thread a(worker, 0x00);
    std::thread b(worker, 0x80);
    a.join();
    b.join();
    EXPECT_EQ(bad.load(), 0);

    // the write log must read back as whole messages, one after the other
    frag::Reassembler r;
    int               messages = 0;
    for (const auto &f : rig.dev->writes())
    {
        if (mtu::is_control(f))
            continue;
        std::optional<Bytes> done;
        ASSERT_EQ(r.feed(f, done), Error::Ok) << "frames of two exchanges interleaved";
        if (done)
            ++messages;
    }
    EXPECT_EQ(messages, 2 * rounds);
    EXPECT_FALSE(r.in_progress());
}

TEST(Session, LinkLossMidExchange)
{
    transport::SimPeerConfig cfg;
    cfg.announced_mtu     = 23;
    cfg.drop_after_frames = 3;  // MTU request + 2 data frames
    SimRig rig(cfg);
    auto   s = rig.make_session();
    ASSERT_TRUE(s);

    std::atomic<int> teardowns{0};
    std::atomic<int> listeners{0};
    s->set_teardown_hook([&](session::Session &) { ++teardowns; });
    s->on_disconnect([&] { ++listeners; });

    ASSERT_EQ(s->negotiate(1000), Error::Ok);

    Bytes resp;
    EXPECT_EQ(s->exchange(pattern(60, 0), resp), Error::DeviceDisconnected);
    EXPECT_TRUE(resp.empty());
    ASSERT_TRUE(s->wait_disconnected(1000));
    EXPECT_EQ(teardowns.load(), 1);
    EXPECT_EQ(listeners.load(), 1);
    EXPECT_FALSE(s->alive());
    EXPECT_EQ(s->state(), State::Disconnected);
    EXPECT_EQ(rig.dev->disconnect_count(), 0);  // peer side drop

    EXPECT_EQ(s->exchange(pattern(4, 0), resp), Error::DeviceDisconnected);
    s->on_link_lost();
    EXPECT_EQ(teardowns.load(), 1);
}

TEST(Session, FailedNegotiationTearsDownEvenIfLinkStaysUp)
{
    transport::SimPeerConfig cfg;
    cfg.answer_mtu        = false;
    cfg.refuse_disconnect = true;
    SimRig rig(cfg);
    auto   s = rig.make_session();
    ASSERT_TRUE(s);

    std::atomic<int> teardowns{0};
    std::atomic<int> listeners{0};
    s->set_teardown_hook([&](session::Session &) { ++teardowns; });
    s->on_disconnect([&] { ++listeners; });

    EXPECT_EQ(s->negotiate(100), Error::NegotiationFailed);
    // no waiting on the link stack: the session is done as soon as negotiate returns
    EXPECT_TRUE(s->wait_disconnected(0));
    EXPECT_EQ(teardowns.load(), 1);
    EXPECT_EQ(listeners.load(), 1);
    EXPECT_FALSE(s->alive());
    EXPECT_EQ(s->state(), State::Disconnected);
    EXPECT_EQ(rig.dev->disconnect_count(), 1);
    EXPECT_TRUE(rig.dev->connected());

    Bytes resp;
    EXPECT_EQ(s->exchange(pattern(4, 0), resp), Error::DeviceDisconnected);
    EXPECT_EQ(rig.dev->disconnect_count(), 1);
}

TEST(Session, BrokenStreamNotReusedWhenDisconnectIsRefused)
{
    transport::SimPeerConfig cfg;
    cfg.refuse_disconnect = true;
    cfg.raw_responder     = [](const transport::Frame &) {
        return std::vector<transport::Frame>{{0x05, 0x00, 0x01, 0x90, 0x00}};
    };
    SimRig rig(cfg);
    auto   s = rig.make_session();
    ASSERT_TRUE(s);

    Bytes resp;
    EXPECT_EQ(s->exchange(pattern(4, 0), resp), Error::ProtocolError);
    EXPECT_TRUE(rig.dev->connected());
    EXPECT_FALSE(s->alive());

    const std::size_t writes = rig.dev->writes().size();
    EXPECT_EQ(s->exchange(pattern(4, 1), resp), Error::DeviceDisconnected);
    EXPECT_EQ(rig.dev->writes().size(), writes);
}

TEST(Session, WriteFailureSeversOnce)
{
    transport::SimPeerConfig cfg;
    cfg.fail_writes = true;
    SimRig rig(cfg);
    auto   s = rig.make_session();
    ASSERT_TRUE(s);

    Bytes resp;
    EXPECT_EQ(s->exchange(pattern(8, 0), resp), Error::WriteFailed);
    EXPECT_EQ(rig.dev->disconnect_count(), 1);
    EXPECT_TRUE(s->wait_disconnected(1000));
}

TEST(Session, OversizedMessageRefusedWithoutIo)
{
    SimRig rig;
    auto   s = rig.make_session();
    ASSERT_TRUE(s);

    Bytes resp;
    EXPECT_EQ(s->exchange(Bytes(frag::MAX_MESSAGE + 1, 0x00), resp), Error::ProtocolError);
    EXPECT_TRUE(rig.dev->writes().empty());
    EXPECT_TRUE(s->alive());
    EXPECT_TRUE(rig.dev->connected());
}

TEST(Session, BadResponseSequenceIsProtocolError)
{
    transport::SimPeerConfig cfg;
    cfg.raw_responder = [](const transport::Frame &) {
        // starts at seq 1
        return std::vector<transport::Frame>{{0x05, 0x00, 0x01, 0x90, 0x00}};
    };
    SimRig rig(cfg);
    auto   s = rig.make_session();
    ASSERT_TRUE(s);

    Bytes resp;
    EXPECT_EQ(s->exchange(pattern(4, 0), resp), Error::ProtocolError);
    EXPECT_EQ(rig.dev->disconnect_count(), 1);
}

TEST(Session, CloseKeepsLinkUp)
{
    SimRig rig;
    auto   s = rig.make_session();
    ASSERT_TRUE(s);
    std::atomic<int> teardowns{0};
    s->set_teardown_hook([&](session::Session &) { ++teardowns; });
    ASSERT_EQ(s->negotiate(1000), Error::Ok);
    EXPECT_TRUE(rig.dev->subscribed());

    s->close();
    s->close();
    EXPECT_EQ(teardowns.load(), 1);
    EXPECT_FALSE(s->alive());
    EXPECT_FALSE(rig.dev->subscribed());
    EXPECT_TRUE(rig.dev->connected());
    EXPECT_EQ(rig.dev->disconnect_count(), 0);

    Bytes resp;
    EXPECT_EQ(s->exchange(pattern(4, 0), resp), Error::DeviceDisconnected);
}

TEST(Session, CloseWaitsForExchangeInFlight)
{
    transport::SimPeerConfig cfg;
    cfg.response_delay_ms = 300;
    SimRig rig(cfg);
    auto   s = rig.make_session();
    ASSERT_TRUE(s);
    ASSERT_EQ(s->negotiate(1000), Error::Ok);

    const Bytes      apdu = pattern(10, 0x40);
    Bytes            resp;
    std::atomic<int> rc{-1};
    bool             resp_at_teardown = false;
    // runs inside close(), after close() got its turn
    s->set_teardown_hook([&](session::Session &) { resp_at_teardown = (resp == with_ok(apdu)); });

    std::thread ex([&] { rc = static_cast<int>(s->exchange(apdu, resp)); });
    ASSERT_TRUE(wait_writes(*rig.dev, 2));  // MTU request + the data frame

    s->close();
    EXPECT_TRUE(resp_at_teardown);
    ex.join();
    EXPECT_EQ(rc.load(), static_cast<int>(Error::Ok));
    EXPECT_EQ(resp, with_ok(apdu));
    EXPECT_TRUE(rig.dev->connected());
}

TEST(Session, QueuedExchangesRunInArrivalOrder)
{
    transport::SimPeerConfig cfg;
    cfg.response_delay_ms = 300;
    SimRig rig(cfg);
    auto   s = rig.make_session();
    ASSERT_TRUE(s);
    ASSERT_EQ(s->negotiate(1000), Error::Ok);

    const int                n = 5;
    std::vector<Bytes>       resps(n);
    std::vector<Error>       rcs(n, Error::Ok);
    std::vector<std::thread> threads;

    auto apdu_for = [](int i) { return Bytes{0xE0, static_cast<std::uint8_t>(i), 0x00, 0x00}; };
    threads.emplace_back([&] { rcs[0] = s->exchange(apdu_for(0), resps[0]); });
    ASSERT_TRUE(wait_writes(*rig.dev, 2));

    // the first exchange holds the lock for 300 ms; queue the rest behind it
    for (int i = 1; i < n; ++i)
    {
        threads.emplace_back([&, i] { rcs[i] = s->exchange(apdu_for(i), resps[i]); });
        std::this_thread::sleep_for(std::chrono::milliseconds(40));
    }
    for (auto &t : threads)
        t.join();

    for (int i = 0; i < n; ++i)
    {
        EXPECT_EQ(rcs[i], Error::Ok) << "caller " << i;
        EXPECT_EQ(resps[i], with_ok(apdu_for(i))) << "caller " << i;
    }
    const std::vector<Bytes> sent = written_messages(*rig.dev);
    ASSERT_EQ(sent.size(), static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i)
        EXPECT_EQ(sent[i], apdu_for(i)) << "position " << i;
}
