#include <cctype>
#include <cstdlib>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "app/apdu_transport.hpp"
#include "ctl/ipc.hpp"
#include "transport/bluez_link.hpp"
#include "transport/sim_link.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/error.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

using apdulink::Error;

static app::ApduTransport *g_transport = nullptr;
static std::string         g_link_name;

// devices reported by the startup listener
static std::mutex                                         g_dev_mu;
static std::map<std::string, transport::DeviceDescriptor> g_devices;

// ---------------- helpers ----------------
static std::vector<std::string> split_words(const std::string &line)
{
    std::vector<std::string> out;
    std::istringstream       in(line);
    std::string              w;
    while (in >> w)
        out.push_back(w);
    return out;
}

static std::string err_reply(Error e)
{
    return std::string("ERR ") + apdulink::error_name(e);
}

// names travel inside a space separated reply
static std::string sanitize_name(std::string n)
{
    for (auto &c : n)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
            c = '_';
    }
    return n;
}

static std::unique_ptr<transport::ILinkStack> make_link(const config::DaemonConfig &cfg)
{
    if (cfg.link == config::LinkKind::Bluez)
    {
        transport::BluezConfig bc;
        bc.adapter = cfg.adapter;
        auto link  = std::make_unique<transport::BluezLink>(bc);
        if (!link->start())
        {
            LOG_ERROR("BlueZ link start failed on %s", cfg.adapter.c_str());
            return nullptr;
        }
        return link;
    }

    auto                     link = std::make_unique<transport::SimLink>();
    transport::SimPeerConfig peer;
    peer.announced_mtu = static_cast<std::uint8_t>(cfg.sim_mtu);
    (void)link->add_peer(peer);
    return link;
}

// ---------------- commands ----------------
static std::string cmd_list()
{
    std::lock_guard<std::mutex> lk(g_dev_mu);
    std::string                 out = "OK";
    for (const auto &kv : g_devices)
        out += " " + kv.first + "=" + sanitize_name(kv.second.name);
    return out;
}

static std::string cmd_open(const std::string &id)
{
    transport::DeviceDescriptor desc;
    bool                        known = false;
    {
        std::lock_guard<std::mutex> lk(g_dev_mu);
        auto                        it = g_devices.find(id);
        if (it != g_devices.end())
        {
            desc  = it->second;
            known = true;
        }
    }

    session::SessionPtr s;
    Error               e = known ? g_transport->open(desc, s) : g_transport->open(id, s);
    if (e != Error::Ok)
        return err_reply(e);
    return "OK " + s->id() + " budget=" + std::to_string(s->packet_budget());
}

static std::string cmd_exchange(const std::string &id, const std::string &hex_apdu)
{
    frame::Bytes apdu;
    if (!hex::decode(hex_apdu, apdu))
        return "ERR BadRequest";

    session::SessionPtr s = g_transport->registry().get(id);
    if (!s)
        return err_reply(Error::DeviceDisconnected);

    frame::Bytes resp;
    Error        e = s->exchange(apdu, resp);
    if (e != Error::Ok)
        return err_reply(e);
    return "OK " + hex::encode(resp);
}

static std::string cmd_close(const std::string &id)
{
    session::SessionPtr s = g_transport->registry().get(id);
    if (!s)
        return err_reply(Error::DeviceDisconnected);
    s->close();
    return "OK";
}

static std::string cmd_status()
{
    std::string out = "OK link=" + g_link_name +
                      " available=" + (g_transport->is_available() ? "1" : "0");
    for (const auto &s : g_transport->registry().all())
    {
        out += " " + s->id() + ":" + session::state_name(s->state()) + ":" +
               std::to_string(s->packet_budget());
    }
    return out;
}

static std::string on_line(const std::string &line)
{
    LOG_DEBUG("IPC line: %s", line.c_str());
    auto words = split_words(line);
    if (words.empty())
        return "ERR BadRequest";

    const std::string &cmd = words[0];
    if (cmd == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return "OK";
    }
    if (cmd == "LIST" && words.size() == 1)
        return cmd_list();
    if (cmd == "STATUS" && words.size() == 1)
        return cmd_status();
    if (cmd == "OPEN" && words.size() == 2)
        return cmd_open(words[1]);
    if (cmd == "CLOSE" && words.size() == 2)
        return cmd_close(words[1]);
    if (cmd == "DISCONNECT" && words.size() == 2)
    {
        Error e = g_transport->disconnect(words[1]);
        return e == Error::Ok ? std::string("OK") : err_reply(e);
    }
    if (cmd == "EXCHANGE" && words.size() >= 3)
    {
        // hex may come with spaces between bytes
        std::string hex_apdu;
        for (size_t i = 2; i < words.size(); ++i)
            hex_apdu += words[i];
        return cmd_exchange(words[1], hex_apdu);
    }

    LOG_WARN("Unknown or malformed command: %s", line.c_str());
    return "ERR BadRequest";
}

int main()
{
    apdulink::init_log_from_env("APDULINK_LOG_LEVEL");

    config::DaemonConfig cfg = config::load_from_env();
    LOG_SYSTEM("Config: transport=%s adapter=%s sock=%s negotiate_timeout=%ums",
               cfg.link == config::LinkKind::Bluez ? "bluez" : "sim", cfg.adapter.c_str(),
               cfg.ctl_sock.c_str(), cfg.negotiate_timeout_ms);

    auto link = make_link(cfg);
    if (!link)
        return 1;
    g_link_name = link->name();

    app::TransportConfig tcfg;
    tcfg.negotiate_timeout_ms = cfg.negotiate_timeout_ms;
    app::ApduTransport transport(*link, tcfg);
    g_transport = &transport;

    transport.observe_availability(
        [](bool on) { LOG_SYSTEM("[RADIO] %s", on ? "available" : "unavailable"); });

    app::ApduTransport::ListenToken token = 0;
    Error                           e     = transport.listen(
        [](const transport::DeviceDescriptor &d) {
            LOG_SYSTEM("[DEVICE] %s name=%s", d.id.c_str(), d.name.c_str());
            std::lock_guard<std::mutex> lk(g_dev_mu);
            g_devices[d.id] = d;
        },
        token);
    if (e != Error::Ok)
        LOG_WARN("listen failed: %s (OPEN by id still works)", apdulink::error_name(e));

    bool ok = ipc::start_server(cfg.ctl_sock, &on_line);
    if (!ok)
        LOG_ERROR("start_server failed");

    if (e == Error::Ok)
        transport.unlisten(token);
    g_transport = nullptr;
    return ok ? 0 : 1;
}
