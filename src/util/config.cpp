#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string>

#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace config
{

bool parse_u32(const char *s, std::uint32_t min_v, std::uint32_t max_v, std::uint32_t &out)
{
    if (!s || !*s)
        return false;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s, &p, 10);
    if (!p || *p != '\0' || !std::isdigit((unsigned char)s[0]))
        return false;
    if (v < min_v || v > max_v)
        return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

static void u32_from_env(const char     *key,
                         std::uint32_t   min_v,
                         std::uint32_t   max_v,
                         std::uint32_t  &out)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    if (parse_u32(e, min_v, max_v, out))
        LOG_INFO("Using %s=%u", key, out);
    else
        LOG_WARN("Ignoring invalid %s='%s' (expect %u..%u)", key, e, min_v, max_v);
}

DaemonConfig load_from_env()
{
    DaemonConfig cfg;

    if (const char *t = std::getenv("APDULINK_TRANSPORT"))
    {
        std::string ts = t;
        for (auto &c : ts)
            c = (char)std::tolower((unsigned char)c);
        if (ts == "bluez")
            cfg.link = LinkKind::Bluez;
        else if (ts == "sim" || ts.empty())
            cfg.link = LinkKind::Sim;
        else
            LOG_WARN("Ignoring unknown APDULINK_TRANSPORT='%s' (expect bluez|sim)", t);
    }
    if (const char *a = std::getenv("APDULINK_ADAPTER"); a && *a)
        cfg.adapter = a;

    cfg.ctl_sock = ipc::expand_user(constants::ctl_sock_path());

    u32_from_env("APDULINK_NEGOTIATE_TIMEOUT_MS", 100, 60000, cfg.negotiate_timeout_ms);
    u32_from_env("APDULINK_SIM_MTU", 23, 255, cfg.sim_mtu);
    return cfg;
}

}  // namespace config
