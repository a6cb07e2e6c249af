#pragma once
#include <cstdint>
#include <string>

namespace config
{

enum class LinkKind
{
    Sim,
    Bluez
};

// Daemon settings, all overridable from APDULINK_* environment variables.
struct DaemonConfig
{
    LinkKind      link                 = LinkKind::Sim;
    std::string   adapter              = "hci0";
    std::string   ctl_sock;
    std::uint32_t negotiate_timeout_ms = 5000;
    std::uint32_t sim_mtu              = 158;
};

// Parses a decimal value in [min_v, max_v]; false leaves `out` untouched.
bool parse_u32(const char *s, std::uint32_t min_v, std::uint32_t max_v, std::uint32_t &out);

DaemonConfig load_from_env();

}  // namespace config
