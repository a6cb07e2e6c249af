#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include "util/log.hpp"

namespace constants
{
// Hardware wallet GATT layout: one service, notify on -0001-, write on -0002-,
// write-without-response on -0003-.
inline constexpr std::string_view NANO_X_SVC_UUID    = "13d63400-2c97-0004-0000-4c6564676572";
inline constexpr std::string_view NANO_X_NOTIFY_UUID = "13d63400-2c97-0004-0001-4c6564676572";
inline constexpr std::string_view NANO_X_WRITE_UUID  = "13d63400-2c97-0004-0002-4c6564676572";
inline constexpr std::string_view STAX_SVC_UUID      = "13d63400-2c97-6004-0000-4c6564676572";
inline constexpr std::string_view FLEX_SVC_UUID      = "13d63400-2c97-3004-0000-4c6564676572";

inline std::vector<std::string> service_uuids()
{
    return {std::string(NANO_X_SVC_UUID), std::string(STAX_SVC_UUID),
            std::string(FLEX_SVC_UUID)};
}

// Session timing
inline constexpr std::uint32_t NEGOTIATE_TIMEOUT_MS   = 5000;
inline constexpr std::uint32_t RECONNECT_THRESHOLD_MS = 500;   // slower MTU answer => fresh pairing
inline constexpr std::uint32_t RECONNECT_SETTLE_MS    = 1000;  // bonding settle after the forced drop
inline constexpr std::uint32_t TEARDOWN_WAIT_MS       = 3000;

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("APDULINK_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/apdulink/ctl.sock";
    LOG_SYSTEM("Control socket defaults to %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
