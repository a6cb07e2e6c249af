#pragma once

// Process exit codes of apdulinkctl
namespace exitc
{
inline constexpr int ok        = 0;
inline constexpr int failed    = 1;  // daemon answered ERR, or status word not 90 00
inline constexpr int bad_args  = 2;
inline constexpr int no_server = 3;
}  // namespace exitc
