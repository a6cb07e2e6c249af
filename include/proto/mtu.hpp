#pragma once
#include <cstddef>
#include <cstdint>

#include "proto/frame.hpp"

// MTU handshake, one per session:
//   host -> 08 00 00 00 00
//   peer -> 08 00 00 00 01 NN   (NN = announced packet size)
namespace mtu
{

inline constexpr std::size_t ANNOUNCE_OFFSET = 5;
inline constexpr std::size_t OVERHEAD        = 3;

frame::Bytes make_request();
frame::Bytes make_answer(std::uint8_t announced);

inline bool is_control(const frame::Bytes &raw)
{
    return !raw.empty() && raw[0] == frame::TAG_CONTROL;
}

// False when the control frame is too short to carry the size.
bool read_announced(const frame::Bytes &raw, std::size_t &announced);

// announced - OVERHEAD, floored at the default budget
std::size_t budget_from_announced(std::size_t announced);

}  // namespace mtu
