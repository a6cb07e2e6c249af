#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "util/error.hpp"

/*
Link frame (one BLE write or one notification):

  [tag 1B][seq 2B BE][total 2B BE, first data frame only][payload...]

  tag 0x05  data: a slice of one APDU
  tag 0x08  control: MTU request/answer

The whole frame, header included, never exceeds the session's packet budget.
*/

namespace frame
{

using Bytes = std::vector<std::uint8_t>;

// --- Protocol constants ---
inline constexpr std::uint8_t TAG_DATA       = 0x05;
inline constexpr std::uint8_t TAG_CONTROL    = 0x08;
inline constexpr std::size_t  HDR_SIZE       = 3;   // tag + seq
inline constexpr std::size_t  LEN_SIZE       = 2;   // total length on seq 0
inline constexpr std::size_t  DEFAULT_BUDGET = 20;  // ATT_MTU 23 minus ATT header

enum class Kind : std::uint8_t
{
    Data    = TAG_DATA,
    Control = TAG_CONTROL
};

struct Frame
{
    Kind                         kind{Kind::Data};
    std::uint16_t                seq{0};
    std::optional<std::uint16_t> total_len{};  // only on the first data frame
    Bytes                        payload;
};

inline std::size_t header_size(const Frame &f)
{
    return HDR_SIZE + (f.total_len ? LEN_SIZE : 0);
}

// ProtocolError when the result would exceed `budget` or a length sits on seq != 0.
apdulink::Error serialize(const Frame &f, std::size_t budget, Bytes &out);

// MalformedFrame when shorter than the header or the tag is unknown.
// A data frame with seq 0 exposes total_len when it holds the full prefix.
apdulink::Error parse(const Bytes &raw, Frame &out);

bool known_tag(std::uint8_t tag);

}  // namespace frame
