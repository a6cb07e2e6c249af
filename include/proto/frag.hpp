#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "proto/frame.hpp"
#include "util/error.hpp"

/*
TX:
session.exchange(apdu)
  -> make_frames(apdu, budget)
       stream = [len 2B BE][apdu]
       cut stream into (budget - 3) byte chunks, prefix each with [tag][seq]
  -> write each frame, waiting for the link acknowledgement in between

RX:
notify(raw)
  -> Reassembler.feed(raw)
       parse -> drop non-data frames -> check seq == expected -> append
  -> complete once the bytes after the prefix reach the declared length
*/

namespace frag
{

inline constexpr std::size_t MAX_MESSAGE = 0xFFFF;  // u16 length prefix
inline constexpr std::size_t MIN_BUDGET  = frame::HDR_SIZE + 1;

inline std::size_t chunk_size(std::size_t budget)
{
    return budget > frame::HDR_SIZE ? budget - frame::HDR_SIZE : 0;
}

// TX: serialized data frames, each at most `budget` bytes
apdulink::Error make_frames(const frame::Bytes               &message,
                            std::size_t                        budget,
                            std::vector<frame::Bytes>         &out);

// RX: in-order accumulation of one message at a time
class Reassembler
{
  public:
    // Ok with `done` engaged once the declared length is reached. A sequence gap yields
    // ProtocolError, a bad frame MalformedFrame; both drop the partial message.
    apdulink::Error feed(const frame::Bytes &raw, std::optional<frame::Bytes> &done);
    void            reset();
    bool            in_progress() const { return next_seq_ != 0; }

  private:
    std::uint32_t next_seq_{0};
    frame::Bytes  stream_;  // [len 2B][message bytes so far]
};

}  // namespace frag
