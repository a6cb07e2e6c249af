#include <algorithm>
#include <cstdint>

#include "proto/frag.hpp"
#include "util/log.hpp"

namespace frag
{

using frame::Bytes;

apdulink::Error make_frames(const Bytes &message, std::size_t budget, std::vector<Bytes> &out)
{
    out.clear();
    if (budget < MIN_BUDGET)
    {
        LOG_ERROR("make_frames: budget %zu below minimum %zu", budget, MIN_BUDGET);
        return apdulink::Error::ProtocolError;
    }
    if (message.size() > MAX_MESSAGE)
    {
        LOG_ERROR("make_frames: message too large (%zu bytes)", message.size());
        return apdulink::Error::ProtocolError;
    }

    const std::size_t chunk = chunk_size(budget);
    Bytes             stream;
    stream.reserve(frame::LEN_SIZE + message.size());
    stream.push_back(static_cast<std::uint8_t>(message.size() >> 8));
    stream.push_back(static_cast<std::uint8_t>(message.size() & 0xFF));
    stream.insert(stream.end(), message.begin(), message.end());

    const std::size_t num_frames = (stream.size() + chunk - 1) / chunk;
    if (num_frames > 0x10000)
    {
        LOG_ERROR("make_frames: %zu frames do not fit the u16 sequence", num_frames);
        return apdulink::Error::ProtocolError;
    }

    out.reserve(num_frames);
    for (std::size_t i = 0; i < num_frames; i++)
    {
        const std::size_t start = i * chunk;
        const std::size_t take  = std::min(chunk, stream.size() - start);

        frame::Frame f;
        f.kind = frame::Kind::Data;
        f.seq  = static_cast<std::uint16_t>(i);
        if (i == 0 && take >= frame::LEN_SIZE)
        {
            // whole prefix fits: expose it as the header's total length
            f.total_len = static_cast<std::uint16_t>(message.size());
            f.payload.assign(stream.begin() + frame::LEN_SIZE, stream.begin() + take);
        }
        else
        {
            f.payload.assign(stream.begin() + start, stream.begin() + start + take);
        }

        Bytes wire;
        apdulink::Error e = frame::serialize(f, budget, wire);
        if (e != apdulink::Error::Ok)
        {
            out.clear();
            return e;
        }
        out.push_back(std::move(wire));
    }
    return apdulink::Error::Ok;
}

void Reassembler::reset()
{
    next_seq_ = 0;
    stream_.clear();
}

apdulink::Error Reassembler::feed(const Bytes &raw, std::optional<Bytes> &done)
{
    done.reset();

    frame::Frame f;
    apdulink::Error e = frame::parse(raw, f);
    if (e != apdulink::Error::Ok)
    {
        reset();
        return e;
    }
    if (f.kind != frame::Kind::Data)
    {
        LOG_DEBUG("Reassembler::feed: ignoring non-data frame (tag=0x%02x)", raw[0]);
        return apdulink::Error::Ok;
    }
    if (f.seq != next_seq_)
    {
        LOG_WARN("Reassembler::feed: sequence mismatch (got %u, expect %u)",
                 static_cast<unsigned>(f.seq), static_cast<unsigned>(next_seq_));
        reset();
        return apdulink::Error::ProtocolError;
    }

    if (f.total_len)
    {
        stream_.push_back(static_cast<std::uint8_t>(*f.total_len >> 8));
        stream_.push_back(static_cast<std::uint8_t>(*f.total_len & 0xFF));
    }
    stream_.insert(stream_.end(), f.payload.begin(), f.payload.end());
    ++next_seq_;

    if (stream_.size() < frame::LEN_SIZE)
        return apdulink::Error::Ok;  // prefix split over tiny frames

    const std::size_t total = (static_cast<std::size_t>(stream_[0]) << 8) | stream_[1];
    const std::size_t have  = stream_.size() - frame::LEN_SIZE;
    if (have > total)
    {
        LOG_WARN("Reassembler::feed: %zu bytes overrun declared length %zu", have, total);
        reset();
        return apdulink::Error::ProtocolError;
    }
    if (have == total)
    {
        done.emplace(stream_.begin() + frame::LEN_SIZE, stream_.end());
        reset();
    }
    return apdulink::Error::Ok;
}

}  // namespace frag
