#include "proto/frame.hpp"
#include "util/log.hpp"

namespace frame
{

static inline void put_u16be(Bytes &out, std::uint16_t v)
{
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

static inline std::uint16_t get_u16be(const std::uint8_t *p)
{
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

bool known_tag(std::uint8_t tag)
{
    return tag == TAG_DATA || tag == TAG_CONTROL;
}

apdulink::Error serialize(const Frame &f, std::size_t budget, Bytes &out)
{
    out.clear();
    if (f.total_len && (f.kind != Kind::Data || f.seq != 0))
    {
        LOG_ERROR("serialize: total length only allowed on data frame 0 (seq=%u)",
                  static_cast<unsigned>(f.seq));
        return apdulink::Error::ProtocolError;
    }

    const std::size_t size = header_size(f) + f.payload.size();
    if (size > budget)
    {
        LOG_ERROR("serialize: frame of %zu bytes exceeds budget %zu", size, budget);
        return apdulink::Error::ProtocolError;
    }

    out.reserve(size);
    out.push_back(static_cast<std::uint8_t>(f.kind));
    put_u16be(out, f.seq);
    if (f.total_len)
        put_u16be(out, *f.total_len);
    out.insert(out.end(), f.payload.begin(), f.payload.end());
    return apdulink::Error::Ok;
}

apdulink::Error parse(const Bytes &raw, Frame &out)
{
    if (raw.size() < HDR_SIZE)
    {
        LOG_WARN("parse: frame too short (%zu)", raw.size());
        return apdulink::Error::MalformedFrame;
    }
    if (!known_tag(raw[0]))
    {
        LOG_WARN("parse: unknown tag 0x%02x", raw[0]);
        return apdulink::Error::MalformedFrame;
    }

    out.kind = static_cast<Kind>(raw[0]);
    out.seq  = get_u16be(raw.data() + 1);
    out.total_len.reset();

    std::size_t body = HDR_SIZE;
    if (out.kind == Kind::Data && out.seq == 0 && raw.size() >= HDR_SIZE + LEN_SIZE)
    {
        out.total_len = get_u16be(raw.data() + HDR_SIZE);
        body += LEN_SIZE;
    }
    out.payload.assign(raw.begin() + body, raw.end());
    return apdulink::Error::Ok;
}

}  // namespace frame
