#include "proto/mtu.hpp"
#include "util/log.hpp"

namespace mtu
{

frame::Bytes make_request()
{
    frame::Frame f;
    f.kind    = frame::Kind::Control;
    f.seq     = 0;
    f.payload = {0x00, 0x00};

    frame::Bytes out;
    (void)frame::serialize(f, frame::DEFAULT_BUDGET, out);  // 5 bytes, always fits
    return out;
}

frame::Bytes make_answer(std::uint8_t announced)
{
    frame::Frame f;
    f.kind    = frame::Kind::Control;
    f.seq     = 0;
    f.payload = {0x00, 0x01, announced};

    frame::Bytes out;
    (void)frame::serialize(f, frame::DEFAULT_BUDGET, out);
    return out;
}

bool read_announced(const frame::Bytes &raw, std::size_t &announced)
{
    if (!is_control(raw) || raw.size() <= ANNOUNCE_OFFSET)
    {
        LOG_WARN("read_announced: control frame too short (%zu)", raw.size());
        return false;
    }
    announced = raw[ANNOUNCE_OFFSET];
    return true;
}

std::size_t budget_from_announced(std::size_t announced)
{
    if (announced <= OVERHEAD + frame::DEFAULT_BUDGET)
        return frame::DEFAULT_BUDGET;
    return announced - OVERHEAD;
}

}  // namespace mtu
