#include "proto/apdu.hpp"
#include "util/log.hpp"

namespace apdu
{

bool build(const Command &c, std::vector<std::uint8_t> &out)
{
    out.clear();
    if (c.data.size() > MAX_SHORT_DATA)
    {
        LOG_ERROR("build: data of %zu bytes needs an extended APDU", c.data.size());
        return false;
    }
    out.reserve(5 + c.data.size());
    out.push_back(c.cla);
    out.push_back(c.ins);
    out.push_back(c.p1);
    out.push_back(c.p2);
    out.push_back(static_cast<std::uint8_t>(c.data.size()));
    out.insert(out.end(), c.data.begin(), c.data.end());
    return true;
}

bool split_status(const std::vector<std::uint8_t> &resp,
                  std::vector<std::uint8_t>       &body,
                  std::uint16_t                   &sw)
{
    if (resp.size() < 2)
        return false;
    const std::size_t n = resp.size();
    sw = static_cast<std::uint16_t>((resp[n - 2] << 8) | resp[n - 1]);
    body.assign(resp.begin(), resp.end() - 2);
    return true;
}

}  // namespace apdu
