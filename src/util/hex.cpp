#include <sodium.h>
#include <string>

#include "util/hex.hpp"

namespace hex
{

std::string encode(const std::uint8_t *data, std::size_t len)
{
    if (!data || len == 0)
        return {};
    std::string out(len * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data, len);
    out.pop_back();  // trailing NUL written by sodium
    return out;
}

bool decode(std::string_view s, std::vector<std::uint8_t> &out)
{
    out.clear();
    if (s.empty())
        return true;

    std::vector<std::uint8_t> buf(s.size() / 2 + 1);
    std::size_t               bin_len = 0;
    // hex_end == nullptr: sodium fails unless the whole input is consumed
    if (sodium_hex2bin(buf.data(), buf.size(), s.data(), s.size(), " :", &bin_len, nullptr) != 0)
        return false;
    buf.resize(bin_len);
    out = std::move(buf);
    return true;
}

}  // namespace hex
