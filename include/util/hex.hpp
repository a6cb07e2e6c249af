#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hex
{

// lowercase, no separators
std::string encode(const std::uint8_t *data, std::size_t len);

inline std::string encode(const std::vector<std::uint8_t> &v)
{
    return encode(v.data(), v.size());
}

// Accepts upper/lower case; spaces and ':' between bytes are skipped.
// False on odd digit count or any other character.
bool decode(std::string_view s, std::vector<std::uint8_t> &out);

}  // namespace hex
