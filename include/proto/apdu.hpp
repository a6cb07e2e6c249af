#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// ISO 7816-4 short command APDUs: [CLA][INS][P1][P2][Lc][data]
// and responses ending in a two byte status word.
namespace apdu
{

inline constexpr std::uint16_t SW_OK          = 0x9000;
inline constexpr std::size_t   MAX_SHORT_DATA = 255;

struct Command
{
    std::uint8_t              cla{0};
    std::uint8_t              ins{0};
    std::uint8_t              p1{0};
    std::uint8_t              p2{0};
    std::vector<std::uint8_t> data;
};

// False when data does not fit a short APDU.
bool build(const Command &c, std::vector<std::uint8_t> &out);

// Splits `resp` into body and status word; false when shorter than the status word.
bool split_status(const std::vector<std::uint8_t> &resp,
                  std::vector<std::uint8_t>       &body,
                  std::uint16_t                   &sw);

}  // namespace apdu
