// tests/test_apdu.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

#include "proto/apdu.hpp"

TEST(Apdu, BuildShortCommand)
{
    apdu::Command c;
    c.cla  = 0xE0;
    c.ins  = 0x01;
    c.data = {0xAA, 0xBB};

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(apdu::build(c, out));
    EXPECT_EQ(out, (std::vector<std::uint8_t>{0xE0, 0x01, 0x00, 0x00, 0x02, 0xAA, 0xBB}));
}

TEST(Apdu, BuildRejectsLongData)
{
    apdu::Command c;
    c.data.assign(256, 0x00);
    std::vector<std::uint8_t> out;
    EXPECT_FALSE(apdu::build(c, out));

    c.data.resize(255);
    ASSERT_TRUE(apdu::build(c, out));
    EXPECT_EQ(out[4], 0xFF);
    EXPECT_EQ(out.size(), 260u);
}

TEST(Apdu, SplitStatus)
{
    std::vector<std::uint8_t> body;
    std::uint16_t             sw = 0;
    ASSERT_TRUE(apdu::split_status({0x01, 0x02, 0x90, 0x00}, body, sw));
    EXPECT_EQ(sw, apdu::SW_OK);
    EXPECT_EQ(body, (std::vector<std::uint8_t>{0x01, 0x02}));

    ASSERT_TRUE(apdu::split_status({0x6E, 0x00}, body, sw));
    EXPECT_EQ(sw, 0x6E00);
    EXPECT_TRUE(body.empty());

    EXPECT_FALSE(apdu::split_status({0x90}, body, sw));
}
