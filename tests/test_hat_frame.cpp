#include "fake_transport.hpp"

#include "hat_frame.hpp"

#include <gtest/gtest.h>

#include <cstring>

TEST(HatFrame, Crc16ModbusCheckValue)
{
    const char* check = "123456789";
    EXPECT_EQ(crc16_modbus(reinterpret_cast<const uint8_t*>(check), std::strlen(check)), 0x4B37);
    EXPECT_EQ(crc16_modbus(nullptr, 0), 0xFFFF);
}

TEST(HatFrame, EncodeAppendsCrcLowByteFirst)
{
    HatFrame frame;
    frame.id = 0x1F;
    frame.command = HAT_CMD_DQ_GET_ALL_CHANNELS;

    EXPECT_EQ(frame.encode(), (std::vector<uint8_t>{0x1F, 0x35, 0xC9, 0x97}));

    frame.id = 0x20;
    frame.command = HAT_CMD_DQ_SET_ALL_CHANNELS;
    frame.data = {0x3F, 0x00, 0x00, 0x00};
    EXPECT_EQ(frame.encode(), (std::vector<uint8_t>{0x20, 0x34, 0x3F, 0x00, 0x00, 0x00, 0xBA, 0xAB}));
}

TEST(HatFrame, DecodeSplitsIdCommandAndData)
{
    HatFrame frame = HatFrame::decode({0x1F, 0x36, 0x03, 0x01, 0x26, 0xCE});

    EXPECT_EQ(frame.id, 0x1F);
    EXPECT_EQ(frame.command, HAT_CMD_DQ_SET_CHANNEL);
    EXPECT_EQ(frame.data, (std::vector<uint8_t>{0x03, 0x01}));
}

TEST(HatFrame, BadCrcIsTransferError)
{
    EXPECT_EQ(error_kind([]() { HatFrame::decode({0x1F, 0x36, 0x03, 0x01, 0x26, 0xCF}); }),
              HatErrorKind::TransferError);
    EXPECT_EQ(error_kind([]() { HatFrame::decode({0x1F, 0x35, 0x97, 0xC9}); }), HatErrorKind::TransferError);
}

TEST(HatFrame, ShortFrameIsTransferError)
{
    EXPECT_EQ(error_kind([]() { HatFrame::decode({0x1F, 0x35, 0xC9}); }), HatErrorKind::TransferError);
    EXPECT_EQ(error_kind([]() { HatFrame::decode({}); }), HatErrorKind::TransferError);
}
