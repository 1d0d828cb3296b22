#include "fake_transport.hpp"

#include "hat_register_file.hpp"

#include <gtest/gtest.h>

#include <memory>

class RegisterFileTest : public ::testing::Test
{
protected:
    RegisterFileTest() : map(hat_board_type(HatModel::DQ16oc))
    {
        auto transport = std::make_unique<FakeTransport>(0x50, "DQ16oc I2C-HAT");
        fake = transport.get();
        regs = std::make_unique<HatRegisterFile>(std::move(transport));
    }

    HatRegisterMap map;
    FakeTransport* fake;
    std::unique_ptr<HatRegisterFile> regs;
};

TEST_F(RegisterFileTest, GetterSendsCommandFrameAndReadsResponse)
{
    fake->set_value(HAT_CMD_DQ_GET_ALL_CHANNELS, 0x3F);

    EXPECT_EQ(regs->read(map.reg(HatField::DqValue)), 0x3Fu);

    // Primeiro byte do quadro vai no campo "command" do bloco SMBus
    ASSERT_EQ(fake->raw_requests().size(), 1u);
    EXPECT_EQ(fake->raw_requests()[0], (std::vector<uint8_t>{0x1F, 0x35, 0xC9, 0x97}));
    EXPECT_EQ(fake->read_commands(), std::vector<uint8_t>{HAT_RESPONSE_DUMMY_BYTE});
    EXPECT_EQ(fake->read_lengths(), std::vector<size_t>{8});
}

TEST_F(RegisterFileTest, SetterSendsLittleEndianValue)
{
    regs->read(map.reg(HatField::DqValue));
    regs->write(map.reg(HatField::DqValue), 0x3F);

    ASSERT_EQ(fake->raw_requests().size(), 2u);
    EXPECT_EQ(fake->raw_requests()[1], (std::vector<uint8_t>{0x20, 0x34, 0x3F, 0x00, 0x00, 0x00, 0xBA, 0xAB}));
    EXPECT_EQ(fake->read_lengths(), (std::vector<size_t>{8, 8}));
    EXPECT_EQ(fake->value(HAT_CMD_DQ_GET_ALL_CHANNELS), 0x3Fu);
}

TEST_F(RegisterFileTest, ValuesAreLittleEndian)
{
    regs->write(map.reg(HatField::DqValue), 0x0000A55A);
    EXPECT_EQ(fake->last_request(HAT_CMD_DQ_SET_ALL_CHANNELS), (std::vector<uint8_t>{0x5A, 0xA5, 0x00, 0x00}));

    fake->set_value(HAT_CMD_GET_STATUS_WORD, 0x01020304);
    EXPECT_EQ(regs->read(map.reg(HatField::StatusWord)), 0x01020304u);
}

TEST_F(RegisterFileTest, FrameIdIncrementsAndWraps)
{
    // 0x1F .. 0xFF, depois 0x00
    for(int i = 0; i < 0x100 - HAT_FIRST_FRAME_ID; i++)
    {
        regs->read(map.reg(HatField::StatusWord));
    }
    regs->read(map.reg(HatField::StatusWord));

    auto requests = fake->raw_requests();
    ASSERT_EQ(requests.size(), static_cast<size_t>(0x100 - HAT_FIRST_FRAME_ID + 1));
    EXPECT_EQ(requests.front()[0], HAT_FIRST_FRAME_ID);
    EXPECT_EQ(requests[requests.size() - 2][0], 0xFF);
    EXPECT_EQ(requests.back()[0], 0x00);
}

TEST_F(RegisterFileTest, WriteToReadOnlyNeverReachesTheBus)
{
    EXPECT_EQ(error_kind([&]() { regs->write(map.reg(HatField::StatusWord), 0); }), HatErrorKind::InvalidAccess);
    EXPECT_EQ(error_kind([&]() { regs->write(map.reg(HatField::BoardName), 0); }), HatErrorKind::InvalidAccess);
    EXPECT_EQ(fake->transactions(), 0u);
}

TEST_F(RegisterFileTest, ReadFromWriteOnlyNeverReachesTheBus)
{
    EXPECT_EQ(error_kind([&]() { regs->read(map.reg(HatField::Reset)); }), HatErrorKind::InvalidAccess);
    EXPECT_EQ(fake->transactions(), 0u);
}

TEST_F(RegisterFileTest, CommandWithoutValueAcceptsOnlyZero)
{
    HatRegisterMap inputs(hat_board_type(HatModel::DI16ac));

    EXPECT_EQ(error_kind([&]() { regs->write(inputs.reg(HatField::DiResetCounters), 1); }),
              HatErrorKind::OutOfRange);
    EXPECT_EQ(fake->transactions(), 0u);

    regs->write(inputs.reg(HatField::DiResetCounters), 0);
    EXPECT_EQ(fake->count(HAT_CMD_DI_RESET_ALL_COUNTERS), 1u);
    EXPECT_TRUE(fake->last_request(HAT_CMD_DI_RESET_ALL_COUNTERS).empty());
}

TEST_F(RegisterFileTest, UnacknowledgedCommandReadsNoResponse)
{
    regs->write(map.reg(HatField::Reset), 0);

    EXPECT_EQ(fake->count(HAT_CMD_RESET), 1u);
    EXPECT_TRUE(fake->read_lengths().empty());
}

TEST_F(RegisterFileTest, TransportErrorsPropagateUnchanged)
{
    fake->fail_with(HatErrorKind::TransferError);
    EXPECT_EQ(error_kind([&]() { regs->read(map.reg(HatField::DqValue)); }), HatErrorKind::TransferError);

    fake->fail_with(HatErrorKind::DeviceNotFound);
    EXPECT_EQ(error_kind([&]() { regs->write(map.reg(HatField::DqValue), 1); }), HatErrorKind::DeviceNotFound);

    fake->clear_failure();
    regs->write(map.reg(HatField::DqValue), 1);
    EXPECT_EQ(regs->read(map.reg(HatField::DqValue)), 1u);
}

TEST_F(RegisterFileTest, BadResponseCrcIsTransferErrorWithoutRetry)
{
    fake->corrupt(FakeTransport::Corruption::Crc);

    EXPECT_EQ(error_kind([&]() { regs->read(map.reg(HatField::DqValue)); }), HatErrorKind::TransferError);
    EXPECT_EQ(fake->transactions(), 1u);
}

TEST_F(RegisterFileTest, ResponseIdMismatchIsTransferError)
{
    fake->corrupt(FakeTransport::Corruption::Id);

    EXPECT_EQ(error_kind([&]() { regs->read(map.reg(HatField::StatusWord)); }), HatErrorKind::TransferError);
    EXPECT_EQ(fake->transactions(), 1u);
}

TEST_F(RegisterFileTest, ResponseCommandMismatchIsTransferError)
{
    fake->corrupt(FakeTransport::Corruption::Command);

    EXPECT_EQ(error_kind([&]() { regs->write(map.reg(HatField::DqSafetyValue), 0x0F); }),
              HatErrorKind::TransferError);
    EXPECT_EQ(fake->transactions(), 1u);
}

TEST_F(RegisterFileTest, SetterEchoMismatchIsTransferError)
{
    fake->corrupt(FakeTransport::Corruption::Echo);

    EXPECT_EQ(error_kind([&]() { regs->write(map.reg(HatField::DqValue), 0x0F); }), HatErrorKind::TransferError);
    EXPECT_EQ(fake->transactions(), 1u);

    // Seletor de canal ecoado errado na leitura
    EXPECT_EQ(error_kind([&]() { regs->read(map.dq_channel(3)); }), HatErrorKind::TransferError);

    fake->corrupt(FakeTransport::Corruption::None);
    regs->write(map.reg(HatField::DqValue), 0x0F);
    EXPECT_EQ(regs->read(map.dq_channel(3)), 1u);
}

TEST_F(RegisterFileTest, ValueWiderThanRegisterIsOutOfRange)
{
    EXPECT_EQ(error_kind([&]() { regs->write(map.dq_channel(0), 0x100); }), HatErrorKind::OutOfRange);
    EXPECT_EQ(fake->transactions(), 0u);

    regs->write(map.dq_channel(0), 1);
    EXPECT_EQ(fake->last_request(HAT_CMD_DQ_SET_CHANNEL), (std::vector<uint8_t>{0x00, 0x01}));
}

TEST_F(RegisterFileTest, BlockReadReturnsRawBytes)
{
    std::vector<uint8_t> name = regs->read_block(map.reg(HatField::BoardName));

    ASSERT_EQ(name.size(), static_cast<size_t>(HAT_BOARD_NAME_SIZE));
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(name.data())), "DQ16oc I2C-HAT");
    EXPECT_EQ(fake->read_lengths(), std::vector<size_t>{HatFrame::OVERHEAD + HAT_BOARD_NAME_SIZE});
    EXPECT_EQ(regs->address(), 0x50);
}

TEST(RegisterFile, NullTransportIsRejected)
{
    EXPECT_EQ(error_kind([]() { HatRegisterFile regs(nullptr); }), HatErrorKind::InvalidAccess);
}

TEST(HatError, TransportFaultsAreDistinguished)
{
    EXPECT_TRUE(HatError(HatErrorKind::DeviceNotFound, "sem ACK").is_transport_fault());
    EXPECT_TRUE(HatError(HatErrorKind::TransferError, "NACK").is_transport_fault());
    EXPECT_FALSE(HatError(HatErrorKind::InvalidAccess, "rotulo").is_transport_fault());
    EXPECT_FALSE(HatError(HatErrorKind::OutOfRange, "valor").is_transport_fault());

    HatError error(HatErrorKind::BoardMismatch, "nome");
    EXPECT_NE(std::string(error.what()).find(to_string(HatErrorKind::BoardMismatch)), std::string::npos);
}
