#include "fake_transport.hpp"

#include "hat_board.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

using namespace std::chrono_literals;

// Constroi a placa guardando um ponteiro para a placa simulada
static std::unique_ptr<HatBoard> make_board(HatModel model, int address, const CwdtPolicy& policy,
                                            FakeTransport** fake, const std::string& name = "")
{
    const HatBoardType& type = hat_board_type(model);
    auto transport = std::make_unique<FakeTransport>(static_cast<uint8_t>(address), name.empty() ? type.name : name);
    *fake = transport.get();
    return std::make_unique<HatBoard>(type, std::move(transport), policy, null_log_sink());
}

TEST(HatBoard, ReadsIdentityOnce)
{
    FakeTransport* fake;
    auto board = make_board(HatModel::DI16ac, 0x40, CwdtPolicy::keep_board_setting(), &fake);

    size_t frames = fake->transactions();
    EXPECT_EQ(board->name(), "DI16ac I2C-HAT");
    EXPECT_EQ(board->firmware_version(), "v1.2.3");
    EXPECT_EQ(board->address(), 0x40);
    EXPECT_EQ(fake->transactions(), frames);
    EXPECT_EQ(fake->count(HAT_CMD_GET_BOARD_NAME), 1u);
    EXPECT_EQ(fake->count(HAT_CMD_GET_FIRMWARE_VERSION), 1u);
}

TEST(HatBoard, ToStringShowsNameAndAddress)
{
    FakeTransport* fake;
    auto board = make_board(HatModel::DQ10rly, 0x5A, CwdtPolicy::keep_board_setting(), &fake);

    EXPECT_EQ(board->to_string(), "DQ10rly I2C-HAT adr: 0x5A");
}

TEST(HatBoard, WrongBoardNameIsMismatch)
{
    FakeTransport* fake;
    EXPECT_EQ(error_kind([&]() {
                  make_board(HatModel::DI16ac, 0x40, CwdtPolicy::keep_board_setting(), &fake, "DQ16oc I2C-HAT");
              }),
              HatErrorKind::BoardMismatch);
}

TEST(HatBoard, AddressOutsideTypeRangeIsOutOfRange)
{
    FakeTransport* fake;
    EXPECT_EQ(error_kind([&]() { make_board(HatModel::DI16ac, 0x50, CwdtPolicy::disabled(), &fake); }),
              HatErrorKind::OutOfRange);
}

TEST(HatBoard, DeviceErrorsPropagateFromConstruction)
{
    const HatBoardType& type = hat_board_type(HatModel::DI16ac);
    auto transport = std::make_unique<FakeTransport>(0x40, type.name);
    transport->fail_with(HatErrorKind::DeviceNotFound);

    EXPECT_EQ(error_kind([&]() { HatBoard board(type, std::move(transport), CwdtPolicy::disabled(), null_log_sink()); }),
              HatErrorKind::DeviceNotFound);
}

TEST(HatBoard, DisabledPolicyWritesZeroPeriod)
{
    FakeTransport* fake;
    auto board = make_board(HatModel::DQ16oc, 0x50, CwdtPolicy::disabled(), &fake);

    EXPECT_EQ(fake->count(HAT_CMD_CWDT_SET_PERIOD), 1u);
    EXPECT_EQ(fake->value(HAT_CMD_CWDT_GET_PERIOD), 0u);
    EXPECT_FALSE(board->cwdt().feeding());
}

TEST(HatBoard, KeepPolicyWritesNothing)
{
    FakeTransport* fake;
    auto board = make_board(HatModel::DQ16oc, 0x50, CwdtPolicy::keep_board_setting(), &fake);

    // Somente nome e versao
    EXPECT_EQ(fake->transactions(), 2u);
    EXPECT_EQ(fake->count(HAT_CMD_CWDT_SET_PERIOD), 0u);
    EXPECT_FALSE(board->cwdt().feeding());
    EXPECT_FALSE(board->cwdt().state().period.has_value());
}

TEST(HatBoard, FedPolicyStartsFeeding)
{
    FakeTransport* fake;
    auto board = make_board(HatModel::DI6acDQ6ssr, 0x70, CwdtPolicy::fed(40ms), &fake);

    EXPECT_EQ(fake->value(HAT_CMD_CWDT_GET_PERIOD), 40u);
    EXPECT_TRUE(board->cwdt().feeding());
    EXPECT_EQ(board->cwdt().feeder().interval(), 20ms);

    // Alimentacao = quadro de leitura do periodo
    auto end = std::chrono::steady_clock::now() + 2s;
    while(fake->count(HAT_CMD_CWDT_GET_PERIOD) < 2 && std::chrono::steady_clock::now() < end)
    {
        std::this_thread::sleep_for(2ms);
    }
    EXPECT_GE(fake->count(HAT_CMD_CWDT_GET_PERIOD), 2u);
}

TEST(HatBoard, FedPolicyNeedsPositivePeriod)
{
    FakeTransport* fake;
    EXPECT_EQ(error_kind([&]() { make_board(HatModel::DQ8rly, 0x50, CwdtPolicy::fed(0ms), &fake); }),
              HatErrorKind::OutOfRange);
}

TEST(HatBoard, StatusWordDecode)
{
    FakeTransport* fake;
    auto board = make_board(HatModel::DI16ac, 0x40, CwdtPolicy::keep_board_setting(), &fake);
    fake->set_value(HAT_CMD_GET_STATUS_WORD, HAT_STATUS_CWDT_TIMEOUT | HAT_STATUS_IRQ_OVERFLOW);

    HatStatus status = board->status();
    EXPECT_TRUE(status.cwdt_timeout);
    EXPECT_FALSE(status.comm_error);
    EXPECT_TRUE(status.irq_overflow);
    EXPECT_EQ(status.raw, 0x05u);
}

TEST(HatBoard, ResetSendsCommandWithoutWaitingForResponse)
{
    FakeTransport* fake;
    auto board = make_board(HatModel::DQ10rly, 0x50, CwdtPolicy::keep_board_setting(), &fake);
    size_t reads = fake->read_lengths().size();

    board->reset();

    EXPECT_EQ(fake->count(HAT_CMD_RESET), 1u);
    EXPECT_TRUE(fake->last_request(HAT_CMD_RESET).empty());
    EXPECT_EQ(fake->read_lengths().size(), reads);
}

TEST(HatBoard, GroupsFollowBoardType)
{
    FakeTransport* fake;
    auto inputs = make_board(HatModel::DI16ac, 0x40, CwdtPolicy::keep_board_setting(), &fake);

    EXPECT_TRUE(inputs->has_di());
    EXPECT_FALSE(inputs->has_dq());
    EXPECT_TRUE(inputs->has_irq());
    EXPECT_EQ(error_kind([&]() { inputs->dq(); }), HatErrorKind::InvalidAccess);

    auto outputs = make_board(HatModel::Rly10, 0x50, CwdtPolicy::keep_board_setting(), &fake);
    EXPECT_EQ(error_kind([&]() { outputs->di(); }), HatErrorKind::InvalidAccess);
    EXPECT_EQ(error_kind([&]() { outputs->irq(); }), HatErrorKind::InvalidAccess);
    outputs->dq().set_channel("Rly3", true);
    EXPECT_EQ(fake->value(HAT_CMD_DQ_GET_ALL_CHANNELS), 0x04u);
}

TEST(HatBoard, MixedBoardExposesBothGroups)
{
    FakeTransport* fake;
    auto board = make_board(HatModel::DI6acDQ6rly, 0x63, CwdtPolicy::disabled(), &fake);

    fake->set_value(HAT_CMD_DI_GET_ALL_CHANNELS, 0x21);
    board->dq().set_value(0x3F);

    EXPECT_TRUE(board->di().channel("I5"));
    EXPECT_EQ(board->dq().value(), 0x3Fu);

    fake->push_capture(0x00200020);
    auto event = board->irq().read_event();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->channels(), (std::vector<size_t>{5}));
}

TEST(HatBoard, FeederAndApplicationNeverShareTheBus)
{
    FakeTransport* fake;
    auto board = make_board(HatModel::DQ10rly, 0x50, CwdtPolicy::fed(2ms), &fake);
    ASSERT_EQ(board->cwdt().feeder().interval(), 1ms);

    // Cada chamada segura o transporte: sem o mutex do handle as transacoes se cruzariam
    fake->set_call_delay(100us);

    auto end = std::chrono::steady_clock::now() + 200ms;
    size_t loops = 0;
    while(std::chrono::steady_clock::now() < end)
    {
        board->dq().value();
        loops++;
    }
    board->cwdt().stop_feeding();

    EXPECT_GT(loops, 0u);
    EXPECT_GT(fake->count(HAT_CMD_CWDT_GET_PERIOD), 1u);
    EXPECT_EQ(fake->overlaps(), 0u);
    EXPECT_EQ(board->cwdt().state().failure_count, 0u);
}
