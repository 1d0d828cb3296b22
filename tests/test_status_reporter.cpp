#include "fake_transport.hpp"

#include "status_reporter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using namespace std::chrono_literals;

static std::unique_ptr<HatBoard> make_board(const CwdtPolicy& policy, FakeTransport** fake)
{
    const HatBoardType& type = hat_board_type(HatModel::DQ16oc);
    auto transport = std::make_unique<FakeTransport>(0x50, type.name);
    *fake = transport.get();
    return std::make_unique<HatBoard>(type, std::move(transport), policy, null_log_sink());
}

TEST(StatusReporter, UnknownPeriodIsOmitted)
{
    FakeTransport* fake;
    auto board = make_board(CwdtPolicy::keep_board_setting(), &fake);

    boost::json::object json = StatusReporter::status_json(*board);

    ASSERT_TRUE(json.contains("cwdt"));
    const boost::json::object& cwdt = json["cwdt"].as_object();
    EXPECT_FALSE(cwdt.contains("period_ms"));
    EXPECT_FALSE(cwdt.at("feeding").as_bool());
}

TEST(StatusReporter, KnownPeriodIsPublished)
{
    FakeTransport* fake;
    auto board = make_board(CwdtPolicy::fed(40ms), &fake);

    boost::json::object json = StatusReporter::status_json(*board);

    const boost::json::object& cwdt = json["cwdt"].as_object();
    ASSERT_TRUE(cwdt.contains("period_ms"));
    EXPECT_EQ(cwdt.at("period_ms").as_int64(), 40);
    EXPECT_EQ(json["address"].as_string(), "0x50");
}
