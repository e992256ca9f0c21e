#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "controller.h"
#include "errors.h"
#include "fakes.h"

using namespace std::chrono_literals;

class ControllerPoolTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock>     clock  = std::make_shared<ManualClock>();
    std::shared_ptr<RecordingSender> sender = std::make_shared<RecordingSender>(clock);

    ControllerPool make(double pause = 0.0, int repeat = 1) {
        ControllerConfig base;
        base.repeat_commands        = repeat;
        base.pause_between_commands = pause;
        std::vector<std::string> hosts = {"127.0.0.1", "127.0.0.2"};
        return ControllerPool(hosts, base, sender, clock);
    }
};

TEST_F(ControllerPoolTest, ExecuteTargetsTheIndexedGateway) {
    auto pool = make();
    ASSERT_EQ(pool.size(), 2);

    pool.execute(0, make_color_operation(NamedColor{"red"}, 1));
    pool.execute(1, make_color_operation(NamedColor{"aqua"}, 3));
    pool.execute(0, make_operation(Command::On));

    ASSERT_EQ(sender->sent.size(), 5u);
    EXPECT_EQ(sender->sent[0].host, "127.0.0.1");
    EXPECT_EQ(sender->sent[1].frame, (Frame{0x40, 0xb0, 0x55}));
    EXPECT_EQ(sender->sent[2].host, "127.0.0.2");
    EXPECT_EQ(sender->sent[3].frame, (Frame{0x40, 0x30, 0x55}));
    EXPECT_EQ(sender->sent[4].host, "127.0.0.1");
    EXPECT_EQ(sender->sent[4].frame, (Frame{0x42, 0x00, 0x55}));
}

TEST_F(ControllerPoolTest, IndexOutOfRange) {
    auto pool = make();
    EXPECT_THROW(pool.execute(2, make_operation(Command::On)), IndexOutOfRange);
    EXPECT_THROW(pool.execute(-1, make_operation(Command::On)), IndexOutOfRange);
    EXPECT_THROW(pool.controller(5), IndexOutOfRange);
    EXPECT_TRUE(sender->sent.empty());
}

TEST_F(ControllerPoolTest, PacingIsSharedAcrossGateways) {
    auto pool = make(0.5);
    EXPECT_EQ(pool.controller(0).pacing_state(), pool.controller(1).pacing_state());

    pool.execute(0, make_operation(Command::On));
    pool.execute(1, make_operation(Command::On));

    ASSERT_EQ(sender->sent.size(), 2u);
    EXPECT_NE(sender->sent[0].host, sender->sent[1].host);
    EXPECT_GE(sender->sent[1].at - sender->sent[0].at,
              std::chrono::duration_cast<Clock::Duration>(500ms));
    ASSERT_EQ(clock->sleeps.size(), 1u);
}

TEST_F(ControllerPoolTest, PerGatewaySettings) {
    ControllerConfig a;
    a.host = "10.0.0.1";
    a.port = 50000;
    ControllerConfig b;
    b.host = "10.0.0.2";
    b.groups[1] = BulbType::White;
    ControllerPool pool({a, b}, sender, clock);

    EXPECT_EQ(pool.controller(0).port(), 50000);
    EXPECT_EQ(pool.controller(1).port(), 8899);
    EXPECT_EQ(pool.controller(1).group_type(2), BulbType::White);
    EXPECT_EQ(pool.controller(0).group_type(2), BulbType::Rgbw);
}

TEST_F(ControllerPoolTest, LargestPauseAppliesToEveryGateway) {
    ControllerConfig slow;
    slow.host = "10.0.0.1";
    slow.repeat_commands = 1;
    slow.pause_between_commands = 0.5;
    ControllerConfig fast = slow;
    fast.host = "10.0.0.2";
    fast.pause_between_commands = 0.0;
    ControllerPool pool({slow, fast}, sender, clock);

    EXPECT_DOUBLE_EQ(pool.pacing_state()->min_pause, 0.5);

    pool.execute(0, make_operation(Command::On));
    pool.execute(1, make_operation(Command::On));

    ASSERT_EQ(sender->sent.size(), 2u);
    EXPECT_EQ(sender->sent[1].host, "10.0.0.2");
    EXPECT_GE(sender->sent[1].at - sender->sent[0].at,
              std::chrono::duration_cast<Clock::Duration>(500ms));
}

TEST_F(ControllerPoolTest, InvalidGatewayConfigFailsConstruction) {
    ControllerConfig bad;
    bad.host = "10.0.0.1";
    bad.port = 0;
    EXPECT_THROW(ControllerPool({bad}, sender, clock), InvalidConfig);
}

TEST_F(ControllerPoolTest, BatchRunOnOneGateway) {
    auto pool = make(0.0, 3);
    pool.batch_run(1, {make_operation(Command::On, 1), make_operation(Command::Off, 1)});

    EXPECT_EQ(sender->opcodes(), (std::vector<uint8_t>{0x45, 0x46, 0x45, 0x46, 0x45, 0x46}));
    for (auto& s : sender->sent)
        EXPECT_EQ(s.host, "127.0.0.2");
    EXPECT_EQ(pool.controller(1).repeat_commands(), 3);
    EXPECT_THROW(pool.batch_run(2, {}), IndexOutOfRange);
}
