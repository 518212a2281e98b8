/*
 * Button_Monitor Unit Tests
 * Edge -> emit -> cooldown cycle against a scripted pin
 */

#include "logic/button_monitor.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>

class ButtonMonitorTest : public ::testing::Test {
protected:
    static constexpr uint32_t COOLDOWN_MS = 500;

    Fake_Input pin;
    Input_Channel channel;
    Button_Monitor monitor{pin, channel, Button_Config{ButtonId::Next, EdgeKind::Rising, COOLDOWN_MS}};
};

TEST_F(ButtonMonitorTest, IdleWithoutEdge) {
    for (uint32_t t = 0; t < 100; t += 10) {
        monitor.poll(t);
    }
    EXPECT_TRUE(channel.empty());
    EXPECT_EQ(monitor.state(), ButtonTaskState::Idle);
    EXPECT_EQ(pin.last_kind(), EdgeKind::Rising);
}

TEST_F(ButtonMonitorTest, EdgeEmitsOnePress) {
    pin.press();
    monitor.poll(0);

    InputEvent ev;
    ASSERT_TRUE(channel.try_receive(ev));
    EXPECT_EQ(ev.kind, InputKind::Button);
    EXPECT_EQ(ev.button, ButtonId::Next);
    EXPECT_EQ(monitor.presses(), 1U);
    EXPECT_EQ(monitor.state(), ButtonTaskState::Cooldown);
}

TEST_F(ButtonMonitorTest, EdgesDuringCooldownAreDiscarded) {
    pin.press();
    monitor.poll(0);
    InputEvent ev;
    ASSERT_TRUE(channel.try_receive(ev));

    /* Bounce while cooling down */
    pin.press();
    monitor.poll(100);
    monitor.poll(499);
    EXPECT_TRUE(channel.empty());
    EXPECT_EQ(monitor.state(), ButtonTaskState::Cooldown);

    monitor.poll(500);
    EXPECT_EQ(monitor.state(), ButtonTaskState::Idle);
    EXPECT_EQ(pin.discards(), 1);

    monitor.poll(510);
    EXPECT_TRUE(channel.empty());
    EXPECT_EQ(monitor.presses(), 1U);
}

TEST_F(ButtonMonitorTest, SecondPressAfterCooldown) {
    pin.press();
    monitor.poll(0);
    InputEvent ev;
    ASSERT_TRUE(channel.try_receive(ev));
    monitor.poll(600);

    pin.press();
    monitor.poll(700);
    EXPECT_TRUE(channel.try_receive(ev));
    EXPECT_EQ(monitor.presses(), 2U);
}

TEST_F(ButtonMonitorTest, PressWaitsForFreeSlot) {
    ASSERT_TRUE(channel.try_send(InputEvent::status_message("busy")));

    pin.press();
    monitor.poll(0);
    monitor.poll(10);
    EXPECT_EQ(monitor.state(), ButtonTaskState::Emit);
    EXPECT_EQ(monitor.presses(), 0U);

    InputEvent ev;
    ASSERT_TRUE(channel.try_receive(ev));
    EXPECT_EQ(ev.kind, InputKind::Status);

    monitor.poll(20);
    ASSERT_TRUE(channel.try_receive(ev));
    EXPECT_EQ(ev.button, ButtonId::Next);
    EXPECT_EQ(monitor.presses(), 1U);
}

TEST_F(ButtonMonitorTest, CooldownSurvivesTimerWrap) {
    pin.press();
    monitor.poll(UINT32_MAX - 100U);
    InputEvent ev;
    ASSERT_TRUE(channel.try_receive(ev));

    monitor.poll(200);  /* 301ms later, after wrap */
    EXPECT_EQ(monitor.state(), ButtonTaskState::Cooldown);
    monitor.poll(400);
    EXPECT_EQ(monitor.state(), ButtonTaskState::Idle);
}

TEST_F(ButtonMonitorTest, PinFaultStopsOnlyThisTask) {
    Fake_Input other_pin;
    Button_Monitor other(other_pin, channel,
                         Button_Config{ButtonId::Calibrate, EdgeKind::Falling, COOLDOWN_MS});

    pin.set_fault(true);
    monitor.poll(0);
    EXPECT_TRUE(monitor.terminated());

    other_pin.press();
    other.poll(0);
    EXPECT_FALSE(other.terminated());
    InputEvent ev;
    ASSERT_TRUE(channel.try_receive(ev));
    EXPECT_EQ(ev.button, ButtonId::Calibrate);
}

TEST(ButtonMonitorNameTest, NamedAfterButton) {
    Fake_Input pin;
    Input_Channel channel;
    Button_Monitor a(pin, channel, Button_Config{ButtonId::Calibrate, EdgeKind::Falling, 500});
    Button_Monitor b(pin, channel, Button_Config{ButtonId::Previous, EdgeKind::Rising, 500});
    EXPECT_STREQ(a.name(), "button-calibrate");
    EXPECT_STREQ(b.name(), "button-previous");
}
