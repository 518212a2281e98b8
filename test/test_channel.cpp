/*
 * Channel / Signal Unit Tests
 */

#include "logic/channel.hpp"
#include "logic/input_channel.hpp"
#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <vector>

TEST(ChannelTest, StartsEmpty) {
    Channel<int, 2> ch;
    int out = 0;
    EXPECT_TRUE(ch.empty());
    EXPECT_FALSE(ch.try_receive(out));
    EXPECT_EQ(ch.capacity(), 2U);
}

TEST(ChannelTest, FifoOrder) {
    Channel<int, 3> ch;
    EXPECT_TRUE(ch.try_send(1));
    EXPECT_TRUE(ch.try_send(2));
    EXPECT_TRUE(ch.try_send(3));
    EXPECT_TRUE(ch.full());

    int out = 0;
    EXPECT_TRUE(ch.try_receive(out)); EXPECT_EQ(out, 1);
    EXPECT_TRUE(ch.try_receive(out)); EXPECT_EQ(out, 2);
    EXPECT_TRUE(ch.try_send(4));      /* wraps around the ring */
    EXPECT_TRUE(ch.try_receive(out)); EXPECT_EQ(out, 3);
    EXPECT_TRUE(ch.try_receive(out)); EXPECT_EQ(out, 4);
    EXPECT_TRUE(ch.empty());
}

TEST(ChannelTest, SendRefusedUntilReceived) {
    /* Capacity 1: a second send must wait for the first to be consumed */
    Input_Channel ch;
    EXPECT_TRUE(ch.try_send(InputEvent::button_press(ButtonId::Next)));
    EXPECT_FALSE(ch.try_send(InputEvent::button_press(ButtonId::Previous)));
    EXPECT_EQ(ch.size(), 1U);

    InputEvent ev;
    ASSERT_TRUE(ch.try_receive(ev));
    EXPECT_EQ(ev.button, ButtonId::Next);
    EXPECT_TRUE(ch.try_send(InputEvent::button_press(ButtonId::Previous)));
}

TEST(ChannelTest, RacingProducersAreSerialized) {
    /* Two producers retry every round; each event is delivered exactly once */
    Input_Channel ch;
    bool a_pending = true;
    bool b_pending = true;
    std::vector<InputKind> received;

    for (int round = 0; round < 4; ++round) {
        if (a_pending && ch.try_send(InputEvent::button_press(ButtonId::Calibrate))) {
            a_pending = false;
        }
        if (b_pending && ch.try_send(InputEvent::status_message("hello"))) {
            b_pending = false;
        }
        InputEvent ev;
        if (ch.try_receive(ev)) {
            received.push_back(ev.kind);
        }
    }

    ASSERT_EQ(received.size(), 2U);
    EXPECT_EQ(received[0], InputKind::Button);   /* found the empty slot first */
    EXPECT_EQ(received[1], InputKind::Status);
}

TEST(InputEventTest, StatusMessageIsTruncatedAndTerminated) {
    std::string long_text(200, 'x');
    InputEvent ev = InputEvent::status_message(long_text.c_str());
    EXPECT_EQ(ev.kind, InputKind::Status);
    EXPECT_EQ(strlen(ev.text), STATUS_TEXT_LEN - 1U);
}

TEST(SignalTest, LatestValueWins) {
    Calibration_Signal sig;
    Calibration cal = Calibration::Range_32V_2A;
    EXPECT_FALSE(sig.take(cal));

    sig.signal(Calibration::Range_32V_1A);
    sig.signal(Calibration::Range_16V_400mA);
    EXPECT_TRUE(sig.signaled());
    EXPECT_TRUE(sig.take(cal));
    EXPECT_EQ(cal, Calibration::Range_16V_400mA);
    EXPECT_FALSE(sig.take(cal));
}

TEST(SignalTest, ResetDropsPendingValue) {
    Signal<int> sig;
    sig.signal(5);
    sig.reset();
    int out = 0;
    EXPECT_FALSE(sig.take(out));
}
