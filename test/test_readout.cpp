/*
 * Readout Unit Tests
 * Calibration cycling, display mode stepping and value formatting
 */

#include "logic/readout.hpp"
#include <gtest/gtest.h>

#include <string>

static std::string format(DisplayMode mode, const PowerSnapshot &snap) {
    char buf[READOUT_TEXT_LEN];
    format_readout(mode, snap, buf, sizeof(buf));
    return std::string(buf);
}

TEST(CalibrationCycleTest, WrapsAfterLastPreset) {
    EXPECT_EQ(calibration_cycle(0), 1U);
    EXPECT_EQ(calibration_cycle(1), 2U);
    EXPECT_EQ(calibration_cycle(2), 0U);
}

TEST(CalibrationCycleTest, IndexIsTakenModuloPresetCount) {
    uint8_t index = 0;
    for (int i = 0; i < 7; ++i) {
        index = calibration_cycle(index);
    }
    EXPECT_EQ(index, 7U % CALIBRATION_COUNT);
    EXPECT_EQ(calibration_at(4), Calibration::Range_32V_1A);
    EXPECT_EQ(calibration_at(5), Calibration::Range_16V_400mA);
}

TEST(CalibrationCycleTest, Labels) {
    EXPECT_STREQ(calibration_label(Calibration::Range_32V_2A), "32V - 2A");
    EXPECT_STREQ(calibration_label(Calibration::Range_32V_1A), "32V - 1A");
    EXPECT_STREQ(calibration_label(Calibration::Range_16V_400mA), "16V - 400mA");
}

TEST(DisplayModeTest, NextClampsAtPower) {
    EXPECT_EQ(display_mode_next(DisplayMode::Voltage), DisplayMode::Current);
    EXPECT_EQ(display_mode_next(DisplayMode::Current), DisplayMode::Power);
    EXPECT_EQ(display_mode_next(DisplayMode::Power), DisplayMode::Power);
}

TEST(DisplayModeTest, PreviousClampsAtVoltage) {
    EXPECT_EQ(display_mode_previous(DisplayMode::Power), DisplayMode::Current);
    EXPECT_EQ(display_mode_previous(DisplayMode::Current), DisplayMode::Voltage);
    EXPECT_EQ(display_mode_previous(DisplayMode::Voltage), DisplayMode::Voltage);
}

TEST(DisplayModeTest, Units) {
    EXPECT_STREQ(display_mode_unit(DisplayMode::Voltage), "V ");
    EXPECT_STREQ(display_mode_unit(DisplayMode::Current), "mA");
    EXPECT_STREQ(display_mode_unit(DisplayMode::Power), "mW");
}

TEST(FormatReadoutTest, VoltageThreeDecimals) {
    PowerSnapshot snap;
    snap.bus_v = 12.3456f;
    snap.current_ma = 10.0f;
    EXPECT_EQ(format(DisplayMode::Voltage, snap), "12.346");
}

TEST(FormatReadoutTest, CurrentAndPowerRightJustified) {
    PowerSnapshot snap;
    snap.current_ma = 42.26f;
    snap.power_mw = 512.0f;
    EXPECT_EQ(format(DisplayMode::Current, snap), "  42.3");
    EXPECT_EQ(format(DisplayMode::Power, snap), " 512.0");
}

TEST(FormatReadoutTest, ZeroCurrentRendersZero) {
    PowerSnapshot snap;
    snap.bus_v = 4.95f;
    snap.current_ma = 0.0f;
    snap.power_mw = 3.0f;
    EXPECT_EQ(format(DisplayMode::Voltage, snap), "0.000");
    EXPECT_EQ(format(DisplayMode::Current, snap), "   0.0");
    EXPECT_EQ(format(DisplayMode::Power, snap), "   0.0");
}

TEST(FormatReadoutTest, NegativeCurrentKeepsSign) {
    PowerSnapshot snap;
    snap.current_ma = -5.5f;
    EXPECT_EQ(format(DisplayMode::Current, snap), "  -5.5");
}
