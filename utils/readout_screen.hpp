/*
 * Readout_Screen - 240x135 power meter screens over a Draw_Target
 * Pure drawing, no SDK dependency. Testable on host.
 *
 * Layout (readout):
 *   y   0..19   header strip, active calibration label (large font)
 *   y  26..89   seven-segment value, unit at the right
 *   y  95..134  button bar: calibrate / previous / next
 *
 * Overlays (status, battery splash) cover the whole screen; the caller
 * repaints the frame with draw_frame() when the overlay is dismissed.
 */

#ifndef READOUT_SCREEN_HPP
#define READOUT_SCREEN_HPP

#include "utils/draw_target.hpp"
#include "utils/graphics.hpp"
#include "utils/widgets.hpp"
#include "types.h"

#include <cstdint>

class Readout_Screen {
public:
    static constexpr int32_t HEADER_HEIGHT = 20;
    static constexpr Point HEADER_TEXT_POS = {4, 2};
    static constexpr Point VALUE_POS = {4, 26};
    static constexpr uint32_t VALUE_WIDTH = 200;
    static constexpr Point UNIT_POS = {208, 50};
    static constexpr uint32_t UNIT_WIDTH = 32;
    static constexpr int32_t BUTTON_BAR_Y = 95;
    static constexpr Size BAR_BUTTON_SIZE = {80, 40};
    static constexpr uint32_t REPORT_ROW_HEIGHT = 20;

    static constexpr Seven_Segment_Style VALUE_STYLE = {24, 64, 6, 6, COLOR_WHITE};

    Readout_Screen(Draw_Target &target, const Theme &theme);

    /* Clear, header, empty value area, button bar */
    HwError draw_frame();

    /* Value and unit only; the frame must already be on screen */
    HwError draw_readout(const char *value, const char *unit);

    /* Full-screen message with the info icon */
    HwError show_overlay(const char *message);

    /* Header text used by the next draw_frame() */
    void set_header_text(const char *text);
    const char *header_text() const { return header_.text(); }

    /* "No ina219 found", drawn once when the power sensor is absent */
    HwError show_fallback();

    /* "Battery X.X V" with the battery icon */
    HwError show_battery(float volts);

    /* One row per probed device */
    HwError show_device_report(const List_Item *items, uint8_t count);

    Draw_Target &target() { return target_; }

private:
    Draw_Target &target_;
    const Theme &theme_;
    Label header_;
    Label unit_;
    Button buttons_[3];

    Rect screen_rect() const;
    Font_Id font_for(const char *text) const;
};

#endif // READOUT_SCREEN_HPP
