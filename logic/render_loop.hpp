/*
 * Render_Loop - Single consumer of the input channel
 * Owns the calibration cursor, the display mode and the last drawn readout.
 *
 * Calibrate:     next preset (wraps), signal the poller, overlay its label
 * Previous/Next: display mode step, clamped at the ends
 * Sensor:        keep the snapshot, redraw the value if its text changed
 * Status:        overlay the message
 *
 * An overlay stays up until the next non-status event, which repaints the
 * whole readout screen. Only readout draw failures are reported by step().
 */

#ifndef RENDER_LOOP_HPP
#define RENDER_LOOP_HPP

#include "logic/input_channel.hpp"
#include "logic/readout.hpp"
#include "logic/task_runner.hpp"
#include "utils/readout_screen.hpp"
#include "types.h"

#include <cstdint>

class Render_Loop final : public Task {
public:
    Render_Loop(Input_Channel &channel, Calibration_Signal &calibration,
                Readout_Screen &screen, bool sensor_present);

    /* First paint: readout frame, or the fallback message without a sensor */
    HwError start();

    void poll(uint32_t now_ms) override;
    const char *name() const override { return "render"; }

    /* Apply one event; returns the readout draw result */
    HwError step(const InputEvent &event);

    DisplayMode mode() const { return mode_; }
    uint8_t calibration_index() const { return calibration_index_; }
    Calibration calibration() const { return calibration_at(calibration_index_); }
    bool overlay_active() const { return overlay_active_; }
    const char *last_value() const { return last_value_; }
    uint32_t draw_failures() const { return draw_failures_; }

private:
    Input_Channel &channel_;
    Calibration_Signal &calibration_;
    Readout_Screen &screen_;
    bool sensor_present_;

    uint8_t calibration_index_ = 0;
    DisplayMode mode_ = DisplayMode::Voltage;
    bool overlay_active_ = false;

    bool have_snapshot_ = false;
    PowerSnapshot snapshot_ = {};

    /* What is on screen now; empty after a repaint */
    char last_value_[READOUT_TEXT_LEN] = {};
    const char *last_unit_ = nullptr;

    uint32_t draw_failures_ = 0;

    HwError repaint();
    HwError refresh_readout();
    void show_overlay(const char *message);
    void forget_readout();
};

#endif // RENDER_LOOP_HPP
