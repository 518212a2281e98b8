/*
 * Render_Loop Implementation
 */

#include "logic/render_loop.hpp"

#include <cstdio>
#include <cstring>

Render_Loop::Render_Loop(Input_Channel &channel, Calibration_Signal &calibration,
                         Readout_Screen &screen, bool sensor_present)
    : channel_(channel), calibration_(calibration), screen_(screen),
      sensor_present_(sensor_present) {
    screen_.set_header_text(calibration_label(calibration_at(calibration_index_)));
}

HwError Render_Loop::start() {
    return repaint();
}

void Render_Loop::poll(uint32_t now_ms) {
    (void)now_ms;

    InputEvent event;
    if (!channel_.try_receive(event)) {
        return;
    }
    HwError err = step(event);
    if (err != HwError::None) {
        if (draw_failures_ < UINT32_MAX) {
            draw_failures_++;
        }
        printf("[RENDER] readout draw failed: %s\n", hw_error_name(err));
    }
}

HwError Render_Loop::step(const InputEvent &event) {
    switch (event.kind) {
        case InputKind::Status:
            show_overlay(event.text);
            return HwError::None;

        case InputKind::Sensor:
            snapshot_ = event.power;
            have_snapshot_ = true;
            break;

        case InputKind::Button:
            if (event.button == ButtonId::Calibrate) {
                calibration_index_ = calibration_cycle(calibration_index_);
                Calibration cal = calibration_at(calibration_index_);
                calibration_.signal(cal);
                screen_.set_header_text(calibration_label(cal));
                printf("[RENDER] calibration -> %s\n", calibration_label(cal));
                show_overlay(calibration_label(cal));
                return HwError::None;
            }
            mode_ = (event.button == ButtonId::Next) ? display_mode_next(mode_)
                                                      : display_mode_previous(mode_);
            break;
    }

    if (overlay_active_) {
        HwError err = repaint();
        if (err != HwError::None) {
            return err;
        }
    }
    return refresh_readout();
}

HwError Render_Loop::repaint() {
    forget_readout();
    HwError err = sensor_present_ ? screen_.draw_frame() : screen_.show_fallback();
    if (err == HwError::None) {
        overlay_active_ = false;
    }
    return err;
}

HwError Render_Loop::refresh_readout() {
    if (!sensor_present_ || !have_snapshot_) {
        return HwError::None;
    }

    char value[READOUT_TEXT_LEN];
    format_readout(mode_, snapshot_, value, sizeof(value));
    const char *unit = display_mode_unit(mode_);

    if (last_unit_ == unit && strcmp(value, last_value_) == 0) {
        return HwError::None;
    }

    HwError err = screen_.draw_readout(value, unit);
    if (err != HwError::None) {
        forget_readout();
        return err;
    }
    snprintf(last_value_, sizeof(last_value_), "%s", value);
    last_unit_ = unit;
    return HwError::None;
}

void Render_Loop::show_overlay(const char *message) {
    /* Best effort: the readout is repainted on the next event either way */
    HwError err = screen_.show_overlay(message);
    if (err != HwError::None) {
        printf("[RENDER] overlay draw failed: %s\n", hw_error_name(err));
    }
    overlay_active_ = true;
    forget_readout();
}

void Render_Loop::forget_readout() {
    last_value_[0] = '\0';
    last_unit_ = nullptr;
}
