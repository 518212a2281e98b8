/*
 * Button_Monitor Implementation
 */

#include "logic/button_monitor.hpp"

#include <cstdio>

const char *Button_Monitor::name() const {
    switch (config_.id) {
        case ButtonId::Calibrate: return "button-calibrate";
        case ButtonId::Previous:  return "button-previous";
        case ButtonId::Next:      return "button-next";
    }
    return "button";
}

void Button_Monitor::poll(uint32_t now_ms) {
    switch (state_) {
        case ButtonTaskState::Idle: {
            bool edge = false;
            HwError err = pin_.poll_edge(config_.edge, edge);
            if (err != HwError::None) {
                printf("[BTN] %s: %s, task stopped\n", name(), hw_error_name(err));
                state_ = ButtonTaskState::Terminated;
                return;
            }
            if (!edge) {
                return;
            }
            state_ = ButtonTaskState::Emit;
            [[fallthrough]];
        }
        case ButtonTaskState::Emit:
            if (!channel_.try_send(InputEvent::button_press(config_.id))) {
                return;  /* Slot busy: retry next poll */
            }
            if (presses_ < UINT32_MAX) {
                presses_++;
            }
            cooldown_start_ms_ = now_ms;
            state_ = ButtonTaskState::Cooldown;
            return;

        case ButtonTaskState::Cooldown:
            /* Unsigned subtraction handles uint32_t wrap */
            if ((now_ms - cooldown_start_ms_) < config_.cooldown_ms) {
                return;
            }
            pin_.discard_edges();
            state_ = ButtonTaskState::Idle;
            return;

        case ButtonTaskState::Terminated:
            return;
    }
}
