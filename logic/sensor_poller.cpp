/*
 * Sensor_Poller Implementation
 */

#include "logic/sensor_poller.hpp"
#include "logic/readout.hpp"

#include <cstdio>

void Sensor_Poller::poll(uint32_t now_ms) {
    switch (state_) {
        case PollerState::Init: {
            HwError err = ina_.initialize(DEFAULT_CALIBRATION);
            if (err != HwError::None) {
                printf("[POLL] INA219 init failed: %s, sampling disabled\n", hw_error_name(err));
                state_ = PollerState::Terminated;
                return;
            }
            /* First tick is due immediately */
            next_tick_ms_ = now_ms;
            state_ = PollerState::WaitTick;
            [[fallthrough]];
        }
        case PollerState::WaitTick: {
            if (static_cast<int32_t>(now_ms - next_tick_ms_) < 0) {
                return;
            }
            Calibration cal = DEFAULT_CALIBRATION;
            if (calibration_.take(cal)) {
                /* Settle regardless of the result; the next sample reports a failure */
                HwError err = ina_.initialize(cal);
                printf("[POLL] calibration %s applied: %s\n", calibration_label(cal),
                       hw_error_name(err));
                settle_start_ms_ = now_ms;
                state_ = PollerState::Settling;
                return;
            }
            sample(now_ms);
            return;
        }

        case PollerState::Settling:
            if ((now_ms - settle_start_ms_) < settle_ms_) {
                return;
            }
            sample(now_ms);
            return;

        case PollerState::Publish:
            publish(now_ms);
            return;

        case PollerState::Terminated:
            return;
    }
}

void Sensor_Poller::sample(uint32_t now_ms) {
    PowerSnapshot snap;
    if (ina_.sample(snap) != HwError::None) {
        if (skipped_ < UINT32_MAX) {
            skipped_++;
        }
        wait_next_tick(now_ms);
        return;
    }
    pending_ = snap;
    state_ = PollerState::Publish;
    publish(now_ms);
}

void Sensor_Poller::publish(uint32_t now_ms) {
    if (!channel_.try_send(InputEvent::sensor_reading(pending_))) {
        return;  /* Slot busy: retry next poll */
    }
    if (published_ < UINT32_MAX) {
        published_++;
    }
    wait_next_tick(now_ms);
}

void Sensor_Poller::wait_next_tick(uint32_t now_ms) {
    next_tick_ms_ += interval_ms_;
    /* Ticks missed while settling or blocked on the channel are dropped */
    if (static_cast<int32_t>(now_ms - next_tick_ms_) >= 0) {
        next_tick_ms_ = now_ms + interval_ms_;
    }
    state_ = PollerState::WaitTick;
}
