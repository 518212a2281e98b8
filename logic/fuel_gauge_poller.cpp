/*
 * Fuel_Gauge_Poller Implementation
 */

#include "logic/fuel_gauge_poller.hpp"

#include <cstdio>

void Fuel_Gauge_Poller::poll(uint32_t now_ms) {
    if (pending_) {
        if (!channel_.try_send(InputEvent::status_message(message_))) {
            return;
        }
        pending_ = false;
    }

    if (!started_) {
        next_check_ms_ = now_ms;
        started_ = true;
    }
    if (static_cast<int32_t>(now_ms - next_check_ms_) < 0) {
        return;
    }
    next_check_ms_ = now_ms + interval_ms_;

    float volts = 0.0f;
    HwError err = gauge_.read_cell_voltage(volts);
    if (err != HwError::None) {
        if (read_errors_ < UINT32_MAX) {
            read_errors_++;
        }
        printf("[GAUGE] read failed: %s\n", hw_error_name(err));
        return;
    }
    last_voltage_ = volts;

    if (volts >= low_voltage_) {
        if (warned_) {
            printf("[GAUGE] battery recovered %.2f V\n", volts);
        }
        warned_ = false;
        return;
    }
    if (warned_) {
        return;
    }

    warned_ = true;
    snprintf(message_, sizeof(message_), "Battery low %.2f V", volts);
    printf("[GAUGE] %s\n", message_);
    pending_ = !channel_.try_send(InputEvent::status_message(message_));
}
