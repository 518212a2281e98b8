/*
 * Fuel_Gauge_Poller - Low-battery status producer
 * Reads the MAX17048 cell voltage every interval_ms (first check immediately)
 * and publishes one status message per low-voltage episode. The warning
 * re-arms once the cell recovers above the threshold.
 */

#ifndef FUEL_GAUGE_POLLER_HPP
#define FUEL_GAUGE_POLLER_HPP

#include "drivers/max17048.hpp"
#include "logic/input_channel.hpp"
#include "logic/task_runner.hpp"
#include "types.h"

#include <cstdint>

class Fuel_Gauge_Poller final : public Task {
public:
    Fuel_Gauge_Poller(MAX17048_Driver &gauge, Input_Channel &channel,
                      uint32_t interval_ms, float low_voltage)
        : gauge_(gauge), channel_(channel), interval_ms_(interval_ms),
          low_voltage_(low_voltage) {}

    void poll(uint32_t now_ms) override;
    const char *name() const override { return "fuel-gauge"; }

    bool warning_active() const { return warned_; }
    bool message_pending() const { return pending_; }
    float last_voltage() const { return last_voltage_; }
    uint32_t read_errors() const { return read_errors_; }

private:
    MAX17048_Driver &gauge_;
    Input_Channel &channel_;
    uint32_t interval_ms_;
    float low_voltage_;

    bool started_ = false;
    uint32_t next_check_ms_ = 0;
    bool warned_ = false;
    bool pending_ = false;
    float last_voltage_ = 0.0f;
    uint32_t read_errors_ = 0;
    char message_[STATUS_TEXT_LEN] = {};
};

#endif // FUEL_GAUGE_POLLER_HPP
