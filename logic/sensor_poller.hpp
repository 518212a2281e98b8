/*
 * Sensor_Poller - Periodic INA219 sampling task
 * Pure logic over INA219_Driver. Testable on host with a fake bus.
 *
 * Init:     program the default preset; failure stops the task for good
 * WaitTick: on each tick apply a pending calibration (then Settling) or sample
 * Settling: fixed delay after a calibration change, then sample
 * Publish:  hold the reading until the input channel accepts it
 *
 * Failed samples are skipped without an event.
 */

#ifndef SENSOR_POLLER_HPP
#define SENSOR_POLLER_HPP

#include "drivers/ina219.hpp"
#include "logic/input_channel.hpp"
#include "logic/task_runner.hpp"
#include "types.h"

#include <cstdint>

enum class PollerState : uint8_t { Init, WaitTick, Settling, Publish, Terminated };

class Sensor_Poller final : public Task {
public:
    static constexpr Calibration DEFAULT_CALIBRATION = Calibration::Range_32V_2A;

    Sensor_Poller(INA219_Driver &ina, Input_Channel &channel, Calibration_Signal &calibration,
                  uint32_t interval_ms, uint32_t settle_ms)
        : ina_(ina), channel_(channel), calibration_(calibration),
          interval_ms_(interval_ms), settle_ms_(settle_ms) {}

    void poll(uint32_t now_ms) override;
    bool terminated() const override { return state_ == PollerState::Terminated; }
    const char *name() const override { return "sensor-poller"; }

    PollerState state() const { return state_; }
    uint32_t samples_published() const { return published_; }
    uint32_t samples_skipped() const { return skipped_; }

private:
    INA219_Driver &ina_;
    Input_Channel &channel_;
    Calibration_Signal &calibration_;
    uint32_t interval_ms_;
    uint32_t settle_ms_;

    PollerState state_ = PollerState::Init;
    uint32_t next_tick_ms_ = 0;
    uint32_t settle_start_ms_ = 0;
    PowerSnapshot pending_ = {};
    uint32_t published_ = 0;
    uint32_t skipped_ = 0;

    void sample(uint32_t now_ms);
    void publish(uint32_t now_ms);
    void wait_next_tick(uint32_t now_ms);
};

#endif // SENSOR_POLLER_HPP
