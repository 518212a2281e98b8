/*
 * Core Type Definitions for RP2350 Power Meter Firmware
 * Shared by drivers, tasks, and the render loop
 */

#ifndef POWERMETER_TYPES_H
#define POWERMETER_TYPES_H

#include <stdint.h>
#include <stdbool.h>

/*============================================================================
 * Hardware Error Codes
 *============================================================================*/

/* Returned by every bus, pin, and draw operation (None = success) */
enum class HwError : uint8_t {
    None,
    BusNack,        /* Device did not acknowledge its address or data */
    BusTimeout,     /* Transfer did not complete within the bus timeout */
    BusBusy,        /* Another transaction holds the shared bus */
    NotCalibrated,  /* Sensor lost its calibration register (power cycle) */
    PinFault,       /* Digital input could not be read */
    DrawFailed      /* Draw target rejected the operation */
};

inline const char *hw_error_name(HwError err) {
    switch (err) {
        case HwError::None:          return "ok";
        case HwError::BusNack:       return "bus nack";
        case HwError::BusTimeout:    return "bus timeout";
        case HwError::BusBusy:       return "bus busy";
        case HwError::NotCalibrated: return "not calibrated";
        case HwError::PinFault:      return "pin fault";
        case HwError::DrawFailed:    return "draw failed";
    }
    return "unknown";
}

/*============================================================================
 * Power Sample
 *============================================================================
 *
 * One INA219 reading, copied by value into input events.
 * Units follow the sensor registers after decoding:
 *   shunt_mv   - shunt voltage (mV)
 *   bus_v      - bus voltage (V)
 *   current_ma - current (mA)
 *   power_mw   - power (mW)
 */

struct PowerSnapshot {
    float shunt_mv = 0.0f;
    float bus_v = 0.0f;
    float current_ma = 0.0f;
    float power_mw = 0.0f;
};

/*============================================================================
 * Calibration Presets and Display Modes
 *============================================================================*/

/* INA219 range presets, in cycling order */
enum class Calibration : uint8_t {
    Range_32V_2A,
    Range_32V_1A,
    Range_16V_400mA
};
static constexpr uint8_t CALIBRATION_COUNT = 3;

/* Readout quantity, in button order (Previous/Next clamp at the ends) */
enum class DisplayMode : uint8_t {
    Voltage,
    Current,
    Power
};
static constexpr uint8_t DISPLAY_MODE_COUNT = 3;

/*============================================================================
 * Input Events
 *============================================================================*/

enum class ButtonId : uint8_t {
    Calibrate,  /* Cycle INA219 calibration preset */
    Previous,   /* Previous display mode */
    Next        /* Next display mode */
};

enum class InputKind : uint8_t {
    Button,   /* Produced by Button_Monitor */
    Sensor,   /* Produced by Sensor_Poller */
    Status    /* Produced by Fuel_Gauge_Poller */
};

static constexpr uint8_t STATUS_TEXT_LEN = 64;

/* Tagged union carried by the input channel; only the field named by kind is meaningful */
struct InputEvent {
    InputKind kind = InputKind::Sensor;
    ButtonId button = ButtonId::Calibrate;
    PowerSnapshot power = {};
    char text[STATUS_TEXT_LEN] = {};

    static InputEvent button_press(ButtonId id) {
        InputEvent ev;
        ev.kind = InputKind::Button;
        ev.button = id;
        return ev;
    }

    static InputEvent sensor_reading(const PowerSnapshot &snap) {
        InputEvent ev;
        ev.kind = InputKind::Sensor;
        ev.power = snap;
        return ev;
    }

    static InputEvent status_message(const char *msg) {
        InputEvent ev;
        ev.kind = InputKind::Status;
        uint8_t i = 0;
        while (msg[i] != '\0' && i < (STATUS_TEXT_LEN - 1U)) {
            ev.text[i] = msg[i];
            i++;
        }
        ev.text[i] = '\0';
        return ev;
    }
};

#endif /* POWERMETER_TYPES_H */
