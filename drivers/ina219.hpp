/*
 * INA219_Driver - High-side current/power monitor on the shared sensor bus
 * Calibration lives only in the device registers; sample() reads it back
 */

#ifndef INA219_HPP
#define INA219_HPP

#include "drivers/bus_arbiter.hpp"
#include "types.h"

#include <cstdint>

/* Register image and decode scale for one calibration preset */
struct INA219_Preset {
    Calibration calibration;
    uint16_t cal_value;       /* Calibration register (0x05) */
    uint16_t config_value;    /* Configuration register (0x00) */
    float current_divider;    /* Current register bits per mA */
    float power_lsb_mw;       /* mW per power register bit */
};

/* Preset table entry for a calibration */
const INA219_Preset &ina219_preset(Calibration cal);

/*
 * Find the preset whose calibration register value matches.
 * Returns nullptr for any other value (0 after a device power cycle).
 */
const INA219_Preset *ina219_preset_for_register(uint16_t cal_value);

class INA219_Driver {
public:
    static constexpr uint8_t REG_CONFIG = 0x00;
    static constexpr uint8_t REG_SHUNT_VOLTAGE = 0x01;
    static constexpr uint8_t REG_BUS_VOLTAGE = 0x02;
    static constexpr uint8_t REG_POWER = 0x03;
    static constexpr uint8_t REG_CURRENT = 0x04;
    static constexpr uint8_t REG_CALIBRATION = 0x05;

    explicit INA219_Driver(Bus_Device &dev) : dev_(dev) {}

    /*
     * Program calibration and configuration registers for a preset.
     * Must be called again after every calibration change before
     * samples are meaningful.
     */
    HwError initialize(Calibration cal);

    /*
     * Read and decode one full measurement.
     * Returns HwError::NotCalibrated if the calibration register does not
     * match any preset.
     */
    HwError sample(PowerSnapshot &out);

private:
    Bus_Device &dev_;

    HwError read_register(uint8_t reg, uint16_t &value);
    HwError write_register(uint8_t reg, uint16_t value);
};

#endif // INA219_HPP
