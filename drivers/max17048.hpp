/*
 * MAX17048_Driver - Single-cell LiPo fuel gauge on the shared sensor bus
 */

#ifndef MAX17048_HPP
#define MAX17048_HPP

#include "drivers/bus_arbiter.hpp"
#include "types.h"

#include <cstdint>

/* Datasheet RCOMP reset value */
static constexpr uint8_t MAX17048_DEFAULT_RCOMP = 0x97;

/*
 * RCOMP byte for a battery temperature.
 * Piecewise per datasheet: -0.5/degC above 20 degC, -5.0/degC at or below,
 * both from MAX17048_DEFAULT_RCOMP. Saturates to 0..255, truncates toward zero.
 */
uint8_t max17048_rcomp_for_temperature(float temp_c);

class MAX17048_Driver {
public:
    static constexpr uint8_t REG_VCELL = 0x02;
    static constexpr uint8_t REG_SOC = 0x04;
    static constexpr uint8_t REG_VERSION = 0x08;
    static constexpr uint8_t REG_CONFIG = 0x0C;
    static constexpr uint8_t REG_CRATE = 0x16;

    static constexpr float VCELL_LSB_V = 0.000078125f;  /* 78.125uV per bit */
    static constexpr float CRATE_LSB_PCT_H = 0.208f;    /* %/hr per bit */

    explicit MAX17048_Driver(Bus_Device &dev) : dev_(dev) {}

    /* Write the default RCOMP; call once after the device is probed */
    HwError init();

    HwError read_cell_voltage(float &volts);
    HwError read_state_of_charge(uint16_t &percent);
    HwError read_charge_rate(float &pct_per_hour);
    HwError read_version(uint16_t &version);

    HwError temperature_compensation(float temp_c);

    /* Replace the RCOMP byte, keeping the low byte of CONFIG */
    HwError set_compensation(uint8_t rcomp);

private:
    Bus_Device &dev_;

    HwError read_register(uint8_t reg, uint16_t &value);
    HwError write_register(uint8_t reg, uint16_t value);
};

#endif // MAX17048_HPP
