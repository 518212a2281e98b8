/*
 * MAX17048_Driver Implementation
 */

#include "drivers/max17048.hpp"

#include <cmath>

uint8_t max17048_rcomp_for_temperature(float temp_c) {
    float rcomp = 0.0f;
    if (temp_c > 20.0f) {
        rcomp = static_cast<float>(MAX17048_DEFAULT_RCOMP) + (temp_c - 20.0f) * -0.5f;
    } else {
        rcomp = static_cast<float>(MAX17048_DEFAULT_RCOMP) + (temp_c - 20.0f) * -5.0f;
    }

    if (std::isnan(rcomp) || rcomp <= 0.0f) {
        return 0U;
    }
    if (rcomp >= 255.0f) {
        return 255U;
    }
    return static_cast<uint8_t>(rcomp);
}

HwError MAX17048_Driver::init() {
    return set_compensation(MAX17048_DEFAULT_RCOMP);
}

HwError MAX17048_Driver::read_cell_voltage(float &volts) {
    uint16_t raw = 0;
    HwError err = read_register(REG_VCELL, raw);
    if (err != HwError::None) {
        return err;
    }
    volts = static_cast<float>(raw) * VCELL_LSB_V;
    return HwError::None;
}

HwError MAX17048_Driver::read_state_of_charge(uint16_t &percent) {
    uint16_t raw = 0;
    HwError err = read_register(REG_SOC, raw);
    if (err != HwError::None) {
        return err;
    }
    /* High byte is whole percent, low byte 1/256 % */
    percent = static_cast<uint16_t>(raw / 256U);
    return HwError::None;
}

HwError MAX17048_Driver::read_charge_rate(float &pct_per_hour) {
    uint16_t raw = 0;
    HwError err = read_register(REG_CRATE, raw);
    if (err != HwError::None) {
        return err;
    }
    pct_per_hour = static_cast<float>(raw) * CRATE_LSB_PCT_H;
    return HwError::None;
}

HwError MAX17048_Driver::read_version(uint16_t &version) {
    return read_register(REG_VERSION, version);
}

HwError MAX17048_Driver::temperature_compensation(float temp_c) {
    return set_compensation(max17048_rcomp_for_temperature(temp_c));
}

HwError MAX17048_Driver::set_compensation(uint8_t rcomp) {
    uint16_t config = 0;
    HwError err = read_register(REG_CONFIG, config);
    if (err != HwError::None) {
        return err;
    }
    config = static_cast<uint16_t>((config & 0x00FFU) | (static_cast<uint16_t>(rcomp) << 8U));
    return write_register(REG_CONFIG, config);
}

HwError MAX17048_Driver::read_register(uint8_t reg, uint16_t &value) {
    uint8_t buf[2] = {0, 0};
    HwError err = dev_.write_read(&reg, 1, buf, sizeof(buf));
    if (err != HwError::None) {
        return err;
    }
    value = static_cast<uint16_t>((static_cast<uint16_t>(buf[0]) << 8U) | buf[1]);
    return HwError::None;
}

HwError MAX17048_Driver::write_register(uint8_t reg, uint16_t value) {
    /* Register pointer and both data bytes in one transaction */
    const uint8_t buf[3] = {
        reg,
        static_cast<uint8_t>(value >> 8U),
        static_cast<uint8_t>(value & 0xFFU),
    };
    return dev_.write(buf, sizeof(buf));
}
