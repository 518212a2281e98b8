/*
 * INA219_Driver Implementation
 * Register values follow the TI datasheet calibration procedure
 */

#include "drivers/ina219.hpp"

/* Config bits: bus range | PGA gain | bus ADC 12-bit | shunt ADC 12-bit | continuous */
static constexpr uint16_t CONFIG_32V_320MV = 0x2000U | 0x1800U | 0x0180U | 0x0018U | 0x0007U;
static constexpr uint16_t CONFIG_16V_40MV = 0x0000U | 0x0000U | 0x0180U | 0x0018U | 0x0007U;

static const INA219_Preset PRESETS[CALIBRATION_COUNT] = {
    {Calibration::Range_32V_2A,    4096U,  CONFIG_32V_320MV, 10.0f, 2.0f},
    {Calibration::Range_32V_1A,    10240U, CONFIG_32V_320MV, 25.0f, 0.8f},
    {Calibration::Range_16V_400mA, 8192U,  CONFIG_16V_40MV,  20.0f, 1.0f},
};

const INA219_Preset &ina219_preset(Calibration cal) {
    uint8_t idx = static_cast<uint8_t>(cal);
    if (idx >= CALIBRATION_COUNT) {
        idx = 0;
    }
    return PRESETS[idx];
}

const INA219_Preset *ina219_preset_for_register(uint16_t cal_value) {
    for (const INA219_Preset &p : PRESETS) {
        if (p.cal_value == cal_value) {
            return &p;
        }
    }
    return nullptr;
}

HwError INA219_Driver::initialize(Calibration cal) {
    const INA219_Preset &preset = ina219_preset(cal);

    HwError err = write_register(REG_CALIBRATION, preset.cal_value);
    if (err != HwError::None) {
        return err;
    }
    return write_register(REG_CONFIG, preset.config_value);
}

HwError INA219_Driver::sample(PowerSnapshot &out) {
    uint16_t cal_raw = 0;
    HwError err = read_register(REG_CALIBRATION, cal_raw);
    if (err != HwError::None) {
        return err;
    }

    const INA219_Preset *preset = ina219_preset_for_register(cal_raw);
    if (preset == nullptr) {
        return HwError::NotCalibrated;
    }

    uint16_t shunt_raw = 0;
    uint16_t bus_raw = 0;
    uint16_t current_raw = 0;
    uint16_t power_raw = 0;

    if ((err = read_register(REG_SHUNT_VOLTAGE, shunt_raw)) != HwError::None) { return err; }
    if ((err = read_register(REG_BUS_VOLTAGE, bus_raw)) != HwError::None) { return err; }
    if ((err = read_register(REG_CURRENT, current_raw)) != HwError::None) { return err; }
    if ((err = read_register(REG_POWER, power_raw)) != HwError::None) { return err; }

    /* Shunt LSB 10uV, signed */
    out.shunt_mv = static_cast<float>(static_cast<int16_t>(shunt_raw)) * 0.01f;

    /* Bus voltage in bits 15..3, LSB 4mV */
    out.bus_v = static_cast<float>(bus_raw >> 3U) * 0.004f;

    out.current_ma = static_cast<float>(static_cast<int16_t>(current_raw)) / preset->current_divider;
    out.power_mw = static_cast<float>(power_raw) * preset->power_lsb_mw;

    return HwError::None;
}

HwError INA219_Driver::read_register(uint8_t reg, uint16_t &value) {
    uint8_t buf[2] = {0, 0};
    HwError err = dev_.write_read(&reg, 1, buf, sizeof(buf));
    if (err != HwError::None) {
        return err;
    }
    value = static_cast<uint16_t>((static_cast<uint16_t>(buf[0]) << 8U) | buf[1]);
    return HwError::None;
}

HwError INA219_Driver::write_register(uint8_t reg, uint16_t value) {
    const uint8_t buf[3] = {
        reg,
        static_cast<uint8_t>(value >> 8U),
        static_cast<uint8_t>(value & 0xFFU),
    };
    return dev_.write(buf, sizeof(buf));
}
