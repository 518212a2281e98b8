/*
 * Pico_I2C_Bus Implementation
 */

#include "drivers/pico_i2c.hpp"

#include "pico/stdlib.h"
#include "pico/error.h"
#include "hardware/gpio.h"

#include <cstdio>

bool Pico_I2C_Bus::init(i2c_inst_t *inst, uint sda_pin, uint scl_pin, uint freq_hz,
                        uint32_t timeout_us) {
    inst_ = inst;
    timeout_us_ = timeout_us;

    uint actual_hz = i2c_init(inst_, freq_hz);
    gpio_set_function(sda_pin, GPIO_FUNC_I2C);
    gpio_set_function(scl_pin, GPIO_FUNC_I2C);
    gpio_pull_up(sda_pin);
    gpio_pull_up(scl_pin);

    printf("[BUS] I2C%u on GP%u/GP%u at %u Hz\n", i2c_hw_index(inst_), sda_pin, scl_pin,
           actual_hz);
    return actual_hz > 0U;
}

HwError Pico_I2C_Bus::map_result(int ret, size_t expected) {
    if (ret == PICO_ERROR_TIMEOUT) {
        return HwError::BusTimeout;
    }
    if (ret < 0 || static_cast<size_t>(ret) != expected) {
        return HwError::BusNack;
    }
    return HwError::None;
}

HwError Pico_I2C_Bus::write(uint8_t addr, const uint8_t *data, size_t len) {
    if (inst_ == nullptr) {
        return HwError::BusNack;
    }
    int ret = i2c_write_timeout_us(inst_, addr, data, len, false, timeout_us_);
    return map_result(ret, len);
}

HwError Pico_I2C_Bus::read(uint8_t addr, uint8_t *data, size_t len) {
    if (inst_ == nullptr) {
        return HwError::BusNack;
    }
    int ret = i2c_read_timeout_us(inst_, addr, data, len, false, timeout_us_);
    return map_result(ret, len);
}

HwError Pico_I2C_Bus::write_read(uint8_t addr, const uint8_t *wr, size_t wr_len,
                                 uint8_t *rd, size_t rd_len) {
    if (inst_ == nullptr) {
        return HwError::BusNack;
    }
    /* nostop = true keeps the bus for the repeated start */
    int ret = i2c_write_timeout_us(inst_, addr, wr, wr_len, true, timeout_us_);
    HwError err = map_result(ret, wr_len);
    if (err != HwError::None) {
        return err;
    }
    ret = i2c_read_timeout_us(inst_, addr, rd, rd_len, false, timeout_us_);
    return map_result(ret, rd_len);
}
