/*
 * Pico_I2C_Bus - hardware/i2c transport for the shared sensor bus
 * Blocking transfers with a per-transfer timeout, errors mapped to HwError
 */

#ifndef PICO_I2C_HPP
#define PICO_I2C_HPP

#include "drivers/i2c_bus.hpp"

#include "hardware/i2c.h"

#include <cstddef>
#include <cstdint>

class Pico_I2C_Bus final : public I2C_Bus {
public:
    bool init(i2c_inst_t *inst, uint sda_pin, uint scl_pin, uint freq_hz, uint32_t timeout_us);

    HwError write(uint8_t addr, const uint8_t *data, size_t len) override;
    HwError read(uint8_t addr, uint8_t *data, size_t len) override;
    HwError write_read(uint8_t addr, const uint8_t *wr, size_t wr_len,
                       uint8_t *rd, size_t rd_len) override;

private:
    i2c_inst_t *inst_ = nullptr;
    uint32_t timeout_us_ = 0;

    static HwError map_result(int ret, size_t expected);
};

#endif // PICO_I2C_HPP
