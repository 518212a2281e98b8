/*
 * I2C_Bus - Abstract register-addressable bus transport
 * Implemented by Pico_I2C_Bus on hardware and by fakes in host tests
 */

#ifndef I2C_BUS_HPP
#define I2C_BUS_HPP

#include "types.h"

#include <cstddef>
#include <cstdint>

class I2C_Bus {
public:
    virtual ~I2C_Bus() = default;

    virtual HwError write(uint8_t addr, const uint8_t *data, size_t len) = 0;
    virtual HwError read(uint8_t addr, uint8_t *data, size_t len) = 0;

    /* Write then read with a repeated start (no stop in between) */
    virtual HwError write_read(uint8_t addr, const uint8_t *wr, size_t wr_len,
                               uint8_t *rd, size_t rd_len) = 0;
};

#endif // I2C_BUS_HPP
