/*
 * Bus_Arbiter - Shared I2C bus arbitration
 * One physical bus, one thin Bus_Device handle per logical sensor
 */

#ifndef BUS_ARBITER_HPP
#define BUS_ARBITER_HPP

#include "drivers/i2c_bus.hpp"
#include "types.h"

#include <cstddef>
#include <cstdint>

class Bus_Arbiter {
public:
    explicit Bus_Arbiter(I2C_Bus &bus) : bus_(bus) {}

    Bus_Arbiter(const Bus_Arbiter &) = delete;
    Bus_Arbiter &operator=(const Bus_Arbiter &) = delete;

    bool busy() const { return locked_; }

    /* Completed transactions (successful or not) */
    uint32_t transaction_count() const { return transactions_; }

    /* Transactions rejected because the bus was already held */
    uint32_t contention_count() const { return contentions_; }

private:
    friend class Bus_Device;

    /* Holds the bus for the lifetime of one transaction */
    class Lock {
    public:
        explicit Lock(Bus_Arbiter &arbiter);
        ~Lock();

        Lock(const Lock &) = delete;
        Lock &operator=(const Lock &) = delete;

        bool acquired() const { return acquired_; }

    private:
        Bus_Arbiter &arbiter_;
        bool acquired_ = false;
    };

    I2C_Bus &bus_;
    bool locked_ = false;
    uint32_t transactions_ = 0;
    uint32_t contentions_ = 0;
};

class Bus_Device {
public:
    Bus_Device(Bus_Arbiter &arbiter, uint8_t address)
        : arbiter_(arbiter), address_(address) {}

    uint8_t address() const { return address_; }

    HwError write(const uint8_t *data, size_t len);
    HwError read(uint8_t *data, size_t len);
    HwError write_read(const uint8_t *wr, size_t wr_len, uint8_t *rd, size_t rd_len);

    /* One-byte read; HwError::None means the device acknowledged */
    HwError probe();

private:
    Bus_Arbiter &arbiter_;
    uint8_t address_;
};

#endif // BUS_ARBITER_HPP
