/*
 * Bus_Arbiter Implementation
 */

#include "drivers/bus_arbiter.hpp"

Bus_Arbiter::Lock::Lock(Bus_Arbiter &arbiter) : arbiter_(arbiter) {
    if (arbiter_.locked_) {
        /* Re-entered from inside a transaction (transport callback) */
        if (arbiter_.contentions_ < UINT32_MAX) {
            arbiter_.contentions_++;
        }
        return;
    }
    arbiter_.locked_ = true;
    acquired_ = true;
}

Bus_Arbiter::Lock::~Lock() {
    if (!acquired_) {
        return;
    }
    arbiter_.locked_ = false;
    if (arbiter_.transactions_ < UINT32_MAX) {
        arbiter_.transactions_++;
    }
}

HwError Bus_Device::write(const uint8_t *data, size_t len) {
    Bus_Arbiter::Lock lock(arbiter_);
    if (!lock.acquired()) {
        return HwError::BusBusy;
    }
    return arbiter_.bus_.write(address_, data, len);
}

HwError Bus_Device::read(uint8_t *data, size_t len) {
    Bus_Arbiter::Lock lock(arbiter_);
    if (!lock.acquired()) {
        return HwError::BusBusy;
    }
    return arbiter_.bus_.read(address_, data, len);
}

HwError Bus_Device::write_read(const uint8_t *wr, size_t wr_len, uint8_t *rd, size_t rd_len) {
    Bus_Arbiter::Lock lock(arbiter_);
    if (!lock.acquired()) {
        return HwError::BusBusy;
    }
    return arbiter_.bus_.write_read(address_, wr, wr_len, rd, rd_len);
}

HwError Bus_Device::probe() {
    uint8_t scratch = 0;
    return read(&scratch, 1);
}
