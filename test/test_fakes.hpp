/*
 * Host test doubles shared by the unit tests
 *
 * Fake_I2C_Bus:          register-level model of devices on one bus
 * Fake_Input:            button pin with scripted edges and faults
 * Recording_Draw_Target: records every draw call, optional failure injection
 */

#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include "drivers/digital_input.hpp"
#include "drivers/i2c_bus.hpp"
#include "utils/draw_target.hpp"
#include "types.h"

#include <cstring>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

// ============================================================================
// Fake_I2C_Bus
// ============================================================================

class Fake_I2C_Bus : public I2C_Bus {
public:
    struct Write_Record {
        uint8_t addr;
        std::vector<uint8_t> bytes;
    };

    void add_device(uint8_t addr) { present_.insert(addr); }
    void remove_device(uint8_t addr) { present_.erase(addr); }

    void set_register(uint8_t addr, uint8_t reg, uint16_t value) { regs_[addr][reg] = value; }
    uint16_t reg(uint8_t addr, uint8_t reg) { return regs_[addr][reg]; }

    /* Forget every register of a device (models a sensor power cycle) */
    void reset_registers(uint8_t addr) { regs_[addr].clear(); }

    /* Fail the next count transfers (count < 0: every transfer) with err */
    void fail_next(HwError err, int count = 1) {
        fail_err_ = err;
        fail_count_ = count;
    }

    /* Called from inside every transfer, before it completes */
    std::function<void()> on_transfer;

    const std::vector<Write_Record> &writes() const { return writes_; }
    int transfer_count() const { return transfers_; }

    HwError write(uint8_t addr, const uint8_t *data, size_t len) override {
        HwError err = begin(addr);
        if (err != HwError::None) {
            return err;
        }
        writes_.push_back({addr, std::vector<uint8_t>(data, data + len)});
        if (len >= 1U) {
            pointer_[addr] = data[0];
        }
        if (len >= 3U) {
            regs_[addr][data[0]] = static_cast<uint16_t>((data[1] << 8U) | data[2]);
        }
        return HwError::None;
    }

    HwError read(uint8_t addr, uint8_t *data, size_t len) override {
        HwError err = begin(addr);
        if (err != HwError::None) {
            return err;
        }
        fill(addr, pointer_[addr], data, len);
        return HwError::None;
    }

    HwError write_read(uint8_t addr, const uint8_t *wr, size_t wr_len,
                       uint8_t *rd, size_t rd_len) override {
        HwError err = begin(addr);
        if (err != HwError::None) {
            return err;
        }
        if (wr_len >= 1U) {
            pointer_[addr] = wr[0];
        }
        fill(addr, pointer_[addr], rd, rd_len);
        return HwError::None;
    }

private:
    std::set<uint8_t> present_;
    std::map<uint8_t, std::map<uint8_t, uint16_t>> regs_;
    std::map<uint8_t, uint8_t> pointer_;
    std::vector<Write_Record> writes_;
    HwError fail_err_ = HwError::None;
    int fail_count_ = 0;
    int transfers_ = 0;

    HwError begin(uint8_t addr) {
        transfers_++;
        if (on_transfer) {
            on_transfer();
        }
        if (fail_count_ != 0) {
            if (fail_count_ > 0) {
                fail_count_--;
            }
            return fail_err_;
        }
        if (present_.count(addr) == 0U) {
            return HwError::BusNack;
        }
        return HwError::None;
    }

    void fill(uint8_t addr, uint8_t reg, uint8_t *data, size_t len) {
        uint16_t value = regs_[addr][reg];
        for (size_t i = 0; i < len; ++i) {
            data[i] = (i == 0U) ? static_cast<uint8_t>(value >> 8U)
                                : static_cast<uint8_t>(value & 0xFFU);
        }
    }
};

// ============================================================================
// Fake_Input
// ============================================================================

class Fake_Input : public Digital_Input {
public:
    void press() { latched_ = true; }
    void set_fault(bool fault) { fault_ = fault; }
    void set_level(bool high) { level_ = high; }

    int polls() const { return polls_; }
    int discards() const { return discards_; }
    EdgeKind last_kind() const { return last_kind_; }

    HwError poll_edge(EdgeKind kind, bool &edge_seen) override {
        polls_++;
        last_kind_ = kind;
        if (fault_) {
            return HwError::PinFault;
        }
        edge_seen = latched_;
        latched_ = false;
        return HwError::None;
    }

    void discard_edges() override {
        discards_++;
        latched_ = false;
    }

    HwError level(bool &high) override {
        if (fault_) {
            return HwError::PinFault;
        }
        high = level_;
        return HwError::None;
    }

private:
    bool latched_ = false;
    bool fault_ = false;
    bool level_ = false;
    int polls_ = 0;
    int discards_ = 0;
    EdgeKind last_kind_ = EdgeKind::Either;
};

// ============================================================================
// Recording_Draw_Target
// ============================================================================

class Recording_Draw_Target : public Draw_Target {
public:
    enum class Op_Kind { Fill, Blit, Glyphs };

    struct Op {
        Op_Kind kind;
        Rect area;
        Color565 color;
        std::string text;
        Font_Id font;
    };

    explicit Recording_Draw_Target(Size size = {240, 135}) : size_(size) {}

    /* Every call from the (n+1)th on fails; negative disables */
    void fail_after(int n) { fail_after_ = n; }

    const std::vector<Op> &ops() const { return ops_; }
    void clear() { ops_.clear(); calls_ = 0; }

    size_t count(Op_Kind kind) const {
        size_t n = 0;
        for (const Op &op : ops_) {
            if (op.kind == kind) {
                n++;
            }
        }
        return n;
    }

    std::vector<std::string> texts() const {
        std::vector<std::string> out;
        for (const Op &op : ops_) {
            if (op.kind == Op_Kind::Glyphs) {
                out.push_back(op.text);
            }
        }
        return out;
    }

    bool drew_text(const std::string &text) const {
        for (const Op &op : ops_) {
            if (op.kind == Op_Kind::Glyphs && op.text == text) {
                return true;
            }
        }
        return false;
    }

    Size size() const override { return size_; }

    HwError fill_rect(const Rect &area, Color565 color) override {
        return record({Op_Kind::Fill, area, color, std::string(), Font_Id::Small});
    }

    HwError blit(const Point &top_left, const Bitmap &bitmap, Color565 color) override {
        return record({Op_Kind::Blit, {top_left, {bitmap.width, bitmap.height}}, color,
                       std::string(), Font_Id::Small});
    }

    HwError draw_glyphs(const Point &top_left, const char *text, Font_Id font,
                        Color565 color) override {
        return record({Op_Kind::Glyphs, {top_left, {0, 0}}, color, std::string(text), font});
    }

private:
    Size size_;
    std::vector<Op> ops_;
    int fail_after_ = -1;
    int calls_ = 0;

    HwError record(const Op &op) {
        if (fail_after_ >= 0 && calls_ >= fail_after_) {
            return HwError::DrawFailed;
        }
        calls_++;
        ops_.push_back(op);
        return HwError::None;
    }
};

#endif // TEST_FAKES_HPP
