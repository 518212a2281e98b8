/*
 * Gpio_Input - hardware/gpio button pin with IRQ-latched edges
 * All instances share the single GPIO IRQ callback of the core.
 */

#ifndef GPIO_INPUT_HPP
#define GPIO_INPUT_HPP

#include "drivers/digital_input.hpp"

#include "pico/types.h"

#include <cstdint>

class Gpio_Input final : public Digital_Input {
public:
    enum class Pull : uint8_t { Up, Down };

    static constexpr uint8_t MAX_PINS = 4;

    /* Configure the pin and start latching both edges */
    bool init(uint pin, Pull pull);

    HwError poll_edge(EdgeKind kind, bool &edge_seen) override;
    void discard_edges() override;
    HwError level(bool &high) override;

private:
    uint pin_ = 0;
    bool ready_ = false;
    volatile uint32_t latched_ = 0;

    static Gpio_Input *s_instances[MAX_PINS];
    static uint8_t s_count;

    static void irq_callback(uint gpio, uint32_t events);
};

#endif // GPIO_INPUT_HPP
