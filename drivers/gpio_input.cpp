/*
 * Gpio_Input Implementation
 */

#include "drivers/gpio_input.hpp"

#include "hardware/gpio.h"
#include "hardware/sync.h"

#include <cstdio>

Gpio_Input *Gpio_Input::s_instances[Gpio_Input::MAX_PINS] = {};
uint8_t Gpio_Input::s_count = 0;

void Gpio_Input::irq_callback(uint gpio, uint32_t events) {
    for (uint8_t i = 0; i < s_count; ++i) {
        Gpio_Input *input = s_instances[i];
        if (input->pin_ == gpio) {
            input->latched_ |= events & (GPIO_IRQ_EDGE_FALL | GPIO_IRQ_EDGE_RISE);
            return;
        }
    }
}

bool Gpio_Input::init(uint pin, Pull pull) {
    if (s_count >= MAX_PINS) {
        printf("[BTN] GP%u: no free input slot\n", pin);
        return false;
    }
    pin_ = pin;

    gpio_init(pin_);
    gpio_set_dir(pin_, GPIO_IN);
    if (pull == Pull::Up) {
        gpio_pull_up(pin_);
    } else {
        gpio_pull_down(pin_);
    }

    uint32_t irq = save_and_disable_interrupts();
    s_instances[s_count++] = this;
    restore_interrupts(irq);

    /* First call installs the shared callback; later calls only enable the pin */
    gpio_set_irq_enabled_with_callback(pin_, GPIO_IRQ_EDGE_FALL | GPIO_IRQ_EDGE_RISE, true,
                                       &Gpio_Input::irq_callback);
    ready_ = true;
    return true;
}

HwError Gpio_Input::poll_edge(EdgeKind kind, bool &edge_seen) {
    if (!ready_) {
        return HwError::PinFault;
    }

    uint32_t mask = 0;
    switch (kind) {
        case EdgeKind::Falling: mask = GPIO_IRQ_EDGE_FALL; break;
        case EdgeKind::Rising:  mask = GPIO_IRQ_EDGE_RISE; break;
        case EdgeKind::Either:  mask = GPIO_IRQ_EDGE_FALL | GPIO_IRQ_EDGE_RISE; break;
    }

    uint32_t irq = save_and_disable_interrupts();
    edge_seen = (latched_ & mask) != 0U;
    latched_ &= ~mask;
    restore_interrupts(irq);
    return HwError::None;
}

void Gpio_Input::discard_edges() {
    uint32_t irq = save_and_disable_interrupts();
    latched_ = 0;
    restore_interrupts(irq);
}

HwError Gpio_Input::level(bool &high) {
    if (!ready_) {
        return HwError::PinFault;
    }
    high = gpio_get(pin_);
    return HwError::None;
}
