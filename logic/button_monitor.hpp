/*
 * Button_Monitor - Edge-triggered, cooldown-debounced button task
 * Pure logic, no GPIO dependency. Testable on host.
 *
 * Idle -> (edge) -> Emit -> Cooldown(cooldown_ms) -> Idle
 *
 * Emit holds the press until the input channel accepts it. Edges latched
 * during cooldown are discarded when the task re-arms. A pin read error
 * stops this task only.
 */

#ifndef BUTTON_MONITOR_HPP
#define BUTTON_MONITOR_HPP

#include "drivers/digital_input.hpp"
#include "logic/input_channel.hpp"
#include "logic/task_runner.hpp"
#include "types.h"

#include <cstdint>

struct Button_Config {
    ButtonId id;
    EdgeKind edge;
    uint32_t cooldown_ms;
};

enum class ButtonTaskState : uint8_t { Idle, Emit, Cooldown, Terminated };

class Button_Monitor final : public Task {
public:
    Button_Monitor(Digital_Input &pin, Input_Channel &channel, const Button_Config &config)
        : pin_(pin), channel_(channel), config_(config) {}

    void poll(uint32_t now_ms) override;
    bool terminated() const override { return state_ == ButtonTaskState::Terminated; }
    const char *name() const override;

    ButtonTaskState state() const { return state_; }
    uint32_t presses() const { return presses_; }

private:
    Digital_Input &pin_;
    Input_Channel &channel_;
    Button_Config config_;
    ButtonTaskState state_ = ButtonTaskState::Idle;
    uint32_t cooldown_start_ms_ = 0;
    uint32_t presses_ = 0;
};

#endif // BUTTON_MONITOR_HPP
