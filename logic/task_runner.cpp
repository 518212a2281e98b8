/*
 * Task_Runner Implementation
 */

#include "logic/task_runner.hpp"

#include <cstdio>

bool Task_Runner::add(Task &task) {
    if (count_ >= MAX_TASKS) {
        return false;
    }
    tasks_[count_] = &task;
    reported_[count_] = false;
    count_++;
    return true;
}

void Task_Runner::run_once(uint32_t now_ms) {
    for (uint8_t i = 0; i < count_; ++i) {
        Task *task = tasks_[i];
        if (task->terminated()) {
            if (!reported_[i]) {
                reported_[i] = true;
                printf("[TASK] %s terminated\n", task->name());
            }
            continue;
        }
        task->poll(now_ms);
    }
}

uint8_t Task_Runner::active_count() const {
    uint8_t active = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        if (!tasks_[i]->terminated()) {
            active++;
        }
    }
    return active;
}
