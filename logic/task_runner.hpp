/*
 * Task_Runner - Single-threaded cooperative executor
 *
 * Every task is a state machine advanced by poll(now_ms). A task yields by
 * returning while it waits (timer deadline, channel slot, pin edge). Nothing
 * is preempted; a task stops being polled once it reports terminated().
 */

#ifndef TASK_RUNNER_HPP
#define TASK_RUNNER_HPP

#include <cstdint>

class Task {
public:
    virtual ~Task() = default;
    virtual void poll(uint32_t now_ms) = 0;
    virtual bool terminated() const { return false; }
    virtual const char *name() const = 0;
};

class Task_Runner {
public:
    static constexpr uint8_t MAX_TASKS = 8;

    /* Returns false when the task table is full */
    bool add(Task &task);

    /* Poll every live task once, in registration order */
    void run_once(uint32_t now_ms);

    uint8_t task_count() const { return count_; }
    uint8_t active_count() const;

private:
    Task *tasks_[MAX_TASKS] = {};
    bool reported_[MAX_TASKS] = {};
    uint8_t count_ = 0;
};

#endif // TASK_RUNNER_HPP
