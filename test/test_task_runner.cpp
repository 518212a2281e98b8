/*
 * Task_Runner Unit Tests
 */

#include "logic/task_runner.hpp"
#include <gtest/gtest.h>

#include <vector>

namespace {

class Counting_Task : public Task {
public:
    explicit Counting_Task(int stop_after) : stop_after_(stop_after) {}

    void poll(uint32_t now_ms) override {
        polls++;
        last_now = now_ms;
    }
    bool terminated() const override { return stop_after_ >= 0 && polls >= stop_after_; }
    const char *name() const override { return "counting"; }

    int polls = 0;
    uint32_t last_now = 0;

private:
    int stop_after_;
};

}  // namespace

TEST(TaskRunnerTest, PollsEveryTaskWithTimestamp) {
    Task_Runner runner;
    Counting_Task a(-1);
    Counting_Task b(-1);
    ASSERT_TRUE(runner.add(a));
    ASSERT_TRUE(runner.add(b));

    runner.run_once(10);
    runner.run_once(20);
    EXPECT_EQ(a.polls, 2);
    EXPECT_EQ(b.polls, 2);
    EXPECT_EQ(b.last_now, 20U);
    EXPECT_EQ(runner.task_count(), 2U);
}

TEST(TaskRunnerTest, TerminatedTaskIsNotPolledAgain) {
    Task_Runner runner;
    Counting_Task once(1);
    Counting_Task forever(-1);
    runner.add(once);
    runner.add(forever);

    for (uint32_t t = 0; t < 5; ++t) {
        runner.run_once(t);
    }
    EXPECT_EQ(once.polls, 1);
    EXPECT_EQ(forever.polls, 5);
    EXPECT_EQ(runner.active_count(), 1U);
}

TEST(TaskRunnerTest, TableFullRejectsTask) {
    Task_Runner runner;
    std::vector<Counting_Task> tasks(Task_Runner::MAX_TASKS + 1, Counting_Task(-1));
    for (uint8_t i = 0; i < Task_Runner::MAX_TASKS; ++i) {
        EXPECT_TRUE(runner.add(tasks[i]));
    }
    EXPECT_FALSE(runner.add(tasks[Task_Runner::MAX_TASKS]));
}
