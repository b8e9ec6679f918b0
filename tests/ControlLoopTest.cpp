#include "stemsync/common/ControlLoop.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace stemsync::common {
namespace {

using namespace std::chrono_literals;

TEST(ControlLoopTest, TimerFiresOnlyOnceItsIntervalHasElapsed) {
    ControlLoop loop;
    const auto t0 = ControlLoop::Clock::now();
    int fired = 0;
    loop.scheduleRepeatingAt(t0, 10ms, [&]() { ++fired; });

    EXPECT_EQ(loop.runDue(t0 + 5ms), 0u);
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(loop.runDue(t0 + 10ms), 1u);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(loop.runDue(t0 + 15ms), 0u);
    EXPECT_EQ(loop.runDue(t0 + 20ms), 1u);
    EXPECT_EQ(fired, 2);
}

TEST(ControlLoopTest, LateRunFiresOnceAndReschedulesFromNow) {
    ControlLoop loop;
    const auto t0 = ControlLoop::Clock::now();
    int fired = 0;
    loop.scheduleRepeatingAt(t0, 10ms, [&]() { ++fired; });

    EXPECT_EQ(loop.runDue(t0 + 100ms), 1u);
    EXPECT_EQ(fired, 1);
    ASSERT_TRUE(loop.nextDeadline().has_value());
    EXPECT_EQ(*loop.nextDeadline(), t0 + 110ms);
}

TEST(ControlLoopTest, CancelledTimerNeverFires) {
    ControlLoop loop;
    const auto t0 = ControlLoop::Clock::now();
    int fired = 0;
    const auto id = loop.scheduleRepeatingAt(t0, 10ms, [&]() { ++fired; });
    loop.cancel(id);

    EXPECT_EQ(loop.runDue(t0 + 50ms), 0u);
    EXPECT_EQ(fired, 0);
    EXPECT_FALSE(loop.nextDeadline().has_value());
}

TEST(ControlLoopTest, CallbackMayCancelItselfAndOtherDueTimers) {
    ControlLoop loop;
    const auto t0 = ControlLoop::Clock::now();
    int firstFired = 0;
    int secondFired = 0;
    ControlScheduler::TimerId first = ControlScheduler::kInvalidTimer;
    ControlScheduler::TimerId second = ControlScheduler::kInvalidTimer;
    first = loop.scheduleRepeatingAt(t0, 10ms, [&]() {
        ++firstFired;
        loop.cancel(first);
        loop.cancel(second);
    });
    second = loop.scheduleRepeatingAt(t0, 10ms, [&]() { ++secondFired; });

    EXPECT_EQ(loop.runDue(t0 + 10ms), 1u);
    EXPECT_EQ(firstFired, 1);
    EXPECT_EQ(secondFired, 0);
    EXPECT_EQ(loop.activeTimerCount(), 0u);
}

TEST(ControlLoopTest, NextDeadlineIsEarliestTimer) {
    ControlLoop loop;
    const auto t0 = ControlLoop::Clock::now();
    loop.scheduleRepeatingAt(t0, 30ms, []() {});
    loop.scheduleRepeatingAt(t0, 10ms, []() {});

    ASSERT_TRUE(loop.nextDeadline().has_value());
    EXPECT_EQ(*loop.nextDeadline(), t0 + 10ms);
}

TEST(ControlLoopTest, ZeroIntervalIsRaisedToOneMillisecond) {
    ControlLoop loop;
    const auto t0 = ControlLoop::Clock::now();
    loop.scheduleRepeatingAt(t0, 0ms, []() {});

    ASSERT_TRUE(loop.nextDeadline().has_value());
    EXPECT_EQ(*loop.nextDeadline(), t0 + 1ms);
}

}  // namespace
}  // namespace stemsync::common
