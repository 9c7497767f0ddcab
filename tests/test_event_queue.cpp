#include <gtest/gtest.h>
#include <thread>
#include "core/process/RunEvents.hpp"

using namespace pyrunner;
using namespace std::chrono_literals;

TEST(RunEventQueueTest, DeliversInOrderAndClosesOnOutcome) {
    RunEventQueue queue;
    queue.onOutput({"first"});
    queue.onOutput({"second"});
    queue.onFinished(Completed{0, 0.5});
    EXPECT_EQ(queue.pending(), 3u);

    auto a = queue.next(10ms);
    ASSERT_TRUE(a);
    EXPECT_EQ(std::get<OutputEvent>(*a).line, "first");
    auto b = queue.nextBlocking();
    EXPECT_EQ(std::get<OutputEvent>(b).line, "second");
    EXPECT_FALSE(queue.closed());

    auto c = queue.next(10ms);
    ASSERT_TRUE(c);
    ASSERT_TRUE(isTerminal(*c));
    EXPECT_EQ(std::get<Completed>(std::get<RunOutcome>(*c)).exitCode, 0);
    EXPECT_TRUE(queue.closed());
}

TEST(RunEventQueueTest, NextTimesOutWhenEmpty) {
    RunEventQueue queue;
    EXPECT_FALSE(queue.next(20ms).has_value());
}

TEST(RunEventQueueTest, EventsAfterOutcomeAreDropped) {
    RunEventQueue queue;
    queue.onFinished(Stopped{1.0});
    queue.onOutput({"late"});
    queue.onFinished(TimedOut{1.0});
    EXPECT_EQ(queue.pending(), 1u);
}

TEST(RunEventQueueTest, WakesBlockedConsumer) {
    RunEventQueue queue;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        queue.onFinished(SupervisorError{"boom"});
    });
    auto event = queue.next(5s);
    producer.join();
    ASSERT_TRUE(event);
    EXPECT_EQ(std::get<SupervisorError>(std::get<RunOutcome>(*event)).message, "boom");
}

TEST(RunEventQueueTest, DescribeOutcome) {
    EXPECT_EQ(describeOutcome(Completed{3, 1.25}), "completed (exit code 3, 1.25s)");
    EXPECT_EQ(describeOutcome(TimedOut{2.0}), "timed out after 2.00s");
    EXPECT_EQ(describeOutcome(Stopped{0.5}), "stopped after 0.50s");
    EXPECT_EQ(describeOutcome(SupervisorError{"no such file"}), "error: no such file");
}
