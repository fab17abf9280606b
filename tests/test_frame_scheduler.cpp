#include "frame_scheduler.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(FrameSchedulerTest, TickCallbacksRunInRegistrationOrder)
{
    FrameScheduler scheduler;
    std::vector<std::string> order;
    scheduler.onTick([&order]() { order.push_back("sampler"); });
    scheduler.onTick([&order]() { order.push_back("surface"); });

    scheduler.tick(16);
    scheduler.tick(32);
    EXPECT_EQ(order, (std::vector<std::string>{"sampler", "surface", "sampler", "surface"}));
}

TEST(FrameSchedulerTest, TimersFireOnceWhenDue)
{
    FrameScheduler scheduler;
    scheduler.tick(1000);

    int fired = 0;
    scheduler.defer(150, [&fired]() { ++fired; });
    EXPECT_EQ(scheduler.pendingTimers(), 1u);

    scheduler.tick(1149);
    EXPECT_EQ(fired, 0);
    scheduler.tick(1150);
    EXPECT_EQ(fired, 1);
    scheduler.tick(2000);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(scheduler.pendingTimers(), 0u);
}

TEST(FrameSchedulerTest, TimersRunBeforeTickCallbacks)
{
    FrameScheduler scheduler;
    std::vector<std::string> order;
    scheduler.onTick([&order]() { order.push_back("tick"); });
    scheduler.defer(0, [&order]() { order.push_back("timer"); });

    scheduler.tick(0);
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "timer");
    EXPECT_EQ(order[1], "tick");
}

TEST(FrameSchedulerTest, TimerScheduledFromTimerWaitsForNextTick)
{
    FrameScheduler scheduler;
    int fired = 0;
    scheduler.defer(0,
                    [&scheduler, &fired]()
                    {
                        ++fired;
                        scheduler.defer(0, [&fired]() { ++fired; });
                    });

    scheduler.tick(10);
    EXPECT_EQ(fired, 1);
    scheduler.tick(20);
    EXPECT_EQ(fired, 2);
}
