#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Scheduler.hpp"
#include "../debug/ManualScheduler.hpp"

using namespace meshquiz::core;
using namespace std::chrono_literals;

TEST(ManualScheduler, FiresInDueOrder)
{
    debug::ManualScheduler s;
    std::vector<int> order;

    (void)s.After(30s, [&order]() { order.push_back(3); });
    (void)s.After(10s, [&order]() { order.push_back(1); });
    (void)s.After(10s, [&order]() { order.push_back(2); }); // same due time, armed later

    EXPECT_EQ(s.Advance(9s), 0u);
    EXPECT_EQ(s.Advance(1s), 2u);
    EXPECT_EQ(s.Advance(60s), 1u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(s.Now(), TimePoint{} + 70s);
}

TEST(ManualScheduler, CancelAndReentrantArming)
{
    debug::ManualScheduler s;
    int fired = 0;

    TimerHandle const h = s.After(5s, [&fired]() { ++fired; });
    s.Cancel(h);
    s.Cancel(h);        // twice is harmless
    s.Cancel(NoTimer);

    // a callback arming a follow-up that is due inside the same advance
    (void)s.After(1s, [&]()
    {
        EXPECT_EQ(s.Now(), TimePoint{} + 1s);
        (void)s.After(2s, [&fired]() { fired += 10; });
    });

    s.Advance(5s);
    EXPECT_EQ(fired, 10);
    EXPECT_EQ(s.Pending(), 0u);
    EXPECT_FALSE(s.NextDueIn().has_value());
}

TEST(AsioScheduler, FiresOnItsOwnThread)
{
    AsioScheduler s;
    std::promise<std::thread::id> ran;
    auto fut = ran.get_future();

    (void)s.After(20ms, [&ran]() { ran.set_value(std::this_thread::get_id()); });

    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_NE(fut.get(), std::this_thread::get_id());
    EXPECT_EQ(s.Pending(), 0u);
}

TEST(AsioScheduler, CancelledTimerNeverRuns)
{
    AsioScheduler s;
    std::atomic<int> fired{0};

    TimerHandle const h = s.After(100ms, [&fired]() { ++fired; });
    s.Cancel(h);

    std::promise<void> later;
    (void)s.After(200ms, [&later]() { later.set_value(); });
    ASSERT_EQ(later.get_future().wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fired.load(), 0);
}

TEST(AsioScheduler, ThrowingCallbackKeepsTheThreadAlive)
{
    AsioScheduler s;
    (void)s.After(1ms, []() { MQZ_THROW(error::Code::Unknown, "callback failure"); });

    std::promise<void> next;
    (void)s.After(50ms, [&next]() { next.set_value(); });
    EXPECT_EQ(next.get_future().wait_for(2s), std::future_status::ready);
}

TEST(AsioScheduler, ShutdownRefusesNewTimers)
{
    AsioScheduler s;
    (void)s.After(10min, []() {});
    EXPECT_EQ(s.Pending(), 1u);

    s.Shutdown();
    s.Shutdown();
    EXPECT_EQ(s.Pending(), 0u);
    EXPECT_THROW((void)s.After(1ms, []() {}), error::ScheduleError);
}
