// tests/test_event_loop.cpp
#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "util/event_loop.hpp"
#include "util/timeout.hpp"
#include "util/work_queue.hpp"

using namespace std::chrono_literals;

TEST(WorkQueue, FifoAndTryPop)
{
    util::WorkQueue<int> q;
    EXPECT_FALSE(q.try_pop().has_value());
    q.push(1);
    q.push(2);
    q.push(3);
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(*q.try_pop(), 1);
    EXPECT_EQ(*q.pop_for(10ms), 2);
    EXPECT_EQ(*q.try_pop(), 3);
    EXPECT_FALSE(q.pop_for(10ms).has_value());
}

TEST(WorkQueue, CloseRejectsPushButDrains)
{
    util::WorkQueue<int> q;
    q.push(7);
    q.close();
    EXPECT_TRUE(q.closed());
    EXPECT_FALSE(q.push(8));
    EXPECT_FALSE(q.force_push(9));
    EXPECT_EQ(*q.try_pop(), 7);
    EXPECT_FALSE(q.pop_for(10ms).has_value());

    q.reopen();
    EXPECT_TRUE(q.push(10));
    EXPECT_EQ(*q.try_pop(), 10);
}

TEST(WorkQueue, PushBlocksWhileFull)
{
    util::WorkQueue<int> q(1);
    ASSERT_TRUE(q.push(1));
    // force_push ignores the bound
    ASSERT_TRUE(q.force_push(2));
    EXPECT_EQ(q.size(), 2u);

    std::atomic<bool> pushed{false};
    std::thread       t([&] {
        q.push(3);
        pushed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(pushed.load());

    q.try_pop();
    q.try_pop();
    t.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(*q.try_pop(), 3);
}

TEST(WorkQueue, CloseWakesBlockedPop)
{
    util::WorkQueue<int> q;
    auto                 f = std::async(std::launch::async, [&] { return q.pop_for(5000ms); });
    std::this_thread::sleep_for(20ms);
    q.close();
    ASSERT_EQ(f.wait_for(1s), std::future_status::ready);
    EXPECT_FALSE(f.get().has_value());
}

TEST(Deadline, DefaultNeverExpires)
{
    util::Deadline d;
    EXPECT_FALSE(d.has_expiry());
    EXPECT_FALSE(d.expired(util::Clock::now() + 24h));

    auto soon = util::Deadline::after(10ms);
    EXPECT_TRUE(soon.has_expiry());
    EXPECT_FALSE(soon.expired());
    EXPECT_TRUE(soon.expired(util::Clock::now() + 20ms));
}

TEST(EventLoop, RunsPostsInOrderOnLoopThread)
{
    util::EventLoop loop;
    ASSERT_TRUE(loop.start());

    std::mutex       mu;
    std::vector<int> order;
    std::atomic<int> on_loop{0};
    for (int i = 0; i < 20; ++i)
    {
        loop.post([&, i] {
            if (loop.in_loop_thread())
                ++on_loop;
            std::lock_guard<std::mutex> lk(mu);
            order.push_back(i);
        });
    }
    EXPECT_FALSE(loop.in_loop_thread());

    loop.stop();  // drains
    ASSERT_EQ(order.size(), 20u);
    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(order[i], i);
    EXPECT_EQ(on_loop.load(), 20);
}

TEST(EventLoop, CallReturnsValue)
{
    util::EventLoop loop;
    loop.start();

    int v = loop.call([&] { return loop.in_loop_thread() ? 41 : 0; });
    EXPECT_EQ(v, 41);

    // nested call from the loop runs inline
    int nested = loop.call([&] { return loop.call([] { return 2; }) + 1; });
    EXPECT_EQ(nested, 3);

    loop.stop();
    // stopped loop runs inline on the caller
    EXPECT_EQ(loop.call([] { return 5; }), 5);
}

TEST(EventLoop, CallWhileStoppingWaitsForDrain)
{
    util::EventLoop   loop;
    std::atomic<bool> busy{false}, drained{false};
    loop.start();

    ASSERT_TRUE(loop.post([&] {
        busy = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        busy    = false;
        drained = true;
    }));
    while (!busy)
        std::this_thread::yield();

    std::thread stopper([&] { loop.stop(); });
    while (loop.running())
        std::this_thread::yield();

    // the loop thread is still inside the queued task here
    bool overlapped = loop.call([&] { return busy.load(); });
    EXPECT_FALSE(overlapped);
    EXPECT_TRUE(drained);
    stopper.join();
}

TEST(EventLoop, PostFailsAfterStop)
{
    util::EventLoop loop;
    loop.start();
    loop.stop();
    EXPECT_FALSE(loop.running());
    EXPECT_FALSE(loop.post([] {}));
    EXPECT_FALSE(loop.post(nullptr));
}

TEST(EventLoop, ScheduleEveryAndCancel)
{
    util::EventLoop loop;
    loop.start();

    std::atomic<int> ticks{0};
    auto             id = loop.schedule_every(20ms, [&] { ++ticks; });

    const auto until = std::chrono::steady_clock::now() + 2s;
    while (ticks.load() < 3 && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(5ms);
    EXPECT_GE(ticks.load(), 3);

    loop.call([&] { loop.cancel(id); });
    const int after_cancel = ticks.load();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(ticks.load(), after_cancel);

    loop.stop();
}

TEST(EventLoop, ThrowingTaskDoesNotKillLoop)
{
    util::EventLoop loop;
    loop.start();

    testing::internal::CaptureStderr();
    loop.post([] { throw std::runtime_error("boom"); });
    int v = loop.call([] { return 9; });
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(v, 9);
    EXPECT_NE(err.find("task threw: boom"), std::string::npos);
    loop.stop();
}
