// WorkerPoolTests.cpp
// Worker pool lifecycle and the closable queue the CLI drains events from.

#include <gtest/gtest.h>

#include "common/ThreadSafeQueue.h"
#include "common/WorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace openfan::common;
using namespace std::chrono_literals;

//==============================================================================
// WorkerPool
//==============================================================================

TEST(WorkerPoolTests, RunsSubmittedTasks) {
    WorkerPool pool("test", 2);
    pool.start();

    auto a = pool.submitTask([] { return 20; });
    auto b = pool.submitTask([] { return 22; });
    EXPECT_EQ(a.get() + b.get(), 42);
    pool.stop();
}

TEST(WorkerPoolTests, RejectsWorkWhenStopped) {
    WorkerPool pool("test", 1);
    EXPECT_FALSE(pool.submit([] {}));

    auto fut = pool.submitTask([] { return 1; });
    EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(WorkerPoolTests, ExceptionReachesFutureAndWorkerSurvives) {
    WorkerPool pool("test", 1);
    pool.start();

    auto bad = pool.submitTask([]() -> int { throw std::logic_error("boom"); });
    EXPECT_THROW(bad.get(), std::logic_error);

    // plain submit: the worker logs and keeps going
    EXPECT_TRUE(pool.submit([] { throw std::runtime_error("ignored"); }));
    auto good = pool.submitTask([] { return 7; });
    EXPECT_EQ(good.get(), 7);
    pool.stop();
}

TEST(WorkerPoolTests, StopDiscardsQueuedTasksAndJoinsRunningOne) {
    WorkerPool pool("test", 1);
    pool.start();

    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    std::atomic<int> laterRuns{0};

    pool.submit([&] {
        started = true;
        std::this_thread::sleep_for(100ms);
        finished = true;
    });
    while (!started.load()) std::this_thread::sleep_for(1ms);
    for (int i = 0; i < 5; ++i) pool.submit([&] { ++laterRuns; });

    pool.stop();
    EXPECT_TRUE(finished.load());
    EXPECT_EQ(laterRuns.load(), 0);
    EXPECT_FALSE(pool.isRunning());
}

TEST(WorkerPoolTests, CanRestartAfterStop) {
    WorkerPool pool("test", 2);
    pool.start();
    pool.stop();
    pool.start();
    EXPECT_TRUE(pool.isRunning());
    EXPECT_EQ(pool.submitTask([] { return 3; }).get(), 3);
}

//==============================================================================
// ThreadSafeQueue
//==============================================================================

TEST(ThreadSafeQueueTests, FifoOrder) {
    ThreadSafeQueue<int> q;
    q.push(1);
    q.push(2);
    q.push(3);
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(*q.pop(), 1);
    EXPECT_EQ(*q.pop(), 2);
    EXPECT_EQ(*q.try_pop(0ms), 3);
    EXPECT_FALSE(q.try_pop(10ms).has_value());
}

TEST(ThreadSafeQueueTests, CloseWakesBlockedConsumerAndRejectsPush) {
    ThreadSafeQueue<std::string> q;
    std::thread consumer([&] { EXPECT_FALSE(q.pop().has_value()); });
    std::this_thread::sleep_for(20ms);
    q.close();
    consumer.join();

    EXPECT_TRUE(q.closed());
    EXPECT_FALSE(q.push("late"));
}

TEST(ThreadSafeQueueTests, DrainsRemainingItemsAfterClose) {
    ThreadSafeQueue<int> q;
    q.push(5);
    q.close();
    EXPECT_EQ(*q.pop(), 5);
    EXPECT_FALSE(q.pop().has_value());
}
