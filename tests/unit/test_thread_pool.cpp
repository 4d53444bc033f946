#include <gtest/gtest.h>

#include "castbridge/utils/threading.hpp"

#include <atomic>
#include <stdexcept>

using namespace castbridge::utils;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, RunsTasksOnWorkers) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.size(), 2u);

    auto first = pool.try_submit([] { return 20; });
    auto second = pool.try_submit([] { return 22; });
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->get() + second->get(), 42);
}

TEST(ThreadPoolTest, ZeroThreadsStillGetsOneWorker) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    auto result = pool.try_submit([] { return true; });
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->get());
}

TEST(ThreadPoolTest, TaskExceptionReachesTheFuture) {
    ThreadPool pool(1);
    auto result = pool.try_submit([]() -> int { throw std::runtime_error("provider crashed"); });
    ASSERT_TRUE(result);
    EXPECT_THROW(result->get(), std::runtime_error);

    auto after = pool.try_submit([] { return 1; });
    ASSERT_TRUE(after);
    EXPECT_EQ(after->get(), 1);
}

TEST(ThreadPoolTest, SubmitAfterShutdownIsRejected) {
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_FALSE(pool.try_submit([] { return 1; }));
}

TEST(ThreadPoolTest, QueuedTaskAbandonedByShutdownBreaksItsPromise) {
    ThreadPool pool(1);
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    auto busy = pool.try_submit([&started, &release] {
        started = true;
        while (!release.load()) {
            std::this_thread::sleep_for(1ms);
        }
    });
    auto queued = pool.try_submit([] { return 7; });
    ASSERT_TRUE(busy);
    ASSERT_TRUE(queued);
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }

    std::thread releaser([&release] {
        std::this_thread::sleep_for(50ms);
        release = true;
    });
    pool.shutdown();
    releaser.join();

    busy->get();
    EXPECT_THROW(queued->get(), std::future_error);
}
