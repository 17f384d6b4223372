#include <shelter/platform/thread_pool.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace shelter::platform;

TEST(ThreadPoolTest, SubmitReturnsResult) {
    ThreadPool pool(2);
    auto future = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(future.get(), 5);
}

TEST(ThreadPoolTest, ZeroThreadsStillRunsWork) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, WaitIdleCoversNestedPosts) {
    ThreadPool pool(2);
    std::atomic<int> count{0};
    for (int i = 0; i < 10; ++i) {
        pool.post([&pool, &count] {
            ++count;
            pool.post([&count] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++count;
            });
        });
    }
    pool.wait_idle();
    EXPECT_EQ(count.load(), 20);
    EXPECT_EQ(pool.in_flight(), 0u);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, PostAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.shutdown();
    EXPECT_FALSE(pool.is_running());
    EXPECT_THROW(pool.post([] {}), std::runtime_error);
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> count{0};
    {
        ThreadPool pool(1);
        for (int i = 0; i < 50; ++i) {
            pool.post([&count] { ++count; });
        }
    }
    EXPECT_EQ(count.load(), 50);
}
