#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

#include "concurrency/blocking_queue.h"
#include "concurrency/thread_pool.h"

using concurrency::BlockingQueue;
using concurrency::ThreadPool;

TEST(ThreadPoolTest, RunsAllTasksAndReturnsResults) {
    ThreadPool pool(4);
    std::atomic<int> ran{0};
    std::vector<std::future<int>> futs;
    for (int i = 0; i < 100; ++i) {
        futs.push_back(pool.submit([&ran](int x) { ran++; return x * 2; }, i));
    }
    int sum = 0;
    for (auto& f : futs) sum += f.get();
    EXPECT_EQ(sum, 2 * (99 * 100 / 2));
    EXPECT_EQ(ran.load(), 100);
}

TEST(ThreadPoolTest, ExceptionsSurfaceFromTheFuture) {
    ThreadPool pool(2);
    auto f = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    // the worker survives
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, ShutdownDrainsAndRejectsNewWork) {
    ThreadPool pool(1);
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) pool.submit([&ran] { ran++; });
    pool.shutdown();
    EXPECT_EQ(ran.load(), 10);
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
    pool.shutdown();
}

TEST(ThreadPoolTest, ThreadCountResolution) {
    EXPECT_EQ(ThreadPool::resolve_thread_count(3), 3u);
    EXPECT_GE(ThreadPool::resolve_thread_count(0), 1u);
    EXPECT_EQ(ThreadPool(2).size(), 2u);
}

TEST(BlockingQueueTest, PopFailsAfterCloseOnceDrained) {
    BlockingQueue<int> q;
    EXPECT_TRUE(q.push(1));
    q.close();
    EXPECT_FALSE(q.push(2));

    EXPECT_EQ(q.pop().value_or(0), 1);
    EXPECT_FALSE(q.pop().has_value());
    EXPECT_TRUE(q.is_closed());
}
