#include <gtest/gtest.h>

#include "thread_pool.hpp"

#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

using linecalc::ThreadPool;

TEST(ThreadPoolTest, ReturnsTaskResultsThroughFutures) {
    ThreadPool pool(3);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, PropagatesTaskExceptions) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, DestructorFinishesQueuedTasks) {
    std::atomic<int> done{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 50; ++i) {
            pool.submit([&done]() { done.fetch_add(1); });
        }
    }
    EXPECT_EQ(done.load(), 50);
}

TEST(ThreadPoolTest, UsesAtLeastOneThread) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.threadCount(), 1u);
    EXPECT_EQ(pool.submit([]() { return 7; }).get(), 7);
}
