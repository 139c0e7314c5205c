#include <gtest/gtest.h>
#include "threading/thread_pool.hpp"

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace syn;

TEST(ThreadPoolTest, RunsEveryTaskOnce) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(4);
        for (int i = 0; i < 1000; ++i) {
            pool.enqueue([&counter]() { counter++; });
        }
    }  // destructor drains the queue
    EXPECT_EQ(counter.load(), 1000);
}

TEST(ThreadPoolTest, SubmitReturnsResult) {
    ThreadPool pool(2);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(pool.submit([i]() { return i * i; }));
    }

    int sum = 0;
    for (auto& r : results) {
        sum += r.get();
    }
    EXPECT_EQ(sum, 285);
}

TEST(ThreadPoolTest, SubmitPropagatesExceptions) {
    ThreadPool pool(1);
    auto result = pool.submit([]() -> int { throw std::invalid_argument("bad word"); });
    EXPECT_THROW(result.get(), std::invalid_argument);
}

TEST(ThreadPoolTest, ZeroThreadsRejected) {
    EXPECT_THROW(ThreadPool pool(0), std::invalid_argument);
}

TEST(ThreadPoolTest, Size) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.size(), 3);
}
