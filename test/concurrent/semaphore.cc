#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <runlib/concurrent/semaphore.hh>
#include <thread>
#include <vector>

// NOLINTNEXTLINE
TEST(concurrent_Semaphore, try_wait) {
    concurrent::Semaphore sem{2};
    EXPECT_TRUE(sem.try_wait());
    EXPECT_TRUE(sem.try_wait());
    EXPECT_FALSE(sem.try_wait());
    sem.post();
    EXPECT_TRUE(sem.try_wait());
}

// NOLINTNEXTLINE
TEST(concurrent_Semaphore, limits_concurrency) {
    constexpr unsigned LIMIT = 3;
    concurrent::Semaphore sem{LIMIT};
    std::atomic<unsigned> inside{0};
    std::atomic<unsigned> max_inside{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            sem.wait();
            auto now_inside = ++inside;
            auto prev_max = max_inside.load();
            while (prev_max < now_inside and
                   not max_inside.compare_exchange_weak(prev_max, now_inside))
            {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
            --inside;
            sem.post();
        });
    }
    for (auto& thr : threads) {
        thr.join();
    }
    EXPECT_LE(max_inside.load(), LIMIT);
    EXPECT_GE(max_inside.load(), 1U);
}
