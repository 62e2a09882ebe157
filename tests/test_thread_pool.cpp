// filename: tests/test_thread_pool.cpp
#include <gtest/gtest.h>
#include "core/thread_pool.hpp"
#include <atomic>
#include <stdexcept>

TEST(ThreadPool, RunsEveryTask) {
    std::atomic<int> n{0};
    ThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4u);
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(pool.post([&n] { n.fetch_add(1); }));
    }
    pool.wait_idle();
    EXPECT_EQ(n.load(), 1000);
}

TEST(ThreadPool, SurvivesThrowingTask) {
    std::atomic<int> n{0};
    ThreadPool pool(1);
    pool.post([] { throw std::runtime_error("boom"); });
    pool.post([&n] { n.fetch_add(1); });
    pool.wait_idle();
    EXPECT_EQ(n.load(), 1);
}

TEST(ThreadPool, RejectsAfterStop) {
    std::atomic<int> n{0};
    ThreadPool pool(2);
    pool.post([&n] { n.fetch_add(1); });
    pool.stop();
    EXPECT_EQ(n.load(), 1);
    EXPECT_FALSE(pool.post([&n] { n.fetch_add(1); }));
    EXPECT_EQ(n.load(), 1);
    // second stop is a no-op
    pool.stop();
}

TEST(ThreadPool, ZeroMeansOne) {
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}
