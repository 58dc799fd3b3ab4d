/**
 * @file task_pool_test.cpp
 * @brief Unit tests for the worker pool and its delayed submission
 */

#include <gtest/gtest.h>
#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "task_pool.hpp"

using ridematch::platform::TaskPool;
using ridematch::platform::TaskPoolConfig;
using namespace std::chrono_literals;

class TaskPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        static bool glog_initialized = false;
        if (!glog_initialized) {
            google::InitGoogleLogging("task_pool_test");
            FLAGS_logtostderr = true;
            glog_initialized = true;
        }
    }

    static TaskPoolConfig single_worker() {
        TaskPoolConfig config;
        config.name = "test";
        config.num_workers = 1;
        return config;
    }
};

TEST_F(TaskPoolTest, RunsSubmittedTasks) {
    TaskPool pool;
    std::atomic<int> count{0};
    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(pool.submit([&count]() { count++; }));
    }
    ASSERT_TRUE(pool.wait_idle(2s));
    EXPECT_EQ(count.load(), 20);
    EXPECT_EQ(pool.stats().executed.load(), 20u);
}

TEST_F(TaskPoolTest, ImmediateTasksRunInSubmissionOrder) {
    TaskPool pool(single_worker());
    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        pool.submit([&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    ASSERT_TRUE(pool.wait_idle(2s));
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(TaskPoolTest, DelayedTaskRunsAfterImmediateOnes) {
    TaskPool pool(single_worker());
    std::mutex mutex;
    std::vector<std::string> order;
    auto record = [&](const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(name);
    };

    pool.submit_after(50ms, [&]() { record("delayed"); });
    pool.submit([&]() { record("now"); });

    ASSERT_TRUE(pool.wait_idle(2s));
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "now");
    EXPECT_EQ(order[1], "delayed");
}

TEST_F(TaskPoolTest, DelayedTaskWaitsAtLeastItsDelay) {
    TaskPool pool(single_worker());
    auto submitted = std::chrono::steady_clock::now();
    std::atomic<int64_t> waited_ms{-1};
    pool.submit_after(80ms, [&]() {
        waited_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - submitted).count();
    });
    ASSERT_TRUE(pool.wait_idle(2s));
    EXPECT_GE(waited_ms.load(), 80);
}

TEST_F(TaskPoolTest, ThrowingTaskIsCountedAndPoolKeepsRunning) {
    TaskPool pool(single_worker());
    std::atomic<bool> ran_after{false};
    pool.submit([]() { throw std::runtime_error("boom"); });
    pool.submit([&]() { ran_after = true; });
    ASSERT_TRUE(pool.wait_idle(2s));
    EXPECT_TRUE(ran_after.load());
    EXPECT_EQ(pool.stats().failed.load(), 1u);
}

TEST_F(TaskPoolTest, NonStandardThrowIsCountedAndPoolKeepsRunning) {
    TaskPool pool(single_worker());
    std::atomic<bool> ran_after{false};
    pool.submit([]() { throw 42; });
    pool.submit([&]() { ran_after = true; });
    ASSERT_TRUE(pool.wait_idle(2s));
    EXPECT_TRUE(ran_after.load());
    EXPECT_EQ(pool.stats().failed.load(), 1u);
    EXPECT_EQ(pool.stats().executed.load(), 2u);
}

TEST_F(TaskPoolTest, ShutdownDropsPendingAndRejectsNew) {
    TaskPool pool(single_worker());
    std::atomic<bool> ran{false};
    pool.submit_after(10s, [&]() { ran = true; });
    EXPECT_EQ(pool.queued(), 1u);

    pool.shutdown();
    EXPECT_FALSE(ran.load());
    EXPECT_EQ(pool.stats().dropped.load(), 1u);
    EXPECT_FALSE(pool.submit([]() {}));
    EXPECT_EQ(pool.stats().rejected.load(), 1u);
}
