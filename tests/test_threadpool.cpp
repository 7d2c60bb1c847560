#include <gtest/gtest.h>
#include "core/ThreadPool.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <stdexcept>

using namespace vigil;

TEST(ThreadPoolTest, BasicExecution) {
    ThreadPool pool(2);
    std::atomic<int> counter{0};

    pool.Submit("increment", [&counter]() { counter++; });
    pool.WaitIdle();

    EXPECT_EQ(counter, 1);
    EXPECT_EQ(pool.GetThreadCount(), 2u);
}

TEST(ThreadPoolTest, ZeroThreadsFallsBackToOne) {
    ThreadPool pool(0);

    EXPECT_EQ(pool.GetThreadCount(), 1u);
}

TEST(ThreadPoolTest, ShutdownWaitsForTasks) {
    auto pool = std::make_unique<ThreadPool>(2);
    std::atomic<bool> task_completed{false};

    pool->Submit("slow", [&task_completed]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        task_completed = true;
    });

    pool->Shutdown();
    EXPECT_TRUE(task_completed);
}

TEST(ThreadPoolTest, SubmitRunsJobAndWaitIdleBlocks) {
    ThreadPool pool(2);
    std::atomic<int> counter{0};

    for (int i = 0; i < 5; ++i) {
        pool.Submit("job-" + std::to_string(i), [&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            counter++;
        });
    }
    pool.WaitIdle();

    EXPECT_EQ(counter, 5);
    EXPECT_EQ(pool.GetQueueSize(), 0u);
}

TEST(ThreadPoolTest, FailingJobDoesNotKillWorker) {
    ThreadPool pool(1);
    std::atomic<bool> ran_after{false};

    pool.Submit("failing", []() { throw std::runtime_error("retraining failed"); });
    pool.Submit("next", [&ran_after]() { ran_after = true; });
    pool.WaitIdle();

    EXPECT_TRUE(ran_after);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool(1);
    pool.Shutdown();

    EXPECT_THROW(pool.Submit("late", []() {}), std::runtime_error);
}
