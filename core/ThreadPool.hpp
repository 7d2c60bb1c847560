#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace vigil {

// Fixed-size worker pool for background jobs (drift-triggered retraining).
// Tasks run in FIFO order across the workers.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Fire-and-forget job. Exceptions escaping the job are logged with its name.
    void Submit(std::string name, std::function<void()> job);

    // Blocks until the queue is empty and no worker is running a task.
    void WaitIdle();

    void Shutdown();
    size_t GetThreadCount() const { return workers_.size(); }
    size_t GetQueueSize() const;

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    size_t busy_{0};

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_condition_;
    std::atomic<bool> stop_{false};
};

} // namespace vigil
