#include "core/ThreadPool.hpp"
#include "core/Logger.hpp"

namespace vigil {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerThread, this);
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Submit(std::string name, std::function<void()> job) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("Cannot submit '" + name + "' on stopped ThreadPool");
        }
        tasks_.emplace([name = std::move(name), job = std::move(job)]() {
            try {
                job();
            } catch (const std::exception& ex) {
                LOG_ERROR("Background job '{}' failed: {}", name, ex.what());
            }
        });
    }
    condition_.notify_one();
}

void ThreadPool::WaitIdle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] { return tasks_.empty() && busy_ == 0; });
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t ThreadPool::GetQueueSize() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void ThreadPool::WorkerThread() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++busy_;
        }

        task();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --busy_;
            if (tasks_.empty() && busy_ == 0) {
                idle_condition_.notify_all();
            }
        }
    }
}

} // namespace vigil
