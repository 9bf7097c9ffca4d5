#include <projmetrics/scan/thread_pool.hpp>
#include <system_error>

namespace projmetrics {

ThreadPool::ThreadPool(size_t threads, Spawn spawn) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    try {
        for (size_t i = 0; i < threads; ++i) {
            if (spawn) {
                workers_.push_back(spawn([this] { run(); }));
            } else {
                workers_.emplace_back([this] { run(); });
            }
        }
    } catch (const std::system_error&) {
        // Threads already started must be joined before the vector dies
        shutdown();
        throw;
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

void ThreadPool::run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

} // namespace projmetrics
