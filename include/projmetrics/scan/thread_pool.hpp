#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace projmetrics {

// Fixed-size worker pool. The destructor drains the queue and joins. If a
// worker fails to start, the constructor joins the others and rethrows.
class ThreadPool {
public:
    // Starts one worker thread from a body; the default is std::thread
    using Spawn = std::function<std::thread(std::function<void()>)>;

    explicit ThreadPool(size_t threads, Spawn spawn = nullptr);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void enqueue(std::function<void()> task);

    size_t size() const { return workers_.size(); }

private:
    void run();
    // Drain the queue and join every started worker
    void shutdown();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

} // namespace projmetrics
